/**
 * @file HostEnvironment.hpp
 * @brief Snapshot of the running process' environment for the composer.
 */

#pragma once

#include "application/EnvironmentComposer.hpp"

namespace nodeforge::infrastructure {

class HostEnvironment {
public:
    /** @brief Copies environ, HOME and a real filesystem probe. Reads only. */
    static application::HostSnapshot Capture();

    /** @brief Number of hardware threads, at least 1. */
    static int CoreCount();
};

} // namespace nodeforge::infrastructure
