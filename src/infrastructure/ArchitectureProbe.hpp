/**
 * @file ArchitectureProbe.hpp
 * @brief Detects the host CPU family.
 */

#pragma once

#include "domain/Architecture.hpp"

#include <string>

namespace nodeforge::infrastructure {

class ArchitectureProbe {
public:
    /** @brief Host architecture, computed on first call and cached for the process lifetime. */
    static domain::Architecture Host();

    /** @brief Maps a machine name ("arm64", "x86_64") to an Architecture. */
    static domain::Architecture Classify(const std::string& machine);

    /** @brief Raw uname machine string, empty if uname fails. */
    static std::string MachineName();
};

} // namespace nodeforge::infrastructure
