/**
 * @file ToolchainProbe.hpp
 * @brief Resolves executables against a composed search path.
 */

#pragma once

#include "domain/BuildEnvironment.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace nodeforge::application {

/**
 * @class ToolchainProbe
 * @brief Looks a program up in the PATH of a BuildEnvironment, never the ambient one.
 */
class ToolchainProbe {
public:
    /** @brief First executable regular file named program on env's search path. */
    static std::optional<std::filesystem::path> locate(const std::string& program,
                                                       const domain::BuildEnvironment& env);

    static bool isExecutable(const std::filesystem::path& candidate);
};

} // namespace nodeforge::application
