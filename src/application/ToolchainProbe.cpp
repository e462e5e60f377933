#include "application/ToolchainProbe.hpp"

#include <system_error>

namespace nodeforge::application {

namespace fs = std::filesystem;

bool ToolchainProbe::isExecutable(const fs::path& candidate) {
    std::error_code ec;
    auto status = fs::status(candidate, ec);
    if (ec || !fs::is_regular_file(status)) return false;
    auto perms = status.permissions();
    return (perms & (fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec)) != fs::perms::none;
}

std::optional<fs::path> ToolchainProbe::locate(const std::string& program, const domain::BuildEnvironment& env) {
    if (program.empty()) return std::nullopt;

    if (program.find('/') != std::string::npos) {
        fs::path direct(program);
        if (isExecutable(direct)) return direct;
        return std::nullopt;
    }

    for (const auto& dir : env.searchPath()) {
        fs::path candidate = fs::path(dir) / program;
        if (isExecutable(candidate)) return candidate;
    }
    return std::nullopt;
}

} // namespace nodeforge::application
