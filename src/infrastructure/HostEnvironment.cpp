#include "infrastructure/HostEnvironment.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>
#include <thread>

extern char** environ;

namespace nodeforge::infrastructure {

namespace fs = std::filesystem;

application::HostSnapshot HostEnvironment::Capture() {
    application::HostSnapshot snapshot;

    for (char** entry = environ; entry && *entry; ++entry) {
        std::string item(*entry);
        auto eq = item.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        snapshot.variables.emplace_back(item.substr(0, eq), item.substr(eq + 1));
    }

    const char* home = std::getenv("HOME");
    if (home && *home) {
        snapshot.homeDir = fs::path(home);
    }

    snapshot.exists = [](const fs::path& p) {
        std::error_code ec;
        return fs::exists(p, ec);
    };
    return snapshot;
}

int HostEnvironment::CoreCount() {
    unsigned int cores = std::thread::hardware_concurrency();
    return cores == 0 ? 1 : static_cast<int>(cores);
}

} // namespace nodeforge::infrastructure
