#include "infrastructure/ArchitectureProbe.hpp"

#include <sys/utsname.h>

namespace nodeforge::infrastructure {

using domain::Architecture;

std::string ArchitectureProbe::MachineName() {
    struct utsname info {};
    if (uname(&info) != 0) {
        return {};
    }
    return info.machine;
}

Architecture ArchitectureProbe::Classify(const std::string& machine) {
    if (machine == "arm64") return Architecture::AppleSilicon;
    if (machine == "x86_64") return Architecture::Intel;
    return Architecture::Unknown;
}

Architecture ArchitectureProbe::Host() {
    static const Architecture host = Classify(MachineName());
    return host;
}

} // namespace nodeforge::infrastructure
