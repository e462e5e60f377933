/**
 * @file Architecture.hpp
 * @brief Value objects describing the host CPU family and the optimization tier.
 */

#pragma once

#include <string>

namespace nodeforge::domain {

/**
 * @enum Architecture
 * @brief Host CPU family. Computed once per process.
 */
enum class Architecture {
    AppleSilicon,
    Intel,
    Unknown
};

/**
 * @enum OptimizationTier
 * @brief Named bundle of compiler/linker flags applied uniformly to a build.
 */
enum class OptimizationTier {
    Standard,   ///< -O2, safe for every supported release.
    Aggressive  ///< -O3 + LTO + wider ISA. Needs explicit confirmation.
};

inline std::string ArchitectureToString(Architecture arch) {
    switch (arch) {
        case Architecture::AppleSilicon: return "apple_silicon";
        case Architecture::Intel: return "intel";
        case Architecture::Unknown: return "unknown";
    }
    return "unknown";
}

inline std::string TierToString(OptimizationTier tier) {
    switch (tier) {
        case OptimizationTier::Standard: return "STANDARD (O2)";
        case OptimizationTier::Aggressive: return "AGGRESSIVE (O3 + LTO)";
    }
    return "STANDARD (O2)";
}

/**
 * @brief True when the tier may fail to build or misbehave at runtime.
 */
inline bool RequiresConfirmation(OptimizationTier tier) {
    return tier == OptimizationTier::Aggressive;
}

} // namespace nodeforge::domain
