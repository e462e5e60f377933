/**
 * @file ConfirmationGate.hpp
 * @brief Interface for decisions only the user may take.
 */

#pragma once

#include <string>

namespace nodeforge::domain {

/**
 * @enum GateKind
 * @brief The points where a run waits for an explicit yes.
 */
enum class GateKind {
    AggressiveOptimizations, ///< Before any subprocess of a run.
    UnverifiedSource,        ///< Checkout commit differs from the tag commit.
    InstallDependencies      ///< Package manager would install missing packages.
};

/**
 * @struct ConfirmationPrompt
 * @brief Question shown to the user.
 */
struct ConfirmationPrompt {
    GateKind kind;
    std::string title;
    std::string message;
};

/**
 * @class ConfirmationGate
 * @brief Answers a prompt with yes/no. Declining is always safe.
 */
class ConfirmationGate {
public:
    virtual ~ConfirmationGate() = default;

    virtual bool confirm(const ConfirmationPrompt& prompt) = 0;
};

} // namespace nodeforge::domain
