/**
 * @file ConfirmationGates.hpp
 * @brief ConfirmationGate implementations for the terminal and for preset answers.
 */

#pragma once

#include "domain/ConfirmationGate.hpp"

#include <iosfwd>
#include <map>
#include <mutex>

namespace nodeforge::infrastructure {

/**
 * @class StaticConfirmationGate
 * @brief Answers from a fixed table. Unlisted kinds get the default answer.
 */
class StaticConfirmationGate : public domain::ConfirmationGate {
public:
    explicit StaticConfirmationGate(bool defaultAnswer = false);

    void setAnswer(domain::GateKind kind, bool answer);
    bool confirm(const domain::ConfirmationPrompt& prompt) override;

    /** @brief How many times confirm() was asked about kind. */
    int timesAsked(domain::GateKind kind) const;

private:
    bool m_default;
    std::map<domain::GateKind, bool> m_answers;
    std::map<domain::GateKind, int> m_asked;
    mutable std::mutex m_mutex;
};

/**
 * @class ConsoleConfirmationGate
 * @brief Asks "[y/N]" on a terminal. Preset answers (flags such as --yes) skip the question.
 *
 * Without an interactive input stream every unanswered prompt is declined.
 */
class ConsoleConfirmationGate : public domain::ConfirmationGate {
public:
    ConsoleConfirmationGate(std::istream& in, std::ostream& out, bool interactive);

    void presetAnswer(domain::GateKind kind, bool answer);
    bool confirm(const domain::ConfirmationPrompt& prompt) override;

private:
    std::istream& m_in;
    std::ostream& m_out;
    bool m_interactive;
    std::map<domain::GateKind, bool> m_presets;
    std::mutex m_mutex;
};

} // namespace nodeforge::infrastructure
