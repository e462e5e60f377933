#include "infrastructure/ConfirmationGates.hpp"

#include <cctype>
#include <istream>
#include <ostream>
#include <string>

namespace nodeforge::infrastructure {

using domain::ConfirmationPrompt;
using domain::GateKind;

StaticConfirmationGate::StaticConfirmationGate(bool defaultAnswer)
    : m_default(defaultAnswer) {}

void StaticConfirmationGate::setAnswer(GateKind kind, bool answer) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_answers[kind] = answer;
}

bool StaticConfirmationGate::confirm(const ConfirmationPrompt& prompt) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_asked[prompt.kind]++;
    auto it = m_answers.find(prompt.kind);
    return it != m_answers.end() ? it->second : m_default;
}

int StaticConfirmationGate::timesAsked(GateKind kind) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_asked.find(kind);
    return it != m_asked.end() ? it->second : 0;
}

ConsoleConfirmationGate::ConsoleConfirmationGate(std::istream& in, std::ostream& out, bool interactive)
    : m_in(in)
    , m_out(out)
    , m_interactive(interactive) {}

void ConsoleConfirmationGate::presetAnswer(GateKind kind, bool answer) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_presets[kind] = answer;
}

bool ConsoleConfirmationGate::confirm(const ConfirmationPrompt& prompt) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto preset = m_presets.find(prompt.kind);
    if (preset != m_presets.end()) {
        return preset->second;
    }

    m_out << "\n=== " << prompt.title << " ===\n" << prompt.message << "\n";
    if (!m_interactive) {
        m_out << "(no terminal attached, answering no)" << std::endl;
        return false;
    }

    m_out << "Continue? [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(m_in, answer)) {
        return false;
    }
    size_t pos = answer.find_first_not_of(" \t");
    return pos != std::string::npos && std::tolower(static_cast<unsigned char>(answer[pos])) == 'y';
}

} // namespace nodeforge::infrastructure
