#include "domain/CommandRunner.hpp"

namespace nodeforge::domain {

std::string ShellQuote(const std::string& word) {
    if (word.empty()) return "''";
    bool plain = true;
    for (char c : word) {
        bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                    c == '-' || c == '_' || c == '.' || c == '/' || c == '=' || c == ':' ||
                    c == ',' || c == '+' || c == '@' || c == '%';
        if (!safe) {
            plain = false;
            break;
        }
    }
    if (plain) return word;

    std::string quoted = "'";
    for (char c : word) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string CommandLine::toString() const {
    std::string text = ShellQuote(program);
    for (const auto& arg : args) {
        text += " ";
        text += ShellQuote(arg);
    }
    return text;
}

std::string CommandOutcome::firstLine() const {
    for (const auto& line : tail) {
        size_t begin = line.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) continue;
        size_t end = line.find_last_not_of(" \t\r\n");
        return line.substr(begin, end - begin + 1);
    }
    return {};
}

} // namespace nodeforge::domain
