#include "policy/CommandSanitizer.hpp"

namespace policy {

namespace {
const char WHITESPACE[] = " \t\n\r\f\v";
}

bool IsSanitizedMetacharacter(char c) {
    switch (c) {
    case '&':
    case ';':
    case '`':
    case '$':
    case '(':
    case ')':
    case '<':
        return true;
    default:
        return false;
    }
}

std::string SanitizeCommand(const std::string& command) {
    std::string escaped;
    escaped.reserve(command.size() * 2);

    for (auto c : command) {
        if (IsSanitizedMetacharacter(c)) {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }

    const auto first = escaped.find_first_not_of(WHITESPACE);
    if (first == std::string::npos) {
        return {};
    }

    const auto last = escaped.find_last_not_of(WHITESPACE);
    return escaped.substr(first, last - first + 1);
}

} // namespace policy
