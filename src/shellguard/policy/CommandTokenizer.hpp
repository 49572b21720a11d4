#pragma once

#include <string>
#include <vector>

namespace policy {

struct TokenizeResult {
    bool ok = false;
    std::vector<std::string> tokens;
    std::string error;
};

// POSIX-shell style word splitting: whitespace separates words, single
// quotes are literal, double quotes allow \" \\ \$ \` escapes, and a bare
// backslash escapes the next character. Unterminated quotes or a trailing
// backslash make the command unparseable.
TokenizeResult TokenizeCommand(const std::string& command);

} // namespace policy
