#include "policy/CommandTokenizer.hpp"

namespace policy {

namespace {

bool IsWordSeparator(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool IsDoubleQuoteEscapable(char c) {
    return c == '"' || c == '\\' || c == '$' || c == '`';
}

TokenizeResult Unparseable(const std::string& error) {
    TokenizeResult result;
    result.error = error;
    return result;
}

} // namespace

TokenizeResult TokenizeCommand(const std::string& command) {
    enum class State {
        Between,
        Word,
        SingleQuoted,
        DoubleQuoted,
    };

    TokenizeResult result;
    std::string current;
    auto state = State::Between;

    for (size_t i = 0; i < command.size(); ++i) {
        const char c = command[i];

        switch (state) {
        case State::Between:
        case State::Word:
            if (IsWordSeparator(c)) {
                if (state == State::Word) {
                    result.tokens.push_back(current);
                    current.clear();
                }
                state = State::Between;
            } else if (c == '\'') {
                state = State::SingleQuoted;
            } else if (c == '"') {
                state = State::DoubleQuoted;
            } else if (c == '\\') {
                if (i + 1 >= command.size()) {
                    return Unparseable("no escaped character");
                }
                current.push_back(command[++i]);
                state = State::Word;
            } else {
                current.push_back(c);
                state = State::Word;
            }
            break;

        case State::SingleQuoted:
            if (c == '\'') {
                state = State::Word;
            } else {
                current.push_back(c);
            }
            break;

        case State::DoubleQuoted:
            if (c == '"') {
                state = State::Word;
            } else if (c == '\\' && i + 1 < command.size() && IsDoubleQuoteEscapable(command[i + 1])) {
                current.push_back(command[++i]);
            } else {
                current.push_back(c);
            }
            break;
        }
    }

    if (state == State::SingleQuoted || state == State::DoubleQuoted) {
        return Unparseable("no closing quotation");
    }

    if (state == State::Word) {
        result.tokens.push_back(current);
    }

    result.ok = true;
    return result;
}

} // namespace policy
