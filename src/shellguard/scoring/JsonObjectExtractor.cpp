#include "scoring/JsonObjectExtractor.hpp"

namespace scoring {

bool ExtractFirstJsonObject(const std::string& text, std::string& object) {
    const auto start = text.find('{');
    if (start == std::string::npos) {
        return false;
    }

    int depth = 0;
    bool inString = false;
    bool escaped = false;

    for (size_t i = start; i < text.size(); ++i) {
        const char c = text[i];

        if (inString) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                inString = false;
            }
            continue;
        }

        if (c == '"') {
            inString = true;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (--depth == 0) {
                object = text.substr(start, i - start + 1);
                return true;
            }
        }
    }

    return false;
}

} // namespace scoring
