#pragma once

#include <string>

namespace scoring {

// Finds the first '{' in text and returns the substring up to its matching
// '}'. Braces inside JSON string literals (including escaped quotes) do not
// count. Returns false if there is no '{' or it is never closed.
bool ExtractFirstJsonObject(const std::string& text, std::string& object);

} // namespace scoring
