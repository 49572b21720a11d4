#pragma once

#include <string>

namespace policy {

// Backslash-escapes & ; ` $ ( ) < and trims surrounding whitespace. Pipes and
// output redirects pass through untouched so ordinary pipelines still work.
//
// This is only a partial mitigation: the result is still handed to a shell,
// so admission control belongs to PatternClassifier and DecisionEngine.
std::string SanitizeCommand(const std::string& command);

bool IsSanitizedMetacharacter(char c);

} // namespace policy
