#include "policy/PatternClassifier.hpp"

#include "policy/CommandTokenizer.hpp"

#include <utility>

namespace policy {

PatternClassifier::PatternClassifier(CommandPolicyTable table)
    : table_{std::move(table)} {}

SecurityLevel PatternClassifier::Classify(const std::string& command) const {
    return Explain(command).level;
}

Classification PatternClassifier::Explain(const std::string& command) const {
    Classification classification;

    const auto tokenized = TokenizeCommand(command);
    if (!tokenized.ok) {
        classification.rule = "unparseable command: " + tokenized.error;
        return classification;
    }

    if (tokenized.tokens.empty()) {
        classification.rule = "empty command";
        return classification;
    }

    const auto& cmd = tokenized.tokens.front();

    if (table_.IsDangerousCommand(cmd)) {
        classification.rule = "dangerous command: " + cmd;
        return classification;
    }

    if (const auto* pattern = table_.MatchDangerPattern(command)) {
        classification.rule = "dangerous pattern: " + pattern->description;
        return classification;
    }

    if (table_.IsWhitelisted(cmd)) {
        classification.level = SecurityLevel::Safe;
        classification.rule = "whitelisted command: " + cmd;
        return classification;
    }

    if (table_.IsServiceManagement(cmd)) {
        classification.level = SecurityLevel::Restricted;
        classification.rule = "service management command: " + cmd;
        return classification;
    }

    classification.level = SecurityLevel::Caution;
    classification.rule = "unknown command: " + cmd;
    return classification;
}

} // namespace policy
