#pragma once

#include "policy/CommandPolicyTable.hpp"
#include "policy/SecurityLevel.hpp"

#include <string>

namespace policy {

struct Classification {
    SecurityLevel level = SecurityLevel::Blocked;
    std::string rule;
};

// Deterministic rule engine. Holds only read-only state, so one instance may
// be shared across threads.
class PatternClassifier {
public:
    explicit PatternClassifier(CommandPolicyTable table);

    SecurityLevel Classify(const std::string& command) const;

    // Same verdict as Classify, plus the name of the rule that produced it.
    Classification Explain(const std::string& command) const;

private:
    CommandPolicyTable table_;
};

} // namespace policy
