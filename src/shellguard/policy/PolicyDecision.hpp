#pragma once

#include "policy/SecurityLevel.hpp"

#include <string>
#include <vector>

namespace policy {

struct Decision {
    SecurityLevel finalLevel = SecurityLevel::Blocked;
    SecurityLevel patternLevel = SecurityLevel::Blocked;
    int riskScore = 100;
    std::string reason;
    bool requiresConfirmation = true;
    std::vector<std::string> safeAlternatives;
};

inline bool operator==(const Decision& lhs, const Decision& rhs) {
    return lhs.finalLevel == rhs.finalLevel
        && lhs.patternLevel == rhs.patternLevel
        && lhs.riskScore == rhs.riskScore
        && lhs.reason == rhs.reason
        && lhs.requiresConfirmation == rhs.requiresConfirmation
        && lhs.safeAlternatives == rhs.safeAlternatives;
}

inline bool operator!=(const Decision& lhs, const Decision& rhs) {
    return !(lhs == rhs);
}

inline const char* DescribeRiskScore(int riskScore) {
    if (riskScore <= 20) {
        return "low";
    }
    if (riskScore <= 40) {
        return "moderate";
    }
    if (riskScore <= 60) {
        return "high";
    }
    if (riskScore <= 80) {
        return "very high";
    }

    return "critical";
}

} // namespace policy
