#pragma once

#include "policy/SecurityLevel.hpp"

#include <string>
#include <vector>

namespace policy {

struct RiskAnalysis {
    SecurityLevel level = SecurityLevel::Caution;
    double riskScore = 50.0;
    std::vector<std::string> riskFactors;
    std::vector<std::string> safeAlternatives;
    std::string explanation;
    double confidence = 0.5;
    int recommendedTimeoutSeconds = 30;
    bool requiresConfirmation = true;
    std::string category = "unknown";
};

} // namespace policy
