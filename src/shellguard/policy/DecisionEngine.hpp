#pragma once

#include "policy/PolicyDecision.hpp"
#include "policy/RiskAnalysis.hpp"

namespace policy {

class DecisionEngine {
public:
    static constexpr int BLOCK_THRESHOLD = 80;
    static constexpr int RESTRICT_THRESHOLD = 60;
    static constexpr int CAUTION_THRESHOLD = 30;
    static constexpr int CONFIRMATION_THRESHOLD = 50;
    static constexpr int RULE_BLOCK_FLOOR = 90;

    Decision Combine(SecurityLevel patternLevel, const RiskAnalysis& analysis) const;

private:
    static int ClampScore(double score);
    static SecurityLevel LevelForScore(int riskScore);
};

} // namespace policy
