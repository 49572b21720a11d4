#include "policy/DecisionEngine.hpp"

#include <algorithm>
#include <cmath>

namespace policy {

constexpr int DecisionEngine::BLOCK_THRESHOLD;
constexpr int DecisionEngine::RESTRICT_THRESHOLD;
constexpr int DecisionEngine::CAUTION_THRESHOLD;
constexpr int DecisionEngine::CONFIRMATION_THRESHOLD;
constexpr int DecisionEngine::RULE_BLOCK_FLOOR;

Decision DecisionEngine::Combine(SecurityLevel patternLevel, const RiskAnalysis& analysis) const {
    Decision decision;
    decision.patternLevel = patternLevel;
    decision.safeAlternatives = analysis.safeAlternatives;

    const int analysisScore = ClampScore(analysis.riskScore);

    if (patternLevel == SecurityLevel::Blocked) {
        decision.finalLevel = SecurityLevel::Blocked;
        decision.riskScore = std::max(analysisScore, RULE_BLOCK_FLOOR);
        decision.reason = "blocked by rule engine and risk analysis";
    } else {
        decision.riskScore = std::max(analysisScore, BaselineRiskScore(patternLevel));
        decision.finalLevel = LevelForScore(decision.riskScore);

        if (decision.finalLevel == SecurityLevel::Blocked) {
            decision.reason = "risk score " + std::to_string(decision.riskScore) + " exceeded block threshold";
            if (!analysis.explanation.empty()) {
                decision.reason += ": " + analysis.explanation;
            }
        } else if (analysis.explanation.empty()) {
            decision.reason = "combined analysis";
        } else {
            decision.reason = "combined analysis: " + analysis.explanation;
        }
    }

    decision.requiresConfirmation = analysis.requiresConfirmation
        || decision.riskScore >= CONFIRMATION_THRESHOLD;

    return decision;
}

int DecisionEngine::ClampScore(double score) {
    if (std::isnan(score)) {
        return 100;
    }

    const auto rounded = std::lround(std::min(std::max(score, 0.0), 100.0));
    return static_cast<int>(rounded);
}

SecurityLevel DecisionEngine::LevelForScore(int riskScore) {
    if (riskScore >= BLOCK_THRESHOLD) {
        return SecurityLevel::Blocked;
    }
    if (riskScore >= RESTRICT_THRESHOLD) {
        return SecurityLevel::Restricted;
    }
    if (riskScore >= CAUTION_THRESHOLD) {
        return SecurityLevel::Caution;
    }

    return SecurityLevel::Safe;
}

} // namespace policy
