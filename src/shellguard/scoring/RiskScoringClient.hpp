#pragma once

#include "policy/RiskAnalysis.hpp"

#include <chrono>
#include <string>

namespace scoring {

class IHttpTransport;

struct ScoringContext {
    std::string workingDirectory;
    std::string user;
    std::string hostType;
};

struct ScoringConfig {
    std::string apiBase;
    std::string apiKey;
    std::string model = "moonshot-v1-8k";
    std::chrono::milliseconds timeout{10000};
    double temperature = 0.1;
    int maxTokens = 1000;
};

class IRiskScoringClient {
public:
    virtual ~IRiskScoringClient() = default;

    // One blocking round trip. Never throws for service problems; those
    // degrade to a conservative CAUTION analysis.
    virtual policy::RiskAnalysis Analyze(const std::string& command, const ScoringContext& context) = 0;

    virtual bool IsEnabled() const = 0;
};

class RiskScoringClient final : public IRiskScoringClient {
public:
    // Throws std::invalid_argument for a non-positive timeout.
    RiskScoringClient(ScoringConfig config, IHttpTransport* transport);

    policy::RiskAnalysis Analyze(const std::string& command, const ScoringContext& context) override;

    bool IsEnabled() const override;

    std::string BuildRequestBody(const std::string& command, const ScoringContext& context) const;

private:
    std::string BuildPrompt(const std::string& command, const ScoringContext& context) const;

    ScoringConfig config_;
    IHttpTransport* transport_;
};

// Parses a chat-completion response body into an analysis. Returns false on
// any structural or type problem.
bool ParseChatCompletion(const std::string& body, policy::RiskAnalysis& analysis);

policy::RiskAnalysis UnavailableAnalysis();
policy::RiskAnalysis ParseFailureAnalysis();
policy::RiskAnalysis ServiceErrorAnalysis(const std::string& error);

} // namespace scoring
