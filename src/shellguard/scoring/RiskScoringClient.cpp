#include "scoring/RiskScoringClient.hpp"

#include "scoring/HttpTransport.hpp"
#include "scoring/JsonObjectExtractor.hpp"

#include "easylogging++.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace scoring {

namespace {

const char SYSTEM_PROMPT[] = "You are a security expert specializing in shell command analysis.";

const double MIN_RECOMMENDED_TIMEOUT_SECONDS = 1.0;
const double MAX_RECOMMENDED_TIMEOUT_SECONDS = 3600.0;

template <typename T>
T Field(const json& object, const char* key, T fallback) {
    auto iter = object.find(key);
    if (iter == object.end() || iter->is_null()) {
        return fallback;
    }

    return iter->get<T>();
}

policy::RiskAnalysis MakeFallback(const std::string& factor, double confidence, const std::string& explanation) {
    policy::RiskAnalysis analysis;
    analysis.level = policy::SecurityLevel::Caution;
    analysis.riskScore = 50.0;
    analysis.riskFactors = {factor};
    analysis.explanation = explanation;
    analysis.confidence = confidence;
    analysis.recommendedTimeoutSeconds = 30;
    analysis.requiresConfirmation = true;
    analysis.category = "unknown";
    return analysis;
}

std::string TrimTrailingSlash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

} // namespace

policy::RiskAnalysis UnavailableAnalysis() {
    return MakeFallback("no scoring service available", 0.5,
        "risk scoring service not configured, using fallback security measures");
}

policy::RiskAnalysis ParseFailureAnalysis() {
    return MakeFallback("response parsing failed", 0.3,
        "failed to parse risk scoring response, using caution level");
}

policy::RiskAnalysis ServiceErrorAnalysis(const std::string& error) {
    return MakeFallback("scoring service error", 0.2, "risk scoring failed: " + error);
}

bool ParseChatCompletion(const std::string& body, policy::RiskAnalysis& analysis) {
    try {
        const auto response = json::parse(body);
        const auto& content = response.at("choices").at(0).at("message").at("content");
        if (!content.is_string()) {
            return false;
        }

        std::string objectText;
        if (!ExtractFirstJsonObject(content.get<std::string>(), objectText)) {
            return false;
        }

        const auto fields = json::parse(objectText);

        policy::RiskAnalysis parsed;
        parsed.level = policy::NormalizeSecurityLevel(Field<std::string>(fields, "security_level", "caution"));
        parsed.riskScore = std::min(std::max(Field<double>(fields, "risk_score", 50.0), 0.0), 100.0);
        parsed.riskFactors = Field<std::vector<std::string>>(fields, "risk_factors", {});
        parsed.safeAlternatives = Field<std::vector<std::string>>(fields, "safe_alternatives", {});
        parsed.explanation = Field<std::string>(fields, "explanation", "");
        parsed.confidence = std::min(std::max(Field<double>(fields, "confidence", 0.5), 0.0), 1.0);
        parsed.recommendedTimeoutSeconds = static_cast<int>(std::min(std::max(
            Field<double>(fields, "recommended_timeout", 30.0), MIN_RECOMMENDED_TIMEOUT_SECONDS),
            MAX_RECOMMENDED_TIMEOUT_SECONDS));
        parsed.requiresConfirmation = Field<bool>(fields, "requires_confirmation", true);
        parsed.category = Field<std::string>(fields, "command_category", "unknown");

        analysis = std::move(parsed);
        return true;
    } catch (const json::exception& e) {
        LOG(WARNING) << "Risk scoring response rejected: " << e.what();
        return false;
    }
}

RiskScoringClient::RiskScoringClient(ScoringConfig config, IHttpTransport* transport)
    : config_{std::move(config)}
    , transport_{transport} {
    if (config_.timeout.count() <= 0) {
        throw std::invalid_argument("scoring timeout must be greater than zero");
    }
}

bool RiskScoringClient::IsEnabled() const {
    return transport_ != nullptr && !config_.apiKey.empty() && !config_.apiBase.empty();
}

policy::RiskAnalysis RiskScoringClient::Analyze(const std::string& command, const ScoringContext& context) {
    if (!IsEnabled()) {
        return UnavailableAnalysis();
    }

    HttpRequest request;
    request.url = TrimTrailingSlash(config_.apiBase) + "/chat/completions";
    request.headers = {
        {"Content-Type", "application/json"},
        {"Authorization", "Bearer " + config_.apiKey},
    };
    request.body = BuildRequestBody(command, context);
    request.timeout = config_.timeout;

    HttpResponse response;
    try {
        response = transport_->Post(request);
    } catch (const HttpTransportException& e) {
        LOG(WARNING) << "Risk scoring request failed: " << e.what();
        return ServiceErrorAnalysis(e.what());
    }

    if (response.status < 200 || response.status >= 300) {
        LOG(WARNING) << "Risk scoring service returned HTTP " << response.status;
        return ParseFailureAnalysis();
    }

    policy::RiskAnalysis analysis;
    if (!ParseChatCompletion(response.body, analysis)) {
        return ParseFailureAnalysis();
    }

    VLOG(1) << "Risk scoring for '" << command << "': " << policy::ToString(analysis.level)
            << " score=" << analysis.riskScore << " confidence=" << analysis.confidence;
    return analysis;
}

std::string RiskScoringClient::BuildRequestBody(const std::string& command, const ScoringContext& context) const {
    json body;
    body["model"] = config_.model;
    body["messages"] = json::array({
        {{"role", "system"}, {"content", SYSTEM_PROMPT}},
        {{"role", "user"}, {"content", BuildPrompt(command, context)}},
    });
    body["temperature"] = config_.temperature;
    body["max_tokens"] = config_.maxTokens;
    return body.dump();
}

std::string RiskScoringClient::BuildPrompt(const std::string& command, const ScoringContext& context) const {
    const json contextJson = {
        {"working_directory", context.workingDirectory},
        {"user", context.user},
        {"system", context.hostType},
    };

    std::ostringstream prompt;
    prompt << "You are a systems security expert assessing Linux/Unix shell commands.\n\n"
           << "Analyze the security risk of the following shell command:\n\n"
           << "Command: `" << command << "`\n\n"
           << "Context:\n" << contextJson.dump(2) << "\n\n"
           << "Assess the risk of system modification, data destruction, privilege escalation, "
           << "network operations, file operations, process operations and environment changes.\n\n"
           << "Levels: safe (harmless, e.g. ls, cat, pwd), caution (needs care, e.g. find, grep), "
           << "dangerous (possibly harmful, e.g. rm, chmod), critical (high risk, e.g. mkfs, dd), "
           << "blocked (never allowed, e.g. rm -rf /, fork bombs).\n\n"
           << "Reply with a single JSON object:\n"
           << "{\n"
           << "  \"security_level\": \"\",\n"
           << "  \"risk_score\": 0,\n"
           << "  \"risk_factors\": [],\n"
           << "  \"safe_alternatives\": [],\n"
           << "  \"explanation\": \"\",\n"
           << "  \"confidence\": 0.0,\n"
           << "  \"recommended_timeout\": 30,\n"
           << "  \"requires_confirmation\": false,\n"
           << "  \"command_category\": \"\"\n"
           << "}\n";
    return prompt.str();
}

} // namespace scoring
