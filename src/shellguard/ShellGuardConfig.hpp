#pragma once

#include <cstdint>
#include <string>

struct ShellGuardConfig {
    ShellGuardConfig() = default;

    const uint32_t version = 1;

    // Default working directory; explicit overrides must resolve inside it.
    std::string rootDirectory;
    int defaultTimeoutSeconds = 30;
    int64_t maxOutputBytes = 1024 * 1024;

    // Scoring is disabled while either the base URL or the key is empty.
    std::string scoringApiBase = "https://api.moonshot.cn/v1";
    std::string scoringApiKey;
    std::string scoringModel = "moonshot-v1-8k";
    int scoringTimeoutSeconds = 10;
    double scoringTemperature = 0.1;
    int scoringMaxTokens = 1000;

    bool auditEnabled = false;
    std::string auditDatabasePath = "var/shellguard/audit.db";

    std::string loggerConfig;
};

// Throws ConfigurationException for values that cannot work at run time.
void ValidateConfiguration(const ShellGuardConfig& config);
