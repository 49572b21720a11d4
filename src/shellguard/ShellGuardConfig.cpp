#include "ShellGuardConfig.hpp"

#include "ConfigurationException.hpp"

#include <string>

void ValidateConfiguration(const ShellGuardConfig& config) {
    if (config.defaultTimeoutSeconds <= 0) {
        throw ConfigurationException("default_timeout_seconds must be greater than zero, got "
            + std::to_string(config.defaultTimeoutSeconds));
    }

    if (config.maxOutputBytes <= 0) {
        throw ConfigurationException("max_output_bytes must be greater than zero, got "
            + std::to_string(config.maxOutputBytes));
    }

    if (config.scoringTimeoutSeconds <= 0) {
        throw ConfigurationException("scoring_timeout_seconds must be greater than zero, got "
            + std::to_string(config.scoringTimeoutSeconds));
    }

    if (config.scoringMaxTokens <= 0) {
        throw ConfigurationException("scoring_max_tokens must be greater than zero, got "
            + std::to_string(config.scoringMaxTokens));
    }

    if (config.auditEnabled && config.auditDatabasePath.empty()) {
        throw ConfigurationException("audit_database_path is required when audit_enabled is true");
    }
}
