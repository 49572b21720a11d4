#pragma once

#include "exec/ExecutionResult.hpp"
#include "policy/PolicyDecision.hpp"
#include "policy/RiskAnalysis.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace policy {
class DecisionEngine;
class PatternClassifier;
}

namespace scoring {
class IRiskScoringClient;
}

namespace exec {

class IConfirmationPrompt;

extern const char OUTPUT_TRUNCATED_MARKER[];
extern const char ERROR_TRUNCATED_MARKER[];

enum class ExecutionState {
    Received,
    Analyzed,
    Blocked,
    AwaitConfirmation,
    Cancelled,
    Confirmed,
    Executing,
    Completed,
    TimedOut,
    Failed,
};

const char* ToString(ExecutionState state);

struct ExecutorConfig {
    std::string rootDirectory;
    std::chrono::seconds defaultTimeout{30};
    std::size_t maxOutputBytes = 1024 * 1024;
};

/**
 * Admission control plus bounded execution for a single command.
 *
 * Every call classifies the command, asks the scoring client for an
 * analysis, merges both through the decision engine and only spawns a
 * process for a non-BLOCKED decision. Holds no per-call state, so one
 * instance serves concurrent callers.
 */
class SandboxedExecutor {
public:
    // Throws std::invalid_argument for a zero output cap or non-positive
    // timeout and ConfigurationException for an unusable root directory.
    SandboxedExecutor(const ExecutorConfig& config,
        const policy::PatternClassifier& classifier,
        scoring::IRiskScoringClient& scorer,
        const policy::DecisionEngine& engine,
        IConfirmationPrompt* prompt);

    policy::Decision Evaluate(const std::string& command);

    ExecutionOutcome Execute(const std::string& command, const ExecutionOptions& options);

    ExecutionResult Run(const std::string& command, const ExecutionOptions& options);

    // Resolves requested (empty means root, relative means under root) to a
    // canonical path inside the root. Returns false with a message otherwise.
    bool ResolveWorkingDirectory(const std::string& requested, std::string& resolved, std::string& error) const;

    const std::string& RootDirectory() const { return rootDirectory_; }
    std::chrono::seconds DefaultTimeout() const { return defaultTimeout_; }
    std::size_t MaxOutputBytes() const { return maxOutputBytes_; }

private:
    struct Assessment {
        policy::Decision decision;
        policy::RiskAnalysis analysis;
    };

    Assessment Assess(const std::string& command, const std::string& workingDirectory);
    bool NeedsConfirmation(const policy::Decision& decision, const ExecutionOptions& options) const;
    std::string Truncate(const std::string& output, bool truncated, const char* marker) const;

    std::string rootDirectory_;
    std::chrono::seconds defaultTimeout_;
    std::size_t maxOutputBytes_;
    const policy::PatternClassifier& classifier_;
    scoring::IRiskScoringClient& scorer_;
    const policy::DecisionEngine& engine_;
    IConfirmationPrompt* prompt_;
};

} // namespace exec
