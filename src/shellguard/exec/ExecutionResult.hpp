#pragma once

#include "policy/PolicyDecision.hpp"
#include "policy/SecurityLevel.hpp"

#include <string>

namespace exec {

enum class ExecutionStatus {
    Success,
    Error,
    Blocked,
    Timeout,
};

inline const char* ToString(ExecutionStatus status) {
    switch (status) {
    case ExecutionStatus::Success:
        return "success";
    case ExecutionStatus::Error:
        return "error";
    case ExecutionStatus::Blocked:
        return "blocked";
    case ExecutionStatus::Timeout:
        return "timeout";
    }

    return "error";
}

constexpr int RETURN_CODE_FAILURE = 1;
constexpr int RETURN_CODE_TIMEOUT = 124;
constexpr int RETURN_CODE_POLICY_BLOCKED = 126;
constexpr int RETURN_CODE_USER_CANCELLED = 130;

struct ExecutionOptions {
    // Empty means the gateway root.
    std::string workingDirectory;
    // Zero or negative means the configured default.
    int timeoutSeconds = 0;
    bool interactive = false;
};

struct ExecutionResult {
    std::string command;
    ExecutionStatus status = ExecutionStatus::Error;
    std::string stdOut;
    std::string stdErr;
    int returnCode = RETURN_CODE_FAILURE;
    double elapsedSeconds = 0.0;
    policy::SecurityLevel securityLevel = policy::SecurityLevel::Blocked;
    // Empty unless status is Blocked.
    std::string blockedReason;
};

struct ExecutionOutcome {
    policy::Decision decision;
    bool evaluated = false;
    ExecutionResult result;
};

} // namespace exec
