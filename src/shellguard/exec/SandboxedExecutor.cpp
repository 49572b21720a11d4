#include "exec/SandboxedExecutor.hpp"

#include "ConfigurationException.hpp"
#include "exec/ConfirmationPrompt.hpp"
#include "exec/ProcessRunner.hpp"
#include "policy/CommandSanitizer.hpp"
#include "policy/DecisionEngine.hpp"
#include "policy/PatternClassifier.hpp"
#include "scoring/RiskScoringClient.hpp"

#include "easylogging++.h"

#include <sys/utsname.h>

#include <cstdlib>
#include <stdexcept>

namespace exec {

const char OUTPUT_TRUNCATED_MARKER[] = "\n[Output truncated]";
const char ERROR_TRUNCATED_MARKER[] = "\n[Error truncated]";

namespace {

using Clock = std::chrono::steady_clock;

bool Canonicalize(const std::string& path, std::string& canonical) {
    char* resolved = realpath(path.c_str(), nullptr);
    if (resolved == nullptr) {
        return false;
    }

    canonical = resolved;
    std::free(resolved);
    return true;
}

bool IsWithinRoot(const std::string& path, const std::string& root) {
    if (path == root) {
        return true;
    }
    if (root == "/") {
        return !path.empty() && path.front() == '/';
    }

    return path.size() > root.size()
        && path.compare(0, root.size(), root) == 0
        && path[root.size()] == '/';
}

std::string InvokingUser() {
    const char* user = std::getenv("USER");
    return (user != nullptr && *user != '\0') ? user : "unknown";
}

std::string HostType() {
    utsname info;
    if (uname(&info) == 0) {
        return info.sysname;
    }
    return "posix";
}

double SecondsSince(const Clock::time_point& start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

void Transition(const std::string& command, ExecutionState& state, ExecutionState next) {
    VLOG(1) << "[" << command << "] " << ToString(state) << " -> " << ToString(next);
    state = next;
}

} // namespace

const char* ToString(ExecutionState state) {
    switch (state) {
    case ExecutionState::Received:
        return "RECEIVED";
    case ExecutionState::Analyzed:
        return "ANALYZED";
    case ExecutionState::Blocked:
        return "BLOCKED";
    case ExecutionState::AwaitConfirmation:
        return "AWAIT_CONFIRMATION";
    case ExecutionState::Cancelled:
        return "CANCELLED";
    case ExecutionState::Confirmed:
        return "CONFIRMED";
    case ExecutionState::Executing:
        return "EXECUTING";
    case ExecutionState::Completed:
        return "COMPLETED";
    case ExecutionState::TimedOut:
        return "TIMED_OUT";
    case ExecutionState::Failed:
        return "FAILED";
    }

    return "UNKNOWN";
}

SandboxedExecutor::SandboxedExecutor(const ExecutorConfig& config,
    const policy::PatternClassifier& classifier,
    scoring::IRiskScoringClient& scorer,
    const policy::DecisionEngine& engine,
    IConfirmationPrompt* prompt)
    : defaultTimeout_{config.defaultTimeout}
    , maxOutputBytes_{config.maxOutputBytes}
    , classifier_{classifier}
    , scorer_{scorer}
    , engine_{engine}
    , prompt_{prompt} {
    if (maxOutputBytes_ == 0) {
        throw std::invalid_argument("max output bytes must be greater than zero");
    }

    if (defaultTimeout_.count() <= 0) {
        throw std::invalid_argument("default timeout must be greater than zero seconds");
    }

    if (config.rootDirectory.empty()) {
        throw ConfigurationException("root directory is not set");
    }

    if (!Canonicalize(config.rootDirectory, rootDirectory_)) {
        throw ConfigurationException("root directory '" + config.rootDirectory + "' cannot be resolved");
    }
}

bool SandboxedExecutor::ResolveWorkingDirectory(
    const std::string& requested, std::string& resolved, std::string& error) const {
    if (requested.empty()) {
        resolved = rootDirectory_;
        return true;
    }

    const auto candidate = requested.front() == '/' ? requested : rootDirectory_ + "/" + requested;

    std::string canonical;
    if (!Canonicalize(candidate, canonical)) {
        error = "working directory '" + requested + "' does not exist";
        return false;
    }

    if (!IsWithinRoot(canonical, rootDirectory_)) {
        error = "working directory '" + requested + "' is outside of " + rootDirectory_;
        return false;
    }

    resolved = canonical;
    return true;
}

SandboxedExecutor::Assessment SandboxedExecutor::Assess(
    const std::string& command, const std::string& workingDirectory) {
    Assessment assessment;

    const auto classification = classifier_.Explain(command);
    VLOG(1) << "Pattern verdict for '" << command << "': " << policy::ToString(classification.level) << " ("
            << classification.rule << ")";

    scoring::ScoringContext context;
    context.workingDirectory = workingDirectory;
    context.user = InvokingUser();
    context.hostType = HostType();

    assessment.analysis = scorer_.Analyze(command, context);
    assessment.decision = engine_.Combine(classification.level, assessment.analysis);

    LOG(INFO) << "Decision for '" << command << "': " << policy::ToString(assessment.decision.finalLevel)
              << " score=" << assessment.decision.riskScore << " pattern="
              << policy::ToString(assessment.decision.patternLevel) << " confirm="
              << (assessment.decision.requiresConfirmation ? "yes" : "no");

    return assessment;
}

policy::Decision SandboxedExecutor::Evaluate(const std::string& command) {
    return Assess(command, rootDirectory_).decision;
}

ExecutionResult SandboxedExecutor::Run(const std::string& command, const ExecutionOptions& options) {
    return Execute(command, options).result;
}

ExecutionOutcome SandboxedExecutor::Execute(const std::string& command, const ExecutionOptions& options) {
    const auto start = Clock::now();

    ExecutionOutcome outcome;
    auto& result = outcome.result;
    result.command = command;

    std::string workingDirectory;
    std::string validationError;
    if (!ResolveWorkingDirectory(options.workingDirectory, workingDirectory, validationError)) {
        LOG(WARNING) << "Rejected '" << command << "': " << validationError;
        result.status = ExecutionStatus::Error;
        result.returnCode = RETURN_CODE_FAILURE;
        result.stdErr = validationError;
        result.elapsedSeconds = SecondsSince(start);
        return outcome;
    }

    const auto assessment = Assess(command, workingDirectory);
    const auto& decision = assessment.decision;
    outcome.decision = decision;
    outcome.evaluated = true;
    result.securityLevel = decision.finalLevel;

    auto state = ExecutionState::Received;
    Transition(command, state, ExecutionState::Analyzed);

    if (decision.finalLevel == policy::SecurityLevel::Blocked) {
        Transition(command, state, ExecutionState::Blocked);
        LOG(WARNING) << "Blocked '" << command << "': " << decision.reason;
        result.status = ExecutionStatus::Blocked;
        result.returnCode = RETURN_CODE_POLICY_BLOCKED;
        result.stdErr = "command blocked: " + decision.reason;
        result.blockedReason = decision.reason;
        result.elapsedSeconds = SecondsSince(start);
        return outcome;
    }

    if (NeedsConfirmation(decision, options)) {
        Transition(command, state, ExecutionState::AwaitConfirmation);

        ConfirmationRequest request;
        request.command = command;
        request.decision = decision;

        if (prompt_ == nullptr || !prompt_->Confirm(request)) {
            Transition(command, state, ExecutionState::Cancelled);
            LOG(INFO) << "User cancelled '" << command << "'";
            result.status = ExecutionStatus::Blocked;
            result.returnCode = RETURN_CODE_USER_CANCELLED;
            result.stdErr = "command cancelled by user";
            result.blockedReason = "user cancelled";
            result.elapsedSeconds = SecondsSince(start);
            return outcome;
        }

        Transition(command, state, ExecutionState::Confirmed);
    }

    const auto timeout = options.timeoutSeconds > 0 ? std::chrono::seconds(options.timeoutSeconds) : defaultTimeout_;
    if (assessment.analysis.recommendedTimeoutSeconds != timeout.count()) {
        VLOG(1) << "Ignoring recommended timeout of " << assessment.analysis.recommendedTimeoutSeconds
                << "s in favour of " << timeout.count() << "s";
    }

    ProcessRunRequest runRequest;
    runRequest.command = policy::SanitizeCommand(command);
    runRequest.workingDirectory = workingDirectory;
    runRequest.timeout = timeout;
    runRequest.captureLimit = maxOutputBytes_;
    result.command = runRequest.command;

    Transition(command, state, ExecutionState::Executing);
    const auto run = RunShellCommand(runRequest);
    result.elapsedSeconds = SecondsSince(start);

    switch (run.state) {
    case ProcessRunState::TimedOut:
        Transition(command, state, ExecutionState::TimedOut);
        LOG(WARNING) << "Timed out '" << runRequest.command << "' after " << timeout.count() << "s";
        result.status = ExecutionStatus::Timeout;
        result.returnCode = RETURN_CODE_TIMEOUT;
        result.stdOut.clear();
        result.stdErr = "timed out after " + std::to_string(timeout.count()) + "s";
        break;

    case ProcessRunState::SpawnFailed:
        Transition(command, state, ExecutionState::Failed);
        LOG(ERROR) << "Failed to spawn '" << runRequest.command << "': " << run.error;
        result.status = ExecutionStatus::Error;
        result.returnCode = RETURN_CODE_FAILURE;
        result.stdErr = run.error;
        break;

    case ProcessRunState::Completed:
        Transition(command, state, ExecutionState::Completed);
        result.returnCode = run.exitCode;
        result.status = run.exitCode == 0 ? ExecutionStatus::Success : ExecutionStatus::Error;
        result.stdOut = Truncate(run.stdOut, run.stdOutTruncated, OUTPUT_TRUNCATED_MARKER);
        result.stdErr = Truncate(run.stdErr, run.stdErrTruncated, ERROR_TRUNCATED_MARKER);
        break;
    }

    return outcome;
}

bool SandboxedExecutor::NeedsConfirmation(const policy::Decision& decision, const ExecutionOptions& options) const {
    if (!options.interactive) {
        return false;
    }

    if (decision.finalLevel != policy::SecurityLevel::Caution
        && decision.finalLevel != policy::SecurityLevel::Restricted) {
        return false;
    }

    return decision.requiresConfirmation && decision.riskScore > 30;
}

std::string SandboxedExecutor::Truncate(const std::string& output, bool truncated, const char* marker) const {
    if (!truncated && output.size() <= maxOutputBytes_) {
        return output;
    }

    return output.substr(0, maxOutputBytes_) + marker;
}

} // namespace exec
