#include "CommandGateway.hpp"

#include "Database.hpp"
#include "ExecutionAuditService.hpp"
#include "exec/SandboxedExecutor.hpp"
#include "scoring/RiskScoringClient.hpp"

#include "easylogging++.h"

#include <sstream>

namespace {

std::string Trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }

    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

// Splits on runs of whitespace into at most maxFields fields; the last field
// keeps the remainder of the line.
std::vector<std::string> SplitFields(const std::string& line, size_t maxFields) {
    std::vector<std::string> fields;
    size_t pos = 0;

    while (fields.size() < maxFields) {
        pos = line.find_first_not_of(" \t", pos);
        if (pos == std::string::npos) {
            break;
        }

        if (fields.size() + 1 == maxFields) {
            fields.push_back(Trim(line.substr(pos)));
            break;
        }

        auto end = line.find_first_of(" \t", pos);
        if (end == std::string::npos) {
            end = line.size();
        }
        fields.push_back(line.substr(pos, end - pos));
        pos = end;
    }

    return fields;
}

std::string SuccessfulOutput(const exec::ExecutionResult& result) {
    if (result.status != exec::ExecutionStatus::Success) {
        return "unknown";
    }

    const auto trimmed = Trim(result.stdOut);
    return trimmed.empty() ? "unknown" : trimmed;
}

} // namespace

std::vector<DirectoryEntry> ParseDirectoryListing(const std::string& output) {
    std::vector<DirectoryEntry> entries;

    std::istringstream lines{output};
    std::string line;
    while (std::getline(lines, line)) {
        const auto fields = SplitFields(line, 9);
        if (fields.size() < 9 || fields[0] == "total") {
            continue;
        }

        DirectoryEntry entry;
        entry.permissions = fields[0];
        entry.links = fields[1];
        entry.owner = fields[2];
        entry.group = fields[3];
        entry.size = fields[4];
        entry.date = fields[5] + " " + fields[6] + " " + fields[7];
        entry.name = fields[8];
        entries.push_back(std::move(entry));
    }

    return entries;
}

CommandGateway::CommandGateway(exec::SandboxedExecutor& executor, const scoring::IRiskScoringClient& scorer,
    ExecutionAuditService* audit)
    : executor_{executor}
    , scorer_{scorer}
    , audit_{audit} {}

policy::Decision CommandGateway::EvaluateOnly(const std::string& command) {
    const auto decision = executor_.Evaluate(command);

    if (audit_) {
        try {
            audit_->RecordEvaluation(command, decision);
        } catch (const DatabaseException& e) {
            LOG(ERROR) << "Failed to audit evaluation of '" << command << "': " << e.what();
        }
    }

    return decision;
}

exec::ExecutionResult CommandGateway::EvaluateAndExecute(
    const std::string& command, const exec::ExecutionOptions& options) {
    const auto outcome = executor_.Execute(command, options);

    if (audit_) {
        try {
            audit_->RecordExecution(command, outcome);
        } catch (const DatabaseException& e) {
            LOG(ERROR) << "Failed to audit execution of '" << command << "': " << e.what();
        }
    }

    return outcome.result;
}

exec::ExecutionResult CommandGateway::RunInternal(const std::string& command) {
    exec::ExecutionOptions options;
    options.interactive = false;
    return EvaluateAndExecute(command, options);
}

SystemInfo CommandGateway::GetSystemInfo() {
    SystemInfo info;

    const auto os = RunInternal("uname -a");
    const auto user = RunInternal("whoami");
    const auto pwd = RunInternal("pwd");

    info.os = SuccessfulOutput(os);
    info.user = SuccessfulOutput(user);
    info.workingDirectory = SuccessfulOutput(pwd);
    info.ok = os.status == exec::ExecutionStatus::Success
        && user.status == exec::ExecutionStatus::Success
        && pwd.status == exec::ExecutionStatus::Success;

    return info;
}

DirectoryListing CommandGateway::ListDirectory(const std::string& path) {
    DirectoryListing listing;
    listing.path = path.empty() ? "." : path;

    if (listing.path.find('\'') != std::string::npos) {
        listing.error = "path must not contain single quotes";
        return listing;
    }

    const auto result = RunInternal("ls -la '" + listing.path + "'");
    if (result.status != exec::ExecutionStatus::Success) {
        listing.error = result.stdErr.empty() ? exec::ToString(result.status) : Trim(result.stdErr);
        return listing;
    }

    listing.entries = ParseDirectoryListing(result.stdOut);
    return listing;
}

exec::ExecutionResult CommandGateway::GetProcessList() {
    return RunInternal("ps aux | head -20");
}

exec::ExecutionResult CommandGateway::GetDiskUsage() {
    return RunInternal("df -h");
}

SecurityCapabilities CommandGateway::GetSecurityCapabilities() const {
    SecurityCapabilities capabilities;
    capabilities.scoringEnabled = scorer_.IsEnabled();

    capabilities.layers = {"pattern_matching", "command_blacklist"};
    if (capabilities.scoringEnabled) {
        capabilities.layers.push_back("risk_scoring_service");
        capabilities.features = {"risk_scoring", "explanation", "alternatives", "confidence"};
    } else {
        capabilities.features = {"basic_blocking"};
    }

    return capabilities;
}
