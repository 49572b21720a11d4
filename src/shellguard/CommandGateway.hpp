#pragma once

#include "exec/ExecutionResult.hpp"
#include "policy/PolicyDecision.hpp"

#include <string>
#include <vector>

class ExecutionAuditService;

namespace exec {
class SandboxedExecutor;
}

namespace scoring {
class IRiskScoringClient;
}

struct SystemInfo {
    std::string os = "unknown";
    std::string user = "unknown";
    std::string workingDirectory = "unknown";
    bool ok = false;
};

struct DirectoryEntry {
    std::string permissions;
    std::string links;
    std::string owner;
    std::string group;
    std::string size;
    std::string date;
    std::string name;
};

struct DirectoryListing {
    std::string path;
    std::vector<DirectoryEntry> entries;
    // Empty on success.
    std::string error;
};

struct SecurityCapabilities {
    bool scoringEnabled = false;
    std::vector<std::string> layers;
    std::vector<std::string> features;
};

// Parses `ls -la` output. The leading "total" line and any line with fewer
// than nine fields are skipped.
std::vector<DirectoryEntry> ParseDirectoryListing(const std::string& output);

/**
 * Public entry point of the gateway. Every operation, including the host
 * introspection helpers, goes through the same admission pipeline and is
 * recorded in the audit store when one is attached.
 */
class CommandGateway {
public:
    CommandGateway(exec::SandboxedExecutor& executor, const scoring::IRiskScoringClient& scorer,
        ExecutionAuditService* audit);

    policy::Decision EvaluateOnly(const std::string& command);

    exec::ExecutionResult EvaluateAndExecute(const std::string& command, const exec::ExecutionOptions& options);

    SystemInfo GetSystemInfo();
    DirectoryListing ListDirectory(const std::string& path);
    exec::ExecutionResult GetProcessList();
    exec::ExecutionResult GetDiskUsage();
    SecurityCapabilities GetSecurityCapabilities() const;

private:
    exec::ExecutionResult RunInternal(const std::string& command);

    exec::SandboxedExecutor& executor_;
    const scoring::IRiskScoringClient& scorer_;
    ExecutionAuditService* audit_;
};
