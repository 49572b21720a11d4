#pragma once

#include "exec/ExecutionResult.hpp"
#include "policy/PolicyDecision.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

class IDatabaseConnection;

struct AuditEntry {
    uint64_t id = 0;
    int64_t recordedAt = 0;
    std::string command;
    std::string mode;
    std::string patternLevel;
    std::string finalLevel;
    int riskScore = 0;
    std::string reason;
    std::string status;
    int returnCode = 0;
    int64_t elapsedMs = 0;
};

class ExecutionAuditService {
public:
    explicit ExecutionAuditService(IDatabaseConnection* db);

    uint64_t RecordEvaluation(const std::string& command, const policy::Decision& decision);
    uint64_t RecordExecution(const std::string& command, const exec::ExecutionOutcome& outcome);

    // Newest first.
    std::vector<AuditEntry> RecentEntries(int limit);

private:
    uint64_t Insert(const AuditEntry& entry);

    IDatabaseConnection* db_;
    std::mutex mutex_;
};
