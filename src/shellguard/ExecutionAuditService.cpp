#include "ExecutionAuditService.hpp"

#include "Database.hpp"

#include <chrono>
#include <cmath>

namespace {

int64_t NowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

ExecutionAuditService::ExecutionAuditService(IDatabaseConnection* db)
    : db_{db} {}

uint64_t ExecutionAuditService::RecordEvaluation(const std::string& command, const policy::Decision& decision) {
    AuditEntry entry;
    entry.command = command;
    entry.mode = "evaluate";
    entry.patternLevel = policy::ToString(decision.patternLevel);
    entry.finalLevel = policy::ToString(decision.finalLevel);
    entry.riskScore = decision.riskScore;
    entry.reason = decision.reason;
    entry.status = "evaluated";
    entry.returnCode = 0;

    return Insert(entry);
}

uint64_t ExecutionAuditService::RecordExecution(const std::string& command, const exec::ExecutionOutcome& outcome) {
    const auto& result = outcome.result;

    AuditEntry entry;
    entry.command = command;
    entry.mode = "execute";
    if (outcome.evaluated) {
        entry.patternLevel = policy::ToString(outcome.decision.patternLevel);
        entry.finalLevel = policy::ToString(outcome.decision.finalLevel);
        entry.riskScore = outcome.decision.riskScore;
        entry.reason = outcome.decision.reason;
    } else {
        entry.patternLevel = "-";
        entry.finalLevel = "-";
        entry.reason = result.stdErr;
    }
    if (!result.blockedReason.empty()) {
        entry.reason = result.blockedReason;
    }
    entry.status = exec::ToString(result.status);
    entry.returnCode = result.returnCode;
    entry.elapsedMs = static_cast<int64_t>(std::llround(result.elapsedSeconds * 1000.0));

    return Insert(entry);
}

uint64_t ExecutionAuditService::Insert(const AuditEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    TransactionScope transaction{db_->BeginTransaction()};

    StatementHandle stmt{db_->Prepare(
        "INSERT INTO command_audit (recorded_at, command, mode, pattern_level, final_level, risk_score, "
        "reason, status, return_code, elapsed_ms) VALUES (@recorded_at, @command, @mode, @pattern_level, "
        "@final_level, @risk_score, @reason, @status, @return_code, @elapsed_ms)")};

    stmt.BindInt("@recorded_at", entry.recordedAt != 0 ? entry.recordedAt : NowSeconds());
    stmt.BindText("@command", entry.command);
    stmt.BindText("@mode", entry.mode);
    stmt.BindText("@pattern_level", entry.patternLevel);
    stmt.BindText("@final_level", entry.finalLevel);
    stmt.BindInt("@risk_score", entry.riskScore);
    stmt.BindText("@reason", entry.reason);
    stmt.BindText("@status", entry.status);
    stmt.BindInt("@return_code", entry.returnCode);
    stmt.BindInt("@elapsed_ms", entry.elapsedMs);
    stmt.ExpectDone("audit insert");

    const auto id = db_->GetLastInsertId();
    transaction.Commit();
    return id;
}

std::vector<AuditEntry> ExecutionAuditService::RecentEntries(int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AuditEntry> entries;

    StatementHandle stmt{db_->Prepare(
        "SELECT id, recorded_at, command, mode, pattern_level, final_level, risk_score, reason, status, "
        "return_code, elapsed_ms FROM command_audit ORDER BY id DESC LIMIT @limit")};
    stmt.BindInt("@limit", limit);

    while (stmt.Step() == StatementStepResult::Row) {
        AuditEntry entry;
        entry.id = static_cast<uint64_t>(stmt->ColumnInt(0));
        entry.recordedAt = stmt->ColumnInt(1);
        entry.command = stmt->ColumnText(2);
        entry.mode = stmt->ColumnText(3);
        entry.patternLevel = stmt->ColumnText(4);
        entry.finalLevel = stmt->ColumnText(5);
        entry.riskScore = static_cast<int>(stmt->ColumnInt(6));
        entry.reason = stmt->ColumnText(7);
        entry.status = stmt->ColumnText(8);
        entry.returnCode = static_cast<int>(stmt->ColumnInt(9));
        entry.elapsedMs = stmt->ColumnInt(10);
        entries.push_back(std::move(entry));
    }

    return entries;
}
