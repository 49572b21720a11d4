#include "catch.hpp"

#include "Database.hpp"
#include "DatabaseBootstrap.hpp"
#include "DatabaseFactory.hpp"
#include "DatabaseSqlite.hpp"
#include "ExecutionAuditService.hpp"
#include "ShellGuardConfig.hpp"

#include "TestSupport.hpp"

using policy::SecurityLevel;

namespace {

policy::Decision BlockedDecision() {
    policy::Decision decision;
    decision.finalLevel = SecurityLevel::Blocked;
    decision.patternLevel = SecurityLevel::Blocked;
    decision.riskScore = 90;
    decision.reason = "blocked by rule engine and risk analysis";
    return decision;
}

exec::ExecutionOutcome SuccessfulOutcome() {
    exec::ExecutionOutcome outcome;
    outcome.evaluated = true;
    outcome.decision.finalLevel = SecurityLevel::Caution;
    outcome.decision.patternLevel = SecurityLevel::Safe;
    outcome.decision.riskScore = 50;
    outcome.decision.reason = "combined analysis";
    outcome.result.command = "ls -la";
    outcome.result.status = exec::ExecutionStatus::Success;
    outcome.result.returnCode = 0;
    outcome.result.elapsedSeconds = 0.25;
    outcome.result.securityLevel = SecurityLevel::Caution;
    return outcome;
}

} // namespace

SCENARIO("the audit schema is created on first use", "[database][audit]") {
    SqliteDatabaseConnection db{":memory:"};

    const auto first = BootstrapAuditSchemaOrThrow(db);
    REQUIRE(first.currentVersion == 1);
    REQUIRE(first.requiredVersion == 1);
    REQUIRE(first.appliedMigrations == std::vector<std::string>{"V001__command_audit"});

    WHEN("it is bootstrapped again") {
        const auto second = BootstrapAuditSchemaOrThrow(db);

        THEN("nothing is reapplied") {
            REQUIRE(second.currentVersion == 1);
            REQUIRE(second.appliedMigrations.empty());
        }
    }
}

SCENARIO("a schema newer than the binary is refused", "[database][audit]") {
    SqliteDatabaseConnection db{":memory:"};
    BootstrapAuditSchemaOrThrow(db);

    db.Execute("UPDATE schema_version SET version = 99");

    REQUIRE_THROWS_AS(BootstrapAuditSchemaOrThrow(db), DatabaseException);
}

SCENARIO("decisions and executions are recorded newest first", "[database][audit]") {
    SqliteDatabaseConnection db{":memory:"};
    BootstrapAuditSchemaOrThrow(db);
    ExecutionAuditService audit{&db};

    const auto firstId = audit.RecordEvaluation("sudo reboot", BlockedDecision());
    const auto secondId = audit.RecordExecution("ls -la", SuccessfulOutcome());
    REQUIRE(secondId > firstId);

    const auto entries = audit.RecentEntries(10);
    REQUIRE(entries.size() == 2);

    const auto& execution = entries[0];
    REQUIRE(execution.id == secondId);
    REQUIRE(execution.command == "ls -la");
    REQUIRE(execution.mode == "execute");
    REQUIRE(execution.patternLevel == "SAFE");
    REQUIRE(execution.finalLevel == "CAUTION");
    REQUIRE(execution.riskScore == 50);
    REQUIRE(execution.status == "success");
    REQUIRE(execution.returnCode == 0);
    REQUIRE(execution.elapsedMs == 250);
    REQUIRE(execution.recordedAt > 0);

    const auto& evaluation = entries[1];
    REQUIRE(evaluation.mode == "evaluate");
    REQUIRE(evaluation.finalLevel == "BLOCKED");
    REQUIRE(evaluation.riskScore == 90);
    REQUIRE(evaluation.status == "evaluated");
    REQUIRE(evaluation.reason == "blocked by rule engine and risk analysis");

    REQUIRE(audit.RecentEntries(1).size() == 1);
    REQUIRE(audit.RecentEntries(1).front().id == secondId);
}

SCENARIO("rejected requests are recorded without a decision", "[database][audit]") {
    SqliteDatabaseConnection db{":memory:"};
    BootstrapAuditSchemaOrThrow(db);
    ExecutionAuditService audit{&db};

    exec::ExecutionOutcome outcome;
    outcome.result.command = "pwd";
    outcome.result.stdErr = "working directory '/' is outside of /srv";

    audit.RecordExecution("pwd", outcome);

    const auto entries = audit.RecentEntries(5);
    REQUIRE(entries.size() == 1);
    REQUIRE(entries[0].finalLevel == "-");
    REQUIRE(entries[0].status == "error");
    REQUIRE(entries[0].returnCode == 1);
    REQUIRE(entries[0].reason == "working directory '/' is outside of /srv");
}

SCENARIO("cancelled executions keep the cancellation as their reason", "[database][audit]") {
    SqliteDatabaseConnection db{":memory:"};
    BootstrapAuditSchemaOrThrow(db);
    ExecutionAuditService audit{&db};

    auto outcome = SuccessfulOutcome();
    outcome.result.status = exec::ExecutionStatus::Blocked;
    outcome.result.returnCode = 130;
    outcome.result.blockedReason = "user cancelled";

    audit.RecordExecution("ls -la", outcome);

    const auto entry = audit.RecentEntries(1).front();
    REQUIRE(entry.status == "blocked");
    REQUIRE(entry.returnCode == 130);
    REQUIRE(entry.reason == "user cancelled");
}

SCENARIO("the audit connection follows configuration", "[database][audit]") {
    ShellGuardConfig config;

    WHEN("auditing is disabled") {
        config.auditEnabled = false;

        THEN("no connection is opened") {
            REQUIRE(CreateAuditDatabaseConnection(config) == nullptr);
        }
    }

    WHEN("auditing is enabled without a path") {
        config.auditEnabled = true;
        config.auditDatabasePath.clear();

        THEN("configuration is rejected") {
            REQUIRE_THROWS_AS(CreateAuditDatabaseConnection(config), DatabaseException);
        }
    }

    WHEN("auditing is enabled with a file path") {
        testing::TemporaryDirectory directory;
        config.auditEnabled = true;
        config.auditDatabasePath = directory.Path() + "/audit.db";

        auto connection = CreateAuditDatabaseConnection(config);

        THEN("a bootstrapped SQLite database is returned") {
            REQUIRE(connection != nullptr);
            REQUIRE(connection->BackendName() == "sqlite");

            ExecutionAuditService audit{connection.get()};
            audit.RecordEvaluation("pwd", BlockedDecision());
            REQUIRE(audit.RecentEntries(10).size() == 1);
        }
    }
}
