#include "catch.hpp"

#include "CommandGateway.hpp"
#include "Database.hpp"
#include "DatabaseBootstrap.hpp"
#include "DatabaseSqlite.hpp"
#include "ExecutionAuditService.hpp"
#include "exec/SandboxedExecutor.hpp"
#include "policy/DecisionEngine.hpp"
#include "policy/PatternClassifier.hpp"
#include "scoring/RiskScoringClient.hpp"

#include "TestSupport.hpp"

using exec::ExecutionStatus;
using policy::SecurityLevel;

namespace {

// Every write fails, as a full or read-only disk would.
class UnwritableConnection final : public IDatabaseConnection {
public:
    std::unique_ptr<IStatement> Prepare(const std::string&) override {
        throw DatabaseException("sqlite", 8, "attempt to write a readonly database");
    }
    std::unique_ptr<ITransaction> BeginTransaction() override {
        throw DatabaseException("sqlite", 8, "attempt to write a readonly database");
    }
    void Execute(const std::string&) override {
        throw DatabaseException("sqlite", 8, "attempt to write a readonly database");
    }
    uint64_t GetLastInsertId() const override { return 0; }
    std::string BackendName() const override { return "sqlite"; }
};

struct GatewayFixture {
    GatewayFixture()
        : classifier{policy::CommandPolicyTable::BuildDefault()}
        , scorer{scoring::ScoringConfig{}, nullptr}
        , executor{MakeConfig(root.Path()), classifier, scorer, engine, nullptr}
        , db{":memory:"}
        , audit{&db}
        , gateway{executor, scorer, &audit} {
        BootstrapAuditSchemaOrThrow(db);
    }

    static exec::ExecutorConfig MakeConfig(const std::string& rootDirectory) {
        exec::ExecutorConfig config;
        config.rootDirectory = rootDirectory;
        config.defaultTimeout = std::chrono::seconds(10);
        return config;
    }

    testing::TemporaryDirectory root;
    policy::PatternClassifier classifier;
    scoring::RiskScoringClient scorer;
    policy::DecisionEngine engine;
    exec::SandboxedExecutor executor;
    SqliteDatabaseConnection db;
    ExecutionAuditService audit;
    CommandGateway gateway;
};

} // namespace

SCENARIO("a dry run evaluates without executing and is audited", "[gateway]") {
    GatewayFixture fixture;

    const auto decision = fixture.gateway.EvaluateOnly("sudo reboot");

    REQUIRE(decision.finalLevel == SecurityLevel::Blocked);
    REQUIRE(decision.riskScore == 90);

    const auto entries = fixture.audit.RecentEntries(10);
    REQUIRE(entries.size() == 1);
    REQUIRE(entries[0].mode == "evaluate");
    REQUIRE(entries[0].command == "sudo reboot");
}

SCENARIO("repeated dry runs give identical decisions", "[gateway]") {
    GatewayFixture fixture;

    REQUIRE(fixture.gateway.EvaluateOnly("ls -la") == fixture.gateway.EvaluateOnly("ls -la"));
    REQUIRE(fixture.gateway.EvaluateOnly("rm -rf /tmp/x") == fixture.gateway.EvaluateOnly("rm -rf /tmp/x"));
}

SCENARIO("executions are returned and audited", "[gateway]") {
    GatewayFixture fixture;

    const auto allowed = fixture.gateway.EvaluateAndExecute("echo hello", exec::ExecutionOptions{});
    const auto blocked = fixture.gateway.EvaluateAndExecute("rm -rf /tmp/x", exec::ExecutionOptions{});

    REQUIRE(allowed.status == ExecutionStatus::Success);
    REQUIRE(allowed.stdOut == "hello\n");
    REQUIRE(blocked.status == ExecutionStatus::Blocked);
    REQUIRE(blocked.returnCode == 126);

    const auto entries = fixture.audit.RecentEntries(10);
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[0].command == "rm -rf /tmp/x");
    REQUIRE(entries[0].status == "blocked");
    REQUIRE(entries[0].returnCode == 126);
    REQUIRE(entries[1].command == "echo hello");
    REQUIRE(entries[1].status == "success");
}

SCENARIO("an audit failure does not lose the result", "[gateway]") {
    testing::TemporaryDirectory root;
    policy::PatternClassifier classifier{policy::CommandPolicyTable::BuildDefault()};
    scoring::RiskScoringClient scorer{scoring::ScoringConfig{}, nullptr};
    policy::DecisionEngine engine;
    exec::SandboxedExecutor executor{GatewayFixture::MakeConfig(root.Path()), classifier, scorer, engine, nullptr};
    UnwritableConnection db;
    ExecutionAuditService audit{&db};
    CommandGateway gateway{executor, scorer, &audit};

    const auto result = gateway.EvaluateAndExecute("echo still-here", exec::ExecutionOptions{});
    REQUIRE(result.status == ExecutionStatus::Success);
    REQUIRE(result.stdOut == "still-here\n");

    REQUIRE(gateway.EvaluateOnly("sudo ls").finalLevel == SecurityLevel::Blocked);
}

SCENARIO("the gateway works without an audit store", "[gateway]") {
    testing::TemporaryDirectory root;
    policy::PatternClassifier classifier{policy::CommandPolicyTable::BuildDefault()};
    scoring::RiskScoringClient scorer{scoring::ScoringConfig{}, nullptr};
    policy::DecisionEngine engine;
    exec::SandboxedExecutor executor{GatewayFixture::MakeConfig(root.Path()), classifier, scorer, engine, nullptr};
    CommandGateway gateway{executor, scorer, nullptr};

    REQUIRE(gateway.EvaluateAndExecute("echo ok", exec::ExecutionOptions{}).stdOut == "ok\n");
}

SCENARIO("ls -la output is parsed into directory entries", "[gateway]") {
    const std::string output =
        "total 12\n"
        "drwxr-xr-x  3 alice staff 4096 Jan  2 10:00 .\n"
        "drwxr-xr-x 10 alice staff 4096 Jan  1 09:00 ..\n"
        "-rw-r--r--  1 alice staff   42 Mar 14  2023 my notes.txt\n"
        "garbage line\n";

    const auto entries = ParseDirectoryListing(output);

    REQUIRE(entries.size() == 3);
    REQUIRE(entries[0].name == ".");
    REQUIRE(entries[2].permissions == "-rw-r--r--");
    REQUIRE(entries[2].links == "1");
    REQUIRE(entries[2].owner == "alice");
    REQUIRE(entries[2].group == "staff");
    REQUIRE(entries[2].size == "42");
    REQUIRE(entries[2].date == "Mar 14 2023");
    REQUIRE(entries[2].name == "my notes.txt");
}

SCENARIO("directories are listed through the policy pipeline", "[gateway]") {
    GatewayFixture fixture;
    fixture.root.WriteFile("report.csv", "a,b\n");

    WHEN("the gateway root is listed") {
        const auto listing = fixture.gateway.ListDirectory(fixture.root.Path());

        THEN("its files are returned") {
            REQUIRE(listing.error.empty());
            bool found = false;
            for (const auto& entry : listing.entries) {
                found |= entry.name == "report.csv";
            }
            REQUIRE(found);
            REQUIRE(fixture.audit.RecentEntries(10).size() == 1);
        }
    }

    WHEN("the directory does not exist") {
        const auto listing = fixture.gateway.ListDirectory(fixture.root.Path() + "/missing");

        THEN("the error is reported") {
            REQUIRE(listing.entries.empty());
            REQUIRE_FALSE(listing.error.empty());
        }
    }

    WHEN("the path would break out of its quotes") {
        const auto listing = fixture.gateway.ListDirectory("x'; id; echo '");

        THEN("it is refused before anything runs") {
            REQUIRE_FALSE(listing.error.empty());
            REQUIRE(fixture.audit.RecentEntries(10).empty());
        }
    }
}

SCENARIO("system information is gathered from the host", "[gateway]") {
    GatewayFixture fixture;

    const auto info = fixture.gateway.GetSystemInfo();

    REQUIRE(info.os != "unknown");
    REQUIRE(info.workingDirectory == fixture.executor.RootDirectory());
    REQUIRE(fixture.audit.RecentEntries(10).size() == 3);
}

SCENARIO("process and disk reports are routed through the policy", "[gateway]") {
    GatewayFixture fixture;

    const auto processes = fixture.gateway.GetProcessList();
    const auto disks = fixture.gateway.GetDiskUsage();

    REQUIRE(processes.status != ExecutionStatus::Blocked);
    REQUIRE(processes.command == "ps aux | head -20");
    REQUIRE(disks.status != ExecutionStatus::Blocked);
    REQUIRE(disks.command == "df -h");
}

SCENARIO("capabilities reflect whether a scoring service is configured", "[gateway]") {
    GIVEN("no scoring service") {
        GatewayFixture fixture;
        const auto capabilities = fixture.gateway.GetSecurityCapabilities();

        REQUIRE_FALSE(capabilities.scoringEnabled);
        REQUIRE(capabilities.layers == std::vector<std::string>{"pattern_matching", "command_blacklist"});
        REQUIRE(capabilities.features == std::vector<std::string>{"basic_blocking"});
    }

    GIVEN("a scoring service") {
        testing::TemporaryDirectory root;
        policy::PatternClassifier classifier{policy::CommandPolicyTable::BuildDefault()};
        testing::FakeRiskScoringClient scorer{testing::MakeAnalysis(SecurityLevel::Safe, 5.0, false)};
        policy::DecisionEngine engine;
        exec::SandboxedExecutor executor{GatewayFixture::MakeConfig(root.Path()), classifier, scorer, engine,
            nullptr};
        CommandGateway gateway{executor, scorer, nullptr};

        const auto capabilities = gateway.GetSecurityCapabilities();

        REQUIRE(capabilities.scoringEnabled);
        REQUIRE(capabilities.layers.size() == 3);
        REQUIRE(capabilities.layers.back() == "risk_scoring_service");
        REQUIRE(capabilities.features.front() == "risk_scoring");
    }
}
