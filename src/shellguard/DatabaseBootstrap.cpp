#include "DatabaseBootstrap.hpp"

#include "Database.hpp"

#include <utility>

namespace {
constexpr int kRequiredSchemaVersion = 1;

struct Migration {
    int version;
    std::string name;
    std::vector<std::string> statements;
};

std::vector<Migration> MigrationCatalog() {
    return {
        {1, "V001__command_audit",
            {
                "CREATE TABLE IF NOT EXISTS command_audit ("
                "id INTEGER PRIMARY KEY AUTOINCREMENT, "
                "recorded_at INTEGER NOT NULL, "
                "command TEXT NOT NULL, "
                "mode TEXT NOT NULL, "
                "pattern_level TEXT NOT NULL, "
                "final_level TEXT NOT NULL, "
                "risk_score INTEGER NOT NULL, "
                "reason TEXT NOT NULL, "
                "status TEXT NOT NULL, "
                "return_code INTEGER NOT NULL, "
                "elapsed_ms INTEGER NOT NULL)",
                "CREATE INDEX IF NOT EXISTS command_audit_recorded_at ON command_audit (recorded_at)",
            }},
    };
}

bool TableExists(IDatabaseConnection& db, const std::string& tableName) {
    StatementHandle stmt{db.Prepare("SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = @table_name")};
    stmt.BindText("@table_name", tableName);
    return stmt.Step() == StatementStepResult::Row;
}

int ReadSchemaVersion(IDatabaseConnection& db) {
    StatementHandle stmt{db.Prepare("SELECT version FROM schema_version LIMIT 1")};
    if (stmt.Step() != StatementStepResult::Row) {
        return 0;
    }

    return static_cast<int>(stmt->ColumnInt(0));
}

void WriteSchemaVersion(IDatabaseConnection& db, int version) {
    db.Execute("DELETE FROM schema_version");

    StatementHandle stmt{db.Prepare("INSERT INTO schema_version (version) VALUES (@version)")};
    stmt.BindInt("@version", version);
    stmt.ExpectDone("schema version update");
}

} // namespace

SchemaValidationResult BootstrapAuditSchemaOrThrow(IDatabaseConnection& db) {
    const auto migrations = MigrationCatalog();
    const int latestKnownVersion = migrations.back().version;

    TransactionScope transaction{db.BeginTransaction()};

    if (!TableExists(db, "schema_version")) {
        db.Execute("CREATE TABLE schema_version (version INTEGER NOT NULL)");
    }

    const int currentVersion = ReadSchemaVersion(db);

    if (currentVersion > latestKnownVersion) {
        throw DatabaseException(db.BackendName(), 0,
            "audit schema version " + std::to_string(currentVersion)
                + " is newer than this binary supports (latest known migration: "
                + std::to_string(latestKnownVersion) + "). Deploy a newer shellguard binary");
    }

    SchemaValidationResult result;
    result.requiredVersion = kRequiredSchemaVersion;
    result.currentVersion = currentVersion;

    for (const auto& migration : migrations) {
        if (migration.version <= currentVersion) {
            continue;
        }

        for (const auto& statement : migration.statements) {
            db.Execute(statement);
        }

        result.appliedMigrations.push_back(migration.name);
        result.currentVersion = migration.version;
    }

    if (result.currentVersion != currentVersion) {
        WriteSchemaVersion(db, result.currentVersion);
    }

    transaction.Commit();
    return result;
}
