#include "DatabaseFactory.hpp"

#include "DatabaseBootstrap.hpp"
#include "DatabaseSqlite.hpp"
#include "ShellGuardConfig.hpp"

#include "easylogging++.h"

#include <sstream>
#include <vector>

namespace {

std::string Join(const std::vector<std::string>& items) {
    if (items.empty()) {
        return "none";
    }

    std::ostringstream out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << items[i];
    }
    return out.str();
}

void LogSchemaStatus(const IDatabaseConnection& db, const std::string& path, const SchemaValidationResult& result) {
    LOG(INFO) << "Audit database backend selected: " << db.BackendName() << " (" << path << ")";
    LOG(INFO) << "Audit schema version: " << result.currentVersion
              << " (required " << result.requiredVersion << ")";
    LOG(INFO) << "Audit migrations applied at startup: " << Join(result.appliedMigrations);
}

} // namespace

std::unique_ptr<IDatabaseConnection> CreateAuditDatabaseConnection(const ShellGuardConfig& config) {
    if (!config.auditEnabled) {
        LOG(INFO) << "Command audit disabled";
        return nullptr;
    }

    if (config.auditDatabasePath.empty()) {
        throw DatabaseException("database", 0,
            "audit_enabled=true requires audit_database_path; set it in shellguard.cfg "
            "(or pass --audit_database_path)");
    }

    std::unique_ptr<IDatabaseConnection> connection =
        std::make_unique<SqliteDatabaseConnection>(config.auditDatabasePath);

    const auto result = BootstrapAuditSchemaOrThrow(*connection);
    LogSchemaStatus(*connection, config.auditDatabasePath, result);

    return connection;
}
