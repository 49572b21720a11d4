#pragma once

#include <string>
#include <vector>

class IDatabaseConnection;

struct SchemaValidationResult {
    int currentVersion = 0;
    int requiredVersion = 0;
    std::vector<std::string> appliedMigrations;
};

// Creates the audit schema on an empty database and brings older schemas up
// to date. Throws DatabaseException for a schema newer than this binary.
SchemaValidationResult BootstrapAuditSchemaOrThrow(IDatabaseConnection& db);
