#pragma once

#include "Database.hpp"

#include <memory>

struct ShellGuardConfig;

// Returns nullptr when auditing is disabled.
std::unique_ptr<IDatabaseConnection> CreateAuditDatabaseConnection(const ShellGuardConfig& config);
