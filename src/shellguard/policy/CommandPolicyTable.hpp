#pragma once

#include <regex>
#include <string>
#include <unordered_set>
#include <vector>

namespace policy {

struct DangerPattern {
    std::string description;
    std::regex expression;
};

// The one table every rule-based check reads from. Built once and shared
// read-only; lookups never mutate it.
class CommandPolicyTable {
public:
    static CommandPolicyTable BuildDefault();

    bool IsDangerousCommand(const std::string& command) const;
    bool IsWhitelisted(const std::string& command) const;
    bool IsServiceManagement(const std::string& command) const;

    // Returns the first pattern matching the raw command, or nullptr.
    const DangerPattern* MatchDangerPattern(const std::string& rawCommand) const;

    void AddDangerousCommand(const std::string& command);
    void AddWhitelistedCommand(const std::string& command);
    void AddServiceManagementName(const std::string& name);
    void AddDangerPattern(const std::string& description, const std::string& expression);

private:
    std::unordered_set<std::string> dangerousCommands_;
    std::unordered_set<std::string> whitelistedCommands_;
    std::vector<std::string> serviceManagementNames_;
    std::vector<DangerPattern> dangerPatterns_;
};

} // namespace policy
