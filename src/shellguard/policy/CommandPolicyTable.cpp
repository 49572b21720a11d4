#include "policy/CommandPolicyTable.hpp"

namespace policy {

CommandPolicyTable CommandPolicyTable::BuildDefault() {
    CommandPolicyTable table;

    for (const auto* command : {"rm", "sudo", "su", "dd", "mkfs", "fdisk", "chmod", "chown",
             "wget", "curl", "nc", "netcat", "telnet"}) {
        table.AddDangerousCommand(command);
    }

    table.AddDangerPattern("pipe to rm", R"(\|\s*rm)");
    table.AddDangerPattern("redirect to block device", R"(>\s*/dev/(sda|sdb))");
    table.AddDangerPattern("fork bomb", R"(:\(\)\{\s*:\|\s*:\s*&\s*\};\s*:)");
    table.AddDangerPattern("recursive forced removal", R"(rm\s+-(rf|fr))");
    table.AddDangerPattern("privileged removal", R"(sudo\s+rm)");
    table.AddDangerPattern("filesystem format of device", R"(mkfs\.?\w*\s+/dev)");
    table.AddDangerPattern("raw write to device", R"(dd\s+.*of=/dev)");

    for (const auto* command : {"ls", "cat", "grep", "find", "pwd", "echo", "date", "whoami",
             "ps", "top", "df", "du", "head", "tail", "wc", "sort", "uniq", "cut", "awk", "sed",
             "tr", "xargs", "which", "whereis", "file", "stat", "dirname", "basename", "realpath",
             "readlink", "env", "printenv", "uptime", "hostname", "uname", "lsb_release",
             "python3", "python", "node", "npm", "pip", "pip3", "git"}) {
        table.AddWhitelistedCommand(command);
    }

    for (const auto* name : {"systemctl", "service", "init", "rc"}) {
        table.AddServiceManagementName(name);
    }

    return table;
}

bool CommandPolicyTable::IsDangerousCommand(const std::string& command) const {
    return dangerousCommands_.find(command) != dangerousCommands_.end();
}

bool CommandPolicyTable::IsWhitelisted(const std::string& command) const {
    return whitelistedCommands_.find(command) != whitelistedCommands_.end();
}

bool CommandPolicyTable::IsServiceManagement(const std::string& command) const {
    for (const auto& name : serviceManagementNames_) {
        if (command.find(name) != std::string::npos) {
            return true;
        }
    }

    return false;
}

const DangerPattern* CommandPolicyTable::MatchDangerPattern(const std::string& rawCommand) const {
    for (const auto& pattern : dangerPatterns_) {
        if (std::regex_search(rawCommand, pattern.expression)) {
            return &pattern;
        }
    }

    return nullptr;
}

void CommandPolicyTable::AddDangerousCommand(const std::string& command) {
    dangerousCommands_.insert(command);
}

void CommandPolicyTable::AddWhitelistedCommand(const std::string& command) {
    whitelistedCommands_.insert(command);
}

void CommandPolicyTable::AddServiceManagementName(const std::string& name) {
    serviceManagementNames_.push_back(name);
}

void CommandPolicyTable::AddDangerPattern(const std::string& description, const std::string& expression) {
    dangerPatterns_.push_back(DangerPattern{description,
        std::regex{expression, std::regex::ECMAScript | std::regex::icase}});
}

} // namespace policy
