#pragma once

#include <string>

namespace policy {

// Ordered: a higher value is always at least as restrictive.
enum class SecurityLevel {
    Safe = 0,
    Caution = 1,
    Restricted = 2,
    Blocked = 3,
};

inline const char* ToString(SecurityLevel level) {
    switch (level) {
    case SecurityLevel::Safe:
        return "SAFE";
    case SecurityLevel::Caution:
        return "CAUTION";
    case SecurityLevel::Restricted:
        return "RESTRICTED";
    case SecurityLevel::Blocked:
        return "BLOCKED";
    }

    return "CAUTION";
}

// Maps the scoring service's five-step scale (and our own names) onto the
// four canonical levels. Unrecognized text is treated as CAUTION.
SecurityLevel NormalizeSecurityLevel(const std::string& name);

int BaselineRiskScore(SecurityLevel level);

} // namespace policy
