#include "policy/SecurityLevel.hpp"

#include <cctype>

namespace policy {

SecurityLevel NormalizeSecurityLevel(const std::string& name) {
    std::string lowered;
    lowered.reserve(name.size());
    for (auto c : name) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }

    if (lowered == "safe") {
        return SecurityLevel::Safe;
    }
    if (lowered == "caution" || lowered == "moderate") {
        return SecurityLevel::Caution;
    }
    if (lowered == "dangerous" || lowered == "restricted") {
        return SecurityLevel::Restricted;
    }
    if (lowered == "critical" || lowered == "blocked") {
        return SecurityLevel::Blocked;
    }

    return SecurityLevel::Caution;
}

int BaselineRiskScore(SecurityLevel level) {
    switch (level) {
    case SecurityLevel::Safe:
        return 10;
    case SecurityLevel::Caution:
        return 30;
    case SecurityLevel::Restricted:
        return 70;
    case SecurityLevel::Blocked:
        return 90;
    }

    return 30;
}

} // namespace policy
