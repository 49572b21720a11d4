#include "exec/ConfirmationPrompt.hpp"

#include <cctype>
#include <istream>
#include <ostream>

namespace exec {

bool IsAffirmativeAnswer(const std::string& answer) {
    std::string normalized;
    for (auto c : answer) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }

    return normalized == "y" || normalized == "yes";
}

ConsoleConfirmationPrompt::ConsoleConfirmationPrompt(std::istream& in, std::ostream& out)
    : in_{in}
    , out_{out} {}

bool ConsoleConfirmationPrompt::Confirm(const ConfirmationRequest& request) {
    const auto& decision = request.decision;

    out_ << "\nCommand security review:\n"
         << "   command:    " << request.command << "\n"
         << "   level:      " << policy::ToString(decision.finalLevel) << "\n"
         << "   risk score: " << decision.riskScore << "/100 (" << policy::DescribeRiskScore(decision.riskScore)
         << ")\n"
         << "   reason:     " << decision.reason << "\n";

    if (!decision.safeAlternatives.empty()) {
        out_ << "   alternatives:\n";
        for (const auto& alternative : decision.safeAlternatives) {
            out_ << "     - " << alternative << "\n";
        }
    }

    out_ << "\n   Proceed? [y/N]: " << std::flush;

    std::string answer;
    if (!std::getline(in_, answer)) {
        out_ << "\n";
        return false;
    }

    return IsAffirmativeAnswer(answer);
}

} // namespace exec
