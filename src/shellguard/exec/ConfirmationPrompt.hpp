#pragma once

#include "policy/PolicyDecision.hpp"

#include <iosfwd>
#include <string>

namespace exec {

struct ConfirmationRequest {
    std::string command;
    policy::Decision decision;
};

class IConfirmationPrompt {
public:
    virtual ~IConfirmationPrompt() = default;

    // True only on an explicit affirmative answer.
    virtual bool Confirm(const ConfirmationRequest& request) = 0;
};

class ConsoleConfirmationPrompt final : public IConfirmationPrompt {
public:
    ConsoleConfirmationPrompt(std::istream& in, std::ostream& out);

    bool Confirm(const ConfirmationRequest& request) override;

private:
    std::istream& in_;
    std::ostream& out_;
};

bool IsAffirmativeAnswer(const std::string& answer);

} // namespace exec
