#include "catch.hpp"

#include "exec/ConfirmationPrompt.hpp"

#include <sstream>

namespace {

exec::ConfirmationRequest Request() {
    exec::ConfirmationRequest request;
    request.command = "find / -name core";
    request.decision.finalLevel = policy::SecurityLevel::Caution;
    request.decision.patternLevel = policy::SecurityLevel::Safe;
    request.decision.riskScore = 55;
    request.decision.reason = "combined analysis: walks the whole filesystem";
    request.decision.safeAlternatives = {"find . -name core"};
    return request;
}

} // namespace

SCENARIO("only an explicit yes counts as confirmation", "[exec][prompt]") {
    REQUIRE(exec::IsAffirmativeAnswer("y"));
    REQUIRE(exec::IsAffirmativeAnswer("YES"));
    REQUIRE(exec::IsAffirmativeAnswer(" yes \r"));
    REQUIRE_FALSE(exec::IsAffirmativeAnswer(""));
    REQUIRE_FALSE(exec::IsAffirmativeAnswer("n"));
    REQUIRE_FALSE(exec::IsAffirmativeAnswer("yep"));
}

SCENARIO("the console prompt shows the decision before asking", "[exec][prompt]") {
    std::istringstream in{"y\n"};
    std::ostringstream out;
    exec::ConsoleConfirmationPrompt prompt{in, out};

    REQUIRE(prompt.Confirm(Request()));

    const auto shown = out.str();
    REQUIRE(shown.find("find / -name core") != std::string::npos);
    REQUIRE(shown.find("CAUTION") != std::string::npos);
    REQUIRE(shown.find("55/100 (high)") != std::string::npos);
    REQUIRE(shown.find("walks the whole filesystem") != std::string::npos);
    REQUIRE(shown.find("find . -name core") != std::string::npos);
    REQUIRE(shown.find("Proceed? [y/N]") != std::string::npos);
}

SCENARIO("the console prompt declines by default", "[exec][prompt]") {
    std::ostringstream out;

    WHEN("the user just presses enter") {
        std::istringstream in{"\n"};
        exec::ConsoleConfirmationPrompt prompt{in, out};
        REQUIRE_FALSE(prompt.Confirm(Request()));
    }

    WHEN("input is closed") {
        std::istringstream in{""};
        exec::ConsoleConfirmationPrompt prompt{in, out};
        REQUIRE_FALSE(prompt.Confirm(Request()));
    }
}
