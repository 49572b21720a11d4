#include "catch.hpp"

#include "scoring/JsonObjectExtractor.hpp"

SCENARIO("the first balanced object is extracted from surrounding prose", "[scoring][json]") {
    std::string object;

    REQUIRE(scoring::ExtractFirstJsonObject("Sure! Here it is: {\"a\": 1} Hope this helps {\"b\": 2}", object));
    REQUIRE(object == "{\"a\": 1}");
}

SCENARIO("nested objects are kept whole", "[scoring][json]") {
    std::string object;

    REQUIRE(scoring::ExtractFirstJsonObject("x {\"a\": {\"b\": {}}, \"c\": [1]} y", object));
    REQUIRE(object == "{\"a\": {\"b\": {}}, \"c\": [1]}");
}

SCENARIO("braces inside strings do not count", "[scoring][json]") {
    std::string object;

    REQUIRE(scoring::ExtractFirstJsonObject(R"({"explanation": "uses } and { freely"} tail)", object));
    REQUIRE(object == R"({"explanation": "uses } and { freely"})");
}

SCENARIO("escaped quotes do not end a string", "[scoring][json]") {
    std::string object;

    REQUIRE(scoring::ExtractFirstJsonObject(R"({"cmd": "echo \"}\""} more)", object));
    REQUIRE(object == R"({"cmd": "echo \"}\""})");
}

SCENARIO("text without a complete object yields nothing", "[scoring][json]") {
    std::string object = "untouched";

    REQUIRE_FALSE(scoring::ExtractFirstJsonObject("no json here", object));
    REQUIRE_FALSE(scoring::ExtractFirstJsonObject("{\"a\": {\"b\": 1}", object));
    REQUIRE_FALSE(scoring::ExtractFirstJsonObject("", object));
    REQUIRE(object == "untouched");
}
