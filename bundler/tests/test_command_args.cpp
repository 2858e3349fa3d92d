#include <catch2/catch_test_macros.hpp>
#include "../src/command_args.hpp"
#include <stdexcept>

TEST_CASE("Command arguments", "[commands]") {
    SECTION("Absent or null options are not set") {
        auto args = nlohmann::json::parse(R"({"target": "mint", "identities": null})");
        REQUIRE_FALSE(parse_identities(args).has_value());
        REQUIRE_FALSE(parse_tip(args).has_value());
    }

    SECTION("Identity indices and tip are read") {
        auto args = nlohmann::json::parse(R"({"identities": [2, 0], "tip_lamports": 150000000})");
        REQUIRE(parse_identities(args).value() == std::vector<size_t>{2, 0});
        REQUIRE(parse_tip(args).value() == 150000000);
    }

    SECTION("Negative or fractional indices are rejected") {
        REQUIRE_THROWS_AS(parse_identities(nlohmann::json::parse(R"({"identities": [1, -1]})")),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(parse_identities(nlohmann::json::parse(R"({"identities": [0.5]})")),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(parse_identities(nlohmann::json::parse(R"({"identities": "0,1"})")),
                          std::invalid_argument);
    }

    SECTION("A malformed tip is rejected") {
        REQUIRE_THROWS_AS(parse_tip(nlohmann::json::parse(R"({"tip_lamports": -5})")), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_tip(nlohmann::json::parse(R"({"tip_lamports": "1000"})")), std::invalid_argument);
    }
}
