// Zap - Scenario Runner Tests

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <zap/sim/scenario.hpp>

#include <string>

using namespace zap;
using nlohmann::json;

namespace {

const char* MARKET = R"({
    "tokens": [{"symbol": "A"}, {"symbol": "B"}, {"symbol": "C"}],
    "accounts": {
        "lp": {"A": "1000000", "B": "1000000"},
        "alice": {"A": "10000"}
    },
    "pools": [{"provider": "lp", "assets": ["A", "B"], "amounts": ["1000000", "1000000"]}]
})";

} // namespace

TEST_CASE("Scenario setup", "[scenario]") {
    auto scenario = sim::Scenario::from_json_string(MARKET);

    REQUIRE(scenario->token("A").balance_of(scenario->account("alice")) == 10000);
    REQUIRE(scenario->token("A").balance_of(scenario->account("lp")) == 0);

    const Address pool = scenario->zapper().resolve_pool(scenario->token("A").address(),
                                                         scenario->token("B").address());
    REQUIRE_FALSE(addresses::is_null(pool));
    REQUIRE(scenario->chain().asset(pool).balance_of(scenario->account("lp")) == 999000);

    REQUIRE_THROWS_AS(scenario->token("Q"), std::invalid_argument);
    REQUIRE_THROWS_AS(scenario->account("mallory"), std::invalid_argument);
}

TEST_CASE("Scenario actions", "[scenario]") {
    auto scenario = sim::Scenario::from_json_string(MARKET);

    SECTION("Zap in then out") {
        json in = scenario->run_action(json::parse(R"({
            "type": "zap_in", "account": "alice", "input": "A", "pair": ["A", "B"],
            "amount": "10000", "min_liquidity": "4900"
        })"));
        REQUIRE(in["ok"] == true);
        REQUIRE(in["liquidity_minted"] == "4979");
        REQUIRE(in["amount_swapped"] == "4995");

        json out = scenario->run_action(json::parse(R"({
            "type": "zap_out", "account": "alice", "output": "A", "pair": ["A", "B"],
            "liquidity": "all"
        })"));
        REQUIRE(out["ok"] == true);
        REQUIRE(out["amount_out"] == "9966");

        json balances = scenario->balances();
        REQUIRE(balances["alice"]["A"] == "9966");
        REQUIRE(balances["alice"]["LP:A/B"] == "0");
    }

    SECTION("Failures are reported with their code and rolled back") {
        json result = scenario->run_action(json::parse(R"({
            "type": "zap_in", "account": "alice", "input": "A", "pair": ["A", "B"],
            "amount": "10000", "min_liquidity": "5000"
        })"));
        REQUIRE(result["ok"] == false);
        REQUIRE(result["error"] == "SlippageExceeded");
        REQUIRE(result["code"] == -5);
        REQUIRE(scenario->token("A").balance_of(scenario->account("alice")) == 10000);
    }

    SECTION("Deadline follows the chain clock") {
        json late = scenario->run_action(json::parse(R"({
            "type": "zap_in", "account": "alice", "input": "A", "pair": ["A", "B"],
            "amount": "10000", "deadline": 1700000000
        })"));
        REQUIRE(late["ok"] == true);

        scenario->run_action(json::parse(R"({"type": "advance_time", "seconds": 60})"));
        json expired = scenario->run_action(json::parse(R"({
            "type": "zap_out", "account": "alice", "output": "A", "pair": ["A", "B"],
            "liquidity": "all", "deadline": 1700000000
        })"));
        REQUIRE(expired["ok"] == false);
        REQUIRE(expired["error"] == "ExternalCollaboratorFailure");
    }

    SECTION("Malformed actions are reported") {
        json result = scenario->run_action(json::parse(R"({"type": "teleport"})"));
        REQUIRE(result["ok"] == false);
        REQUIRE(result["error"] == "Exception");
    }
}

TEST_CASE("Example scenario", "[scenario]") {
    auto scenario = sim::Scenario::from_file(std::string(ZAP_EXAMPLES_DIR) + "/scenario.json");
    json report = scenario->run();

    json& results = report["results"];
    REQUIRE(results.size() == 5);
    REQUIRE(results[0]["liquidity_minted"] == "4979");
    REQUIRE(results[1]["type"] == "advance_time");
    REQUIRE(results[2]["amount_out"] == "9966");
    REQUIRE(results[3]["liquidity_minted"] == "4856");
    REQUIRE(results[4]["error"] == "UnsupportedOutputToken");

    REQUIRE(report["balances"]["alice"]["USDC"] == "99966");
    REQUIRE(report["stats"]["transactions"] == 4);
    REQUIRE(report["stats"]["reverted"] == 1);
}

TEST_CASE("Scenario loading errors", "[scenario]") {
    REQUIRE_THROWS_AS(sim::Scenario::from_json_string("{"), std::runtime_error);
    REQUIRE_THROWS_AS(sim::Scenario::from_file("/nonexistent/scenario.json"), std::runtime_error);
    REQUIRE_THROWS_AS(sim::Scenario::from_json_string("[1, 2]"), std::invalid_argument);
    REQUIRE_THROWS_AS(sim::Scenario::from_json_string("42"), std::invalid_argument);
    REQUIRE_THROWS_AS(sim::Scenario::from_json_string(R"({"tokens": [{"symbol": "A"}, {"symbol": "A"}]})"),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(sim::Scenario::from_json_string(R"({"accounts": {"x": {"NOPE": "1"}}})"),
                      std::invalid_argument);
}
