// LVR Simulator - Configuration Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <lvr/config.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

using namespace lvr;
using Catch::Approx;

TEST_CASE("Default scenario", "[config]") {
    SimulationConfig config = SimulationConfig::default_scenario();

    REQUIRE(config.blocks_per_day == 7200);
    REQUIRE(config.num_days == 10);
    REQUIRE(config.tx_fee_per_eth == Approx(0.009));
    REQUIRE(config.seed == 123);
    REQUIRE(config.pools.size() == 3);
    REQUIRE(config.pools[0].kind == PoolKind::Liquidity);
    REQUIRE(config.pools[1].protocol == ProtocolKind::Static);
    REQUIRE(config.pools[2].protocol == ProtocolKind::Dynamic);
    REQUIRE(config.pools[0].reserve_x * config.initial_price == Approx(5e7));
    REQUIRE(config.pools[0].reserve_y == Approx(5e7));
}

TEST_CASE("Config from JSON", "[config]") {
    SECTION("Missing keys keep defaults") {
        auto config = SimulationConfig::from_json(R"({
            "num_days": 3,
            "pools": [
                {"type": "liquidity", "reserve_x": 10, "reserve_y": 23000, "dynamic_fee": true},
                {"type": "diamond", "reserve_x": 10, "reserve_y": 23000,
                 "beta": 0.75, "protocol": "dynamic", "beta_curve": {"alpha1": 0.5}}
            ]
        })");

        REQUIRE(config.num_days == 3);
        REQUIRE(config.blocks_per_day == 7200);
        REQUIRE(config.retail_flow.size_mean == Approx(1743.0));
        REQUIRE(config.pools.size() == 2);
        REQUIRE(config.pools[0].dynamic_fee);
        REQUIRE(config.pools[0].fee == Approx(0.003));
        REQUIRE(config.pools[1].kind == PoolKind::Diamond);
        REQUIRE(config.pools[1].beta == Approx(0.75));
        REQUIRE(config.pools[1].protocol == ProtocolKind::Dynamic);
        REQUIRE(config.pools[1].beta_curve.has_value());
        REQUIRE(config.pools[1].beta_curve->alpha1 == Approx(0.5));
        REQUIRE(config.pools[1].beta_curve->alpha2 == Approx(0.012));
    }

    SECTION("Serialized config reloads") {
        SimulationConfig original = SimulationConfig::default_scenario(2e6);
        original.new_liquidity = 5000;
        original.new_liquidity_period = 100;

        auto reloaded = SimulationConfig::from_json(original.to_json());
        REQUIRE(reloaded.new_liquidity == Approx(5000));
        REQUIRE(reloaded.new_liquidity_period == 100);
        REQUIRE(reloaded.pools.size() == 3);
        REQUIRE(reloaded.pools[2].protocol == ProtocolKind::Dynamic);
        REQUIRE_FALSE(reloaded.pools[2].beta_curve.has_value());
    }

    SECTION("Unknown names rejected") {
        REQUIRE_THROWS_AS(SimulationConfig::from_json(
                              R"({"pools": [{"type": "diamond", "reserve_x": 1,
                                             "reserve_y": 1, "protocol": "magic"}]})"),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(SimulationConfig::from_json(
                              R"({"pools": [{"type": "orderbook", "reserve_x": 1, "reserve_y": 1}]})"),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(SimulationConfig::from_json(R"({"token_x": "BTC"})"),
                          std::invalid_argument);
    }

    SECTION("Pools need reserves") {
        REQUIRE_THROWS_AS(SimulationConfig::from_json(R"({"pools": [{"type": "liquidity"}]})"),
                          nlohmann::json::exception);
    }

    SECTION("Malformed JSON") {
        REQUIRE_THROWS_AS(SimulationConfig::from_json("{ not json"), nlohmann::json::exception);
    }
}

TEST_CASE("Config from file", "[config]") {
    REQUIRE_THROWS_AS(SimulationConfig::from_file("/nonexistent/lvr-sim.json"),
                      std::runtime_error);
}

TEST_CASE("Protocol names", "[config]") {
    REQUIRE(protocol_from_string("none") == ProtocolKind::None);
    REQUIRE(std::string(to_string(ProtocolKind::Dynamic)) == "dynamic");
    REQUIRE_THROWS_AS(protocol_from_string("Static"), std::invalid_argument);
}
