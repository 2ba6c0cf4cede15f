// LVR Simulator - Simulator Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <lvr/simulator.hpp>
#include <nlohmann/json.hpp>
#include <iomanip>
#include <ios>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace lvr;
using Catch::Approx;
using json = nlohmann::json;

namespace {

SimulationConfig small_config(uint64_t seed = 123) {
    SimulationConfig config = SimulationConfig::default_scenario(1e7);
    config.blocks_per_day = 20;
    config.num_days = 2;
    config.seed = seed;
    return config;
}

Simulator flat_simulator(uint64_t blocks_per_day, uint64_t num_days) {
    Simulator sim(blocks_per_day, num_days, 0.009, 0.0, 0);
    sim.create_liquidity_pool(Token::ETH, Token::USDC, 1000, 2300000, 0.003);
    sim.create_diamond_pool(Token::ETH, Token::USDC, 1000, 2300000, 0.003,
                            std::make_shared<DiamondProtocolHooks>(0.009), 0.9);
    sim.set_oracle(PriceOracle(Oracle(blocks_per_day * num_days, PriceFeed(2300, 1)), {}));
    return sim;
}

}  // namespace

TEST_CASE("GBM oracle", "[simulator]") {
    Rng rng(123);
    OracleConfig config{20, 3, 2300.0, 0.05};
    PriceOracle oracle = PriceOracle::generate_gbm(config, rng);

    SECTION("Warm-up removed, volatility aligned") {
        REQUIRE(oracle.size() == 60);
        REQUIRE(oracle.volatility_series().size() == oracle.size());
    }

    SECTION("First block pinned to the initial price") {
        REQUIRE(oracle.at(0).ratio(Token::ETH, Token::USDC) == Approx(2300.0));
        REQUIRE(oracle.at(0)[Token::USDC] == 1.0);
    }

    SECTION("Prices stay positive") {
        for (const auto& feed : oracle.feeds()) REQUIRE(feed[Token::ETH] > 0);
        for (double v : oracle.volatility_series()) REQUIRE(v >= -1e-6);
    }

    SECTION("Out of range lookups throw") {
        REQUIRE_THROWS_AS(oracle.at(60), std::out_of_range);
        REQUIRE_THROWS_AS(oracle.volatility(60), std::out_of_range);
    }

    SECTION("Empty horizon rejected") {
        Rng other(1);
        REQUIRE_THROWS_AS(PriceOracle::generate_gbm(OracleConfig{0, 3, 2300.0, 0.05}, other),
                          std::invalid_argument);
    }

    SECTION("Misaligned volatility rejected") {
        REQUIRE_THROWS_AS(PriceOracle(Oracle(5, PriceFeed(2300, 1)), std::vector<double>(4)),
                          std::invalid_argument);
    }
}

TEST_CASE("Simulator lifecycle", "[simulator]") {
    SECTION("Blocks need an oracle") {
        Simulator sim(10, 1, 0.009, 0.0, 0);
        sim.create_liquidity_pool(Token::ETH, Token::USDC, 10, 23000, 0.003);

        REQUIRE(sim.state() == SimState::Uninitialized);
        REQUIRE_THROWS_AS(sim.run(), std::logic_error);
        REQUIRE_THROWS_AS(sim.before_swap(0), std::logic_error);
    }

    SECTION("Oracle seeded, running, finished") {
        Simulator sim(10, 1, 0.009, 0.0, 0);
        sim.create_liquidity_pool(Token::ETH, Token::USDC, 10, 23000, 0.003);
        sim.create_oracle(2300, 0.05);
        REQUIRE(sim.state() == SimState::OracleSeeded);
        REQUIRE(sim.total_blocks() == 10);
        REQUIRE(sim.oracle().size() == 10);

        sim.run_block(0);
        REQUIRE(sim.state() == SimState::Running);
        REQUIRE(sim.current_block() == 0);

        for (uint64_t b = 1; b < sim.total_blocks(); ++b) sim.run_block(b);
        REQUIRE(sim.state() == SimState::Finished);

        REQUIRE_THROWS_AS(sim.before_swap(10), std::out_of_range);
        REQUIRE_THROWS_AS(sim.run(), std::logic_error);
    }

    SECTION("Step phases match run_block") {
        Simulator stepped = flat_simulator(5, 1);
        Simulator whole = flat_simulator(5, 1);

        for (uint64_t b = 0; b < 5; ++b) {
            stepped.before_swap(b);
            stepped.retail_swap(b);
            stepped.after_swap(b);
            whole.run_block(b);
        }
        REQUIRE(stepped.pool(0).reserve_x() == whole.pool(0).reserve_x());
        REQUIRE(stepped.pool(1).reserve_y() == whole.pool(1).reserve_y());
    }
}

TEST_CASE("Simulation determinism", "[simulator]") {
    Simulator first = Simulator::from_config(small_config(42));
    Simulator second = Simulator::from_config(small_config(42));
    first.run();
    second.run();

    auto a = first.current_snapshot();
    auto b = second.current_snapshot();
    REQUIRE(a.size() == 3);
    REQUIRE(a.size() == b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        REQUIRE(a[i].reserve_x == b[i].reserve_x);
        REQUIRE(a[i].reserve_y == b[i].reserve_y);
        REQUIRE(a[i].lvr == b[i].lvr);
        REQUIRE(a[i].fees_total == b[i].fees_total);
    }

    SECTION("Different seeds diverge") {
        Simulator other = Simulator::from_config(small_config(43));
        other.run();
        REQUIRE(other.oracle().at(39)[Token::ETH] != first.oracle().at(39)[Token::ETH]);
    }
}

TEST_CASE("Configured pools", "[simulator]") {
    Simulator sim = Simulator::from_config(small_config());

    REQUIRE(sim.num_pools() == 3);
    REQUIRE(sim.pool(0).kind() == PoolKind::Liquidity);
    REQUIRE(sim.pool(1).kind() == PoolKind::Diamond);
    REQUIRE(sim.pool(2).kind() == PoolKind::Diamond);
    REQUIRE(sim.pool(0).price() == Approx(2300.0));
    REQUIRE(sim.pool(0).total_value_locked(sim.oracle().at(0)) == Approx(1e7));

    sim.run();

    SECTION("Running totals are non-negative") {
        for (const auto& s : sim.current_snapshot()) {
            REQUIRE(s.lvr >= 0);
            REQUIRE(s.fees_total == Approx(s.fees_retail + s.fees_arbitrage));
            REQUIRE(s.volume_total >= s.volume_retail);
            REQUIRE(s.vault_x >= 0);
            REQUIRE(s.vault_y >= 0);
            REQUIRE(s.reserve_x > 0);
            REQUIRE(s.reserve_y > 0);
        }
    }

    SECTION("Dynamic protocol keeps beta on the scaled curve") {
        auto& dynamic = static_cast<const DiamondPool&>(sim.pool(2));
        REQUIRE(dynamic.beta() >= 0.8);
        REQUIRE(dynamic.beta() <= 1.0);
        REQUIRE(dynamic.beta() ==
                Approx(calculate_dynamic_beta(sim.volatility(sim.total_blocks() - 1))));
    }
}

TEST_CASE("Liquidity injection", "[simulator]") {
    Simulator sim(10, 1, 0.009, 1e6, 5);
    sim.create_liquidity_pool(Token::ETH, Token::USDC, 1000, 2300000, 0.003);
    sim.create_liquidity_pool(Token::ETH, Token::USDC, 3000, 6900000, 0.003);
    sim.set_oracle(PriceOracle(Oracle(10, PriceFeed(2300, 1)), {}));
    const PriceFeed& feed = sim.oracle().at(0);

    REQUIRE_FALSE(sim.inject_liquidity(0));
    REQUIRE_FALSE(sim.inject_liquidity(5));

    double small_before = sim.pool(0).total_value_locked(feed);
    double large_before = sim.pool(1).total_value_locked(feed);
    REQUIRE(sim.inject_liquidity(4));

    // Split by TVL share, price unchanged
    REQUIRE(sim.pool(0).total_value_locked(feed) - small_before == Approx(250000));
    REQUIRE(sim.pool(1).total_value_locked(feed) - large_before == Approx(750000));
    REQUIRE(sim.pool(0).price() == Approx(2300.0));

    SECTION("Disabled without a period") {
        Simulator off(10, 1, 0.009, 1e6, 0);
        off.create_liquidity_pool(Token::ETH, Token::USDC, 1000, 2300000, 0.003);
        off.set_oracle(PriceOracle(Oracle(10, PriceFeed(2300, 1)), {}));
        REQUIRE_FALSE(off.inject_liquidity(4));
    }
}

TEST_CASE("Snapshots and history", "[simulator]") {
    Simulator sim = flat_simulator(4, 2);
    sim.set_record_history(true);
    sim.run();

    SECTION("One record per block") {
        REQUIRE(sim.history().size() == 8);
        REQUIRE(sim.history().front().block_num == 0);
        REQUIRE(sim.history().back().block_num == 7);
        REQUIRE(sim.history().back().pools.size() == 2);
        REQUIRE(sim.history().back().oracle_price == Approx(2300.0));
    }

    SECTION("JSON keys by pool type") {
        auto snapshots = sim.snapshot(7);
        json plain = snapshots[0];
        json diamond = snapshots[1];

        REQUIRE(plain["Type of Pool"].get<std::string>() == "Liquidity");
        REQUIRE(plain.contains("TVL"));
        REQUIRE(plain.contains("LVR"));
        REQUIRE(plain.contains("Collected Fees"));
        REQUIRE_FALSE(plain.contains("Beta"));

        REQUIRE(diamond["Type of Pool"].get<std::string>() == "Diamond");
        REQUIRE(diamond["Beta"].get<double>() == Approx(0.9));
        REQUIRE(diamond.contains("Vault Token_x Reserve"));

        json record = sim.history().back();
        REQUIRE(record["pools"].size() == 2);
    }

    SECTION("Printed report") {
        std::ostringstream out;
        sim.print_snapshot(out, 7);
        std::string report = out.str();
        REQUIRE(report.find("Block 7") != std::string::npos);
        REQUIRE(report.find("Type of Pool: Diamond") != std::string::npos);
        REQUIRE(report.find("Vault ETH Reserve") != std::string::npos);
    }

    SECTION("Caller's stream format is restored") {
        std::ostringstream out;
        out << std::setprecision(7);
        sim.print_snapshot(out, 7);

        REQUIRE(out.precision() == 7);
        REQUIRE((out.flags() & std::ios_base::floatfield) == std::ios_base::fmtflags{});
        out.str("");
        out << 2300.5;
        REQUIRE(out.str() == "2300.5");
    }

    SECTION("Verbose run prints first and last blocks") {
        Simulator verbose = flat_simulator(4, 1);
        std::ostringstream out;
        verbose.run(true, out);
        REQUIRE(out.str().find("Block 0") != std::string::npos);
        REQUIRE(out.str().find("Block 3") != std::string::npos);
    }
}
