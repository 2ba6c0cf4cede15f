// LVR Simulator - Pool Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <lvr/diamond.hpp>
#include <lvr/pool.hpp>
#include <cmath>
#include <type_traits>

using namespace lvr;
using Catch::Approx;

namespace {

void seed_reserves(Pool& pool, double reserve_x, double reserve_y) {
    pool.add_liquidity(Token::ETH, reserve_x);
    pool.add_liquidity(Token::USDC, reserve_y);
}

}  // namespace

TEST_CASE("Constant product quote", "[pool]") {
    Pool pool(Token::ETH, Token::USDC, 0.003);
    seed_reserves(pool, 1000, 1000);

    SECTION("Fee charged on input") {
        REQUIRE(pool.quote(Token::ETH, 10) == Approx(9.8716).margin(1e-3));
    }

    SECTION("Symmetric reserves") {
        REQUIRE(pool.quote(Token::ETH, 50) == Approx(pool.quote(Token::USDC, 50)));
    }

    SECTION("Quote leaves reserves untouched") {
        pool.quote(Token::USDC, 100);
        REQUIRE(pool.reserve_x() == 1000);
        REQUIRE(pool.reserve_y() == 1000);
    }

    SECTION("Larger trade = more slippage") {
        double small = pool.quote(Token::ETH, 1) / 1;
        double large = pool.quote(Token::ETH, 100) / 100;
        REQUIRE(large < small);
    }
}

TEST_CASE("Swap updates reserves", "[pool]") {
    Pool pool(Token::ETH, Token::USDC, 0.003);
    seed_reserves(pool, 1000, 2300000);
    double k_before = pool.reserve_x() * pool.reserve_y();

    double expected = pool.quote(Token::USDC, 23000);
    double out = pool.swap(Token::USDC, 23000);

    REQUIRE(out == Approx(expected));
    REQUIRE(pool.reserve_y() == Approx(2323000));
    REQUIRE(pool.reserve_x() == Approx(1000 - out));
    REQUIRE(pool.price() > 2300);

    // Fee stays in the pool
    REQUIRE(pool.reserve_x() * pool.reserve_y() >= k_before);
}

TEST_CASE("Zero fee preserves invariant", "[pool]") {
    Pool pool(Token::ETH, Token::USDC, 0.0);
    seed_reserves(pool, 500, 1150000);
    double k_before = pool.reserve_x() * pool.reserve_y();

    pool.swap(Token::ETH, 12.5);
    pool.swap(Token::USDC, 4000);

    REQUIRE(pool.reserve_x() * pool.reserve_y() == Approx(k_before).epsilon(1e-12));
}

TEST_CASE("Liquidity and valuation", "[pool]") {
    Pool pool(Token::ETH, Token::USDC, 0.003);
    seed_reserves(pool, 10, 23000);
    PriceFeed feed(2400, 1);

    SECTION("TVL at reference prices") {
        REQUIRE(pool.total_value_locked(feed) == Approx(10 * 2400 + 23000));
    }

    SECTION("Add and remove") {
        pool.add_liquidity(Token::ETH, 5);
        pool.remove_liquidity(Token::USDC, 3000);
        REQUIRE(pool.reserve_x() == Approx(15));
        REQUIRE(pool.reserve_y() == Approx(20000));
        REQUIRE(pool.liquidity() == Approx(std::sqrt(15.0 * 20000.0)));
    }

    SECTION("Spot price") {
        REQUIRE(pool.price() == Approx(2300));
        REQUIRE(pool.kind() == PoolKind::Liquidity);
    }
}

TEST_CASE("Pool metrics", "[pool]") {
    Pool pool(Token::ETH, Token::USDC, 0.003);
    seed_reserves(pool, 10, 23000);

    pool.record_retail(3.0, 1000);
    pool.record_retail(1.5, 500);
    pool.record_arbitrage(20.0, 6.0, 2000);

    const PoolMetrics& m = pool.metrics();
    REQUIRE(m.retail_swap_count == 2);
    REQUIRE(m.arbitrage_count == 1);
    REQUIRE(m.lvr == Approx(20.0));
    REQUIRE(m.total_fees() == Approx(10.5));
    REQUIRE(m.total_volume() == Approx(3500));
}

TEST_CASE("Dynamic fee follows volatility", "[pool]") {
    Pool pool(Token::ETH, Token::USDC, 0.003, true);
    pool.add_liquidity(Token::ETH, 10);
    pool.add_liquidity(Token::USDC, 23000);
    PriceFeed feed(2300, 1);

    pool.before_swap(BlockContext{feed, 0.0, 0, 0.009});
    double calm = pool.fee();
    pool.before_swap(BlockContext{feed, 1e6, 1, 0.009});
    double stressed = pool.fee();

    REQUIRE(calm < 0.003);
    REQUIRE(stressed > calm);

    SECTION("Static fee pool ignores volatility") {
        Pool fixed(Token::ETH, Token::USDC, 0.003);
        seed_reserves(fixed, 10, 23000);
        fixed.before_swap(BlockContext{feed, 1e6, 0, 0.009});
        REQUIRE(fixed.fee() == 0.003);
    }
}

TEST_CASE("Pools are not copyable", "[pool]") {
    STATIC_REQUIRE_FALSE(std::is_copy_constructible_v<Pool>);
    STATIC_REQUIRE_FALSE(std::is_copy_assignable_v<Pool>);
    STATIC_REQUIRE_FALSE(std::is_copy_constructible_v<DiamondPool>);
}
