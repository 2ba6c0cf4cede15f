// =============================================================================
// pool.cpp - Constant-Product AMM Pool
// =============================================================================

#include "lvr/pool.hpp"
#include "lvr/curve.hpp"
#include "lvr/strategy.hpp"

namespace lvr {

// =============================================================================
// Constructor
// =============================================================================

Pool::Pool(Token token_x, Token token_y, double fee, bool dynamic_fee)
    : token_x_(token_x),
      token_y_(token_y),
      fee_(fee),
      dynamic_fee_(dynamic_fee) {}

// =============================================================================
// Core Operations
// =============================================================================

double Pool::quote(Token token_in, double amount_in) const {
    double amount_in_with_fee = amount_in * (1.0 - fee_);
    double reserve_in = reserve_[token_in];
    double reserve_out = reserve_[other_token(token_in)];
    return amount_in_with_fee * reserve_out / (reserve_in + amount_in_with_fee);
}

double Pool::swap(Token token_in, double amount_in) {
    double amount_out = quote(token_in, amount_in);

    reserve_[token_in] += amount_in;
    reserve_[other_token(token_in)] -= amount_out;

    return amount_out;
}

void Pool::add_liquidity(Token token, double amount) {
    reserve_[token] += amount;
}

void Pool::remove_liquidity(Token token, double amount) {
    reserve_[token] -= amount;
}

double Pool::total_value_locked(const PriceFeed& price_feed) const {
    return reserve_x() * price_feed[token_x_] + reserve_y() * price_feed[token_y_];
}

// =============================================================================
// Block Phases
// =============================================================================

void Pool::before_swap(const BlockContext& ctx) {
    if (dynamic_fee_) {
        fee_ = calculate_dynamic_fee(ctx.volatility);
    }
}

void Pool::after_swap(const BlockContext& ctx) {
    perform_arbitrage(*this, ctx.price_feed, ctx.tx_fee_per_eth);
}

// =============================================================================
// Metrics
// =============================================================================

void Pool::record_retail(double fee, double volume) {
    metrics_.fees_retail += fee;
    metrics_.volume_retail += volume;
    ++metrics_.retail_swap_count;
}

void Pool::record_arbitrage(double lvr, double fee, double volume) {
    metrics_.lvr += lvr;
    metrics_.fees_arbitrage += fee;
    metrics_.volume_arbitrage += volume;
    ++metrics_.arbitrage_count;
}

} // namespace lvr
