#ifndef LVR_POOL_HPP
#define LVR_POOL_HPP

#include <cmath>
#include <cstdint>

#include "types.hpp"

namespace lvr {

// =============================================================================
// Pool Metrics (running totals, one update per qualifying event)
// =============================================================================

struct PoolMetrics {
    double lvr = 0.0;               // LP loss vs CEX, excluding swap and tx fees
    double fees_retail = 0.0;
    double fees_arbitrage = 0.0;
    double volume_retail = 0.0;
    double volume_arbitrage = 0.0;
    uint64_t retail_swap_count = 0;
    uint64_t arbitrage_count = 0;

    double total_fees() const { return fees_retail + fees_arbitrage; }
    double total_volume() const { return volume_retail + volume_arbitrage; }
};

// =============================================================================
// Pool - Constant-Product AMM (x * y = k)
// =============================================================================

class Pool {
public:
    Pool(Token token_x, Token token_y, double fee, bool dynamic_fee = false);
    virtual ~Pool() = default;

    // Non-copyable
    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;

    virtual PoolKind kind() const { return PoolKind::Liquidity; }

    // =========================================================================
    // Core Operations
    // =========================================================================

    // Output amount for `amount_in` of `token_in`, fee charged on the input.
    // Requires amount_in > 0 and non-empty reserves.
    double quote(Token token_in, double amount_in) const;

    // Execute a swap at the quoted amount, returns amount of the other token out
    double swap(Token token_in, double amount_in);

    // Reserve-only adjustments (single LP, no share tokens)
    void add_liquidity(Token token, double amount);
    void remove_liquidity(Token token, double amount);

    // Value of the pool's holdings at the given prices
    virtual double total_value_locked(const PriceFeed& price_feed) const;

    // =========================================================================
    // Block Phases
    // =========================================================================

    // Dynamic fee update
    virtual void before_swap(const BlockContext& ctx);

    // Arbitrage against the block's reference price
    virtual void after_swap(const BlockContext& ctx);

    // =========================================================================
    // Metrics
    // =========================================================================

    void record_retail(double fee, double volume);
    void record_arbitrage(double lvr, double fee, double volume);

    const PoolMetrics& metrics() const { return metrics_; }

    // =========================================================================
    // Accessors
    // =========================================================================

    Token token_x() const { return token_x_; }
    Token token_y() const { return token_y_; }
    Token other_token(Token token) const { return token == token_y_ ? token_x_ : token_y_; }

    double reserve(Token token) const { return reserve_[token]; }
    double reserve_x() const { return reserve_[token_x_]; }
    double reserve_y() const { return reserve_[token_y_]; }

    // Spot price of X in units of Y
    double price() const { return reserve_y() / reserve_x(); }

    // Constant-product invariant sqrt(k)
    double liquidity() const { return std::sqrt(reserve_x() * reserve_y()); }

    double fee() const { return fee_; }
    void set_fee(double fee) { fee_ = fee; }

    bool dynamic_fee() const { return dynamic_fee_; }

protected:
    // Direct reserve assignment, used by the vault protocol to re-peg the pool
    void set_reserve(Token token, double amount) { reserve_[token] = amount; }

private:
    Token token_x_;
    Token token_y_;
    TokenAmounts reserve_;
    double fee_;
    bool dynamic_fee_;
    PoolMetrics metrics_;
};

} // namespace lvr

#endif // LVR_POOL_HPP
