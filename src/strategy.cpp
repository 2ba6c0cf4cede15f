// =============================================================================
// strategy.cpp - Profit-Maximizing Arbitrage
// =============================================================================

#include "lvr/strategy.hpp"
#include <cmath>

namespace lvr {

// =============================================================================
// Closed-Form Optimum
// =============================================================================

// For x * y = k with input fee f, the arbitrageur's profit in the reference
// market is maximized when
//   amount_in = sqrt(k * p_out / (p_in * (1 - f))) - reserve_in / (1 - f)
// A negative value means the pool price is within the fee band.
ArbitrageTrade compute_profit_maximizing_trade(double true_price_x, double true_price_y,
                                               const Pool& pool) {
    double reserve_x = pool.reserve_x();
    double reserve_y = pool.reserve_y();
    double fee = pool.fee();

    bool x_to_y = (reserve_x * true_price_x) / reserve_y < true_price_y;

    double invariant = reserve_x * reserve_y;
    double price_in = x_to_y ? true_price_x : true_price_y;
    double price_out = x_to_y ? true_price_y : true_price_x;

    double left_side = std::sqrt(invariant * price_out / (price_in * (1.0 - fee)));
    double right_side = (x_to_y ? reserve_x : reserve_y) / (1.0 - fee);

    if (left_side < right_side) {
        return ArbitrageTrade{false, 0.0};
    }

    return ArbitrageTrade{x_to_y, left_side - right_side};
}

// =============================================================================
// Plain-Pool Arbitrage
// =============================================================================

ArbitrageQuote quote_arbitrage(const Pool& pool, const PriceFeed& price_feed,
                               double tx_fee_per_eth) {
    Token token_x = pool.token_x();
    Token token_y = pool.token_y();

    ArbitrageQuote q;
    q.tx_fee = tx_fee_per_eth * price_feed.ratio(token_x, token_y);
    q.trade = compute_profit_maximizing_trade(price_feed[token_x], price_feed[token_y], pool);
    if (q.trade.empty()) return q;

    q.token_in = q.trade.x_to_y ? token_x : token_y;
    Token token_out = pool.other_token(q.token_in);
    double price_in = price_feed[q.token_in];
    double price_out = price_feed[token_out];

    q.amount_out = pool.quote(q.token_in, q.trade.amount_in);
    q.swap_fee = q.trade.amount_in * price_in * pool.fee();
    q.lp_loss_vs_cex = (q.amount_out * price_out - q.trade.amount_in * price_in) + q.swap_fee;
    q.arbitrageur_profit = q.lp_loss_vs_cex - q.swap_fee - q.tx_fee;
    return q;
}

bool perform_arbitrage(Pool& pool, const PriceFeed& price_feed, double tx_fee_per_eth) {
    ArbitrageQuote q = quote_arbitrage(pool, price_feed, tx_fee_per_eth);
    if (!q.profitable()) return false;

    pool.swap(q.token_in, q.trade.amount_in);
    // LVR excludes swap and tx fees
    pool.record_arbitrage(q.lp_loss_vs_cex, q.swap_fee,
                          q.trade.amount_in * price_feed[q.token_in]);
    return true;
}

} // namespace lvr
