#ifndef LVR_STRATEGY_HPP
#define LVR_STRATEGY_HPP

#include "pool.hpp"
#include "types.hpp"

namespace lvr {

// =============================================================================
// Profit-Maximizing Arbitrage Trade
// =============================================================================

struct ArbitrageTrade {
    bool x_to_y = false;    // true: sell token_x into the pool, false: sell token_y
    double amount_in = 0.0; // 0 when the pool is inside the no-arbitrage fee band

    bool empty() const { return amount_in <= 0.0; }
};

// Closed-form optimum for a constant-product pool with a proportional input fee.
// Shared by plain-pool arbitrage and the diamond core protocol.
ArbitrageTrade compute_profit_maximizing_trade(double true_price_x, double true_price_y,
                                               const Pool& pool);

// =============================================================================
// Arbitrage Evaluation
// =============================================================================

// Value split of a candidate arbitrage, before any state change
struct ArbitrageQuote {
    ArbitrageTrade trade;
    Token token_in = Token::ETH;
    double amount_out = 0.0;
    double swap_fee = 0.0;           // amount_in * price_in * fee
    double tx_fee = 0.0;             // tx_fee_per_eth * target price
    double lp_loss_vs_cex = 0.0;     // LVR, fees added back
    double arbitrageur_profit = 0.0;

    bool profitable() const { return !trade.empty() && arbitrageur_profit > 0.0; }
};

// Evaluate the profit-maximizing trade against a plain pool (beta = 0)
ArbitrageQuote quote_arbitrage(const Pool& pool, const PriceFeed& price_feed,
                               double tx_fee_per_eth);

// Execute the trade on a plain pool when the arbitrageur profits.
// Returns true if the swap was executed.
bool perform_arbitrage(Pool& pool, const PriceFeed& price_feed, double tx_fee_per_eth);

} // namespace lvr

#endif // LVR_STRATEGY_HPP
