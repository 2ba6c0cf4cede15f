// =============================================================================
// diamond.cpp - Diamond Pool and Vault Protocol
// =============================================================================

#include "lvr/diamond.hpp"
#include "lvr/strategy.hpp"
#include <algorithm>

namespace lvr {

// =============================================================================
// DiamondPool
// =============================================================================

DiamondPool::DiamondPool(Token token_x, Token token_y, double fee, double beta,
                         std::shared_ptr<IDiamondHooks> hooks, bool dynamic_beta)
    : Pool(token_x, token_y, fee),
      beta_(beta),
      dynamic_beta_(dynamic_beta),
      vault_(token_x, token_y),
      hooks_(hooks ? std::move(hooks) : std::make_shared<NullHooks>()) {}

double DiamondPool::total_value_locked(const PriceFeed& price_feed) const {
    return Pool::total_value_locked(price_feed) + vault_.value(price_feed);
}

void DiamondPool::before_swap(const BlockContext& ctx) {
    if (dynamic_beta_) {
        beta_ = calculate_dynamic_beta(ctx.volatility);
    }
    hooks_->before_swap(*this, ctx.price_feed, ctx.volatility, ctx.block_num);
}

void DiamondPool::after_swap(const BlockContext& ctx) {
    hooks_->after_swap(*this, ctx.price_feed, ctx.volatility, ctx.block_num);
}

void DiamondPool::set_hooks(std::shared_ptr<IDiamondHooks> hooks) {
    hooks_ = hooks ? std::move(hooks) : std::make_shared<NullHooks>();
}

// =============================================================================
// Hook Implementations
// =============================================================================

void FunctionHooks::before_swap(DiamondPool& pool, const PriceFeed& price_feed,
                                double volatility, uint64_t block_num) {
    if (before_) before_(pool, price_feed, volatility, block_num);
}

void FunctionHooks::after_swap(DiamondPool& pool, const PriceFeed& price_feed,
                               double volatility, uint64_t block_num) {
    if (after_) after_(pool, price_feed, volatility, block_num);
}

void DiamondProtocolHooks::after_swap(DiamondPool& pool, const PriceFeed& price_feed,
                                      double /*volatility*/, uint64_t block_num) {
    core_protocol(pool, price_feed, tx_fee_per_eth_);

    vault_rebalancing(pool, price_feed);
    if (block_num % VAULT_CONVERSION_PERIOD == 0) {
        vault_conversion(pool, price_feed);
    }
}

void DynamicBetaProtocolHooks::after_swap(DiamondPool& pool, const PriceFeed& price_feed,
                                          double volatility, uint64_t block_num) {
    pool.set_beta(params_ ? calculate_dynamic_beta(volatility, *params_)
                          : calculate_dynamic_beta(volatility));
    DiamondProtocolHooks::after_swap(pool, price_feed, volatility, block_num);
}

// =============================================================================
// Core Protocol
// =============================================================================

bool core_protocol(DiamondPool& pool, const PriceFeed& price_feed, double tx_fee_per_eth) {
    double beta = pool.beta();
    Token token_x = pool.token_x();
    Token token_y = pool.token_y();
    double target_price = price_feed.ratio(token_x, token_y);
    double tx_fee = tx_fee_per_eth * target_price;

    ArbitrageTrade trade =
        compute_profit_maximizing_trade(price_feed[token_x], price_feed[token_y], pool);
    if (trade.empty()) return false;

    Token token_in = trade.x_to_y ? token_x : token_y;
    Token token_out = pool.other_token(token_in);
    double price_in = price_feed[token_in];
    double price_out = price_feed[token_out];

    double amount_in = trade.amount_in;
    double amount_out = pool.quote(token_in, amount_in);
    double swap_fee = amount_in * price_in * pool.fee();

    // Pool-side deltas of the unsplit swap; beta of the loss goes to the vault
    double delta_in = amount_in;
    double delta_out = -amount_out;
    double lp_loss_vs_cex =
        -(1.0 - beta) * (delta_in * price_in + delta_out * price_out) + swap_fee;
    double arbitrageur_profit = lp_loss_vs_cex - swap_fee - tx_fee;

    if (arbitrageur_profit <= 0.0) return false;

    // Arbitrageur trades (1 - beta) of the swap; beta of the output is captured
    pool.vault_.deposit(token_out, amount_out * beta);
    pool.add_liquidity(token_in, amount_in * (1.0 - beta));
    pool.remove_liquidity(token_out, amount_out);

    // Re-peg the output side to the target price, excess to the vault
    double pegged_out = token_out == token_y
        ? pool.reserve_x() * target_price
        : pool.reserve_y() / target_price;
    double residual = pool.reserve(token_out) - pegged_out;
    if (residual > 0.0) {
        pool.set_reserve(token_out, pegged_out);
        pool.vault_.deposit(token_out, residual);
    }

    // LVR excludes swap and tx fees
    pool.record_arbitrage(lp_loss_vs_cex, swap_fee, amount_in * price_in);
    return true;
}

// =============================================================================
// Vault Maintenance
// =============================================================================

void vault_rebalancing(DiamondPool& pool, const PriceFeed& price_feed) {
    Token token_x = pool.token_x();
    Token token_y = pool.token_y();
    double target_price = price_feed.ratio(token_x, token_y);
    Vault& vault = pool.vault();

    // The matched side never exceeds the vault balance, so no side goes negative
    if (vault.reserve_y() < vault.reserve_x() * target_price) {
        // All of Y with its value-matched X
        double move_y = vault.reserve_y();
        double adjust_x = std::min(move_y / target_price, vault.reserve_x());
        pool.add_liquidity(token_y, move_y);
        pool.add_liquidity(token_x, adjust_x);
        vault.withdraw(token_y, move_y);
        vault.withdraw(token_x, adjust_x);
    } else if (vault.reserve_x() < vault.reserve_y() / target_price) {
        // All of X with its value-matched Y
        double move_x = vault.reserve_x();
        double adjust_y = std::min(move_x * target_price, vault.reserve_y());
        pool.add_liquidity(token_x, move_x);
        pool.add_liquidity(token_y, adjust_y);
        vault.withdraw(token_x, move_x);
        vault.withdraw(token_y, adjust_y);
    }
}

void vault_conversion(DiamondPool& pool, const PriceFeed& price_feed) {
    Token token_x = pool.token_x();
    Token token_y = pool.token_y();
    double target_price = price_feed.ratio(token_x, token_y);
    Vault& vault = pool.vault();

    if (vault.reserve_x() == 0.0 && vault.reserve_y() != 0.0) {
        double half_y = vault.reserve_y() / 2.0;
        pool.add_liquidity(token_x, half_y / target_price);
        pool.add_liquidity(token_y, half_y);
        vault.withdraw(token_y, vault.reserve_y());
    } else if (vault.reserve_y() == 0.0 && vault.reserve_x() != 0.0) {
        double half_x = vault.reserve_x() / 2.0;
        pool.add_liquidity(token_y, half_x * target_price);
        pool.add_liquidity(token_x, half_x);
        vault.withdraw(token_x, vault.reserve_x());
    }
}

} // namespace lvr
