// =============================================================================
// router.cpp - Uninformed Retail Flow and Best-Price Routing
// =============================================================================

#include "lvr/router.hpp"
#include <algorithm>
#include <cmath>

namespace lvr {

// =============================================================================
// Flow Generation
// =============================================================================

BlockFlow sample_block_flow(Rng& rng, const RetailFlowParams& params) {
    std::normal_distribution<double> txn_dist(params.txn_mean, params.txn_std);
    std::normal_distribution<double> size_dist(params.size_mean, params.size_std);

    BlockFlow flow;
    double n = std::max(std::round(txn_dist(rng)), 0.0);
    flow.num_transactions = static_cast<uint64_t>(n);
    flow.retail_size = std::max(size_dist(rng), 0.0);
    return flow;
}

std::vector<RetailTransaction> generate_uninformed_transactions(uint64_t n, double scale,
                                                                Rng& rng) {
    std::vector<RetailTransaction> transactions(n, RetailTransaction{0.0, SwapDirection::XToY});
    if (n == 0) return transactions;

    if (scale > 0.0) {
        std::exponential_distribution<double> size_dist(1.0 / scale);
        for (auto& txn : transactions) txn.size = size_dist(rng);
    }

    std::bernoulli_distribution direction_dist(0.5);
    for (auto& txn : transactions) {
        txn.direction = direction_dist(rng) ? SwapDirection::XToY : SwapDirection::YToX;
    }
    return transactions;
}

// =============================================================================
// Routing
// =============================================================================

std::vector<PendingSwap> route_transaction(const std::vector<Pool*>& pools,
                                           const RetailTransaction& txn,
                                           const PriceFeed& price_feed) {
    std::vector<PendingSwap> swaps;
    if (pools.empty() || txn.size <= 0.0) return swaps;

    Token token_x = pools.front()->token_x();
    Token token_y = pools.front()->token_y();
    double target_price = price_feed.ratio(token_x, token_y);

    std::vector<Pool*> best_pools;
    double best_amount_out = 0.0;
    for (Pool* pool : pools) {
        double amount_out = txn.direction == SwapDirection::XToY
            ? pool->quote(token_x, txn.size / target_price)
            : pool->quote(token_y, txn.size);

        if (amount_out > best_amount_out) {
            best_amount_out = amount_out;
            best_pools.assign(1, pool);
        } else if (amount_out == best_amount_out && best_amount_out > 0.0) {
            best_pools.push_back(pool);
        }
    }

    if (best_pools.empty()) return swaps;

    // Even split across tied pools
    double split_size = txn.size / static_cast<double>(best_pools.size());
    swaps.reserve(best_pools.size());
    for (Pool* pool : best_pools) {
        swaps.push_back(PendingSwap{pool, split_size, txn.direction});
    }
    return swaps;
}

size_t execute_retail_flow(const std::vector<Pool*>& pools,
                           const std::vector<RetailTransaction>& transactions,
                           const PriceFeed& price_feed) {
    if (pools.empty() || transactions.empty()) return 0;

    Token token_x = pools.front()->token_x();
    Token token_y = pools.front()->token_y();
    double target_price = price_feed.ratio(token_x, token_y);

    std::vector<PendingSwap> pending;
    for (const auto& txn : transactions) {
        auto swaps = route_transaction(pools, txn, price_feed);
        pending.insert(pending.end(), swaps.begin(), swaps.end());
    }

    for (const auto& swap : pending) {
        if (swap.direction == SwapDirection::XToY) {
            swap.pool->swap(token_x, swap.size / target_price);
        } else {
            swap.pool->swap(token_y, swap.size);
        }

        double notional = swap.size * price_feed[token_y];
        swap.pool->record_retail(notional * swap.pool->fee(), notional);
    }
    return pending.size();
}

size_t multi_pool_random_swap(const std::vector<Pool*>& pools, const PriceFeed& price_feed,
                              Rng& rng, const RetailFlowParams& params) {
    if (pools.empty()) return 0;

    BlockFlow flow = sample_block_flow(rng, params);
    auto transactions = generate_uninformed_transactions(flow.num_transactions,
                                                         flow.retail_size, rng);
    return execute_retail_flow(pools, transactions, price_feed);
}

} // namespace lvr
