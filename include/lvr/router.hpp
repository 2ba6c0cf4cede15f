#ifndef LVR_ROUTER_HPP
#define LVR_ROUTER_HPP

#include <cstdint>
#include <random>
#include <vector>

#include "pool.hpp"
#include "types.hpp"

namespace lvr {

using Rng = std::mt19937_64;

// =============================================================================
// Retail Flow Calibration
// =============================================================================

// Transactions per block and mean swap size (in token_y units), taken from the
// Uniswap V2 ETH/USDT pool between 2023/02 and 2024/02.
struct RetailFlowParams {
    double txn_mean = 1.2546;
    double txn_std = 0.5909;
    double size_mean = 1743.0;
    double size_std = 6331.0;
};

// =============================================================================
// Uninformed Transactions
// =============================================================================

enum class SwapDirection : int8_t {
    XToY = 1,   // Sell token_x
    YToX = -1   // Sell token_y
};

struct RetailTransaction {
    double size;              // Notional in token_y units
    SwapDirection direction;
};

struct BlockFlow {
    uint64_t num_transactions = 0;
    double retail_size = 0.0;
};

// Draw this block's transaction count and mean size, both floored at 0
BlockFlow sample_block_flow(Rng& rng, const RetailFlowParams& params);

// `n` exponential swap sizes with mean `scale`, uniform random directions.
// A non-positive scale yields zero-sized transactions.
std::vector<RetailTransaction> generate_uninformed_transactions(uint64_t n, double scale,
                                                                Rng& rng);

// =============================================================================
// Multi-Pool Routing
// =============================================================================

struct PendingSwap {
    Pool* pool;
    double size;
    SwapDirection direction;
};

// Pools tied for the best strictly positive output, each with an even share
std::vector<PendingSwap> route_transaction(const std::vector<Pool*>& pools,
                                           const RetailTransaction& txn,
                                           const PriceFeed& price_feed);

// Route a batch: all quotes are taken before any swap executes.
// Returns the number of swaps executed.
size_t execute_retail_flow(const std::vector<Pool*>& pools,
                           const std::vector<RetailTransaction>& transactions,
                           const PriceFeed& price_feed);

// Sample one block of uninformed flow and route it across `pools`
size_t multi_pool_random_swap(const std::vector<Pool*>& pools, const PriceFeed& price_feed,
                              Rng& rng, const RetailFlowParams& params = RetailFlowParams{});

} // namespace lvr

#endif // LVR_ROUTER_HPP
