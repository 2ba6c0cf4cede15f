#ifndef LVR_ORACLE_HPP
#define LVR_ORACLE_HPP

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

#include "types.hpp"

namespace lvr {

// =============================================================================
// GBM Path Configuration
// =============================================================================

struct OracleConfig {
    uint64_t blocks_per_day;
    uint64_t num_days;
    double initial_price;     // token_x price at the start of the run
    double sigma_per_day;     // Daily volatility of token_x
    double mu = 0.0;          // Drift
};

// Lookback consumed by the volatility estimator (two one-day windows)
constexpr uint64_t WARMUP_DAYS = 2;

// =============================================================================
// PriceOracle - Block-Indexed Reference Prices and Realized Volatility
// =============================================================================

class PriceOracle {
public:
    PriceOracle() = default;

    // Build from an explicit price path. `volatility` must already be aligned
    // with `feeds` (same length, same block indices).
    PriceOracle(Oracle feeds, std::vector<double> volatility);

    // Geometric Brownian motion for ETH with USDC pinned at 1.0.
    // The path spans (num_days + WARMUP_DAYS) * blocks_per_day blocks and is
    // normalized so the first post-warm-up block equals initial_price.
    // Volatility is computed over the full path with a one-day window, then
    // the warm-up blocks are dropped so both series start at block 0.
    static PriceOracle generate_gbm(const OracleConfig& config, std::mt19937_64& rng);

    // Raw GBM path (no trimming), used by generate_gbm
    static std::vector<double> gbm_path(size_t steps, double sigma_per_day, double mu,
                                        uint64_t blocks_per_day, std::mt19937_64& rng);

    const PriceFeed& at(uint64_t block_num) const;
    double volatility(uint64_t block_num) const;

    const Oracle& feeds() const { return feeds_; }
    const std::vector<double>& volatility_series() const { return volatility_; }

    size_t size() const { return feeds_.size(); }
    bool empty() const { return feeds_.empty(); }

private:
    Oracle feeds_;
    std::vector<double> volatility_;
};

} // namespace lvr

#endif // LVR_ORACLE_HPP
