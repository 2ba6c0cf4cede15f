// =============================================================================
// oracle.cpp - Synthetic Reference Prices
// =============================================================================

#include "lvr/oracle.hpp"
#include "lvr/volatility.hpp"
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <utility>

namespace lvr {

// =============================================================================
// Constructor
// =============================================================================

PriceOracle::PriceOracle(Oracle feeds, std::vector<double> volatility)
    : feeds_(std::move(feeds)), volatility_(std::move(volatility)) {
    // No volatility supplied: flat zero series
    if (volatility_.empty()) {
        volatility_.assign(feeds_.size(), 0.0);
    }
    if (volatility_.size() != feeds_.size()) {
        throw std::invalid_argument("volatility series not aligned with oracle");
    }
}

// =============================================================================
// GBM Generation
// =============================================================================

std::vector<double> PriceOracle::gbm_path(size_t steps, double sigma_per_day, double mu,
                                          uint64_t blocks_per_day, std::mt19937_64& rng) {
    std::vector<double> path;
    if (steps == 0) return path;
    path.reserve(steps);

    double dt = 1.0 / static_cast<double>(blocks_per_day);
    double drift = (mu - sigma_per_day * sigma_per_day / 2.0) * dt;
    std::normal_distribution<double> shock(0.0, std::sqrt(dt));

    path.push_back(1.0);
    for (size_t i = 1; i < steps; ++i) {
        path.push_back(path.back() * std::exp(drift + sigma_per_day * shock(rng)));
    }
    return path;
}

PriceOracle PriceOracle::generate_gbm(const OracleConfig& config, std::mt19937_64& rng) {
    size_t warmup = static_cast<size_t>(WARMUP_DAYS * config.blocks_per_day);
    size_t steps = static_cast<size_t>((config.num_days + WARMUP_DAYS) * config.blocks_per_day);
    if (config.blocks_per_day == 0 || config.num_days == 0) {
        throw std::invalid_argument("oracle needs at least one block per day and one day");
    }

    std::vector<double> path = gbm_path(steps, config.sigma_per_day, config.mu,
                                        config.blocks_per_day, rng);

    // Block 0 of the run (first post-warm-up block) is pinned to initial_price
    double scale = config.initial_price / path[warmup];

    Oracle feeds;
    feeds.reserve(steps);
    for (double p : path) {
        feeds.emplace_back(p * scale, 1.0);
    }

    std::vector<double> volatility = calculate_volatility(
        Token::ETH, Token::USDC, feeds, static_cast<size_t>(config.blocks_per_day));

    // Volatility is 2 * blocks_per_day shorter than the path: drop the warm-up
    feeds.erase(feeds.begin(), feeds.begin() + static_cast<std::ptrdiff_t>(warmup));

    return PriceOracle(std::move(feeds), std::move(volatility));
}

// =============================================================================
// Queries
// =============================================================================

const PriceFeed& PriceOracle::at(uint64_t block_num) const {
    return feeds_.at(block_num);
}

double PriceOracle::volatility(uint64_t block_num) const {
    return volatility_.at(block_num);
}

} // namespace lvr
