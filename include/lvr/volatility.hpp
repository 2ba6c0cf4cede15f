#ifndef LVR_VOLATILITY_HPP
#define LVR_VOLATILITY_HPP

#include <cstddef>
#include <vector>

#include "types.hpp"

namespace lvr {

// =============================================================================
// Time-Weighted Moving Average
// =============================================================================

// Sliding-window mean, updated incrementally after an O(window) seed.
// Returns prices.size() - window - 1 values; entry i averages prices[i, i+window).
std::vector<double> time_weighted_moving_average(const std::vector<double>& prices,
                                                 size_t window);

// =============================================================================
// Realized Volatility
// =============================================================================

// Rolling mean squared deviation of the token_x/token_y price from its TWMA,
// over a second window offset by `window` blocks. Entry i covers prices
// [i + window, i + 2*window). Returns oracle.size() - 2*window values.
std::vector<double> calculate_volatility(Token token_x, Token token_y,
                                         const Oracle& oracle, size_t window);

} // namespace lvr

#endif // LVR_VOLATILITY_HPP
