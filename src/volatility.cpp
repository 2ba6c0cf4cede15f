// =============================================================================
// volatility.cpp - TWMA and Rolling Realized Volatility
// =============================================================================

#include "lvr/volatility.hpp"

namespace lvr {

std::vector<double> time_weighted_moving_average(const std::vector<double>& prices,
                                                 size_t window) {
    std::vector<double> twma;
    if (window == 0 || prices.size() < window + 2) return twma;

    size_t count = prices.size() - window - 1;
    twma.reserve(count);

    // Seed: plain mean of the first window
    double sum = 0.0;
    for (size_t i = 0; i < window; ++i) sum += prices[i];
    twma.push_back(sum / static_cast<double>(window));

    // Slide: add the entering price, drop the leaving one
    for (size_t i = 0; i + 1 < count; ++i) {
        twma.push_back(twma[i] + (prices[i + window] - prices[i]) / static_cast<double>(window));
    }
    return twma;
}

std::vector<double> calculate_volatility(Token token_x, Token token_y,
                                         const Oracle& oracle, size_t window) {
    std::vector<double> volatility;
    if (window == 0 || oracle.size() < 2 * window + 1) return volatility;

    std::vector<double> prices;
    prices.reserve(oracle.size());
    for (const auto& feed : oracle) {
        prices.push_back(feed.ratio(token_x, token_y));
    }

    std::vector<double> twma = time_weighted_moving_average(prices, window);

    size_t count = prices.size() - 2 * window;
    volatility.reserve(count);

    double w = static_cast<double>(window);
    double seed = 0.0;
    for (size_t i = 0; i < window; ++i) {
        double dev = prices[i + window] - twma[i];
        seed += dev * dev;
    }
    volatility.push_back(seed / w);

    for (size_t i = 0; i + 1 < count; ++i) {
        double entering = prices[i + 2 * window] - twma[i + window];
        double leaving = prices[i + window] - twma[i];
        volatility.push_back(volatility[i] + (entering * entering - leaving * leaving) / w);
    }
    return volatility;
}

} // namespace lvr
