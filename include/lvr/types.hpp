#ifndef LVR_TYPES_HPP
#define LVR_TYPES_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lvr {

// =============================================================================
// Tokens
// =============================================================================

// ETH is the volatile token X, USDC the numeraire token Y.
enum class Token : uint8_t {
    ETH = 0,
    USDC = 1
};

constexpr size_t NUM_TOKENS = 2;

inline const char* to_string(Token token) {
    switch (token) {
        case Token::ETH:  return "ETH";
        case Token::USDC: return "USDC";
    }
    return "UNKNOWN";
}

// Per-token amounts (reserves, vault balances)
struct TokenAmounts {
    std::array<double, NUM_TOKENS> values{};

    double& operator[](Token token) { return values[static_cast<size_t>(token)]; }
    double operator[](Token token) const { return values[static_cast<size_t>(token)]; }
};

// =============================================================================
// Price Feed / Oracle
// =============================================================================

// Prices of both tokens in a common unit. All values > 0.
struct PriceFeed {
    std::array<double, NUM_TOKENS> prices{1.0, 1.0};

    PriceFeed() = default;
    PriceFeed(double eth_price, double usdc_price) : prices{eth_price, usdc_price} {}

    double& operator[](Token token) { return prices[static_cast<size_t>(token)]; }
    double operator[](Token token) const { return prices[static_cast<size_t>(token)]; }

    // Price of `base` denominated in `quote`
    double ratio(Token base, Token quote) const { return (*this)[base] / (*this)[quote]; }
};

// One price feed per block
using Oracle = std::vector<PriceFeed>;

// =============================================================================
// Pool Variants
// =============================================================================

enum class PoolKind : uint8_t {
    Liquidity = 0,  // Plain constant-product pool
    Diamond = 1     // Constant-product pool with vault protocol
};

inline const char* to_string(PoolKind kind) {
    return kind == PoolKind::Diamond ? "Diamond" : "Liquidity";
}

// =============================================================================
// Block Context (passed to before/after swap phases)
// =============================================================================

struct BlockContext {
    const PriceFeed& price_feed;
    double volatility;
    uint64_t block_num;
    double tx_fee_per_eth;
};

} // namespace lvr

#endif // LVR_TYPES_HPP
