#ifndef LVR_DIAMOND_HPP
#define LVR_DIAMOND_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <utility>

#include "curve.hpp"
#include "pool.hpp"
#include "types.hpp"

namespace lvr {

class DiamondPool;

// =============================================================================
// Vault (owned by a single DiamondPool)
// =============================================================================

class Vault {
public:
    Vault(Token token_x, Token token_y) : token_x_(token_x), token_y_(token_y) {}

    double reserve(Token token) const { return reserve_[token]; }
    double reserve_x() const { return reserve_[token_x_]; }
    double reserve_y() const { return reserve_[token_y_]; }

    void deposit(Token token, double amount) { reserve_[token] += amount; }
    void withdraw(Token token, double amount) { reserve_[token] -= amount; }

    double value(const PriceFeed& price_feed) const {
        return reserve_x() * price_feed[token_x_] + reserve_y() * price_feed[token_y_];
    }

private:
    Token token_x_;
    Token token_y_;
    TokenAmounts reserve_;
};

// =============================================================================
// Hook Interface
// =============================================================================

class IDiamondHooks {
public:
    virtual ~IDiamondHooks() = default;

    virtual void before_swap(DiamondPool& pool, const PriceFeed& price_feed,
                             double volatility, uint64_t block_num) {}
    virtual void after_swap(DiamondPool& pool, const PriceFeed& price_feed,
                            double volatility, uint64_t block_num) {}
};

// Null hooks (no-op)
class NullHooks : public IDiamondHooks {};

// Caller-supplied callables; an empty function is skipped
class FunctionHooks : public IDiamondHooks {
public:
    using Callback = std::function<void(DiamondPool&, const PriceFeed&, double, uint64_t)>;

    FunctionHooks(Callback before, Callback after)
        : before_(std::move(before)), after_(std::move(after)) {}

    void before_swap(DiamondPool& pool, const PriceFeed& price_feed,
                     double volatility, uint64_t block_num) override;
    void after_swap(DiamondPool& pool, const PriceFeed& price_feed,
                    double volatility, uint64_t block_num) override;

private:
    Callback before_;
    Callback after_;
};

// Core protocol every block, vault rebalancing every block,
// vault conversion every VAULT_CONVERSION_PERIOD blocks
class DiamondProtocolHooks : public IDiamondHooks {
public:
    explicit DiamondProtocolHooks(double tx_fee_per_eth) : tx_fee_per_eth_(tx_fee_per_eth) {}

    void after_swap(DiamondPool& pool, const PriceFeed& price_feed,
                    double volatility, uint64_t block_num) override;

    double tx_fee_per_eth() const { return tx_fee_per_eth_; }

private:
    double tx_fee_per_eth_;
};

// Sets beta from volatility, then runs the protocol. The default curve is the
// scaled standard curve, calculate_dynamic_beta(volatility), in [0, 1].
// Explicit CurveParams select the parameterized curve, in [0, MAX_DYNAMIC_BETA].
class DynamicBetaProtocolHooks : public DiamondProtocolHooks {
public:
    explicit DynamicBetaProtocolHooks(double tx_fee_per_eth)
        : DiamondProtocolHooks(tx_fee_per_eth) {}
    DynamicBetaProtocolHooks(double tx_fee_per_eth, const CurveParams& params)
        : DiamondProtocolHooks(tx_fee_per_eth), params_(params) {}

    void after_swap(DiamondPool& pool, const PriceFeed& price_feed,
                    double volatility, uint64_t block_num) override;

    const std::optional<CurveParams>& params() const { return params_; }

private:
    std::optional<CurveParams> params_;
};

constexpr uint64_t VAULT_CONVERSION_PERIOD = 10;

// =============================================================================
// DiamondPool - Constant-Product Pool with Arbitrage-Capture Vault
// =============================================================================

class DiamondPool : public Pool {
public:
    DiamondPool(Token token_x, Token token_y, double fee, double beta,
                std::shared_ptr<IDiamondHooks> hooks = nullptr,
                bool dynamic_beta = false);

    PoolKind kind() const override { return PoolKind::Diamond; }

    // Pool reserves plus vault balance
    double total_value_locked(const PriceFeed& price_feed) const override;

    // Dynamic beta update, then the before-swap hook. Diamond pools keep a
    // static fee.
    void before_swap(const BlockContext& ctx) override;

    // After-swap hook (no built-in arbitrage)
    void after_swap(const BlockContext& ctx) override;

    double beta() const { return beta_; }
    void set_beta(double beta) { beta_ = beta; }
    bool dynamic_beta() const { return dynamic_beta_; }

    Vault& vault() { return vault_; }
    const Vault& vault() const { return vault_; }

    IDiamondHooks& hooks() { return *hooks_; }
    void set_hooks(std::shared_ptr<IDiamondHooks> hooks);

    // Protocol functions re-peg reserves directly
    friend bool core_protocol(DiamondPool& pool, const PriceFeed& price_feed,
                              double tx_fee_per_eth);

private:
    double beta_;
    bool dynamic_beta_;
    Vault vault_;
    std::shared_ptr<IDiamondHooks> hooks_;
};

// =============================================================================
// Vault Protocol
// =============================================================================

// Beta-split arbitrage capture. Returns true if the arbitrage executed.
bool core_protocol(DiamondPool& pool, const PriceFeed& price_feed, double tx_fee_per_eth);

// Fold the value-balanced part of the vault back into the pool
void vault_rebalancing(DiamondPool& pool, const PriceFeed& price_feed);

// Split a single-token vault balance into both tokens and add it to the pool
void vault_conversion(DiamondPool& pool, const PriceFeed& price_feed);

} // namespace lvr

#endif // LVR_DIAMOND_HPP
