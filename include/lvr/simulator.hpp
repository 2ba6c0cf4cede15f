#ifndef LVR_SIMULATOR_HPP
#define LVR_SIMULATOR_HPP

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <random>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "config.hpp"
#include "diamond.hpp"
#include "oracle.hpp"
#include "pool.hpp"
#include "router.hpp"
#include "types.hpp"

namespace lvr {

// =============================================================================
// Snapshots
// =============================================================================

struct PoolSnapshot {
    PoolKind kind;
    Token token_x;
    Token token_y;
    double reserve_x;
    double reserve_y;
    double price;
    double oracle_price;
    double tvl;
    double lvr;
    double fees_retail;
    double fees_arbitrage;
    double fees_total;
    double volume_retail;
    double volume_arbitrage;
    double volume_total;
    double fee;
    double beta;        // 0 for plain pools
    double vault_x;     // 0 for plain pools
    double vault_y;
};

// One ledger row per block, recorded after the block's after-swap phase
struct BlockRecord {
    uint64_t block_num;
    double oracle_price;
    double volatility;
    std::vector<PoolSnapshot> pools;
};

void to_json(nlohmann::json& j, const PoolSnapshot& snapshot);
void to_json(nlohmann::json& j, const BlockRecord& record);

// =============================================================================
// Simulator State
// =============================================================================

enum class SimState : uint8_t {
    Uninitialized = 0,  // No oracle yet
    OracleSeeded = 1,   // Oracle generated, no block run
    Running = 2,
    Finished = 3        // Last configured block completed
};

const char* to_string(SimState state);

// =============================================================================
// Simulator - One Independent Monte-Carlo Run
// =============================================================================

class Simulator {
public:
    static constexpr uint64_t DEFAULT_SEED = 123;

    Simulator(uint64_t blocks_per_day, uint64_t num_days, double tx_fee_per_eth,
              double new_liquidity, uint64_t new_liquidity_period,
              uint64_t seed = DEFAULT_SEED);
    ~Simulator() = default;

    // Non-copyable
    Simulator(const Simulator&) = delete;
    Simulator& operator=(const Simulator&) = delete;
    Simulator(Simulator&&) = default;
    Simulator& operator=(Simulator&&) = default;

    // Pools and oracle built from configuration, ready to run
    static Simulator from_config(const SimulationConfig& config);

    // =========================================================================
    // Construction
    // =========================================================================

    Pool& create_liquidity_pool(Token token_x, Token token_y, double reserve_x,
                                double reserve_y, double fee, bool dynamic_fee = false);

    DiamondPool& create_diamond_pool(Token token_x, Token token_y, double reserve_x,
                                     double reserve_y, double fee,
                                     std::shared_ptr<IDiamondHooks> hooks, double beta,
                                     bool dynamic_beta = false);

    DiamondPool& create_diamond_pool(Token token_x, Token token_y, double reserve_x,
                                     double reserve_y, double fee,
                                     FunctionHooks::Callback before_swap,
                                     FunctionHooks::Callback after_swap, double beta,
                                     bool dynamic_beta = false);

    // GBM oracle and aligned volatility series
    void create_oracle(double initial_price, double sigma_per_day);

    // Explicit oracle (e.g. replayed or hand-built price paths)
    void set_oracle(PriceOracle oracle);

    void set_retail_flow(const RetailFlowParams& params) { retail_flow_ = params; }
    void set_record_history(bool enabled) { record_history_ = enabled; }

    // =========================================================================
    // Step API
    // =========================================================================

    // Dynamic fee/beta updates and pool pre-hooks
    void before_swap(uint64_t block_num);

    // Uninformed flow routed across all pools
    void retail_swap(uint64_t block_num);

    // Arbitrage (plain pools) or protocol hooks (diamond pools)
    void after_swap(uint64_t block_num);

    // before_swap, retail_swap, after_swap
    void run_block(uint64_t block_num);

    // New liquidity split by TVL share, if due after `block_num`
    bool inject_liquidity(uint64_t block_num);

    // All configured blocks; verbose prints the first and last snapshots
    void run(bool verbose = false);
    void run(bool verbose, std::ostream& out);

    // =========================================================================
    // Read API
    // =========================================================================

    std::vector<PoolSnapshot> current_snapshot() const;
    std::vector<PoolSnapshot> snapshot(uint64_t block_num) const;
    void print_snapshot(std::ostream& out, uint64_t block_num) const;

    const std::vector<BlockRecord>& history() const { return history_; }

    const std::vector<std::unique_ptr<Pool>>& pools() const { return pools_; }
    Pool& pool(size_t index) { return *pools_.at(index); }
    const Pool& pool(size_t index) const { return *pools_.at(index); }
    size_t num_pools() const { return pools_.size(); }

    const PriceOracle& oracle() const { return oracle_; }
    double volatility(uint64_t block_num) const { return oracle_.volatility(block_num); }

    SimState state() const { return state_; }
    uint64_t current_block() const { return current_block_; }
    uint64_t total_blocks() const { return blocks_per_day_ * num_days_; }

    uint64_t blocks_per_day() const { return blocks_per_day_; }
    uint64_t num_days() const { return num_days_; }
    double tx_fee_per_eth() const { return tx_fee_per_eth_; }
    double new_liquidity() const { return new_liquidity_; }
    uint64_t new_liquidity_period() const { return new_liquidity_period_; }
    uint64_t seed() const { return seed_; }

private:
    uint64_t blocks_per_day_;
    uint64_t num_days_;
    double tx_fee_per_eth_;
    double new_liquidity_;
    uint64_t new_liquidity_period_;
    uint64_t seed_;

    std::vector<std::unique_ptr<Pool>> pools_;
    PriceOracle oracle_;
    Rng rng_;
    RetailFlowParams retail_flow_;

    SimState state_{SimState::Uninitialized};
    uint64_t current_block_{0};

    bool record_history_{false};
    std::vector<BlockRecord> history_;

    // Throws if the oracle is missing or block_num is out of range
    void check_block(uint64_t block_num) const;
    BlockContext context(uint64_t block_num) const;
    std::vector<Pool*> pool_ptrs() const;
    void record_block(uint64_t block_num);
};

} // namespace lvr

#endif // LVR_SIMULATOR_HPP
