// =============================================================================
// simulator.cpp - Block-Stepped LVR Simulation
// =============================================================================

#include "lvr/simulator.hpp"
#include <nlohmann/json.hpp>
#include <iomanip>
#include <ios>
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>

namespace lvr {

using json = nlohmann::json;

const char* to_string(SimState state) {
    switch (state) {
        case SimState::Uninitialized: return "uninitialized";
        case SimState::OracleSeeded:  return "oracle-seeded";
        case SimState::Running:       return "running";
        case SimState::Finished:      return "finished";
    }
    return "unknown";
}

// =============================================================================
// Snapshot Serialization
// =============================================================================

void to_json(json& j, const PoolSnapshot& snapshot) {
    j = json{
        {"Type of Pool", to_string(snapshot.kind)},
        {"Token_x", to_string(snapshot.token_x)},
        {"Token_y", to_string(snapshot.token_y)},
        {"Token_x Reserve", snapshot.reserve_x},
        {"Token_y Reserve", snapshot.reserve_y},
        {"Pool Price", snapshot.price},
        {"Oracle Price", snapshot.oracle_price},
        {"TVL", snapshot.tvl},
        {"LVR", snapshot.lvr},
        {"Collected Fees Retail", snapshot.fees_retail},
        {"Collected Fees Arbitrage", snapshot.fees_arbitrage},
        {"Collected Fees", snapshot.fees_total},
        {"Volume Retail", snapshot.volume_retail},
        {"Volume Arbitrage", snapshot.volume_arbitrage},
        {"Volume", snapshot.volume_total},
        {"Fee", snapshot.fee}
    };
    if (snapshot.kind == PoolKind::Diamond) {
        j["Beta"] = snapshot.beta;
        j["Vault Token_x Reserve"] = snapshot.vault_x;
        j["Vault Token_y Reserve"] = snapshot.vault_y;
    }
}

void to_json(json& j, const BlockRecord& record) {
    j = json{
        {"block", record.block_num},
        {"oracle_price", record.oracle_price},
        {"volatility", record.volatility},
        {"pools", record.pools}
    };
}

// =============================================================================
// Construction
// =============================================================================

Simulator::Simulator(uint64_t blocks_per_day, uint64_t num_days, double tx_fee_per_eth,
                     double new_liquidity, uint64_t new_liquidity_period, uint64_t seed)
    : blocks_per_day_(blocks_per_day),
      num_days_(num_days),
      tx_fee_per_eth_(tx_fee_per_eth),
      new_liquidity_(new_liquidity),
      new_liquidity_period_(new_liquidity_period),
      seed_(seed),
      rng_(seed) {}

Simulator Simulator::from_config(const SimulationConfig& config) {
    Simulator sim(config.blocks_per_day, config.num_days, config.tx_fee_per_eth,
                  config.new_liquidity, config.new_liquidity_period, config.seed);
    sim.set_retail_flow(config.retail_flow);
    sim.set_record_history(config.record_history);

    for (const auto& pool : config.pools) {
        if (pool.kind == PoolKind::Liquidity) {
            sim.create_liquidity_pool(config.token_x, config.token_y, pool.reserve_x,
                                      pool.reserve_y, pool.fee, pool.dynamic_fee);
            continue;
        }

        std::shared_ptr<IDiamondHooks> hooks;
        switch (pool.protocol) {
            case ProtocolKind::None:
                break;
            case ProtocolKind::Static:
                hooks = std::make_shared<DiamondProtocolHooks>(config.tx_fee_per_eth);
                break;
            case ProtocolKind::Dynamic:
                hooks = pool.beta_curve
                    ? std::make_shared<DynamicBetaProtocolHooks>(config.tx_fee_per_eth,
                                                                 *pool.beta_curve)
                    : std::make_shared<DynamicBetaProtocolHooks>(config.tx_fee_per_eth);
                break;
        }
        sim.create_diamond_pool(config.token_x, config.token_y, pool.reserve_x,
                                pool.reserve_y, pool.fee, std::move(hooks), pool.beta,
                                pool.dynamic_beta);
    }

    sim.create_oracle(config.initial_price, config.sigma_per_day);
    return sim;
}

Pool& Simulator::create_liquidity_pool(Token token_x, Token token_y, double reserve_x,
                                       double reserve_y, double fee, bool dynamic_fee) {
    auto pool = std::make_unique<Pool>(token_x, token_y, fee, dynamic_fee);
    pool->add_liquidity(token_x, reserve_x);
    pool->add_liquidity(token_y, reserve_y);

    pools_.push_back(std::move(pool));
    return *pools_.back();
}

DiamondPool& Simulator::create_diamond_pool(Token token_x, Token token_y, double reserve_x,
                                            double reserve_y, double fee,
                                            std::shared_ptr<IDiamondHooks> hooks, double beta,
                                            bool dynamic_beta) {
    auto pool = std::make_unique<DiamondPool>(token_x, token_y, fee, beta,
                                              std::move(hooks), dynamic_beta);
    pool->add_liquidity(token_x, reserve_x);
    pool->add_liquidity(token_y, reserve_y);

    DiamondPool& ref = *pool;
    pools_.push_back(std::move(pool));
    return ref;
}

DiamondPool& Simulator::create_diamond_pool(Token token_x, Token token_y, double reserve_x,
                                            double reserve_y, double fee,
                                            FunctionHooks::Callback before_swap,
                                            FunctionHooks::Callback after_swap, double beta,
                                            bool dynamic_beta) {
    auto hooks = std::make_shared<FunctionHooks>(std::move(before_swap), std::move(after_swap));
    return create_diamond_pool(token_x, token_y, reserve_x, reserve_y, fee,
                               std::move(hooks), beta, dynamic_beta);
}

void Simulator::create_oracle(double initial_price, double sigma_per_day) {
    OracleConfig config{blocks_per_day_, num_days_, initial_price, sigma_per_day};
    set_oracle(PriceOracle::generate_gbm(config, rng_));
}

void Simulator::set_oracle(PriceOracle oracle) {
    oracle_ = std::move(oracle);
    state_ = SimState::OracleSeeded;
    current_block_ = 0;
    history_.clear();
}

// =============================================================================
// Internal Helpers
// =============================================================================

void Simulator::check_block(uint64_t block_num) const {
    if (state_ == SimState::Uninitialized) {
        throw std::logic_error("Simulator: create_oracle must run before any block");
    }
    if (block_num >= oracle_.size()) {
        throw std::out_of_range("Simulator: block " + std::to_string(block_num) +
                                " beyond oracle of " + std::to_string(oracle_.size()));
    }
}

BlockContext Simulator::context(uint64_t block_num) const {
    return BlockContext{oracle_.at(block_num), oracle_.volatility(block_num), block_num,
                        tx_fee_per_eth_};
}

std::vector<Pool*> Simulator::pool_ptrs() const {
    std::vector<Pool*> ptrs;
    ptrs.reserve(pools_.size());
    for (const auto& pool : pools_) ptrs.push_back(pool.get());
    return ptrs;
}

void Simulator::record_block(uint64_t block_num) {
    BlockRecord record;
    record.block_num = block_num;
    record.oracle_price = oracle_.at(block_num).ratio(Token::ETH, Token::USDC);
    record.volatility = oracle_.volatility(block_num);
    record.pools = snapshot(block_num);
    history_.push_back(std::move(record));
}

// =============================================================================
// Step API
// =============================================================================

void Simulator::before_swap(uint64_t block_num) {
    check_block(block_num);
    state_ = SimState::Running;
    current_block_ = block_num;

    BlockContext ctx = context(block_num);
    for (auto& pool : pools_) {
        pool->before_swap(ctx);
    }
}

void Simulator::retail_swap(uint64_t block_num) {
    check_block(block_num);
    multi_pool_random_swap(pool_ptrs(), oracle_.at(block_num), rng_, retail_flow_);
}

void Simulator::after_swap(uint64_t block_num) {
    check_block(block_num);

    BlockContext ctx = context(block_num);
    for (auto& pool : pools_) {
        pool->after_swap(ctx);
    }

    if (record_history_) record_block(block_num);
    if (block_num + 1 >= total_blocks()) state_ = SimState::Finished;
}

void Simulator::run_block(uint64_t block_num) {
    before_swap(block_num);
    retail_swap(block_num);
    after_swap(block_num);
}

bool Simulator::inject_liquidity(uint64_t block_num) {
    if (new_liquidity_ <= 0.0 || new_liquidity_period_ == 0) return false;
    if ((block_num + 1) % new_liquidity_period_ != 0 || block_num == 0) return false;

    const PriceFeed& price_feed = oracle_.at(block_num);
    std::vector<double> tvls;
    tvls.reserve(pools_.size());
    for (const auto& pool : pools_) {
        tvls.push_back(pool->total_value_locked(price_feed));
    }
    double total_tvl = std::accumulate(tvls.begin(), tvls.end(), 0.0);

    // Split by TVL share, half in each token at the pool's own spot price
    for (size_t i = 0; i < pools_.size(); ++i) {
        Pool& pool = *pools_[i];
        double share = new_liquidity_ * (tvls[i] / total_tvl);
        pool.add_liquidity(pool.token_x(), share / 2.0 / pool.price());
        pool.add_liquidity(pool.token_y(), share / 2.0);
    }
    return true;
}

void Simulator::run(bool verbose) {
    run(verbose, std::cout);
}

void Simulator::run(bool verbose, std::ostream& out) {
    if (state_ != SimState::OracleSeeded) {
        throw std::logic_error(std::string("Simulator: run() needs a fresh oracle, state is ") +
                               to_string(state_));
    }

    if (verbose) print_snapshot(out, 0);

    uint64_t last_block = total_blocks();
    for (uint64_t block_num = 0; block_num < last_block; ++block_num) {
        run_block(block_num);

        if (verbose && block_num + 1 == last_block) {
            print_snapshot(out, block_num);
        }

        inject_liquidity(block_num);
    }
}

// =============================================================================
// Read API
// =============================================================================

std::vector<PoolSnapshot> Simulator::current_snapshot() const {
    return snapshot(current_block_);
}

std::vector<PoolSnapshot> Simulator::snapshot(uint64_t block_num) const {
    check_block(block_num);
    const PriceFeed& price_feed = oracle_.at(block_num);

    std::vector<PoolSnapshot> snapshots;
    snapshots.reserve(pools_.size());
    for (const auto& pool : pools_) {
        const PoolMetrics& m = pool->metrics();

        PoolSnapshot s{};
        s.kind = pool->kind();
        s.token_x = pool->token_x();
        s.token_y = pool->token_y();
        s.reserve_x = pool->reserve_x();
        s.reserve_y = pool->reserve_y();
        s.price = pool->price();
        s.oracle_price = price_feed.ratio(pool->token_x(), pool->token_y());
        s.tvl = pool->total_value_locked(price_feed);
        s.lvr = m.lvr;
        s.fees_retail = m.fees_retail;
        s.fees_arbitrage = m.fees_arbitrage;
        s.fees_total = m.total_fees();
        s.volume_retail = m.volume_retail;
        s.volume_arbitrage = m.volume_arbitrage;
        s.volume_total = m.total_volume();
        s.fee = pool->fee();

        if (s.kind == PoolKind::Diamond) {
            const auto& diamond = static_cast<const DiamondPool&>(*pool);
            s.beta = diamond.beta();
            s.vault_x = diamond.vault().reserve_x();
            s.vault_y = diamond.vault().reserve_y();
        }
        snapshots.push_back(s);
    }
    return snapshots;
}

void Simulator::print_snapshot(std::ostream& out, uint64_t block_num) const {
    auto snapshots = snapshot(block_num);

    out << "Block " << block_num << "------------------------------------\n";
    std::ios_base::fmtflags flags = out.flags();
    std::streamsize precision = out.precision();
    out << std::fixed << std::setprecision(2);
    for (const auto& s : snapshots) {
        out << "Type of Pool: " << to_string(s.kind) << "\n";
        out << to_string(s.token_x) << " Reserve: " << s.reserve_x << "\n";
        out << to_string(s.token_y) << " Reserve: " << s.reserve_y << "\n";
        out << "Pool Price: " << s.price << "\n";
        out << "Oracle Price: " << s.oracle_price << "\n";
        out << "TVL: " << s.tvl << "\n";
        out << "LVR: " << s.lvr << "\n";
        out << "Collected Fees: " << s.fees_total
            << " (Retail " << s.fees_retail << ", Arbitrage " << s.fees_arbitrage << ")\n";
        out << "Volume: " << s.volume_total
            << " (Retail " << s.volume_retail << ", Arbitrage " << s.volume_arbitrage << ")\n";
        if (s.kind == PoolKind::Diamond) {
            out << "Vault " << to_string(s.token_x) << " Reserve: " << s.vault_x << "\n";
            out << "Vault " << to_string(s.token_y) << " Reserve: " << s.vault_y << "\n";
        }
    }
    out.flags(flags);
    out.precision(precision);
    out.flush();
}

} // namespace lvr
