#ifndef LVR_CONFIG_HPP
#define LVR_CONFIG_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "curve.hpp"
#include "router.hpp"
#include "types.hpp"

namespace lvr {

// =============================================================================
// Pool Configuration
// =============================================================================

// Hook set attached to a diamond pool
enum class ProtocolKind : uint8_t {
    None = 0,     // No hooks
    Static = 1,   // DiamondProtocolHooks
    Dynamic = 2   // DynamicBetaProtocolHooks
};

ProtocolKind protocol_from_string(std::string_view name);
const char* to_string(ProtocolKind kind);

struct PoolConfig {
    PoolKind kind = PoolKind::Liquidity;
    double reserve_x = 0.0;
    double reserve_y = 0.0;
    double fee = 0.003;
    bool dynamic_fee = false;  // Plain pools only

    // Diamond only
    double beta = 0.9;
    bool dynamic_beta = false;
    ProtocolKind protocol = ProtocolKind::Static;
    // Dynamic protocol only; unset uses the scaled standard beta curve
    std::optional<CurveParams> beta_curve;
};

// =============================================================================
// Simulation Configuration
// =============================================================================

struct SimulationConfig {
    uint64_t blocks_per_day = 86400 / 12;  // 12 second blocks
    uint64_t num_days = 10;
    double tx_fee_per_eth = 0.009;
    double new_liquidity = 0.0;
    uint64_t new_liquidity_period = 0;
    uint64_t seed = 123;

    double initial_price = 2300.0;
    double sigma_per_day = 0.05;

    bool record_history = false;
    bool verbose = false;

    Token token_x = Token::ETH;
    Token token_y = Token::USDC;

    RetailFlowParams retail_flow;
    std::vector<PoolConfig> pools;

    // One plain pool and two diamond pools (static and dynamic beta), each
    // seeded with `total_value` split evenly at initial_price
    static SimulationConfig default_scenario(double total_value = 1e8);

    // Load from JSON (missing keys keep their defaults)
    static SimulationConfig from_file(std::string_view path);
    static SimulationConfig from_json(std::string_view content);

    std::string to_json() const;
};

// nlohmann ADL hooks
void to_json(nlohmann::json& j, const CurveParams& params);
void from_json(const nlohmann::json& j, CurveParams& params);
void to_json(nlohmann::json& j, const RetailFlowParams& params);
void from_json(const nlohmann::json& j, RetailFlowParams& params);
void to_json(nlohmann::json& j, const PoolConfig& config);
void from_json(const nlohmann::json& j, PoolConfig& config);
void to_json(nlohmann::json& j, const SimulationConfig& config);
void from_json(const nlohmann::json& j, SimulationConfig& config);

} // namespace lvr

#endif // LVR_CONFIG_HPP
