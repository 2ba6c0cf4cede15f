// =============================================================================
// config.cpp - JSON Run Configuration
// =============================================================================

#include "lvr/config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace lvr {

using json = nlohmann::json;

// =============================================================================
// Enum Names
// =============================================================================

ProtocolKind protocol_from_string(std::string_view name) {
    if (name == "none") return ProtocolKind::None;
    if (name == "static") return ProtocolKind::Static;
    if (name == "dynamic") return ProtocolKind::Dynamic;
    throw std::invalid_argument("Unknown diamond protocol: " + std::string(name));
}

const char* to_string(ProtocolKind kind) {
    switch (kind) {
        case ProtocolKind::None:    return "none";
        case ProtocolKind::Static:  return "static";
        case ProtocolKind::Dynamic: return "dynamic";
    }
    return "none";
}

namespace {

PoolKind pool_kind_from_string(const std::string& name) {
    if (name == "liquidity") return PoolKind::Liquidity;
    if (name == "diamond") return PoolKind::Diamond;
    throw std::invalid_argument("Unknown pool type: " + name);
}

Token token_from_string(const std::string& name) {
    if (name == "ETH") return Token::ETH;
    if (name == "USDC") return Token::USDC;
    throw std::invalid_argument("Unknown token: " + name);
}

}  // namespace

// =============================================================================
// Curve / Retail Flow
// =============================================================================

void to_json(json& j, const CurveParams& params) {
    j = json{
        {"initial_min", params.initial_min},
        {"alpha1", params.alpha1},
        {"alpha2", params.alpha2},
        {"beta1", params.beta1},
        {"beta2", params.beta2},
        {"gamma1", params.gamma1},
        {"gamma2", params.gamma2}
    };
}

void from_json(const json& j, CurveParams& params) {
    CurveParams defaults;
    params.initial_min = j.value("initial_min", defaults.initial_min);
    params.alpha1 = j.value("alpha1", defaults.alpha1);
    params.alpha2 = j.value("alpha2", defaults.alpha2);
    params.beta1 = j.value("beta1", defaults.beta1);
    params.beta2 = j.value("beta2", defaults.beta2);
    params.gamma1 = j.value("gamma1", defaults.gamma1);
    params.gamma2 = j.value("gamma2", defaults.gamma2);
}

void to_json(json& j, const RetailFlowParams& params) {
    j = json{
        {"txn_mean", params.txn_mean},
        {"txn_std", params.txn_std},
        {"size_mean", params.size_mean},
        {"size_std", params.size_std}
    };
}

void from_json(const json& j, RetailFlowParams& params) {
    RetailFlowParams defaults;
    params.txn_mean = j.value("txn_mean", defaults.txn_mean);
    params.txn_std = j.value("txn_std", defaults.txn_std);
    params.size_mean = j.value("size_mean", defaults.size_mean);
    params.size_std = j.value("size_std", defaults.size_std);
}

// =============================================================================
// Pools
// =============================================================================

void to_json(json& j, const PoolConfig& config) {
    j = json{
        {"type", config.kind == PoolKind::Diamond ? "diamond" : "liquidity"},
        {"reserve_x", config.reserve_x},
        {"reserve_y", config.reserve_y},
        {"fee", config.fee}
    };
    if (config.kind == PoolKind::Liquidity) {
        j["dynamic_fee"] = config.dynamic_fee;
    } else {
        j["beta"] = config.beta;
        j["dynamic_beta"] = config.dynamic_beta;
        j["protocol"] = to_string(config.protocol);
        if (config.beta_curve) j["beta_curve"] = *config.beta_curve;
    }
}

void from_json(const json& j, PoolConfig& config) {
    PoolConfig defaults;
    config.kind = pool_kind_from_string(j.value("type", std::string("liquidity")));
    config.reserve_x = j.at("reserve_x").get<double>();
    config.reserve_y = j.at("reserve_y").get<double>();
    config.fee = j.value("fee", defaults.fee);
    config.dynamic_fee = j.value("dynamic_fee", defaults.dynamic_fee);
    config.beta = j.value("beta", defaults.beta);
    config.dynamic_beta = j.value("dynamic_beta", defaults.dynamic_beta);
    config.protocol = protocol_from_string(
        j.value("protocol", std::string(to_string(defaults.protocol))));
    if (j.contains("beta_curve")) {
        config.beta_curve = j.at("beta_curve").get<CurveParams>();
    } else {
        config.beta_curve.reset();
    }
}

// =============================================================================
// Simulation
// =============================================================================

void to_json(json& j, const SimulationConfig& config) {
    j = json{
        {"blocks_per_day", config.blocks_per_day},
        {"num_days", config.num_days},
        {"tx_fee_per_eth", config.tx_fee_per_eth},
        {"new_liquidity", config.new_liquidity},
        {"new_liquidity_period", config.new_liquidity_period},
        {"seed", config.seed},
        {"initial_price", config.initial_price},
        {"sigma_per_day", config.sigma_per_day},
        {"record_history", config.record_history},
        {"verbose", config.verbose},
        {"token_x", to_string(config.token_x)},
        {"token_y", to_string(config.token_y)},
        {"retail_flow", config.retail_flow},
        {"pools", config.pools}
    };
}

void from_json(const json& j, SimulationConfig& config) {
    SimulationConfig defaults;
    config.blocks_per_day = j.value("blocks_per_day", defaults.blocks_per_day);
    config.num_days = j.value("num_days", defaults.num_days);
    config.tx_fee_per_eth = j.value("tx_fee_per_eth", defaults.tx_fee_per_eth);
    config.new_liquidity = j.value("new_liquidity", defaults.new_liquidity);
    config.new_liquidity_period = j.value("new_liquidity_period", defaults.new_liquidity_period);
    config.seed = j.value("seed", defaults.seed);
    config.initial_price = j.value("initial_price", defaults.initial_price);
    config.sigma_per_day = j.value("sigma_per_day", defaults.sigma_per_day);
    config.record_history = j.value("record_history", defaults.record_history);
    config.verbose = j.value("verbose", defaults.verbose);
    config.token_x = token_from_string(j.value("token_x", std::string(to_string(defaults.token_x))));
    config.token_y = token_from_string(j.value("token_y", std::string(to_string(defaults.token_y))));
    config.retail_flow = j.value("retail_flow", defaults.retail_flow);
    config.pools = j.value("pools", defaults.pools);
}

SimulationConfig SimulationConfig::default_scenario(double total_value) {
    SimulationConfig config;

    double reserve_x = total_value / 2.0 / config.initial_price;
    double reserve_y = total_value / 2.0;

    PoolConfig cfmm;
    cfmm.kind = PoolKind::Liquidity;
    cfmm.reserve_x = reserve_x;
    cfmm.reserve_y = reserve_y;

    PoolConfig diamond = cfmm;
    diamond.kind = PoolKind::Diamond;
    diamond.beta = 0.9;
    diamond.protocol = ProtocolKind::Static;

    PoolConfig dynamic = diamond;
    dynamic.protocol = ProtocolKind::Dynamic;

    config.pools = {cfmm, diamond, dynamic};
    return config;
}

SimulationConfig SimulationConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

SimulationConfig SimulationConfig::from_json(std::string_view content) {
    return json::parse(content).get<SimulationConfig>();
}

std::string SimulationConfig::to_json() const {
    return json(*this).dump(2);
}

} // namespace lvr
