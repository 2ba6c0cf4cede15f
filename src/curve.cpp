// =============================================================================
// curve.cpp - Volatility-Responsive Fee and Beta Curves
// =============================================================================

#include "lvr/curve.hpp"
#include <algorithm>
#include <cmath>

namespace lvr {

double custom_sigmoid(double x, double alpha, double gamma, double beta) noexcept {
    double exponent = std::clamp(gamma * (beta - x), -SIGMOID_EXP_LIMIT, SIGMOID_EXP_LIMIT);
    return alpha / (1.0 + std::exp(exponent));
}

double double_sigmoid(double volatility, const CurveParams& params) noexcept {
    return params.initial_min
        + custom_sigmoid(volatility, params.alpha1, params.gamma1, params.beta1)
        + custom_sigmoid(volatility, params.alpha2, params.gamma2, params.beta2);
}

double calculate_dynamic_fee(double volatility, const CurveParams& params) noexcept {
    return double_sigmoid(volatility, params);
}

double calculate_dynamic_beta(double volatility, const CurveParams& params) noexcept {
    return std::clamp(double_sigmoid(volatility, params), 0.0, MAX_DYNAMIC_BETA);
}

double calculate_dynamic_beta(double volatility) noexcept {
    double beta = double_sigmoid(volatility, CurveParams::standard()) * DYNAMIC_BETA_SCALE;
    return std::clamp(beta, 0.0, 1.0);
}

} // namespace lvr
