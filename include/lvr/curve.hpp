#ifndef LVR_CURVE_HPP
#define LVR_CURVE_HPP

namespace lvr {

// =============================================================================
// Double-Sigmoid Curve Parameters
// =============================================================================

// Two logistic regimes (low and high volatility) on top of a floor:
//   f(v) = initial_min + s(v; alpha1, gamma1, beta1) + s(v; alpha2, gamma2, beta2)
struct CurveParams {
    double initial_min = 0.01 / 100;
    double alpha1 = 3000.0 / 1000000.0;
    double alpha2 = (15000.0 - 3000.0) / 1000000.0;
    double beta1 = 360.0;        // Midpoint of the low-volatility regime
    double beta2 = 60000.0;      // Midpoint of the high-volatility regime
    double gamma1 = 1.0 / 59.0;  // Steepness
    double gamma2 = 1.0 / 8500.0;

    static CurveParams standard() { return CurveParams{}; }
};

// Largest beta the parameterized curve may return
constexpr double MAX_DYNAMIC_BETA = 0.99;

// Scale applied by the unparameterized dynamic beta curve
constexpr double DYNAMIC_BETA_SCALE = 7000.0;

// Exponent magnitude past which exp() is treated as saturated
constexpr double SIGMOID_EXP_LIMIT = 700.0;

// =============================================================================
// Curve Functions
// =============================================================================

// alpha / (1 + exp(gamma * (beta - x))), exponent clamped to +/-700
double custom_sigmoid(double x, double alpha, double gamma, double beta) noexcept;

// Floor plus both sigmoid regimes, unclamped
double double_sigmoid(double volatility, const CurveParams& params) noexcept;

// Volatility-driven swap fee
double calculate_dynamic_fee(double volatility,
                             const CurveParams& params = CurveParams::standard()) noexcept;

// Volatility-driven LP/vault split, clamped to [0, MAX_DYNAMIC_BETA]
double calculate_dynamic_beta(double volatility, const CurveParams& params) noexcept;

// Standard curve scaled by DYNAMIC_BETA_SCALE, clamped to [0, 1]
double calculate_dynamic_beta(double volatility) noexcept;

} // namespace lvr

#endif // LVR_CURVE_HPP
