/**
 * @file FilterMath.hpp
 * @brief Numeric helpers shared by the scalar filters
 *
 * Windowed population statistics and the scalar formulas used by the
 * adaptive Kalman filter (setpoint error factor, adaptive measurement noise).
 *
 * @author peanut-nav
 * @date Created: 2026-10-18
 * @last Modified: 2026-10-18
 * @version 0.1
 */

#pragma once
#include <cmath>
#include <Eigen/Dense>

namespace FilterUtils {

/**
 * @brief Smallest measurement noise the adaptive update may produce
 */
constexpr double MIN_MEASUREMENT_NOISE = 1.0;

/**
 * @brief Scale applied to the configured process noise
 */
constexpr double PROCESS_NOISE_SCALE = 0.001;

/**
 * @brief Population mean and variance of a sample set
 */
struct WindowStatistics {
    double mean = 0.0;
    double variance = 0.0;
};

/**
 * @brief Population statistics of a vector of samples
 *
 * variance = |E[x^2] - E[x]^2|. The absolute value absorbs small negative
 * results from cancellation. An empty input yields zeros.
 *
 * @tparam Derived Eigen expression type
 * @param samples Sample vector
 * @return Mean and variance
 */
template <typename Derived>
WindowStatistics populationStatistics(const Eigen::MatrixBase<Derived>& samples) {
    WindowStatistics stats;
    const auto n = samples.size();
    if (n == 0) {
        return stats;
    }
    const double inverse_n = 1.0 / static_cast<double>(n);
    stats.mean = samples.sum() * inverse_n;
    stats.variance = std::abs(samples.squaredNorm() * inverse_n - stats.mean * stats.mean);
    return stats;
}

/**
 * @brief Setpoint error factor |1 - target/projected|
 *
 * Falls back to 1.0 when either the target or the projected estimate is zero.
 */
inline double setpointErrorFactor(double target, double projected) {
    if (target != 0.0 && projected != 0.0) {
        return std::abs(1.0 - target / projected);
    }
    return 1.0;
}

/**
 * @brief Measurement noise derived from a variance: sqrt(variance) * scale
 */
inline double adaptiveNoise(double variance, double scale) {
    return std::sqrt(variance) * scale;
}

} // namespace FilterUtils
