/**
 * @file ScalarKalmanFilter.hpp
 * @brief Adaptive scalar Kalman filter with velocity projection
 *
 * Single-variable Kalman filter. Differences from the textbook
 * constant-value filter:
 * - the prediction step projects the estimate by its last rate of change
 * - uncertainty growth is boosted when the projection is far from a setpoint
 * - measurement noise R can be re-estimated from recent innovations
 *
 * @author peanut-nav
 * @date Created: 2026-10-18
 * @last Modified: 2026-10-18
 * @version 0.1
 */

#pragma once
#include "core/ScalarFilterBase.hpp"
#include "core/InnovationHistory.hpp"
#include "params/KalmanParams.hpp"
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <vector>

/**
 * @brief Snapshot of the filter state
 */
struct FilterStats {
    double state = 0.0;              ///< Current estimate
    double velocity = 0.0;           ///< estimate - prior estimate
    double covariance = 0.0;         ///< Estimate uncertainty P
    double gain = 0.0;               ///< Last Kalman gain K
    double measurement_noise = 0.0;  ///< Current R
    std::uint64_t observations = 0;  ///< Processed measurements
};

/**
 * @brief Adaptive scalar Kalman filter
 *
 * Tracks one value and its per-step velocity. All public operations are
 * thread-safe; queries take a shared lock, updates an exclusive one.
 */
class ScalarKalmanFilter : public ScalarFilterBase {
public:
    static constexpr double RESET_COVARIANCE = 30.0;   ///< P after resetState()
    static constexpr std::size_t MIN_ADAPTIVE_SAMPLES = 5;  ///< Innovations needed for adaptive R

    explicit ScalarKalmanFilter(const KalmanParams& params);

    /**
     * @brief Construct with a seeded estimate
     *
     * @param params Filter parameters
     * @param initial_state Value used for both the estimate and the prior estimate
     */
    ScalarKalmanFilter(const KalmanParams& params, double initial_state);

    // ScalarFilterBase interface implementation
    /**
     * @brief Predict with velocity projection, then correct with the measurement
     *
     * NaN and infinite inputs propagate through the state.
     *
     * @param measurement Observed value
     * @param target Setpoint for error boosting (0 disables boosting)
     * @return Corrected estimate
     */
    double process(double measurement, double target) override;

    std::vector<double> processBatch(const std::vector<double>& measurements,
                                     double target) override;

    /**
     * @brief Linear extrapolation: estimate + steps * velocity
     */
    double predict(std::int64_t steps) const override;

    /**
     * @brief Extrapolation plus sqrt(P + steps * Q * e)
     *
     * Uses the setpoint error factor of the last processed measurement.
     * Non-positive horizons add no process noise.
     */
    FilterPrediction predictWithUncertainty(std::int64_t steps) const override;

    /**
     * @brief Zero the estimate, clear history, P = RESET_COVARIANCE
     *
     * The configured initial covariance is not restored.
     */
    void resetState() override;

    /**
     * @brief Set estimate and prior estimate (velocity becomes zero)
     */
    void setState(double value) override;

    double getState() const override;
    double getVelocity() const override;
    std::uint64_t getObservationCount() const override;
    std::string getType() const override { return "ScalarKalman"; }

    /**
     * @brief Re-estimate R from the innovation history
     *
     * R = sqrt(var(innovations)) * variance_scale, floored at 1.0.
     * Does nothing with fewer than MIN_ADAPTIVE_SAMPLES innovations.
     */
    void updateAdaptiveNoise();

    double getUncertainty() const;
    double getGain() const;
    double getPriorEstimate() const;
    double getMeasurementNoise() const;
    double getSetpointErrorFactor() const;

    /**
     * @brief Retained innovations, oldest first
     */
    std::vector<double> getInnovationHistory() const;

    /**
     * @brief Consistent snapshot of all state values
     */
    FilterStats getStats() const;

private:
    mutable std::shared_mutex mutex_;

    // Filter state
    double x_ = 0.0;       // Current estimate
    double last_x_ = 0.0;  // Projected estimate of the previous cycle
    double p_ = 0.0;       // Estimate covariance
    double k_ = 0.0;       // Kalman gain
    double e_ = 1.0;       // Setpoint error factor

    // Configuration
    double q_ = 0.0;               // Scaled process noise
    double r_ = 0.0;               // Measurement noise
    double variance_scale_ = 0.0;

    // Statistics
    std::uint64_t observations_ = 0;
    InnovationHistory innovations_;

    /**
     * @brief One predict/correct cycle; caller holds the exclusive lock
     */
    double processLocked(double measurement, double target);
};
