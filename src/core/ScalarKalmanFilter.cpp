/**
 * @file ScalarKalmanFilter.cpp
 * @brief Implementation of the adaptive scalar Kalman filter
 *
 * Recurrence per measurement z with setpoint t:
 *   v  = x - x_last           (velocity)
 *   x  = x + v                (projection)
 *   x_last = x
 *   e  = |1 - t/x_last|       (1 if t or x_last is zero)
 *   P  = P + Q*e
 *   K  = P / (P + R)
 *   y  = z - x                (innovation)
 *   x  = x + K*y
 *   P  = (1 - K)*P
 *
 * @author peanut-nav
 * @date Created: 2026-10-18
 * @last Modified: 2026-10-18
 * @version 0.1
 */

#include "core/ScalarKalmanFilter.hpp"
#include "FilterMath.hpp"
#include <cmath>
#include <mutex>

// ================== Construction ==================
ScalarKalmanFilter::ScalarKalmanFilter(const KalmanParams& params)
    : p_(params.initial_covariance),
      q_(params.process_noise * FilterUtils::PROCESS_NOISE_SCALE),
      r_(params.measurement_noise),
      variance_scale_(params.variance_scale) {
}

ScalarKalmanFilter::ScalarKalmanFilter(const KalmanParams& params, double initial_state)
    : ScalarKalmanFilter(params) {
    x_ = initial_state;
    last_x_ = initial_state;
}

// ================== Measurement Processing ==================
double ScalarKalmanFilter::process(double measurement, double target) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return processLocked(measurement, target);
}

std::vector<double> ScalarKalmanFilter::processBatch(const std::vector<double>& measurements,
                                                     double target) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::vector<double> results;
    results.reserve(measurements.size());
    for (double m : measurements) {
        results.push_back(processLocked(m, target));
    }
    return results;
}

double ScalarKalmanFilter::processLocked(double measurement, double target) {
    // Project ahead by the last rate of change
    const double velocity = x_ - last_x_;
    x_ += velocity;

    // The projected (uncorrected) value is the next cycle's baseline
    last_x_ = x_;

    // Far from the setpoint: grow uncertainty faster so measurements weigh more
    e_ = FilterUtils::setpointErrorFactor(target, last_x_);

    // Prediction update
    p_ += q_ * e_;

    // Measurement update
    k_ = p_ / (p_ + r_);
    const double innovation = measurement - x_;
    x_ += k_ * innovation;
    p_ = (1.0 - k_) * p_;

    innovations_.push(innovation);
    ++observations_;
    return x_;
}

// ================== Prediction ==================
double ScalarKalmanFilter::predict(std::int64_t steps) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const double velocity = x_ - last_x_;
    return x_ + static_cast<double>(steps) * velocity;
}

FilterPrediction ScalarKalmanFilter::predictWithUncertainty(std::int64_t steps) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    FilterPrediction prediction;
    const double velocity = x_ - last_x_;
    prediction.value = x_ + static_cast<double>(steps) * velocity;

    // Each prediction-only step adds Q*e
    double covariance = p_;
    if (steps > 0) {
        covariance += static_cast<double>(steps) * q_ * e_;
    }
    prediction.uncertainty = std::sqrt(covariance);
    return prediction;
}

// ================== Adaptive Measurement Noise ==================
void ScalarKalmanFilter::updateAdaptiveNoise() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (innovations_.size() < MIN_ADAPTIVE_SAMPLES) {
        return;
    }

    const FilterUtils::WindowStatistics stats = innovations_.statistics();
    r_ = FilterUtils::adaptiveNoise(stats.variance, variance_scale_);
    if (r_ < FilterUtils::MIN_MEASUREMENT_NOISE) {
        r_ = FilterUtils::MIN_MEASUREMENT_NOISE;
    }
}

// ================== State Management ==================
void ScalarKalmanFilter::resetState() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    x_ = 0.0;
    last_x_ = 0.0;
    p_ = RESET_COVARIANCE;
    k_ = 0.0;
    e_ = 1.0;
    observations_ = 0;
    innovations_.clear();
}

void ScalarKalmanFilter::setState(double value) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    x_ = value;
    last_x_ = value;
}

double ScalarKalmanFilter::getState() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return x_;
}

double ScalarKalmanFilter::getVelocity() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return x_ - last_x_;
}

std::uint64_t ScalarKalmanFilter::getObservationCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return observations_;
}

double ScalarKalmanFilter::getUncertainty() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return p_;
}

double ScalarKalmanFilter::getGain() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return k_;
}

double ScalarKalmanFilter::getPriorEstimate() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return last_x_;
}

double ScalarKalmanFilter::getMeasurementNoise() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return r_;
}

double ScalarKalmanFilter::getSetpointErrorFactor() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return e_;
}

std::vector<double> ScalarKalmanFilter::getInnovationHistory() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return innovations_.values();
}

FilterStats ScalarKalmanFilter::getStats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    FilterStats stats;
    stats.state = x_;
    stats.velocity = x_ - last_x_;
    stats.covariance = p_;
    stats.gain = k_;
    stats.measurement_noise = r_;
    stats.observations = observations_;
    return stats;
}
