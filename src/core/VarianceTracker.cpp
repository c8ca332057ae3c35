/**
 * @file VarianceTracker.cpp
 * @brief Implementation of the sliding window variance tracker
 *
 * @author peanut-nav
 * @date Created: 2026-10-18
 * @last Modified: 2026-10-18
 * @version 0.1
 */

#include "core/VarianceTracker.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

SlidingWindowVarianceTracker::SlidingWindowVarianceTracker(int window_size)
    : window_size_(window_size) {
    if (window_size <= 0) {
        throw std::invalid_argument("Variance tracker window size must be positive, got "
                                    + std::to_string(window_size));
    }
    window_ = Eigen::VectorXd::Zero(window_size);
    inverse_n_ = 1.0 / static_cast<double>(window_size);
}

void SlidingWindowVarianceTracker::update(double sample) {
    std::lock_guard<std::mutex> lock(mutex_);

    const double old_sample = window_(write_index_);
    window_(write_index_) = sample;

    // Swap the evicted sample's contribution for the new one
    sum_ += sample - old_sample;
    sum_sq_ += sample * sample - old_sample * old_sample;

    if (++write_index_ >= window_size_) {
        write_index_ = 0;
    }

    mean_ = sum_ * inverse_n_;
    variance_ = std::abs(sum_sq_ * inverse_n_ - mean_ * mean_);
}

double SlidingWindowVarianceTracker::mean() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mean_;
}

double SlidingWindowVarianceTracker::variance() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return variance_;
}

double SlidingWindowVarianceTracker::stdDev() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::sqrt(variance_);
}

double SlidingWindowVarianceTracker::adaptiveNoise(double scale) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::sqrt(variance_) * scale;
}
