/**
 * @file VarianceTracker.hpp
 * @brief Sliding window mean/variance tracker
 *
 * Keeps running sums over the last N samples so each update is O(1)
 * regardless of N. Slots that have not been written yet count as zeros,
 * which biases the statistics toward zero until N samples have arrived.
 *
 * @author peanut-nav
 * @date Created: 2026-10-18
 * @last Modified: 2026-10-18
 * @version 0.1
 */

#pragma once
#include <Eigen/Dense>
#include <mutex>

class SlidingWindowVarianceTracker {
public:
    /**
     * @brief Create a tracker with a zero-filled window
     *
     * @param window_size Number of samples in the window
     * @throws std::invalid_argument if window_size <= 0
     */
    explicit SlidingWindowVarianceTracker(int window_size);

    /**
     * @brief Overwrite the oldest sample and refresh mean and variance
     */
    void update(double sample);

    double mean() const;
    double variance() const;
    double stdDev() const;

    /**
     * @brief sqrt(variance) * scale
     */
    double adaptiveNoise(double scale) const;

    int getWindowSize() const { return window_size_; }

private:
    mutable std::mutex mutex_;

    Eigen::VectorXd window_;
    int window_size_;
    int write_index_ = 0;
    double inverse_n_;

    double sum_ = 0.0;
    double sum_sq_ = 0.0;
    double mean_ = 0.0;
    double variance_ = 0.0;
};
