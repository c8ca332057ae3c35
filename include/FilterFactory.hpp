/**
 * @file FilterFactory.hpp
 * @brief Factory for creating filter components
 *
 * Provides unified creation of parameters, filters and variance trackers
 *
 * @author peanut-nav
 * @date Created: 2026-10-18
 * @last Modified: 2026-10-18
 * @version 0.1
 */

#pragma once

#include "params/KalmanParams.hpp"
#include "core/ScalarKalmanFilter.hpp"
#include "core/VarianceTracker.hpp"
#include "FilterPreset.hpp"
#include <memory>
#include <stdexcept>

/**
 * @brief Filter component factory
 */
class FilterFactory {
public:
    /**
     * @brief Create filter parameters for a preset
     *
     * @param preset Signal type the filter is tuned for
     * @return KalmanParams Fixed parameter tuple of the preset
     */
    static KalmanParams create_params(FilterPreset preset) {
        KalmanParams params;
        switch (preset) {
            case FilterPreset::Default:
                params.process_noise = 0.1;
                params.measurement_noise = 88.0;
                params.initial_covariance = 30.0;
                params.variance_scale = 10.0;
                return params;
            case FilterPreset::DecayPrediction:
                params.process_noise = 0.05;      // Decay is relatively stable
                params.measurement_noise = 50.0;  // Access patterns are noisy
                params.initial_covariance = 20.0;
                params.variance_scale = 8.0;
                return params;
            case FilterPreset::CoAccess:
                params.process_noise = 0.2;
                params.measurement_noise = 100.0;
                params.initial_covariance = 40.0;
                params.variance_scale = 12.0;
                return params;
            case FilterPreset::Latency:
                params.process_noise = 0.15;      // Latency varies with load
                params.measurement_noise = 60.0;
                params.initial_covariance = 25.0;
                params.variance_scale = 10.0;
                return params;
            case FilterPreset::Similarity:
                params.process_noise = 0.05;
                params.measurement_noise = 30.0;  // ANN scores jitter
                params.initial_covariance = 20.0;
                params.variance_scale = 8.0;
                return params;
            default:
                throw std::runtime_error("Unsupported filter preset");
        }
    }

    /**
     * @brief Create a Kalman filter for a preset
     */
    static std::unique_ptr<ScalarKalmanFilter> create_filter(FilterPreset preset) {
        return std::make_unique<ScalarKalmanFilter>(create_params(preset));
    }

    /**
     * @brief Create a Kalman filter from explicit parameters
     */
    static std::unique_ptr<ScalarKalmanFilter> create_filter(const KalmanParams& params) {
        return std::make_unique<ScalarKalmanFilter>(params);
    }

    /**
     * @brief Create a sliding window variance tracker
     *
     * @throws std::invalid_argument if window_size <= 0
     */
    static std::unique_ptr<SlidingWindowVarianceTracker> create_tracker(int window_size) {
        return std::make_unique<SlidingWindowVarianceTracker>(window_size);
    }
};
