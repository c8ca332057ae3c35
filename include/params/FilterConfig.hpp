/**
 * @file FilterConfig.hpp
 * @brief Application level configuration for filter runs
 *
 * @author peanut-nav
 * @date Created: 2026-10-18
 * @last Modified: 2026-10-18
 * @version 0.1
 */

#pragma once
#include "FilterPreset.hpp"
#include "params/KalmanParams.hpp"
#include <map>
#include <string>

/**
 * @brief Feature flag settings
 */
struct FeatureParams {
    bool kalman_enabled = false;              ///< Master switch for all kalman_* features
    std::map<std::string, bool> overrides;    ///< Per-feature overrides
};

/**
 * @brief Complete configuration of a filter run
 */
struct FilterConfig {
    FilterPreset preset = FilterPreset::Default;
    KalmanParams kalman;           ///< Resolved filter parameters (preset + overrides)
    int adapt_interval = 16;       ///< Samples between adaptive R updates (0 disables)
    int tracker_window = 32;       ///< Window of the raw signal variance tracker
    FeatureParams features;
};
