/**
 * @file FeatureGate.hpp
 * @brief Apply a filter only when its feature flag is enabled
 *
 * @author peanut-nav
 * @date Created: 2026-10-18
 * @last Modified: 2026-10-18
 * @version 0.1
 */

#pragma once
#include "core/ScalarFilterBase.hpp"
#include "features/FeatureFlags.hpp"
#include <cstdint>
#include <string>

/**
 * @brief A value that may or may not have been filtered
 */
struct FilteredValue {
    double raw = 0.0;           ///< Input value
    double filtered = 0.0;      ///< Filter output, equal to raw when bypassed
    bool was_filtered = false;  ///< True if the filter was applied
    std::string feature;        ///< Flag that made the decision
};

class FeatureGate {
public:
    /**
     * @brief Filter a measurement if the feature is enabled
     *
     * When disabled the filter is not touched and the measurement is
     * returned unchanged.
     */
    static FilteredValue processIfEnabled(ScalarFilterBase& filter,
                                          const IFeatureFlagProvider& flags,
                                          const std::string& feature,
                                          double measurement,
                                          double target);

    /**
     * @brief Predict ahead if the feature is enabled
     *
     * raw is the current state; when disabled, filtered is the current state too.
     */
    static FilteredValue predictIfEnabled(const ScalarFilterBase& filter,
                                          const IFeatureFlagProvider& flags,
                                          const std::string& feature,
                                          std::int64_t steps);
};
