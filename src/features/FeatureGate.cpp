/**
 * @file FeatureGate.cpp
 * @brief Implementation of flag-gated filtering
 *
 * @author peanut-nav
 * @date Created: 2026-10-18
 * @last Modified: 2026-10-18
 * @version 0.1
 */

#include "features/FeatureGate.hpp"

FilteredValue FeatureGate::processIfEnabled(ScalarFilterBase& filter,
                                            const IFeatureFlagProvider& flags,
                                            const std::string& feature,
                                            double measurement,
                                            double target) {
    FilteredValue result;
    result.raw = measurement;
    result.feature = feature;

    if (flags.isFeatureEnabled(feature)) {
        result.filtered = filter.process(measurement, target);
        result.was_filtered = true;
    } else {
        result.filtered = measurement;
        result.was_filtered = false;
    }
    return result;
}

FilteredValue FeatureGate::predictIfEnabled(const ScalarFilterBase& filter,
                                            const IFeatureFlagProvider& flags,
                                            const std::string& feature,
                                            std::int64_t steps) {
    FilteredValue result;
    result.raw = filter.getState();
    result.feature = feature;

    if (flags.isFeatureEnabled(feature)) {
        result.filtered = filter.predict(steps);
        result.was_filtered = true;
    } else {
        result.filtered = result.raw;
        result.was_filtered = false;
    }
    return result;
}
