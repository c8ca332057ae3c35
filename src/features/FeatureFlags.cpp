/**
 * @file FeatureFlags.cpp
 * @brief Implementation of the feature flag provider
 *
 * @author peanut-nav
 * @date Created: 2026-10-18
 * @last Modified: 2026-10-18
 * @version 0.1
 */

#include "features/FeatureFlags.hpp"
#include <cstdlib>
#include <mutex>

FeatureFlags::FeatureFlags(const FeatureParams& params)
    : kalman_enabled_(params.kalman_enabled),
      overrides_(params.overrides) {
}

FeatureFlags FeatureFlags::fromEnvironment() {
    FeatureParams params;
    const char* env = std::getenv(Features::ENV_KALMAN_ENABLED);
    if (env != nullptr) {
        const std::string value(env);
        params.kalman_enabled = (value == "true" || value == "1");
    }
    return FeatureFlags(params);
}

bool FeatureFlags::isFeatureEnabled(const std::string& feature) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (!kalman_enabled_) {
        return false;
    }
    auto it = overrides_.find(feature);
    // Features without an override follow the master switch
    if (it == overrides_.end()) {
        return true;
    }
    return it->second;
}

void FeatureFlags::enableFiltering() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    kalman_enabled_ = true;
}

void FeatureFlags::disableFiltering() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    kalman_enabled_ = false;
}

bool FeatureFlags::isFilteringEnabled() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return kalman_enabled_;
}

void FeatureFlags::setFeature(const std::string& feature, bool enabled) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    overrides_[feature] = enabled;
}

void FeatureFlags::clearFeature(const std::string& feature) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    overrides_.erase(feature);
}
