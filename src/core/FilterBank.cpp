/**
 * @file FilterBank.cpp
 * @brief Implementation of the keyed filter collection
 *
 * @author peanut-nav
 * @date Created: 2026-10-18
 * @last Modified: 2026-10-18
 * @version 0.1
 */

#include "core/FilterBank.hpp"
#include <mutex>

FilterBank::FilterBank(const KalmanParams& params)
    : params_(params) {
}

std::shared_ptr<ScalarKalmanFilter> FilterBank::getOrCreate(const std::string& key) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = filters_.find(key);
        if (it != filters_.end()) {
            return it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    // Another caller may have created it between the two locks
    auto& slot = filters_[key];
    if (!slot) {
        slot = std::make_shared<ScalarKalmanFilter>(params_);
    }
    return slot;
}

std::shared_ptr<ScalarKalmanFilter> FilterBank::find(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = filters_.find(key);
    return it != filters_.end() ? it->second : nullptr;
}

bool FilterBank::contains(const std::string& key) const {
    return find(key) != nullptr;
}

std::size_t FilterBank::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return filters_.size();
}

double FilterBank::process(const std::string& key, double measurement, double target) {
    return getOrCreate(key)->process(measurement, target);
}

FilteredValue FilterBank::processIfEnabled(const std::string& key,
                                           const IFeatureFlagProvider& flags,
                                           const std::string& feature,
                                           double measurement,
                                           double target) {
    return FeatureGate::processIfEnabled(*getOrCreate(key), flags, feature, measurement, target);
}

double FilterBank::velocity(const std::string& key) const {
    const auto filter = find(key);
    return filter ? filter->getVelocity() : 0.0;
}

std::vector<std::string> FilterBank::risingKeys(double min_velocity) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> keys;
    for (const auto& entry : filters_) {
        if (entry.second->getVelocity() >= min_velocity) {
            keys.push_back(entry.first);
        }
    }
    return keys;
}

std::vector<std::string> FilterBank::fallingKeys(double max_velocity) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> keys;
    for (const auto& entry : filters_) {
        if (entry.second->getVelocity() <= max_velocity) {
            keys.push_back(entry.first);
        }
    }
    return keys;
}

void FilterBank::updateAdaptiveNoise() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (auto& entry : filters_) {
        entry.second->updateAdaptiveNoise();
    }
}

void FilterBank::reset() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    filters_.clear();
}
