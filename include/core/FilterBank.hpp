/**
 * @file FilterBank.hpp
 * @brief Keyed collection of scalar Kalman filters
 *
 * Owns one filter per tracked signal (document id, node id, query class...),
 * created on first use from a shared parameter set. Also answers trend
 * questions across all tracked signals.
 *
 * @author peanut-nav
 * @date Created: 2026-10-18
 * @last Modified: 2026-10-18
 * @version 0.1
 */

#pragma once
#include "core/ScalarKalmanFilter.hpp"
#include "features/FeatureGate.hpp"
#include "params/KalmanParams.hpp"
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

class FilterBank {
public:
    explicit FilterBank(const KalmanParams& params);

    /**
     * @brief Filter for a key, created if missing
     *
     * The returned handle shares ownership, so the filter outlives a
     * concurrent reset() for as long as the caller holds it.
     */
    std::shared_ptr<ScalarKalmanFilter> getOrCreate(const std::string& key);

    /**
     * @brief Filter for a key, or nullptr if the key is not tracked
     */
    std::shared_ptr<ScalarKalmanFilter> find(const std::string& key) const;

    bool contains(const std::string& key) const;
    std::size_t size() const;

    /**
     * @brief Route a measurement to the key's filter
     */
    double process(const std::string& key, double measurement, double target);

    /**
     * @brief Route a measurement through the feature gate
     *
     * The key's filter is created even when the feature is disabled.
     */
    FilteredValue processIfEnabled(const std::string& key,
                                   const IFeatureFlagProvider& flags,
                                   const std::string& feature,
                                   double measurement,
                                   double target);

    /**
     * @brief Velocity of the key's filter, 0 if the key is not tracked
     */
    double velocity(const std::string& key) const;

    /**
     * @brief Keys whose velocity is at least min_velocity, sorted
     */
    std::vector<std::string> risingKeys(double min_velocity) const;

    /**
     * @brief Keys whose velocity is at most max_velocity, sorted
     */
    std::vector<std::string> fallingKeys(double max_velocity) const;

    /**
     * @brief Run the adaptive R update on every filter
     */
    void updateAdaptiveNoise();

    /**
     * @brief Drop all filters
     *
     * Handles already given out stay usable but are detached from the bank.
     */
    void reset();

    const KalmanParams& getParams() const { return params_; }

private:
    mutable std::shared_mutex mutex_;
    KalmanParams params_;
    std::map<std::string, std::shared_ptr<ScalarKalmanFilter>> filters_;
};
