/**
 * @file FeatureFlags.hpp
 * @brief Feature flags deciding whether filtering is applied
 *
 * Flags are passed to the code that needs them instead of living in
 * process-wide state, so each filter can be tested in isolation.
 *
 * @author peanut-nav
 * @date Created: 2026-10-18
 * @last Modified: 2026-10-18
 * @version 0.1
 */

#pragma once
#include "params/FilterConfig.hpp"
#include <map>
#include <shared_mutex>
#include <string>

namespace Features {

constexpr const char* KALMAN_DECAY = "kalman_decay";
constexpr const char* KALMAN_COACCESS = "kalman_coaccess";
constexpr const char* KALMAN_LATENCY = "kalman_latency";
constexpr const char* KALMAN_SIMILARITY = "kalman_similarity";
constexpr const char* KALMAN_TEMPORAL = "kalman_temporal";

/// Environment variable holding the master switch ("true" or "1" enables)
constexpr const char* ENV_KALMAN_ENABLED = "KALMAN_ENABLED";

} // namespace Features

/**
 * @brief Feature flag lookup interface
 */
class IFeatureFlagProvider {
public:
    virtual ~IFeatureFlagProvider() = default;

    /**
     * @brief Whether filtering for a feature should be applied
     *
     * @param feature Feature name, e.g. Features::KALMAN_LATENCY
     */
    virtual bool isFeatureEnabled(const std::string& feature) const = 0;
};

/**
 * @brief Master switch plus per-feature overrides
 *
 * A feature is enabled when the master switch is on and the feature is
 * either not overridden or overridden to true.
 */
class FeatureFlags : public IFeatureFlagProvider {
public:
    FeatureFlags() = default;
    explicit FeatureFlags(const FeatureParams& params);

    /**
     * @brief Flags with the master switch read from KALMAN_ENABLED
     */
    static FeatureFlags fromEnvironment();

    bool isFeatureEnabled(const std::string& feature) const override;

    void enableFiltering();
    void disableFiltering();
    bool isFilteringEnabled() const;

    void setFeature(const std::string& feature, bool enabled);
    void clearFeature(const std::string& feature);

private:
    mutable std::shared_mutex mutex_;
    bool kalman_enabled_ = false;
    std::map<std::string, bool> overrides_;
};
