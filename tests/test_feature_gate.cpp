/**
 * @file test_feature_gate.cpp
 * @brief Unit tests for feature flags and flag-gated filtering
 *
 * @author peanut-nav
 * @date Created: 2026-10-18
 * @last Modified: 2026-10-18
 * @version 0.1
 */

#include <gtest/gtest.h>
#include "FilterFactory.hpp"
#include "features/FeatureFlags.hpp"
#include "features/FeatureGate.hpp"
#include <cstdlib>
#include <set>
#include <string>
#include <utility>

/**
 * @brief Provider that enables an explicit set of features
 */
class FixedFlags : public IFeatureFlagProvider {
public:
    explicit FixedFlags(std::set<std::string> enabled) : enabled_(std::move(enabled)) {}

    bool isFeatureEnabled(const std::string& feature) const override {
        ++lookups;
        return enabled_.count(feature) > 0;
    }

    mutable int lookups = 0;

private:
    std::set<std::string> enabled_;
};

// ================== FeatureFlags ==================

TEST(FeatureFlagsTest, DisabledByDefault) {
    FeatureFlags flags;
    EXPECT_FALSE(flags.isFilteringEnabled());
    EXPECT_FALSE(flags.isFeatureEnabled(Features::KALMAN_DECAY));
    EXPECT_FALSE(flags.isFeatureEnabled("anything"));
}

// Master switch enables every feature without an override
TEST(FeatureFlagsTest, MasterSwitchAndOverrides) {
    FeatureFlags flags;
    flags.setFeature(Features::KALMAN_LATENCY, true);
    EXPECT_FALSE(flags.isFeatureEnabled(Features::KALMAN_LATENCY));

    flags.enableFiltering();
    EXPECT_TRUE(flags.isFeatureEnabled(Features::KALMAN_LATENCY));
    EXPECT_TRUE(flags.isFeatureEnabled(Features::KALMAN_SIMILARITY));

    flags.setFeature(Features::KALMAN_SIMILARITY, false);
    EXPECT_FALSE(flags.isFeatureEnabled(Features::KALMAN_SIMILARITY));
    EXPECT_TRUE(flags.isFeatureEnabled(Features::KALMAN_COACCESS));

    flags.clearFeature(Features::KALMAN_SIMILARITY);
    EXPECT_TRUE(flags.isFeatureEnabled(Features::KALMAN_SIMILARITY));

    flags.disableFiltering();
    EXPECT_FALSE(flags.isFeatureEnabled(Features::KALMAN_LATENCY));
}

TEST(FeatureFlagsTest, FromParams) {
    FeatureParams params;
    params.kalman_enabled = true;
    params.overrides[Features::KALMAN_DECAY] = false;

    FeatureFlags flags(params);
    EXPECT_TRUE(flags.isFilteringEnabled());
    EXPECT_FALSE(flags.isFeatureEnabled(Features::KALMAN_DECAY));
    EXPECT_TRUE(flags.isFeatureEnabled(Features::KALMAN_TEMPORAL));
}

TEST(FeatureFlagsTest, FromEnvironment) {
    setenv(Features::ENV_KALMAN_ENABLED, "true", 1);
    EXPECT_TRUE(FeatureFlags::fromEnvironment().isFilteringEnabled());

    setenv(Features::ENV_KALMAN_ENABLED, "1", 1);
    EXPECT_TRUE(FeatureFlags::fromEnvironment().isFilteringEnabled());

    setenv(Features::ENV_KALMAN_ENABLED, "yes", 1);
    EXPECT_FALSE(FeatureFlags::fromEnvironment().isFilteringEnabled());

    unsetenv(Features::ENV_KALMAN_ENABLED);
    EXPECT_FALSE(FeatureFlags::fromEnvironment().isFilteringEnabled());
}

// ================== FeatureGate ==================

class FeatureGateTest : public ::testing::Test {
protected:
    FeatureGateTest() : filter(FilterFactory::create_filter(FilterPreset::Latency)) {}

    std::unique_ptr<ScalarKalmanFilter> filter;
};

// Disabled: raw value passes through and the filter is untouched
TEST_F(FeatureGateTest, BypassesWhenDisabled) {
    FixedFlags flags(std::set<std::string>{});
    FilteredValue value = FeatureGate::processIfEnabled(*filter, flags, Features::KALMAN_LATENCY, 42.0, 0.0);

    EXPECT_EQ(flags.lookups, 1);
    EXPECT_FALSE(value.was_filtered);
    EXPECT_DOUBLE_EQ(value.raw, 42.0);
    EXPECT_DOUBLE_EQ(value.filtered, 42.0);
    EXPECT_EQ(value.feature, Features::KALMAN_LATENCY);
    EXPECT_EQ(filter->getObservationCount(), 0u);
    EXPECT_DOUBLE_EQ(filter->getState(), 0.0);
}

// Enabled: same result as calling the filter directly
TEST_F(FeatureGateTest, FiltersWhenEnabled) {
    FixedFlags flags(std::set<std::string>{Features::KALMAN_LATENCY});
    auto reference = FilterFactory::create_filter(FilterPreset::Latency);

    for (double z : {12.0, 15.0, 11.0, 30.0}) {
        FilteredValue value = FeatureGate::processIfEnabled(*filter, flags, Features::KALMAN_LATENCY, z, 0.0);
        EXPECT_TRUE(value.was_filtered);
        EXPECT_DOUBLE_EQ(value.raw, z);
        EXPECT_DOUBLE_EQ(value.filtered, reference->process(z, 0.0));
    }
    EXPECT_EQ(filter->getObservationCount(), 4u);
}

// Prediction gate reports the current state as raw
TEST_F(FeatureGateTest, PredictIfEnabled) {
    filter->process(10.0, 0.0);
    filter->process(20.0, 0.0);
    const double state = filter->getState();

    FixedFlags off(std::set<std::string>{});
    FilteredValue bypass = FeatureGate::predictIfEnabled(*filter, off, Features::KALMAN_DECAY, 5);
    EXPECT_FALSE(bypass.was_filtered);
    EXPECT_DOUBLE_EQ(bypass.raw, state);
    EXPECT_DOUBLE_EQ(bypass.filtered, state);

    FixedFlags on(std::set<std::string>{Features::KALMAN_DECAY});
    FilteredValue predicted = FeatureGate::predictIfEnabled(*filter, on, Features::KALMAN_DECAY, 5);
    EXPECT_TRUE(predicted.was_filtered);
    EXPECT_DOUBLE_EQ(predicted.raw, state);
    EXPECT_DOUBLE_EQ(predicted.filtered, filter->predict(5));
    EXPECT_EQ(filter->getObservationCount(), 2u);
}

// The gate works with the concrete provider too
TEST_F(FeatureGateTest, UsesFeatureFlagsProvider) {
    FeatureFlags flags;
    flags.enableFiltering();
    flags.setFeature(Features::KALMAN_COACCESS, false);

    EXPECT_TRUE(FeatureGate::processIfEnabled(*filter, flags, Features::KALMAN_LATENCY, 1.0, 0.0).was_filtered);
    EXPECT_FALSE(FeatureGate::processIfEnabled(*filter, flags, Features::KALMAN_COACCESS, 1.0, 0.0).was_filtered);
    EXPECT_EQ(filter->getObservationCount(), 1u);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
