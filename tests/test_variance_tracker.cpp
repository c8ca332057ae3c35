/**
 * @file test_variance_tracker.cpp
 * @brief Unit tests for the sliding window variance tracker
 *
 * @author peanut-nav
 * @date Created: 2026-10-18
 * @last Modified: 2026-10-18
 * @version 0.1
 */

#include <gtest/gtest.h>
#include "core/VarianceTracker.hpp"
#include "FilterFactory.hpp"
#include <cmath>
#include <stdexcept>
#include <thread>
#include <vector>

// A constant signal over a full window has zero variance
TEST(VarianceTrackerTest, ConstantSignalConverges) {
    SlidingWindowVarianceTracker tracker(8);
    for (int i = 0; i < 8; ++i) {
        tracker.update(5.0);
    }
    EXPECT_DOUBLE_EQ(tracker.mean(), 5.0);
    EXPECT_DOUBLE_EQ(tracker.variance(), 0.0);
    EXPECT_DOUBLE_EQ(tracker.stdDev(), 0.0);

    // Keeps holding after wrapping around
    for (int i = 0; i < 13; ++i) {
        tracker.update(5.0);
    }
    EXPECT_DOUBLE_EQ(tracker.mean(), 5.0);
    EXPECT_DOUBLE_EQ(tracker.variance(), 0.0);
}

// Unwritten slots count as zeros
TEST(VarianceTrackerTest, EarlySamplesAreBiasedTowardZero) {
    SlidingWindowVarianceTracker tracker(4);
    tracker.update(8.0);

    EXPECT_DOUBLE_EQ(tracker.mean(), 2.0);               // 8 / 4
    EXPECT_DOUBLE_EQ(tracker.variance(), 64.0 / 4.0 - 4.0);
    EXPECT_DOUBLE_EQ(tracker.stdDev(), std::sqrt(12.0));
    EXPECT_DOUBLE_EQ(tracker.adaptiveNoise(10.0), std::sqrt(12.0) * 10.0);
}

// Old samples leave the window
TEST(VarianceTrackerTest, EvictsOldestSample) {
    SlidingWindowVarianceTracker tracker(3);
    tracker.update(1.0);
    tracker.update(2.0);
    tracker.update(3.0);
    tracker.update(4.0);  // Replaces 1.0

    EXPECT_NEAR(tracker.mean(), 3.0, 1e-12);
    EXPECT_NEAR(tracker.variance(), 2.0 / 3.0, 1e-12);
}

// Fresh tracker reports zeros
TEST(VarianceTrackerTest, EmptyTrackerIsZero) {
    SlidingWindowVarianceTracker tracker(16);
    EXPECT_EQ(tracker.getWindowSize(), 16);
    EXPECT_DOUBLE_EQ(tracker.mean(), 0.0);
    EXPECT_DOUBLE_EQ(tracker.variance(), 0.0);
    EXPECT_DOUBLE_EQ(tracker.adaptiveNoise(3.0), 0.0);
}

// Non-positive window sizes are rejected
TEST(VarianceTrackerTest, RejectsInvalidWindow) {
    EXPECT_THROW(SlidingWindowVarianceTracker(0), std::invalid_argument);
    EXPECT_THROW(SlidingWindowVarianceTracker(-5), std::invalid_argument);
    EXPECT_THROW(FilterFactory::create_tracker(0), std::invalid_argument);
    EXPECT_NO_THROW(SlidingWindowVarianceTracker(1));
}

// Concurrent updates with one value leave consistent statistics
TEST(VarianceTrackerTest, ConcurrentUpdates) {
    SlidingWindowVarianceTracker tracker(16);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&tracker]() {
            for (int i = 0; i < 1000; ++i) {
                tracker.update(2.0);
                tracker.stdDev();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_DOUBLE_EQ(tracker.mean(), 2.0);
    EXPECT_NEAR(tracker.variance(), 0.0, 1e-12);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
