/**
 * @file test_innovation_history.cpp
 * @brief Unit tests for the innovation ring buffer
 *
 * @author peanut-nav
 * @date Created: 2026-10-18
 * @last Modified: 2026-10-18
 * @version 0.1
 */

#include <gtest/gtest.h>
#include "core/InnovationHistory.hpp"
#include <vector>

// Entries come back oldest first before the buffer fills
TEST(InnovationHistoryTest, KeepsInsertionOrder) {
    InnovationHistory history;
    EXPECT_TRUE(history.empty());

    history.push(1.0);
    history.push(-2.0);
    history.push(3.5);

    std::vector<double> values = history.values();
    ASSERT_EQ(values.size(), 3u);
    EXPECT_DOUBLE_EQ(values[0], 1.0);
    EXPECT_DOUBLE_EQ(values[1], -2.0);
    EXPECT_DOUBLE_EQ(values[2], 3.5);
    EXPECT_FALSE(history.full());
}

// Once full, the oldest entries are evicted
TEST(InnovationHistoryTest, EvictsOldestWhenFull) {
    InnovationHistory history;
    for (int i = 0; i < 70; ++i) {
        history.push(static_cast<double>(i));
        EXPECT_LE(history.size(), static_cast<std::size_t>(InnovationHistory::CAPACITY));
    }
    EXPECT_TRUE(history.full());

    std::vector<double> values = history.values();
    ASSERT_EQ(values.size(), 32u);
    for (int i = 0; i < 32; ++i) {
        EXPECT_DOUBLE_EQ(values[i], static_cast<double>(70 - 32 + i));
    }
}

// Statistics cover only the retained entries
TEST(InnovationHistoryTest, StatisticsOfRetainedEntries) {
    InnovationHistory history;
    history.push(2.0);
    history.push(4.0);
    history.push(6.0);

    FilterUtils::WindowStatistics stats = history.statistics();
    EXPECT_DOUBLE_EQ(stats.mean, 4.0);
    EXPECT_NEAR(stats.variance, 8.0 / 3.0, 1e-12);

    // Push 32 copies of 5: every earlier entry is evicted
    for (int i = 0; i < 32; ++i) {
        history.push(5.0);
    }
    stats = history.statistics();
    EXPECT_DOUBLE_EQ(stats.mean, 5.0);
    EXPECT_NEAR(stats.variance, 0.0, 1e-12);
}

// Clearing empties the buffer and restarts ordering
TEST(InnovationHistoryTest, ClearRestarts) {
    InnovationHistory history;
    for (int i = 0; i < 40; ++i) {
        history.push(i * 1.0);
    }
    history.clear();
    EXPECT_TRUE(history.empty());
    EXPECT_TRUE(history.values().empty());

    FilterUtils::WindowStatistics stats = history.statistics();
    EXPECT_DOUBLE_EQ(stats.mean, 0.0);
    EXPECT_DOUBLE_EQ(stats.variance, 0.0);

    history.push(9.0);
    ASSERT_EQ(history.values().size(), 1u);
    EXPECT_DOUBLE_EQ(history.values()[0], 9.0);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
