/**
 * @file InnovationHistory.hpp
 * @brief Bounded FIFO of recent measurement residuals
 *
 * @author peanut-nav
 * @date Created: 2026-10-18
 * @last Modified: 2026-10-18
 * @version 0.1
 */

#pragma once
#include "FilterMath.hpp"
#include <Eigen/Dense>
#include <cstddef>
#include <vector>

/**
 * @brief Fixed capacity ring buffer of innovations
 *
 * Once full, each push evicts the oldest entry. Not thread-safe; the
 * owning filter serialises access.
 */
class InnovationHistory {
public:
    static constexpr int CAPACITY = 32;  ///< Maximum number of retained innovations

    InnovationHistory();

    /**
     * @brief Append an innovation, evicting the oldest when full
     */
    void push(double innovation);

    /**
     * @brief Remove all entries
     */
    void clear();

    std::size_t size() const { return static_cast<std::size_t>(size_); }
    bool empty() const { return size_ == 0; }
    bool full() const { return size_ == CAPACITY; }

    /**
     * @brief Entries ordered oldest to newest
     */
    std::vector<double> values() const;

    /**
     * @brief Population mean and variance of the retained entries
     */
    FilterUtils::WindowStatistics statistics() const;

private:
    Eigen::Matrix<double, CAPACITY, 1> buffer_;
    int head_ = 0;   // Index of the oldest entry
    int size_ = 0;
};
