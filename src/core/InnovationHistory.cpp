/**
 * @file InnovationHistory.cpp
 * @brief Implementation of the innovation ring buffer
 *
 * @author peanut-nav
 * @date Created: 2026-10-18
 * @last Modified: 2026-10-18
 * @version 0.1
 */

#include "core/InnovationHistory.hpp"

InnovationHistory::InnovationHistory() {
    buffer_.setZero();
}

void InnovationHistory::push(double innovation) {
    if (size_ < CAPACITY) {
        buffer_((head_ + size_) % CAPACITY) = innovation;
        ++size_;
        return;
    }
    // Full: overwrite the oldest slot
    buffer_(head_) = innovation;
    head_ = (head_ + 1) % CAPACITY;
}

void InnovationHistory::clear() {
    head_ = 0;
    size_ = 0;
}

std::vector<double> InnovationHistory::values() const {
    std::vector<double> out;
    out.reserve(size_);
    for (int i = 0; i < size_; ++i) {
        out.push_back(buffer_((head_ + i) % CAPACITY));
    }
    return out;
}

FilterUtils::WindowStatistics InnovationHistory::statistics() const {
    // Order does not matter for mean/variance. While not full, head_ is 0
    // and the entries occupy the first size_ slots.
    if (size_ < CAPACITY) {
        return FilterUtils::populationStatistics(buffer_.head(size_));
    }
    return FilterUtils::populationStatistics(buffer_);
}
