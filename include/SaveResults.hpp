/**
 * @file SaveResults.hpp
 * @brief Filter results saving utilities
 *
 * @author peanut-nav
 * @date Created: 2026-10-18
 * @last Modified: 2026-10-18
 * @version 0.1
 */

#pragma once
#include "DataLoader.hpp"
#include <string>
#include <vector>

/**
 * @brief Per-sample filter output
 */
struct FilterResult {
    double filtered = 0.0;     ///< Filter output (raw value if bypassed)
    double velocity = 0.0;     ///< Filter velocity after the sample
    double uncertainty = 0.0;  ///< Filter covariance after the sample
};

/**
 * @brief Filter results saving class
 */
class SaveResults {
public:
    /**
     * @brief Save filter results to a file
     *
     * @param filePath Output file path
     * @param series Input series
     * @param results One result per input sample
     * @return true if the file was written
     */
    static bool saveFilterResults(const std::string& filePath,
                                  const SignalSeries& series,
                                  const std::vector<FilterResult>& results);
};
