/**
 * @file SaveResults.cpp
 * @brief Implementation of results saving utilities
 *
 * @author peanut-nav
 * @date Created: 2026-10-18
 * @last Modified: 2026-10-18
 * @version 0.1
 */

#include "SaveResults.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>

/**
 * @brief Save filter results to an output file
 *
 * Columns: index, raw, filtered, velocity, uncertainty.
 */
bool SaveResults::saveFilterResults(const std::string& filePath,
                                    const SignalSeries& series,
                                    const std::vector<FilterResult>& results) {
    std::ofstream outFile(filePath);
    if (!outFile) {
        std::cerr << "Error: Unable to open output file: " << filePath << std::endl;
        return false;
    }

    outFile << std::setprecision(15);

    const std::size_t count = std::min(series.measurements.size(), results.size());
    for (std::size_t i = 0; i < count; i++) {
        outFile << std::setw(8) << i + 1 << "   "                     // Sample index (1-based)
                << std::setw(20) << series.measurements[i] << "  "   // Raw measurement
                << std::setw(20) << results[i].filtered << "  "      // Filtered estimate
                << std::setw(20) << results[i].velocity << "  "      // Velocity (per step)
                << std::setw(20) << results[i].uncertainty << "\n"; // Covariance P
    }

    outFile.close();
    std::cout << "Filter results saved to " << filePath << std::endl;
    return true;
}
