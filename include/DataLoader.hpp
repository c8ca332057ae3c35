/**
 * @file DataLoader.hpp
 * @brief Loading of measurement series from text files
 *
 * @author peanut-nav
 * @date Created: 2026-10-18
 * @last Modified: 2026-10-18
 * @version 0.1
 */

#pragma once
#include <string>
#include <vector>

/**
 * @brief Measurement series container
 */
struct SignalSeries {
    std::vector<double> measurements;  ///< Observed values
    std::vector<double> targets;       ///< Setpoint per sample (0 when the file has none)
};

/**
 * @brief Data loading class
 *
 * Reads whitespace separated rows of "measurement" or "measurement target".
 * Lines starting with '#' and blank lines are skipped. Values may be
 * written as "nan" or "inf".
 */
class DataLoader {
public:
    /**
     * @brief Load a series from a file
     *
     * @param filePath Path to the series file
     * @return Loaded series
     * @throws std::runtime_error if the file cannot be opened or a row is malformed
     */
    static SignalSeries loadSeries(const std::string& filePath);

private:
    /**
     * @brief Parse one numeric token, rejecting trailing characters
     *
     * @throws std::runtime_error naming the column and line on failure
     */
    static double parseValue(const std::string& token, const char* column, int lineNumber);

    /**
     * @brief Parse one data row
     *
     * @param line Row text
     * @param lineNumber 1-based line number for error messages
     * @param[out] series Series to append to
     */
    static void parseRow(const std::string& line, int lineNumber, SignalSeries& series);
};
