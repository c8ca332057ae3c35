/**
 * @file DataLoader.cpp
 * @brief Implementation of series loading
 *
 * @author peanut-nav
 * @date Created: 2026-10-18
 * @last Modified: 2026-10-18
 * @version 0.1
 */

#include "DataLoader.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

/**
 * @brief Load a measurement series from file
 *
 * Rows with a single column get a zero target.
 */
SignalSeries DataLoader::loadSeries(const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open series file: " + filePath);
    }

    SignalSeries series;
    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line)) {
        ++lineNumber;
        const auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }
        parseRow(line, lineNumber, series);
    }
    return series;
}

double DataLoader::parseValue(const std::string& token, const char* column, int lineNumber) {
    // std::stod also accepts "nan" and "inf", which stream extraction rejects
    std::size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(token, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string("Invalid ") + column + " on line " + std::to_string(lineNumber));
    }
    if (consumed != token.size()) {
        throw std::runtime_error(std::string("Invalid ") + column + " on line " + std::to_string(lineNumber));
    }
    return value;
}

void DataLoader::parseRow(const std::string& line, int lineNumber, SignalSeries& series) {
    std::istringstream row(line);
    std::string token;

    row >> token;
    const double measurement = parseValue(token, "measurement", lineNumber);

    // Optional second column
    double target = 0.0;
    if (row >> token) {
        target = parseValue(token, "target", lineNumber);
        std::string extra;
        if (row >> extra) {
            throw std::runtime_error("Too many columns on line " + std::to_string(lineNumber));
        }
    }

    series.measurements.push_back(measurement);
    series.targets.push_back(target);
}
