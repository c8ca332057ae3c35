/**
 * @file ConfigLoader.cpp
 * @brief Implementation of configuration loading
 *
 * @author peanut-nav
 * @date Created: 2026-10-18
 * @last Modified: 2026-10-18
 * @version 0.1
 */

#include "ConfigLoader.hpp"
#include "FilterFactory.hpp"
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>

FilterConfig ConfigLoader::loadConfig(const std::string& filePath, const FilterConfig& base) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open config file: " + filePath);
    }

    FilterConfig config = base;
    std::map<std::string, double> noiseOverrides;  // Applied after the preset is known

    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line)) {
        ++lineNumber;
        const auto hash = line.find('#');
        if (hash != std::string::npos) {
            line.erase(hash);
        }

        std::istringstream row(line);
        std::string key;
        std::string value;
        if (!(row >> key)) {
            continue;
        }
        if (!(row >> value)) {
            throw std::runtime_error("Missing value for '" + key + "' on line "
                                     + std::to_string(lineNumber));
        }

        if (key == "preset") {
            try {
                config.preset = preset_from_string(value);
            } catch (const std::invalid_argument& e) {
                throw std::runtime_error(std::string(e.what()) + " (line "
                                         + std::to_string(lineNumber) + ")");
            }
            config.kalman = FilterFactory::create_params(config.preset);
        } else if (key == "process_noise" || key == "measurement_noise"
                   || key == "initial_covariance" || key == "variance_scale") {
            noiseOverrides[key] = parseDouble(key, value);
        } else if (key == "adapt_interval") {
            config.adapt_interval = parseInt(key, value);
        } else if (key == "tracker_window") {
            config.tracker_window = parseInt(key, value);
        } else if (key == "kalman_enabled") {
            config.features.kalman_enabled = parseBool(value);
        } else if (key.compare(0, 8, "feature.") == 0 && key.size() > 8) {
            config.features.overrides[key.substr(8)] = parseBool(value);
        } else {
            std::cerr << "Warning: unknown config key '" << key << "' on line "
                      << lineNumber << " of " << filePath << std::endl;
        }
    }

    for (const auto& entry : noiseOverrides) {
        if (entry.first == "process_noise") {
            config.kalman.process_noise = entry.second;
        } else if (entry.first == "measurement_noise") {
            config.kalman.measurement_noise = entry.second;
        } else if (entry.first == "initial_covariance") {
            config.kalman.initial_covariance = entry.second;
        } else {
            config.kalman.variance_scale = entry.second;
        }
    }
    return config;
}

bool ConfigLoader::parseBool(const std::string& value) {
    if (value == "true" || value == "1") return true;
    if (value == "false" || value == "0") return false;
    throw std::runtime_error("Invalid boolean value: " + value);
}

double ConfigLoader::parseDouble(const std::string& key, const std::string& value) {
    std::size_t consumed = 0;
    double result = 0.0;
    try {
        result = std::stod(value, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid number for '" + key + "': " + value);
    }
    if (consumed != value.size()) {
        throw std::runtime_error("Invalid number for '" + key + "': " + value);
    }
    return result;
}

int ConfigLoader::parseInt(const std::string& key, const std::string& value) {
    std::size_t consumed = 0;
    int result = 0;
    try {
        result = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid integer for '" + key + "': " + value);
    }
    if (consumed != value.size()) {
        throw std::runtime_error("Invalid integer for '" + key + "': " + value);
    }
    return result;
}
