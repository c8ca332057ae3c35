/**
 * @file ConfigLoader.hpp
 * @brief Loading of filter run configuration
 *
 * File format: one "key value" pair per line, '#' starts a comment.
 *
 *   preset              latency
 *   measurement_noise   45.0
 *   adapt_interval      20
 *   kalman_enabled      true
 *   feature.kalman_latency false
 *
 * Explicit noise keys override the values of the preset regardless of
 * the order in which they appear.
 *
 * @author peanut-nav
 * @date Created: 2026-10-18
 * @last Modified: 2026-10-18
 * @version 0.1
 */

#pragma once
#include "params/FilterConfig.hpp"
#include <string>

class ConfigLoader {
public:
    /**
     * @brief Load a configuration file
     *
     * Unknown keys are reported on stderr and ignored.
     *
     * @param filePath Path to the configuration file
     * @param base Configuration the file is applied on top of
     * @return Resolved configuration
     * @throws std::runtime_error if the file cannot be opened or a value is malformed
     */
    static FilterConfig loadConfig(const std::string& filePath,
                                   const FilterConfig& base = FilterConfig());

    /**
     * @brief Parse "true"/"false"/"1"/"0"
     *
     * @throws std::runtime_error for anything else
     */
    static bool parseBool(const std::string& value);

private:
    static double parseDouble(const std::string& key, const std::string& value);
    static int parseInt(const std::string& key, const std::string& value);
};
