/**
 * @file FilterPreset.hpp
 * @brief Named parameter presets for scalar filters
 *
 * @author peanut-nav
 * @date Created: 2026-10-18
 * @last Modified: 2026-10-18
 * @version 0.1
 */

#pragma once
#include <string>

/**
 * @brief Filter preset enumeration
 */
enum class FilterPreset {
    Default,          ///< General purpose smoothing
    DecayPrediction,  ///< Memory decay score prediction
    CoAccess,         ///< Co-access confidence filtering
    Latency,          ///< Query latency prediction
    Similarity        ///< Similarity score smoothing
};

/**
 * @brief Parse a preset name ("default", "decay", "coaccess", "latency", "similarity")
 *
 * @throws std::invalid_argument for unknown names
 */
FilterPreset preset_from_string(const std::string& name);

/**
 * @brief Canonical name of a preset
 */
std::string to_string(FilterPreset preset);
