/**
 * @file FilterPreset.cpp
 * @brief Preset name conversion
 *
 * @author peanut-nav
 * @date Created: 2026-10-18
 * @last Modified: 2026-10-18
 * @version 0.1
 */

#include "FilterPreset.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

FilterPreset preset_from_string(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "default") return FilterPreset::Default;
    if (lower == "decay") return FilterPreset::DecayPrediction;
    if (lower == "coaccess") return FilterPreset::CoAccess;
    if (lower == "latency") return FilterPreset::Latency;
    if (lower == "similarity") return FilterPreset::Similarity;

    throw std::invalid_argument("Unknown filter preset: " + name);
}

std::string to_string(FilterPreset preset) {
    switch (preset) {
        case FilterPreset::Default:         return "default";
        case FilterPreset::DecayPrediction: return "decay";
        case FilterPreset::CoAccess:        return "coaccess";
        case FilterPreset::Latency:         return "latency";
        case FilterPreset::Similarity:      return "similarity";
    }
    return "default";
}
