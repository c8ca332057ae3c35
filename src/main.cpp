/**
 * @file main.cpp
 * @brief Command line application for adaptive scalar filtering
 *
 * Loads a measurement series, runs it through the adaptive Kalman filter
 * (behind the feature gate), saves the filtered series and prints a summary.
 *
 * Usage: adaptive_filter_app <series-file> [config-file]
 *
 * @author peanut-nav
 * @date Created: 2026-10-18
 * @last Modified: 2026-10-18
 * @version 0.1
 */

#include "ConfigLoader.hpp"
#include "DataLoader.hpp"
#include "FilterFactory.hpp"
#include "SaveResults.hpp"
#include "features/FeatureFlags.hpp"
#include "features/FeatureGate.hpp"
#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>

namespace {

int run(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <series-file> [config-file]" << std::endl;
        return 1;
    }
    const std::string seriesPath = argv[1];

    // Configuration: defaults, then environment, then config file
    FilterConfig config;
    config.kalman = FilterFactory::create_params(config.preset);
    config.features.kalman_enabled = FeatureFlags::fromEnvironment().isFilteringEnabled();
    if (argc > 2) {
        config = ConfigLoader::loadConfig(argv[2], config);
    }
    FeatureFlags flags(config.features);
    const std::string feature = Features::KALMAN_TEMPORAL;

    std::cout << "=== Adaptive Filter Startup ===" << std::endl;
    std::cout << "Filter Configuration: " << std::endl;
    std::cout << "  Preset: " << to_string(config.preset) << std::endl;
    std::cout << "  Process noise: " << config.kalman.process_noise << std::endl;
    std::cout << "  Measurement noise: " << config.kalman.measurement_noise << std::endl;
    std::cout << "  Initial covariance: " << config.kalman.initial_covariance << std::endl;
    std::cout << "  Variance scale: " << config.kalman.variance_scale << std::endl;
    std::cout << "  Adapt interval: " << config.adapt_interval << std::endl;
    std::cout << "  Filtering (" << feature << "): "
              << (flags.isFeatureEnabled(feature) ? "enabled" : "disabled") << std::endl;

    std::cout << "\nLoading series..." << std::endl;
    SignalSeries series = DataLoader::loadSeries(seriesPath);
    std::cout << "  Samples: " << series.measurements.size() << std::endl;

    auto filter = FilterFactory::create_filter(config.kalman);
    auto tracker = FilterFactory::create_tracker(config.tracker_window);

    std::cout << "\nRunning filter..." << std::endl;
    std::vector<FilterResult> results;
    results.reserve(series.measurements.size());
    int filteredCount = 0;
    for (std::size_t i = 0; i < series.measurements.size(); i++) {
        const double z = series.measurements[i];
        tracker->update(z);

        FilteredValue value = FeatureGate::processIfEnabled(*filter, flags, feature, z, series.targets[i]);
        if (value.was_filtered) {
            ++filteredCount;
        }

        if (config.adapt_interval > 0 && (i + 1) % static_cast<std::size_t>(config.adapt_interval) == 0) {
            filter->updateAdaptiveNoise();
        }

        FilterResult result;
        result.filtered = value.filtered;
        result.velocity = filter->getVelocity();
        result.uncertainty = filter->getUncertainty();
        results.push_back(result);
    }
    std::cout << "  Filtered samples: " << filteredCount << "/" << series.measurements.size() << std::endl;

    std::cout << "\nSaving filter results..." << std::endl;
    SaveResults::saveFilterResults(seriesPath + ".filtered", series, results);

    std::cout << "\n===== Summary =====" << std::endl;
    std::cout << std::fixed << std::setprecision(6);
    if (!results.empty()) {
        double diffSq = 0.0;
        for (std::size_t i = 0; i < results.size(); i++) {
            diffSq += std::pow(series.measurements[i] - results[i].filtered, 2);
        }
        std::cout << "Raw vs filtered RMS: " << std::sqrt(diffSq / results.size()) << std::endl;
    }
    std::cout << "Signal mean (last " << tracker->getWindowSize() << "): " << tracker->mean() << std::endl;
    std::cout << "Signal std dev (last " << tracker->getWindowSize() << "): " << tracker->stdDev() << std::endl;

    const FilterStats stats = filter->getStats();
    std::cout << "State: " << stats.state << std::endl;
    std::cout << "Velocity: " << stats.velocity << std::endl;
    std::cout << "Covariance: " << stats.covariance << std::endl;
    std::cout << "Gain: " << stats.gain << std::endl;
    std::cout << "Measurement noise: " << stats.measurement_noise << std::endl;
    std::cout << "Observations: " << stats.observations << std::endl;

    const FilterPrediction prediction = filter->predictWithUncertainty(10);
    std::cout << "10-step prediction: " << prediction.value
              << " +/- " << prediction.uncertainty << std::endl;

    std::cout << "\n=== Adaptive Filter Completed ===" << std::endl;
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
