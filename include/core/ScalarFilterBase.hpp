/**
 * @file ScalarFilterBase.hpp
 * @brief Base class for single-variable filters
 *
 * Defines the operations every scalar filter offers:
 * 1. Measurement processing (predict + correct)
 * 2. Non-mutating extrapolation
 * 3. State management
 *
 * @author peanut-nav
 * @date Created: 2026-10-18
 * @last Modified: 2026-10-18
 * @version 0.1
 */

#pragma once
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Predicted value together with its one-sigma uncertainty
 */
struct FilterPrediction {
    double value = 0.0;        ///< Extrapolated state
    double uncertainty = 0.0;  ///< Standard deviation of the extrapolation
};

/**
 * @brief Base class for scalar filters
 *
 * Implementations must be safe to call from several threads.
 */
class ScalarFilterBase {
public:
    virtual ~ScalarFilterBase() = default;

    // ================== Core Components ==================

    /**
     * @brief Process one measurement
     *
     * @param measurement Observed value
     * @param target Desired setpoint (0 for none)
     * @return Filtered estimate
     */
    virtual double process(double measurement, double target) = 0;

    /**
     * @brief Process a sequence of measurements under one lock acquisition
     *
     * @param measurements Observed values, in order
     * @param target Desired setpoint shared by all samples (0 for none)
     * @return One filtered estimate per measurement
     */
    virtual std::vector<double> processBatch(const std::vector<double>& measurements,
                                             double target) = 0;

    /**
     * @brief Extrapolate the state without changing it
     *
     * @param steps Number of steps ahead
     */
    virtual double predict(std::int64_t steps) const = 0;

    /**
     * @brief Extrapolate the state and its uncertainty
     *
     * @param steps Number of steps ahead
     */
    virtual FilterPrediction predictWithUncertainty(std::int64_t steps) const = 0;

    // ================== State Management ==================

    /**
     * @brief Return the filter to its seed state
     */
    virtual void resetState() = 0;

    /**
     * @brief Overwrite the current estimate
     */
    virtual void setState(double value) = 0;

    /**
     * @brief Current estimate
     */
    virtual double getState() const = 0;

    /**
     * @brief Current rate of change
     */
    virtual double getVelocity() const = 0;

    /**
     * @brief Number of measurements processed since construction or reset
     */
    virtual std::uint64_t getObservationCount() const = 0;

    /**
     * @brief Get the filter type
     */
    virtual std::string getType() const = 0;
};
