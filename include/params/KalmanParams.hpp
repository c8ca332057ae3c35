/**
 * @file KalmanParams.hpp
 * @brief Construction parameters for the adaptive scalar Kalman filter
 *
 * @author peanut-nav
 * @date Created: 2026-10-18
 * @last Modified: 2026-10-18
 * @version 0.1
 */

#pragma once

/**
 * @brief Scalar Kalman filter parameters
 *
 * All four values are expected to be positive. They are not validated.
 */
struct KalmanParams {
    double process_noise = 0.1;        ///< Q, scaled by 0.001 inside the filter
    double measurement_noise = 88.0;   ///< R seed, replaced by adaptive updates
    double initial_covariance = 30.0;  ///< P at construction
    double variance_scale = 10.0;      ///< Multiplier for adaptive R
};
