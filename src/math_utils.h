#ifndef MATH_UTILS_H
#define MATH_UTILS_H

#include <algorithm>

namespace math_utils {

/**
 * @brief Clamp a value between min and max
 * @param value The value to clamp
 * @param min_value Minimum value
 * @param max_value Maximum value
 * @return Clamped value
 */
template <class T>
inline T clamped(T value, T min_value, T max_value) {
    return std::max(min_value, std::min(max_value, value));
}

/** Clamp an angle in degrees to the servo range [0,180]. */
int clampServoAngle(int angle);

/** Convert a distance in meters to centimeters. */
double metersToCentimeters(double meters);

/**
 * @brief Per-degree delay for a sweep of the given length.
 *
 * Sweeps longer than SWEEP_SCALE_DEGREES divide the base delay so a 90 degree
 * sweep and a 5 degree sweep take a comparable wall-clock time.
 * @param base_delay Base step delay in seconds
 * @param sweep_degrees Absolute sweep length in degrees
 * @return Delay in seconds to wait after each one degree step
 */
double sweepStepDelay(double base_delay, int sweep_degrees);

/**
 * @brief Round to nearest integer
 * @param x The value to round
 * @return Rounded integer
 */
inline int roundToInt(double x) {
    return (x >= 0) ? static_cast<int>(x + 0.5) : -static_cast<int>(0.5 - x);
}

} // namespace math_utils

#endif // MATH_UTILS_H
