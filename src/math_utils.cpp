#include "math_utils.h"
#include "spidermotion_constants.h"
#include <cstdlib>

namespace math_utils {

int clampServoAngle(int angle) {
    return clamped<int>(angle, SERVO_ANGLE_MIN, SERVO_ANGLE_MAX);
}

double metersToCentimeters(double meters) {
    return meters * 100.0;
}

double sweepStepDelay(double base_delay, int sweep_degrees) {
    double divisor = std::max(1.0, std::abs(sweep_degrees) / SWEEP_SCALE_DEGREES);
    return base_delay / divisor;
}

} // namespace math_utils
