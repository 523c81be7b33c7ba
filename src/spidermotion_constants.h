#ifndef SPIDERMOTION_CONSTANTS_H
#define SPIDERMOTION_CONSTANTS_H

/**
 * @file spidermotion_constants.h
 * @brief Global constants for the SpiderMotion quadruped controller
 *
 * Joint layout, servo angle limits, timing defaults and range sensor limits
 * shared by every module. Values that a deployment may want to tune also
 * appear in Parameters, where these constants act as defaults.
 */

// ========================================================================
// ROBOT LAYOUT
// ========================================================================

#define NUM_LEGS 4
#define JOINTS_PER_LEG 3
#define TOTAL_JOINTS (NUM_LEGS * JOINTS_PER_LEG)

// PCA9685 style bus: 16 addressable channels, only the first 12 are wired
#define NUM_ACTUATOR_CHANNELS 16

// ========================================================================
// SERVO ANGLE CONSTANTS (degrees)
// ========================================================================

#define SERVO_ANGLE_MIN 0
#define SERVO_ANGLE_MAX 180
#define NEUTRAL_ANGLE 90

// ========================================================================
// TIMING DEFAULTS (seconds)
// ========================================================================

#define DEFAULT_STEP_DELAY 0.1      // Single joint sweep delay (move_joint default)
#define POSE_STEP_DELAY 0.02        // Delay used for concurrent pose sweeps
#define STARTUP_SERVO_DELAY 0.1     // Pause between joints while homing at startup
#define SWEEP_SCALE_DEGREES 10.0    // Sweeps longer than this shorten the per-degree delay

// ========================================================================
// RANGE SENSOR CONSTANTS
// ========================================================================

#define RANGE_MAX_CM 400.0            // Sentinel for no echo / out of range
#define RANGE_PLACEHOLDER_CM 50.0     // Constant reading published without a sensor
#define RANGE_SAMPLE_INTERVAL 0.5     // Seconds between samples
#define RANGE_ERROR_BACKOFF 2.0       // Seconds to wait after a failed read

#endif // SPIDERMOTION_CONSTANTS_H
