#ifndef ROBOT_MODEL_H
#define ROBOT_MODEL_H

#include "spider_log.h"
#include "spidermotion_constants.h"
#include <Eigen/Dense>
#include <cstdint>
#include <map>
#include <string>

//
// Designation for every servo driven joint. Joints are ordered leg by leg,
// shoulder/elbow/foot within each leg, matching the default channel wiring.
//
enum JointDesignation {
    JOINT_LEG1_SHOULDER,
    JOINT_LEG1_ELBOW,
    JOINT_LEG1_FOOT,
    JOINT_LEG2_SHOULDER,
    JOINT_LEG2_ELBOW,
    JOINT_LEG2_FOOT,
    JOINT_LEG3_SHOULDER,
    JOINT_LEG3_ELBOW,
    JOINT_LEG3_FOOT,
    JOINT_LEG4_SHOULDER,
    JOINT_LEG4_ELBOW,
    JOINT_LEG4_FOOT,
    JOINT_COUNT,            //< Misc enum defining number of joints
    JOINT_UNDESIGNATED = -1 //< Unknown or invalid joint
};

//
// Segment of a leg driven by one joint.
//
enum LegSegment {
    SEGMENT_SHOULDER, //< Horizontal swing of the leg
    SEGMENT_ELBOW,    //< Vertical lift of the upper leg
    SEGMENT_FOOT,     //< Lower leg, lifts the tip off the ground
    SEGMENT_COUNT,
};

//
// Modes reported to the display and dashboard. Never read back by the controller.
//
enum RobotMode {
    MODE_IDLE,
    MODE_READY,
    MODE_WALKING,
    MODE_TURNING,
    MODE_DANCING,
    MODE_WAVING,
    MODE_ANALYZING,
    MODE_ERROR,
    MODE_SHUTDOWN,
    MODE_COUNT,
};

/**
 * @brief Target angle assignment for a subset of joints.
 * A map cannot name the same joint twice, so one pose never drives a joint
 * from two workers.
 */
typedef std::map<JointDesignation, int> JointPose;

/**
 * @brief Joint angles in degrees laid out [leg][segment].
 */
typedef Eigen::Matrix<int, NUM_LEGS, JOINTS_PER_LEG, Eigen::RowMajor> JointAngleMatrix;

/**
 * @brief Robot configuration parameters.
 */
struct Parameters {
    // Channel index on the actuator bus for every joint, indexed by JointDesignation
    int channel_map[TOTAL_JOINTS] = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11};

    int neutral_angle = NEUTRAL_ANGLE;

    // Multiplier applied to every gait delay and pause. 1.0 is real time.
    double time_scale = 1.0;

    double startup_servo_delay = STARTUP_SERVO_DELAY; //< Delay between joints while homing (s)
    double default_step_delay = DEFAULT_STEP_DELAY;   //< move_joint default step delay (s)

    /**
     * @brief Distance sensor sampling configuration.
     */
    struct RangeConfig {
        double sample_interval = RANGE_SAMPLE_INTERVAL; //< Seconds between samples
        double error_backoff = RANGE_ERROR_BACKOFF;     //< Seconds to wait after a read failure
        double max_range_cm = RANGE_MAX_CM;             //< Readings at or above this become the sentinel
        double placeholder_cm = RANGE_PLACEHOLDER_CM;   //< Published when no sensor is attached
        int trigger_pin = 23;                           //< HC-SR04 trigger GPIO (BCM)
        int echo_pin = 24;                              //< HC-SR04 echo GPIO (BCM)
        int sysfs_gpio_base = 0;                        //< Offset of the BCM GPIO chip in sysfs numbering
        std::string sysfs_gpio_root = "/sys/class/gpio";
    } range;

    /**
     * @brief PCA9685 servo driver configuration.
     */
    struct ServoDriverConfig {
        int i2c_bus = 1;           //< /dev/i2c-N
        uint8_t address = 0x40;    //< PCA9685 I2C address
        double frequency = 50.0;   //< PWM frequency in Hz
        int min_pulse_us = 750;    //< Pulse width at 0 degrees
        int max_pulse_us = 2250;   //< Pulse width at 180 degrees
    } servo_driver;

    spider_log::LogLevel log_level = spider_log::LOG_INFO;
};

/** Default parameters: channels wired leg by leg, stock gait timing. */
Parameters createDefaultParameters();

/**
 * @brief Check a parameter set before the controller uses it.
 * Rejects out-of-range or duplicated channels, a neutral angle outside the
 * servo range and negative or zero timings.
 * @param params Parameters to validate
 * @param reason Filled with a description of the first problem found
 * @return True if the parameters are usable
 */
bool validateParameters(const Parameters &params, std::string *reason = nullptr);

// Joint identity helpers
JointDesignation jointFor(int leg_number, LegSegment segment); //< leg_number is 1..4
int legNumberOf(JointDesignation joint);                        //< 1..4
LegSegment segmentOf(JointDesignation joint);

/** Symbolic name such as "leg2_elbow". */
std::string jointName(JointDesignation joint);
/** Parse a symbolic joint name; returns JOINT_UNDESIGNATED when unknown. */
JointDesignation parseJointName(const std::string &name);

/** Upper-case display label for a mode, e.g. "WALKING". */
const char *modeToString(RobotMode mode);

/** Pose driving every joint to the given angle. */
JointPose uniformPose(int angle);

#endif // ROBOT_MODEL_H
