#include "robot_model.h"
#include <sstream>

namespace {
const char *const SEGMENT_NAMES[SEGMENT_COUNT] = {"shoulder", "elbow", "foot"};

const char *const MODE_NAMES[MODE_COUNT] = {
    "IDLE", "READY", "WALKING", "TURNING", "DANCING",
    "WAVING", "ANALYZING", "ERROR", "SHUTDOWN"};
} // namespace

Parameters createDefaultParameters() {
    Parameters params;
    params.log_level = spider_log::LOG_INFO;
    return params;
}

bool validateParameters(const Parameters &params, std::string *reason) {
    std::ostringstream problem;
    bool used[NUM_ACTUATOR_CHANNELS] = {false};

    for (int joint = 0; joint < TOTAL_JOINTS && problem.tellp() == 0; ++joint) {
        int channel = params.channel_map[joint];
        if (channel < 0 || channel >= NUM_ACTUATOR_CHANNELS) {
            problem << jointName(static_cast<JointDesignation>(joint)) << " mapped to invalid channel " << channel;
        } else if (used[channel]) {
            problem << "channel " << channel << " assigned to more than one joint";
        } else {
            used[channel] = true;
        }
    }

    if (problem.tellp() == 0) {
        if (params.neutral_angle < SERVO_ANGLE_MIN || params.neutral_angle > SERVO_ANGLE_MAX) {
            problem << "neutral angle " << params.neutral_angle << " outside servo range";
        } else if (params.time_scale < 0.0 || params.startup_servo_delay < 0.0 || params.default_step_delay < 0.0) {
            problem << "negative timing parameter";
        } else if (params.range.sample_interval <= 0.0 || params.range.error_backoff <= 0.0) {
            problem << "range sampling intervals must be positive";
        } else if (params.range.max_range_cm <= 0.0 || params.range.placeholder_cm < 0.0) {
            problem << "invalid range limits";
        } else if (params.servo_driver.frequency <= 0.0 ||
                   params.servo_driver.min_pulse_us >= params.servo_driver.max_pulse_us) {
            problem << "invalid servo driver pulse configuration";
        }
    }

    if (problem.tellp() != 0) {
        if (reason)
            *reason = problem.str();
        return false;
    }
    return true;
}

JointDesignation jointFor(int leg_number, LegSegment segment) {
    if (leg_number < 1 || leg_number > NUM_LEGS || segment < 0 || segment >= SEGMENT_COUNT)
        return JOINT_UNDESIGNATED;
    return static_cast<JointDesignation>((leg_number - 1) * JOINTS_PER_LEG + segment);
}

int legNumberOf(JointDesignation joint) {
    return static_cast<int>(joint) / JOINTS_PER_LEG + 1;
}

LegSegment segmentOf(JointDesignation joint) {
    return static_cast<LegSegment>(static_cast<int>(joint) % JOINTS_PER_LEG);
}

std::string jointName(JointDesignation joint) {
    if (joint < 0 || joint >= JOINT_COUNT)
        return "unknown";
    return "leg" + std::to_string(legNumberOf(joint)) + "_" + SEGMENT_NAMES[segmentOf(joint)];
}

JointDesignation parseJointName(const std::string &name) {
    for (int joint = 0; joint < JOINT_COUNT; ++joint) {
        if (jointName(static_cast<JointDesignation>(joint)) == name)
            return static_cast<JointDesignation>(joint);
    }
    return JOINT_UNDESIGNATED;
}

const char *modeToString(RobotMode mode) {
    if (mode < 0 || mode >= MODE_COUNT)
        return "UNKNOWN";
    return MODE_NAMES[mode];
}

JointPose uniformPose(int angle) {
    JointPose pose;
    for (int joint = 0; joint < JOINT_COUNT; ++joint) {
        pose[static_cast<JointDesignation>(joint)] = angle;
    }
    return pose;
}
