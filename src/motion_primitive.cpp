#include "motion_primitive.h"
#include "math_utils.h"
#include <chrono>
#include <cstdlib>
#include <sstream>
#include <thread>

MotionPrimitiveEngine::MotionPrimitiveEngine(ActuatorBus &bus, JointStateTable &table)
    : bus_(bus), table_(table), skipped_steps_(0) {}

bool MotionPrimitiveEngine::isTransientError(ActuatorError error) {
    // An unavailable bus has already degraded to detached mode
    return error == ACTUATOR_IO_ERROR || error == ACTUATOR_UNAVAILABLE;
}

ActuatorError MotionPrimitiveEngine::moveJoint(JointDesignation joint, int target_angle, double step_delay) {
    if (joint < 0 || joint >= JOINT_COUNT)
        return ACTUATOR_CHANNEL_OUT_OF_RANGE;

    int target = math_utils::clampServoAngle(target_angle);
    int current = table_.getAngle(joint);

    if (current == target) {
        ActuatorError result = bus_.setJointAngle(joint, target);
        if (result != ACTUATOR_OK && !isTransientError(result))
            return result;
        if (result != ACTUATOR_OK)
            skipped_steps_++;
        return ACTUATOR_OK;
    }

    int sweep = std::abs(target - current);
    int direction = (target > current) ? 1 : -1;
    double delay = math_utils::sweepStepDelay(step_delay, sweep);

    int last_commanded = current;
    ActuatorError last_skip = ACTUATOR_OK;
    for (int position = current + direction;; position += direction) {
        ActuatorError result = bus_.setJointAngle(joint, position);
        if (result == ACTUATOR_OK) {
            last_commanded = position;
        } else if (isTransientError(result)) {
            skipped_steps_++;
            last_skip = result;
            std::ostringstream msg;
            msg << jointName(joint) << " skipped " << position << " degrees: " << actuatorErrorToString(result);
            spider_log::warning("MotionPrimitive", msg.str());
        } else {
            table_.setAngle(joint, last_commanded);
            std::ostringstream msg;
            msg << "Error moving " << jointName(joint) << ": " << actuatorErrorToString(result);
            spider_log::error("MotionPrimitive", msg.str());
            return result;
        }

        if (position == target)
            break;

        if (bus_.isAttached() && delay > 0.0) {
            std::this_thread::sleep_for(std::chrono::duration<double>(delay));
        }
    }

    table_.setAngle(joint, last_commanded);
    if (last_commanded != target) {
        std::ostringstream msg;
        msg << jointName(joint) << " stopped at " << last_commanded << " degrees instead of " << target;
        spider_log::warning("MotionPrimitive", msg.str());
        return last_skip;
    }
    return ACTUATOR_OK;
}
