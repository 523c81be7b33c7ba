#include "locomotion_system.h"
#include <chrono>
#include <exception>
#include <sstream>
#include <thread>

// Constructor
LocomotionSystem::LocomotionSystem(const Parameters &params)
    : params(params), gait_config(createGaitConfiguration(params)), joint_table(params.neutral_angle),
      status_sink(nullptr), system_enabled(false), last_error(NO_ERROR) {}

// Destructor
LocomotionSystem::~LocomotionSystem() {
    shutdown();
}

// System initialization
bool LocomotionSystem::initialize(IActuatorInterface *actuator, IRangeSensorInterface *sensor, IStatusSink *sink) {
    if (system_enabled || actuator_bus) {
        last_error = STATE_ERROR;
        return false;
    }

    std::string reason;
    if (!validateParameters(params, &reason)) {
        spider_log::error("LocomotionSystem", "Invalid parameters: " + reason);
        last_error = PARAMETER_ERROR;
        return false;
    }

    spider_log::setLevel(params.log_level);
    status_sink = sink;

    actuator_bus.reset(new ActuatorBus(params, actuator));
    motion_engine.reset(new MotionPrimitiveEngine(*actuator_bus, joint_table));
    pose_engine.reset(new PoseEngine(*motion_engine));
    gait_engine.reset(new GaitEngine(*motion_engine, *pose_engine, joint_table, gait_config, status_sink));

    if (!homeJoints()) {
        // Homing problems leave the joints where they are but do not stop the controller
        last_error = ACTUATOR_ERROR;
    }

    range_monitor.reset(new RangeMonitor(params, sensor, status_sink));
    if (!range_monitor->start()) {
        last_error = SENSOR_ERROR;
    }

    system_enabled = true;
    gait_engine->notifyMode(MODE_READY);
    spider_log::info("LocomotionSystem", actuator_bus->isAttached() ? "Ready" : "Ready (detached)");
    return true;
}

// Drive every joint to neutral one at a time
bool LocomotionSystem::homeJoints() {
    bool all_ok = true;
    double delay = params.startup_servo_delay * params.time_scale;

    for (int joint = 0; joint < JOINT_COUNT; ++joint) {
        JointDesignation designation = static_cast<JointDesignation>(joint);
        try {
            ActuatorError error = motion_engine->moveJoint(designation, params.neutral_angle, 0.0);
            if (error != ACTUATOR_OK) {
                spider_log::error("LocomotionSystem", "Error setting " + jointName(designation) + ": " +
                                                          actuatorErrorToString(error));
                all_ok = false;
            }
        } catch (const std::exception &e) {
            spider_log::error("LocomotionSystem", "Error setting " + jointName(designation) + ": " + e.what());
            all_ok = false;
        }
        if (actuator_bus->isAttached() && delay > 0.0)
            std::this_thread::sleep_for(std::chrono::duration<double>(delay));
    }
    return all_ok;
}

void LocomotionSystem::shutdown() {
    if (!system_enabled.exchange(false))
        return;

    if (range_monitor)
        range_monitor->stop();

    reportMode(MODE_SHUTDOWN);
    spider_log::info("LocomotionSystem", "Shut down");
}

BehaviorResult LocomotionSystem::notReady() {
    last_error = STATE_ERROR;
    spider_log::warning("LocomotionSystem", "Behavior requested before initialization");
    return BEHAVIOR_FAILED;
}

BehaviorResult LocomotionSystem::walkForward(int steps) {
    if (!system_enabled)
        return notReady();
    return execute(GaitCommand(GAIT_WALK_FORWARD, steps));
}

BehaviorResult LocomotionSystem::turnLeft(int steps) {
    if (!system_enabled)
        return notReady();
    return execute(GaitCommand(GAIT_TURN_LEFT, steps));
}

BehaviorResult LocomotionSystem::turnRight(int steps) {
    if (!system_enabled)
        return notReady();
    return execute(GaitCommand(GAIT_TURN_RIGHT, steps));
}

BehaviorResult LocomotionSystem::dance() {
    if (!system_enabled)
        return notReady();
    return gait_engine->dance();
}

BehaviorResult LocomotionSystem::wave() {
    if (!system_enabled)
        return notReady();
    return gait_engine->wave();
}

BehaviorResult LocomotionSystem::execute(const GaitCommand &command) {
    if (!system_enabled)
        return notReady();
    return gait_engine->execute(command);
}

BehaviorResult LocomotionSystem::executeText(const std::string &text) {
    GaitCommand command = parseGaitCommand(text);
    if (!command.isValid())
        command = interpretFreeText(text);

    if (!command.isValid()) {
        spider_log::info("LocomotionSystem", "Unknown command: " + text);
        return BEHAVIOR_INVALID;
    }
    return execute(command);
}

void LocomotionSystem::reportMode(RobotMode mode) {
    if (gait_engine) {
        gait_engine->notifyMode(mode);
    } else if (status_sink) {
        status_sink->updateMode(mode);
    }
}

LocomotionSystem::Status LocomotionSystem::getStatus() const {
    Status status;
    status.busy = isBusy();
    status.distance_cm = getDistance();
    status.joint_angles = joint_table.snapshot();
    status.actuator_attached = actuator_bus && actuator_bus->isAttached();
    status.sensor_attached = range_monitor && range_monitor->isAttached();
    return status;
}

bool LocomotionSystem::isBusy() const {
    return gait_engine && gait_engine->isBusy();
}

double LocomotionSystem::getDistance() const {
    if (!range_monitor)
        return params.range.max_range_cm;
    return range_monitor->getDistance();
}

std::string LocomotionSystem::getErrorMessage(ErrorCode error) {
    switch (error) {
    case NO_ERROR:
        return "No error";
    case ACTUATOR_ERROR:
        return "Actuator error while homing joints";
    case SENSOR_ERROR:
        return "Range monitor failed to start";
    case PARAMETER_ERROR:
        return "Invalid parameters";
    case STATE_ERROR:
        return "Invalid system state";
    default:
        return "Unknown error";
    }
}
