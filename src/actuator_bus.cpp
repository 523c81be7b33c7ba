#include "actuator_bus.h"
#include <sstream>

const char *actuatorErrorToString(ActuatorError error) {
    switch (error) {
    case ACTUATOR_OK:
        return "ok";
    case ACTUATOR_UNAVAILABLE:
        return "actuator unavailable";
    case ACTUATOR_CHANNEL_OUT_OF_RANGE:
        return "channel out of range";
    case ACTUATOR_IO_ERROR:
        return "transient I/O error";
    }
    return "unknown actuator error";
}

ActuatorBus::ActuatorBus(const Parameters &params, IActuatorInterface *hardware)
    : hardware_(hardware), attached_(false) {
    for (int joint = 0; joint < TOTAL_JOINTS; ++joint) {
        channel_map_[joint] = params.channel_map[joint];
    }

    if (!hardware_) {
        spider_log::info("ActuatorBus", "No servo driver present, running detached");
        return;
    }

    if (!hardware_->initialize()) {
        spider_log::warning("ActuatorBus", "Servo driver initialization failed, running detached");
        hardware_ = nullptr;
        return;
    }

    attached_.store(true);
    spider_log::info("ActuatorBus", "Servo driver initialized");
}

ActuatorError ActuatorBus::setAngle(int channel, int angle) {
    if (channel < 0 || channel >= NUM_ACTUATOR_CHANNELS) {
        return ACTUATOR_CHANNEL_OUT_OF_RANGE;
    }

    if (!attached_.load()) {
        std::ostringstream msg;
        msg << "Mock servo move: channel " << channel << " to " << angle << " degrees";
        spider_log::debug("ActuatorBus", msg.str());
        return ACTUATOR_OK;
    }

    ActuatorError result = hardware_->setChannelAngle(channel, angle);
    if (result == ACTUATOR_UNAVAILABLE) {
        // Only the first failing worker logs the transition
        bool expected = true;
        if (attached_.compare_exchange_strong(expected, false)) {
            spider_log::error("ActuatorBus", "Servo driver stopped responding, switching to detached mode");
        }
    }
    return result;
}

ActuatorError ActuatorBus::setJointAngle(JointDesignation joint, int angle) {
    int channel = channelFor(joint);
    if (channel < 0)
        return ACTUATOR_CHANNEL_OUT_OF_RANGE;
    return setAngle(channel, angle);
}

int ActuatorBus::channelFor(JointDesignation joint) const {
    if (joint < 0 || joint >= JOINT_COUNT)
        return -1;
    return channel_map_[joint];
}
