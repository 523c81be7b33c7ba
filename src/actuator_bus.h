#ifndef ACTUATOR_BUS_H
#define ACTUATOR_BUS_H

#include "../include/robot_interfaces.h"
#include "robot_model.h"
#include <atomic>

/**
 * @brief Angle command bus shared by all joints.
 *
 * The bus is either attached to hardware or detached. The choice is made once
 * at construction: a null interface, or one whose initialize() fails, gives a
 * detached bus where every command succeeds immediately and is only logged.
 * An attached bus that later reports ACTUATOR_UNAVAILABLE degrades to
 * detached instead of failing every following command.
 */
class ActuatorBus {
  public:
    /**
     * @brief Construct the bus and probe the hardware.
     * @param params Channel map used to resolve joint names
     * @param hardware Actuator implementation, may be null (not owned)
     */
    ActuatorBus(const Parameters &params, IActuatorInterface *hardware);

    /**
     * @brief Command a raw channel.
     * @param channel Channel index (0-15)
     * @param angle Angle in degrees, clamped by the caller
     */
    ActuatorError setAngle(int channel, int angle);

    /** Command a joint through the channel map. */
    ActuatorError setJointAngle(JointDesignation joint, int angle);

    /** Channel a joint is wired to, -1 for an undesignated joint. */
    int channelFor(JointDesignation joint) const;

    bool isAttached() const { return attached_.load(); }

  private:
    int channel_map_[TOTAL_JOINTS];
    IActuatorInterface *hardware_;
    std::atomic<bool> attached_;
};

#endif // ACTUATOR_BUS_H
