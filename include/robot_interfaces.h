#ifndef ROBOT_INTERFACES_H
#define ROBOT_INTERFACES_H

/**
 * @file robot_interfaces.h
 * @brief Hardware and notification contracts implemented outside the controller
 *
 * REQUIRED IMPLEMENTATIONS:
 * =========================
 *
 * - IActuatorInterface: 16-channel angle command bus (e.g. PCA9685 PWM board)
 * - IRangeSensorInterface: single distance sensor reporting meters
 * - IStatusSink: display or dashboard receiving mode and distance updates
 *
 * Any of them may be omitted. A missing actuator or range sensor puts the
 * matching component in detached mode; a missing sink drops notifications.
 */

#include "../src/robot_model.h"

//
// Result of a single actuator command.
//
enum ActuatorError {
    ACTUATOR_OK = 0,
    ACTUATOR_UNAVAILABLE = 1,          //< Bus not initialized or gone
    ACTUATOR_CHANNEL_OUT_OF_RANGE = 2, //< Channel outside 0..15
    ACTUATOR_IO_ERROR = 3              //< Transient write failure, retry on the next command
};

/** Display label for an actuator result. */
const char *actuatorErrorToString(ActuatorError error);

class IActuatorInterface {
  public:
    virtual ~IActuatorInterface() = default;

    /** Initialize the bus. Returning false selects detached mode. */
    virtual bool initialize() = 0;

    /**
     * Command a channel to an angle.
     * @param channel Channel index (0-15)
     * @param angle Angle in degrees, already clamped to 0-180 by the caller
     * @return ACTUATOR_OK when the command was written
     */
    virtual ActuatorError setChannelAngle(int channel, int angle) = 0;

    /** Check if the hardware is still responding. */
    virtual bool isConnected() = 0;
};

class IRangeSensorInterface {
  public:
    virtual ~IRangeSensorInterface() = default;

    /** Initialize the sensor. Returning false selects detached mode. */
    virtual bool initialize() = 0;

    /**
     * Take one distance measurement.
     * @param distance_m Filled with the distance in meters. NaN, negative or
     *        out of range values are treated as "no echo".
     * @return False when the read itself failed (bus or GPIO error)
     */
    virtual bool readDistance(double &distance_m) = 0;
};

/**
 * One-way notification contract. Called from the caller's thread for mode
 * changes and from the range monitor thread for distances, so implementations
 * must be thread safe.
 */
class IStatusSink {
  public:
    virtual ~IStatusSink() = default;

    /** A mode transition happened. */
    virtual void updateMode(RobotMode mode) = 0;

    /** A new distance sample (centimeters) was published. */
    virtual void updateDistance(double distance_cm) = 0;
};

#endif // ROBOT_INTERFACES_H
