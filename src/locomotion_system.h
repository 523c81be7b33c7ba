#ifndef LOCOMOTION_SYSTEM_H
#define LOCOMOTION_SYSTEM_H

#include "../include/robot_interfaces.h"
#include "actuator_bus.h"
#include "command_parser.h"
#include "gait_config_factory.h"
#include "gait_engine.h"
#include "joint_state_table.h"
#include "motion_primitive.h"
#include "pose_engine.h"
#include "range_monitor.h"
#include "robot_model.h"
#include <atomic>
#include <memory>
#include <string>

// Main locomotion system class
class LocomotionSystem {
  public:
    // Error control
    enum ErrorCode {
        NO_ERROR = 0,
        ACTUATOR_ERROR = 1,  // Homing failed on a joint
        SENSOR_ERROR = 2,    // Range monitor could not start
        PARAMETER_ERROR = 3, // Invalid channel map or timing
        STATE_ERROR = 4      // Called in the wrong lifecycle state
    };

    /**
     * @brief Snapshot for polling consumers (status broadcast, reasoning context).
     */
    struct Status {
        bool busy;                      //< A behavior is running
        double distance_cm;             //< Last published distance
        JointAngleMatrix joint_angles;  //< Last commanded angles [leg][segment]
        bool actuator_attached;         //< False in detached mode
        bool sensor_attached;           //< False when publishing placeholder distances
    };

    /**
     * @brief Construct a locomotion system with the given parameters.
     * @param params Channel map, timing and hardware configuration.
     */
    explicit LocomotionSystem(const Parameters &params);

    /**
     * @brief Destructor stops the range monitor. Must not run while a behavior
     * is executing on another thread.
     */
    ~LocomotionSystem();

    /**
     * @brief Attach hardware, home every joint and start distance sampling.
     *
     * Null or failing hardware selects detached mode for that component and
     * is not an error. Only invalid parameters or a second call fail.
     *
     * @param actuator Servo bus implementation, may be null.
     * @param sensor Distance sensor implementation, may be null.
     * @param sink Status notifications, may be null.
     * @return True on successful initialization.
     */
    bool initialize(IActuatorInterface *actuator, IRangeSensorInterface *sensor, IStatusSink *sink);

    /** Stop sampling and report SHUTDOWN. Safe to call more than once. */
    void shutdown();

    /** Check if the locomotion system is enabled. */
    bool isSystemEnabled() const { return system_enabled.load(); }

    // Behaviors. A negative step count selects the behavior default.
    BehaviorResult walkForward(int steps = -1);
    BehaviorResult turnLeft(int steps = -1);
    BehaviorResult turnRight(int steps = -1);
    BehaviorResult dance();
    BehaviorResult wave();

    /** Run a parsed command. */
    BehaviorResult execute(const GaitCommand &command);

    /**
     * @brief Run a command given as text.
     * Structured verbs ("turn_left 3") are tried first, then free-text keywords.
     */
    BehaviorResult executeText(const std::string &text);

    /** Push a mode on behalf of an external collaborator (e.g. ANALYZING). */
    void reportMode(RobotMode mode);

    // Status queries
    Status getStatus() const;
    bool isBusy() const;
    double getDistance() const;

    ErrorCode getLastError() const { return last_error.load(); }
    /** Human readable description of an error code. */
    static std::string getErrorMessage(ErrorCode error);

    const Parameters &getParameters() const { return params; }
    const GaitConfiguration &getGaitConfiguration() const { return gait_config; }
    const JointStateTable &getJointStateTable() const { return joint_table; }

  private:
    bool homeJoints();
    BehaviorResult notReady();

    Parameters params;
    GaitConfiguration gait_config;
    JointStateTable joint_table;

    std::unique_ptr<ActuatorBus> actuator_bus;
    std::unique_ptr<MotionPrimitiveEngine> motion_engine;
    std::unique_ptr<PoseEngine> pose_engine;
    std::unique_ptr<GaitEngine> gait_engine;
    std::unique_ptr<RangeMonitor> range_monitor;

    IStatusSink *status_sink;

    // Behaviors and shutdown may be called from different threads
    std::atomic<bool> system_enabled;
    std::atomic<ErrorCode> last_error;
};

#endif // LOCOMOTION_SYSTEM_H
