#ifndef GAIT_ENGINE_H
#define GAIT_ENGINE_H

#include "../include/robot_interfaces.h"
#include "command_parser.h"
#include "gait_config.h"
#include "pose_engine.h"
#include <atomic>
#include <functional>

//
// Outcome of a behavior request.
//
enum BehaviorResult {
    BEHAVIOR_COMPLETED, //< Behavior ran to the end
    BEHAVIOR_REJECTED,  //< Another behavior was already running, nothing was done
    BEHAVIOR_FAILED,    //< Behavior aborted part way, controller is idle again
    BEHAVIOR_INVALID    //< Command did not name a behavior
};

/** Display label for a behavior result. */
const char *behaviorResultToString(BehaviorResult result);

/**
 * @brief Named behaviors built from poses and single joint sweeps.
 *
 * Behaviors are mutually exclusive. A request while another behavior runs is
 * rejected immediately, never queued. Every behavior pushes its mode on entry
 * and READY on exit, whatever the outcome. A failure pushes ERROR first.
 *
 * Behaviors block the calling thread until they finish and cannot be
 * cancelled once started.
 */
class GaitEngine {
  public:
    /**
     * @param motion Single joint sweeps (used by wave)
     * @param poses Concurrent pose application
     * @param table Joint state, read for relative shoulder advances
     * @param config Angles and timing for every behavior
     * @param sink Mode notifications, may be null (not owned)
     */
    GaitEngine(MotionPrimitiveEngine &motion, PoseEngine &poses, JointStateTable &table,
               const GaitConfiguration &config, IStatusSink *sink);

    // Named behaviors
    BehaviorResult walkForward(int steps);
    BehaviorResult walkForward() { return walkForward(config_.walk.default_steps); }
    BehaviorResult turnLeft(int steps);
    BehaviorResult turnLeft() { return turnLeft(config_.turn.default_steps); }
    BehaviorResult turnRight(int steps);
    BehaviorResult turnRight() { return turnRight(config_.turn.default_steps); }
    BehaviorResult dance();
    BehaviorResult wave();

    /**
     * @brief Run the behavior a command names.
     * Commands without a step count use the behavior default.
     */
    BehaviorResult execute(const GaitCommand &command);

    /** Drive all twelve joints to the neutral angle in one pose. */
    ActuatorError returnToNeutral();

    /** True while a behavior runs. */
    bool isBusy() const { return busy_.load(); }

    /** Push a mode to the status sink, if any. Sink exceptions are logged and dropped. */
    void notifyMode(RobotMode mode);

    const GaitConfiguration &getConfiguration() const { return config_; }

  private:
    typedef std::function<ActuatorError()> BehaviorBody;

    BehaviorResult runBehavior(const char *name, RobotMode mode, const BehaviorBody &body);

    ActuatorError walkPhase(JointDesignation lift_a, JointDesignation lift_b,
                            JointDesignation advance_a, JointDesignation advance_b);
    ActuatorError turnSteps(int steps, int direction);
    void pause(double seconds) const;

    MotionPrimitiveEngine &motion_;
    PoseEngine &poses_;
    JointStateTable &table_;
    GaitConfiguration config_;
    IStatusSink *sink_;
    std::atomic<bool> busy_;
};

#endif // GAIT_ENGINE_H
