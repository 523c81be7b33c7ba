#ifndef MOTION_PRIMITIVE_H
#define MOTION_PRIMITIVE_H

#include "actuator_bus.h"
#include "joint_state_table.h"
#include <atomic>

/**
 * @brief Moves a single joint smoothly from its current angle to a target.
 *
 * The sweep advances one degree per command. The wait after each degree is
 * the step delay divided by (sweep / 10) for sweeps longer than ten degrees,
 * which bounds the duration of long sweeps. On a detached bus the same
 * commands and table updates happen without waiting.
 */
class MotionPrimitiveEngine {
  public:
    MotionPrimitiveEngine(ActuatorBus &bus, JointStateTable &table);

    /**
     * @brief Sweep a joint to a target angle.
     *
     * The target is clamped to [0,180]. When the joint is already there a
     * single command is issued. Transient I/O errors skip the failing degree
     * and the sweep continues. The joint state table always ends at the last
     * angle that was actually commanded.
     * @param joint Joint to move
     * @param target_angle Requested angle in degrees
     * @param step_delay Base delay in seconds
     * @return ACTUATOR_OK, the first non-transient error, which aborts the sweep,
     *         or the transient error that kept the final degree from being commanded
     */
    ActuatorError moveJoint(JointDesignation joint, int target_angle, double step_delay);

    /** Number of transient errors skipped since construction. */
    unsigned long getSkippedSteps() const { return skipped_steps_.load(); }

    static bool isTransientError(ActuatorError error);

  private:
    ActuatorBus &bus_;
    JointStateTable &table_;
    std::atomic<unsigned long> skipped_steps_;
};

#endif // MOTION_PRIMITIVE_H
