#ifndef POSE_ENGINE_H
#define POSE_ENGINE_H

#include "motion_primitive.h"

/**
 * @brief Moves a set of joints to a pose in parallel.
 *
 * Each joint of the pose sweeps on its own worker thread. applyPose() joins
 * every worker before returning, so the slowest joint sets the latency.
 * Joints are not locked individually: concurrent applyPose() calls with
 * overlapping joints must be serialized by the caller (the gait engine's
 * busy flag does this).
 */
class PoseEngine {
  public:
    explicit PoseEngine(MotionPrimitiveEngine &motion);

    /**
     * @brief Drive every joint of the pose to its target.
     * @param pose Joint to target angle mapping
     * @param step_delay Base step delay in seconds for each sweep
     * @return ACTUATOR_OK, or the first error reported by any worker
     *
     * An exception thrown inside a worker is rethrown here once every
     * worker has been joined.
     */
    ActuatorError applyPose(const JointPose &pose, double step_delay);

  private:
    MotionPrimitiveEngine &motion_;
};

#endif // POSE_ENGINE_H
