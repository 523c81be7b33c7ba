#include "pose_engine.h"
#include <exception>
#include <thread>
#include <vector>

PoseEngine::PoseEngine(MotionPrimitiveEngine &motion)
    : motion_(motion) {}

ActuatorError PoseEngine::applyPose(const JointPose &pose, double step_delay) {
    if (pose.empty())
        return ACTUATOR_OK;

    // One result slot per worker, each written only by its own thread
    std::vector<ActuatorError> results(pose.size(), ACTUATOR_OK);
    std::vector<std::exception_ptr> failures(pose.size());
    std::vector<std::thread> workers;
    workers.reserve(pose.size());

    size_t slot = 0;
    try {
        for (JointPose::const_iterator it = pose.begin(); it != pose.end(); ++it, ++slot) {
            JointDesignation joint = it->first;
            int angle = it->second;
            ActuatorError *result = &results[slot];
            std::exception_ptr *failure = &failures[slot];
            workers.emplace_back([this, joint, angle, step_delay, result, failure]() {
                // An exception must not leave the worker; it is rethrown after the join
                try {
                    *result = motion_.moveJoint(joint, angle, step_delay);
                } catch (...) {
                    *failure = std::current_exception();
                }
            });
        }
    } catch (...) {
        // Never leave joinable threads behind when spawning fails part way
        for (std::thread &worker : workers) {
            worker.join();
        }
        throw;
    }

    for (std::thread &worker : workers) {
        worker.join();
    }

    for (const std::exception_ptr &failure : failures) {
        if (failure)
            std::rethrow_exception(failure);
    }

    for (ActuatorError result : results) {
        if (result != ACTUATOR_OK)
            return result;
    }
    return ACTUATOR_OK;
}
