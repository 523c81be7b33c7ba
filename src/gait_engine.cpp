#include "gait_engine.h"
#include "math_utils.h"
#include <chrono>
#include <exception>
#include <sstream>
#include <thread>

namespace {
// Clears the busy flag and restores READY on every exit path
class BehaviorGuard {
  public:
    BehaviorGuard(GaitEngine &engine, std::atomic<bool> &busy) : engine_(engine), busy_(busy) {}
    ~BehaviorGuard() {
        engine_.notifyMode(MODE_READY);
        busy_.store(false);
    }

  private:
    GaitEngine &engine_;
    std::atomic<bool> &busy_;
};
} // namespace

const char *behaviorResultToString(BehaviorResult result) {
    switch (result) {
    case BEHAVIOR_COMPLETED:
        return "completed";
    case BEHAVIOR_REJECTED:
        return "already moving";
    case BEHAVIOR_FAILED:
        return "failed";
    case BEHAVIOR_INVALID:
        return "invalid command";
    }
    return "unknown";
}

GaitEngine::GaitEngine(MotionPrimitiveEngine &motion, PoseEngine &poses, JointStateTable &table,
                       const GaitConfiguration &config, IStatusSink *sink)
    : motion_(motion), poses_(poses), table_(table), config_(config), sink_(sink), busy_(false) {}

void GaitEngine::notifyMode(RobotMode mode) {
    if (!sink_)
        return;
    // A failing display must not stop the gait or its cleanup
    try {
        sink_->updateMode(mode);
    } catch (const std::exception &e) {
        spider_log::error("GaitEngine", std::string("Status sink rejected ") + modeToString(mode) + ": " + e.what());
    }
}

void GaitEngine::pause(double seconds) const {
    if (seconds > 0.0)
        std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
}

BehaviorResult GaitEngine::runBehavior(const char *name, RobotMode mode, const BehaviorBody &body) {
    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true)) {
        spider_log::info("GaitEngine", std::string("Already moving, ") + name + " ignored");
        return BEHAVIOR_REJECTED;
    }

    BehaviorGuard guard(*this, busy_);

    ActuatorError error = ACTUATOR_OK;
    std::string failure;
    try {
        notifyMode(mode);
        error = body();
        if (error != ACTUATOR_OK)
            failure = actuatorErrorToString(error);
    } catch (const std::exception &e) {
        failure = e.what();
    }

    if (!failure.empty()) {
        spider_log::error("GaitEngine", std::string(name) + " error: " + failure);
        notifyMode(MODE_ERROR);
        return BEHAVIOR_FAILED;
    }
    return BEHAVIOR_COMPLETED;
}

ActuatorError GaitEngine::returnToNeutral() {
    return poses_.applyPose(uniformPose(config_.neutral_angle), config_.neutral_step_delay);
}

ActuatorError GaitEngine::walkPhase(JointDesignation lift_a, JointDesignation lift_b,
                                    JointDesignation advance_a, JointDesignation advance_b) {
    const WalkGaitConfig &walk = config_.walk;

    JointPose lift;
    lift[lift_a] = walk.lift_angle;
    lift[lift_b] = walk.lift_angle;
    ActuatorError error = poses_.applyPose(lift, walk.step_delay);
    if (error != ACTUATOR_OK)
        return error;

    // Shoulder advance is relative and uses the narrower walk-only clamp
    JointPose advance;
    advance[advance_a] = math_utils::clamped(table_.getAngle(advance_a) + walk.shoulder_advance,
                                             walk.shoulder_min, walk.shoulder_max);
    advance[advance_b] = math_utils::clamped(table_.getAngle(advance_b) + walk.shoulder_advance,
                                             walk.shoulder_min, walk.shoulder_max);
    error = poses_.applyPose(advance, walk.step_delay);
    if (error != ACTUATOR_OK)
        return error;

    JointPose lower;
    lower[lift_a] = walk.lower_angle;
    lower[lift_b] = walk.lower_angle;
    error = poses_.applyPose(lower, walk.step_delay);
    if (error != ACTUATOR_OK)
        return error;

    pause(walk.phase_pause);
    return ACTUATOR_OK;
}

BehaviorResult GaitEngine::walkForward(int steps) {
    return runBehavior("walk_forward", MODE_WALKING, [this, steps]() {
        spider_log::info("GaitEngine", "Walking forward " + std::to_string(steps) + " steps");
        for (int step = 0; step < steps; ++step) {
            // Phase A: lift diagonal 1/4, advance the opposite diagonal 2/3
            ActuatorError error = walkPhase(JOINT_LEG1_FOOT, JOINT_LEG4_FOOT,
                                            JOINT_LEG2_SHOULDER, JOINT_LEG3_SHOULDER);
            if (error != ACTUATOR_OK)
                return error;

            // Phase B: mirror
            error = walkPhase(JOINT_LEG2_FOOT, JOINT_LEG3_FOOT,
                              JOINT_LEG1_SHOULDER, JOINT_LEG4_SHOULDER);
            if (error != ACTUATOR_OK)
                return error;
        }
        return ACTUATOR_OK;
    });
}

ActuatorError GaitEngine::turnSteps(int steps, int direction) {
    const TurnGaitConfig &turn = config_.turn;
    int offset = turn.turn_offset * direction;

    // Legs 1 and 3 twist one way, legs 2 and 4 the other
    JointPose twist;
    twist[JOINT_LEG1_SHOULDER] = config_.neutral_angle - offset;
    twist[JOINT_LEG2_SHOULDER] = config_.neutral_angle + offset;
    twist[JOINT_LEG3_SHOULDER] = config_.neutral_angle - offset;
    twist[JOINT_LEG4_SHOULDER] = config_.neutral_angle + offset;

    for (int step = 0; step < steps; ++step) {
        ActuatorError error = poses_.applyPose(twist, turn.step_delay);
        if (error != ACTUATOR_OK)
            return error;
        pause(turn.hold_pause);

        error = returnToNeutral();
        if (error != ACTUATOR_OK)
            return error;
        pause(turn.settle_pause);
    }
    return ACTUATOR_OK;
}

BehaviorResult GaitEngine::turnLeft(int steps) {
    return runBehavior("turn_left", MODE_TURNING, [this, steps]() {
        spider_log::info("GaitEngine", "Turning left " + std::to_string(steps) + " steps");
        return turnSteps(steps, 1);
    });
}

BehaviorResult GaitEngine::turnRight(int steps) {
    return runBehavior("turn_right", MODE_TURNING, [this, steps]() {
        spider_log::info("GaitEngine", "Turning right " + std::to_string(steps) + " steps");
        return turnSteps(steps, -1);
    });
}

BehaviorResult GaitEngine::dance() {
    return runBehavior("dance", MODE_DANCING, [this]() {
        const DanceGaitConfig &dance = config_.dance;
        spider_log::info("GaitEngine", "Dancing!");
        for (int cycle = 0; cycle < dance.cycles; ++cycle) {
            for (const JointPose &move : dance.moves) {
                ActuatorError error = poses_.applyPose(move, dance.step_delay);
                if (error != ACTUATOR_OK)
                    return error;
                pause(dance.hold_pause);

                error = returnToNeutral();
                if (error != ACTUATOR_OK)
                    return error;
                pause(dance.settle_pause);
            }
        }
        return ACTUATOR_OK;
    });
}

BehaviorResult GaitEngine::wave() {
    return runBehavior("wave", MODE_WAVING, [this]() {
        const WaveGaitConfig &wave = config_.wave;
        spider_log::info("GaitEngine", "Waving!");
        const int angles[2] = {wave.low_angle, wave.high_angle};
        for (int rep = 0; rep < wave.repetitions; ++rep) {
            for (int angle : angles) {
                for (JointDesignation joint : wave.joints) {
                    ActuatorError error = motion_.moveJoint(joint, angle, wave.step_delay);
                    if (error != ACTUATOR_OK)
                        return error;
                }
                pause(wave.pause);
            }
        }
        return returnToNeutral();
    });
}

BehaviorResult GaitEngine::execute(const GaitCommand &command) {
    switch (command.verb) {
    case GAIT_WALK_FORWARD:
        return command.hasSteps() ? walkForward(command.steps) : walkForward();
    case GAIT_TURN_LEFT:
        return command.hasSteps() ? turnLeft(command.steps) : turnLeft();
    case GAIT_TURN_RIGHT:
        return command.hasSteps() ? turnRight(command.steps) : turnRight();
    case GAIT_DANCE:
        return dance();
    case GAIT_WAVE:
        return wave();
    default:
        break;
    }
    spider_log::warning("GaitEngine", "Unknown command ignored");
    return BEHAVIOR_INVALID;
}
