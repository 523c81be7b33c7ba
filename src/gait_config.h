#ifndef GAIT_CONFIG_H
#define GAIT_CONFIG_H

#include "robot_model.h"
#include <string>
#include <vector>

/**
 * @file gait_config.h
 * @brief Angles, delays and pauses for every named behavior
 *
 * All durations are in seconds and already include Parameters::time_scale
 * once built by createGaitConfiguration().
 */

/**
 * @brief Alternating diagonal walk.
 * Each step lifts one diagonal pair, advances the shoulders of the other
 * pair, lowers the lifted pair, then mirrors.
 */
struct WalkGaitConfig {
    int default_steps = 4;
    int lift_angle = 45;       //< Foot angle while lifted
    int lower_angle = 90;      //< Foot angle on the ground
    int shoulder_advance = 20; //< Degrees added to the shoulder per phase
    int shoulder_min = 60;     //< Advance clamp, walk gait only
    int shoulder_max = 120;
    double step_delay = 0.05;  //< Sweep delay for lift/advance/lower poses
    double phase_pause = 0.3;  //< Settle time between phases
};

/**
 * @brief Turn in place by twisting all shoulders then returning to neutral.
 */
struct TurnGaitConfig {
    int default_steps = 2;
    int turn_offset = 20;      //< Shoulder offset from neutral
    double step_delay = 0.02;
    double hold_pause = 0.5;   //< Time the twisted pose is held
    double settle_pause = 0.3; //< Time after returning to neutral
};

/**
 * @brief Cyclic elbow sequence, each pose followed by neutral.
 */
struct DanceGaitConfig {
    std::vector<JointPose> moves;
    int cycles = 3;
    double step_delay = 0.02;
    double hold_pause = 0.4;
    double settle_pause = 0.2;
};

/**
 * @brief Front elbows alternating between two angles.
 */
struct WaveGaitConfig {
    int repetitions = 3;
    int low_angle = 45;
    int high_angle = 135;
    double step_delay = 0.1;   //< Single joint sweep delay
    double pause = 0.3;
    std::vector<JointDesignation> joints; //< Moved one after another
};

/**
 * @brief Complete behavior configuration.
 */
struct GaitConfiguration {
    WalkGaitConfig walk;
    TurnGaitConfig turn;
    DanceGaitConfig dance;
    WaveGaitConfig wave;

    int neutral_angle = NEUTRAL_ANGLE;
    double neutral_step_delay = POSE_STEP_DELAY; //< Delay for return-to-neutral poses
};

#endif // GAIT_CONFIG_H
