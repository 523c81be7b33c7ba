#include "gait_config_factory.h"

WalkGaitConfig createWalkGaitConfig(const Parameters &params) {
    WalkGaitConfig config;
    config.lower_angle = params.neutral_angle;
    config.step_delay *= params.time_scale;
    config.phase_pause *= params.time_scale;
    return config;
}

TurnGaitConfig createTurnGaitConfig(const Parameters &params) {
    TurnGaitConfig config;
    config.step_delay *= params.time_scale;
    config.hold_pause *= params.time_scale;
    config.settle_pause *= params.time_scale;
    return config;
}

DanceGaitConfig createDanceGaitConfig(const Parameters &params) {
    DanceGaitConfig config;
    const int low = 45;
    const int high = 135;

    // Diagonal elbow pairs (1,3) and (2,4), down then up
    config.moves.push_back({{JOINT_LEG1_ELBOW, low}, {JOINT_LEG3_ELBOW, low}});
    config.moves.push_back({{JOINT_LEG2_ELBOW, low}, {JOINT_LEG4_ELBOW, low}});
    config.moves.push_back({{JOINT_LEG1_ELBOW, high}, {JOINT_LEG3_ELBOW, high}});
    config.moves.push_back({{JOINT_LEG2_ELBOW, high}, {JOINT_LEG4_ELBOW, high}});

    config.step_delay *= params.time_scale;
    config.hold_pause *= params.time_scale;
    config.settle_pause *= params.time_scale;
    return config;
}

WaveGaitConfig createWaveGaitConfig(const Parameters &params) {
    WaveGaitConfig config;
    config.joints.push_back(JOINT_LEG1_ELBOW);
    config.joints.push_back(JOINT_LEG2_ELBOW);
    config.step_delay *= params.time_scale;
    config.pause *= params.time_scale;
    return config;
}

GaitConfiguration createGaitConfiguration(const Parameters &params) {
    GaitConfiguration config;
    config.walk = createWalkGaitConfig(params);
    config.turn = createTurnGaitConfig(params);
    config.dance = createDanceGaitConfig(params);
    config.wave = createWaveGaitConfig(params);
    config.neutral_angle = params.neutral_angle;
    config.neutral_step_delay = POSE_STEP_DELAY * params.time_scale;
    return config;
}
