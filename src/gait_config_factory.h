#ifndef GAIT_CONFIG_FACTORY_H
#define GAIT_CONFIG_FACTORY_H

#include "gait_config.h"

/**
 * @file gait_config_factory.h
 * @brief Builds behavior configurations from robot parameters
 */

WalkGaitConfig createWalkGaitConfig(const Parameters &params);
TurnGaitConfig createTurnGaitConfig(const Parameters &params);
DanceGaitConfig createDanceGaitConfig(const Parameters &params);
WaveGaitConfig createWaveGaitConfig(const Parameters &params);

/** Full configuration with every duration scaled by params.time_scale. */
GaitConfiguration createGaitConfiguration(const Parameters &params);

#endif // GAIT_CONFIG_FACTORY_H
