#ifndef SPIDERMOTION_H
#define SPIDERMOTION_H

#include "../include/robot_interfaces.h"
#include "actuator_bus.h"
#include "command_parser.h"
#include "console_status_sink.h"
#include "gait_config.h"
#include "gait_config_factory.h"
#include "gait_engine.h"
#include "joint_state_table.h"
#include "locomotion_system.h"
#include "math_utils.h"
#include "motion_primitive.h"
#include "pose_engine.h"
#include "range_monitor.h"
#include "robot_model.h"
#include "spider_log.h"
#include "spidermotion_constants.h"

#endif // SPIDERMOTION_H
