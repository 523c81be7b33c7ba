/**
 * @file detached_demo.cpp
 * @brief Runs every behavior without hardware and prints the joint table
 */

#include "SpiderMotion.h"
#include <iomanip>
#include <iostream>

void printJointAngles(const JointAngleMatrix &angles) {
    std::cout << "          shoulder  elbow  foot\n";
    for (int leg = 0; leg < NUM_LEGS; ++leg) {
        std::cout << "  leg" << (leg + 1) << "   "
                  << std::setw(8) << angles(leg, SEGMENT_SHOULDER)
                  << std::setw(7) << angles(leg, SEGMENT_ELBOW)
                  << std::setw(6) << angles(leg, SEGMENT_FOOT) << "\n";
    }
}

int main() {
    Parameters params = createDefaultParameters();
    params.time_scale = 0.1; // ten times faster than real time

    ConsoleStatusSink sink;
    LocomotionSystem spider(params);
    if (!spider.initialize(nullptr, nullptr, &sink)) {
        std::cerr << LocomotionSystem::getErrorMessage(spider.getLastError()) << std::endl;
        return 1;
    }

    const char *commands[] = {"walk_forward 2", "turn_left", "turn right 1", "dance", "wave"};
    for (const char *command : commands) {
        BehaviorResult result = spider.executeText(command);
        std::cout << command << " -> " << behaviorResultToString(result) << "\n";
        printJointAngles(spider.getStatus().joint_angles);
    }

    LocomotionSystem::Status status = spider.getStatus();
    std::cout << std::fixed << std::setprecision(1)
              << "Distance: " << status.distance_cm << " cm, busy: " << (status.busy ? "yes" : "no") << std::endl;

    spider.shutdown();
    return 0;
}
