#include "joint_state_table.h"

JointStateTable::JointStateTable(int initial_angle) {
    angles_.fill(initial_angle);
}

int JointStateTable::getAngle(JointDesignation joint) const {
    if (joint < 0 || joint >= JOINT_COUNT)
        return NEUTRAL_ANGLE;
    std::lock_guard<std::mutex> lock(mutex_);
    return angles_[joint];
}

bool JointStateTable::setAngle(JointDesignation joint, int angle) {
    if (joint < 0 || joint >= JOINT_COUNT)
        return false;
    std::lock_guard<std::mutex> lock(mutex_);
    angles_[joint] = angle;
    return true;
}

void JointStateTable::reset(int angle) {
    std::lock_guard<std::mutex> lock(mutex_);
    angles_.fill(angle);
}

JointAngleMatrix JointStateTable::snapshot() const {
    JointAngleMatrix matrix;
    std::lock_guard<std::mutex> lock(mutex_);
    for (int leg = 0; leg < NUM_LEGS; ++leg) {
        for (int segment = 0; segment < JOINTS_PER_LEG; ++segment) {
            matrix(leg, segment) = angles_[leg * JOINTS_PER_LEG + segment];
        }
    }
    return matrix;
}

bool JointStateTable::allAt(int angle) const {
    return (snapshot().array() == angle).all();
}
