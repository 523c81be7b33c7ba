#ifndef JOINT_STATE_TABLE_H
#define JOINT_STATE_TABLE_H

#include "robot_model.h"
#include <array>
#include <mutex>

/**
 * @brief Authoritative record of the last commanded angle of every joint.
 *
 * Written only by the motion primitive engine at the end of a sweep. The
 * table is guarded by one coarse mutex so status readers never observe a
 * torn snapshot while pose workers update their joints.
 */
class JointStateTable {
  public:
    /**
     * @brief Create a table with every joint at the given angle.
     * @param initial_angle Starting angle in degrees (normally neutral)
     */
    explicit JointStateTable(int initial_angle = NEUTRAL_ANGLE);

    /** Last commanded angle of a joint. */
    int getAngle(JointDesignation joint) const;

    /**
     * @brief Record a commanded angle.
     * @return False for an undesignated joint
     */
    bool setAngle(JointDesignation joint, int angle);

    /** Set every joint to the same angle. */
    void reset(int angle);

    /** Copy of all angles laid out [leg][segment]. */
    JointAngleMatrix snapshot() const;

    /** True when every joint equals the given angle. */
    bool allAt(int angle) const;

  private:
    mutable std::mutex mutex_;
    std::array<int, TOTAL_JOINTS> angles_;
};

#endif // JOINT_STATE_TABLE_H
