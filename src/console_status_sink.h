#ifndef CONSOLE_STATUS_SINK_H
#define CONSOLE_STATUS_SINK_H

#include "../include/robot_interfaces.h"
#include <atomic>

/**
 * @brief Status sink printing mode changes and distance samples to the log.
 * Used when no display is attached. Distances are logged at debug level only
 * since they arrive twice a second.
 */
class ConsoleStatusSink : public IStatusSink {
  public:
    ConsoleStatusSink();

    void updateMode(RobotMode mode) override;
    void updateDistance(double distance_cm) override;

    RobotMode getLastMode() const { return last_mode_.load(); }
    double getLastDistance() const { return last_distance_.load(); }

  private:
    std::atomic<RobotMode> last_mode_;
    std::atomic<double> last_distance_;
};

#endif // CONSOLE_STATUS_SINK_H
