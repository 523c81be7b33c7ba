#ifndef HCSR04_RANGE_SENSOR_H
#define HCSR04_RANGE_SENSOR_H

#include "../include/robot_interfaces.h"
#include <chrono>
#include <string>

/**
 * @brief HC-SR04 ultrasonic sensor on two GPIO lines via the sysfs interface.
 *
 * A 10 us trigger pulse starts a measurement; the echo line stays high for
 * the round-trip time of the sound. An echo that never starts or never ends
 * within the timeout is reported as a valid read of "no echo" (NaN), which
 * the range monitor turns into the max range sentinel.
 */
class HcSr04RangeSensor : public IRangeSensorInterface {
  public:
    explicit HcSr04RangeSensor(const Parameters::RangeConfig &config);
    ~HcSr04RangeSensor() override;

    HcSr04RangeSensor(const HcSr04RangeSensor &) = delete;
    HcSr04RangeSensor &operator=(const HcSr04RangeSensor &) = delete;

    bool initialize() override;
    bool readDistance(double &distance_m) override;

    /** Distance in meters for an echo pulse length in seconds. */
    static double echoToMeters(double echo_seconds);

  private:
    std::string pinPath(int gpio, const char *attribute) const;
    bool exportPin(int pin, const char *direction);
    void unexportPin(int pin);
    // Close value files and unexport whatever initialize() exported
    void releasePins();
    bool readEcho(int &level);
    // Wait until the echo line reaches level; false on timeout or read error
    bool waitForEcho(int level, std::chrono::steady_clock::time_point deadline, bool &io_error);

    std::string gpio_root_;
    int trigger_gpio_;
    int echo_gpio_;
    int trigger_fd_;
    int echo_fd_;
    bool trigger_exported_;
    bool echo_exported_;
};

#endif // HCSR04_RANGE_SENSOR_H
