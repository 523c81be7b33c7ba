#ifndef PCA9685_SERVO_DRIVER_H
#define PCA9685_SERVO_DRIVER_H

#include "../include/robot_interfaces.h"
#include <cstdint>
#include <mutex>
#include <string>

/**
 * @brief 16-channel PCA9685 PWM board driven through Linux i2c-dev.
 *
 * Angles map linearly onto the configured pulse range (750-2250 us by
 * default, the common hobby servo range) at the configured PWM frequency.
 * Writes are serialized because pose workers command channels concurrently.
 */
class Pca9685ServoDriver : public IActuatorInterface {
  public:
    explicit Pca9685ServoDriver(const Parameters::ServoDriverConfig &config);
    ~Pca9685ServoDriver() override;

    Pca9685ServoDriver(const Pca9685ServoDriver &) = delete;
    Pca9685ServoDriver &operator=(const Pca9685ServoDriver &) = delete;

    bool initialize() override;
    ActuatorError setChannelAngle(int channel, int angle) override;
    bool isConnected() override;

    /** Pulse width in microseconds for an angle. */
    double pulseWidthForAngle(int angle) const;
    /** PWM on-time in 12-bit ticks for an angle. */
    uint16_t ticksForAngle(int angle) const;

  private:
    bool writeRegister(uint8_t reg, uint8_t value);
    bool readRegister(uint8_t reg, uint8_t &value);

    Parameters::ServoDriverConfig config_;
    std::string device_path_;
    int fd_;
    std::mutex bus_mutex_;
};

#endif // PCA9685_SERVO_DRIVER_H
