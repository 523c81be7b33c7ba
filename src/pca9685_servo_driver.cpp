#include "pca9685_servo_driver.h"
#include "math_utils.h"
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstring>
#include <fcntl.h>
#include <linux/i2c-dev.h>
#include <sstream>
#include <sys/ioctl.h>
#include <thread>
#include <unistd.h>

namespace {
// PCA9685 registers
const uint8_t MODE1 = 0x00;
const uint8_t MODE2 = 0x01;
const uint8_t PRESCALE = 0xFE;
const uint8_t LED0_ON_L = 0x06;

// MODE1 bits
const uint8_t MODE1_RESTART = 0x80;
const uint8_t MODE1_AUTO_INCREMENT = 0x20;
const uint8_t MODE1_SLEEP = 0x10;
// MODE2 bits
const uint8_t MODE2_OUTDRV = 0x04;

const double OSCILLATOR_HZ = 25000000.0;
const double PWM_RESOLUTION = 4096.0;
} // namespace

Pca9685ServoDriver::Pca9685ServoDriver(const Parameters::ServoDriverConfig &config)
    : config_(config), device_path_("/dev/i2c-" + std::to_string(config.i2c_bus)), fd_(-1) {}

Pca9685ServoDriver::~Pca9685ServoDriver() {
    if (fd_ >= 0)
        close(fd_);
}

bool Pca9685ServoDriver::writeRegister(uint8_t reg, uint8_t value) {
    uint8_t buffer[2] = {reg, value};
    return write(fd_, buffer, sizeof(buffer)) == static_cast<ssize_t>(sizeof(buffer));
}

bool Pca9685ServoDriver::readRegister(uint8_t reg, uint8_t &value) {
    if (write(fd_, &reg, 1) != 1)
        return false;
    return read(fd_, &value, 1) == 1;
}

bool Pca9685ServoDriver::initialize() {
    std::lock_guard<std::mutex> lock(bus_mutex_);

    fd_ = open(device_path_.c_str(), O_RDWR);
    if (fd_ < 0) {
        spider_log::warning("PCA9685", "Cannot open " + device_path_ + ": " + std::strerror(errno));
        return false;
    }

    if (ioctl(fd_, I2C_SLAVE, config_.address) < 0) {
        spider_log::warning("PCA9685", std::string("Cannot select device: ") + std::strerror(errno));
        close(fd_);
        fd_ = -1;
        return false;
    }

    uint8_t old_mode = 0;
    if (!writeRegister(MODE2, MODE2_OUTDRV) || !readRegister(MODE1, old_mode)) {
        std::ostringstream msg;
        msg << "PCA9685 not responding at 0x" << std::hex << static_cast<int>(config_.address);
        spider_log::warning("PCA9685", msg.str());
        close(fd_);
        fd_ = -1;
        return false;
    }

    // Prescale can only be written while the oscillator sleeps
    int prescale = math_utils::roundToInt(OSCILLATOR_HZ / (PWM_RESOLUTION * config_.frequency)) - 1;
    prescale = math_utils::clamped(prescale, 3, 255);
    uint8_t awake = static_cast<uint8_t>(old_mode & ~(MODE1_SLEEP | MODE1_RESTART));
    bool ok = writeRegister(MODE1, awake | MODE1_SLEEP) &&
              writeRegister(PRESCALE, static_cast<uint8_t>(prescale)) &&
              writeRegister(MODE1, awake);
    if (ok) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        ok = writeRegister(MODE1, awake | MODE1_RESTART | MODE1_AUTO_INCREMENT);
    }

    if (!ok) {
        spider_log::warning("PCA9685", "Failed to configure PWM frequency");
        close(fd_);
        fd_ = -1;
        return false;
    }

    std::ostringstream msg;
    msg << "PCA9685 on " << device_path_ << " at " << config_.frequency << " Hz (prescale " << prescale << ")";
    spider_log::info("PCA9685", msg.str());
    return true;
}

double Pca9685ServoDriver::pulseWidthForAngle(int angle) const {
    int clamped = math_utils::clampServoAngle(angle);
    double span = config_.max_pulse_us - config_.min_pulse_us;
    return config_.min_pulse_us + span * clamped / static_cast<double>(SERVO_ANGLE_MAX);
}

uint16_t Pca9685ServoDriver::ticksForAngle(int angle) const {
    double period_us = 1000000.0 / config_.frequency;
    int ticks = math_utils::roundToInt(pulseWidthForAngle(angle) / period_us * PWM_RESOLUTION);
    return static_cast<uint16_t>(math_utils::clamped(ticks, 0, 4095));
}

ActuatorError Pca9685ServoDriver::setChannelAngle(int channel, int angle) {
    if (channel < 0 || channel >= NUM_ACTUATOR_CHANNELS)
        return ACTUATOR_CHANNEL_OUT_OF_RANGE;

    uint16_t off = ticksForAngle(angle);
    uint8_t buffer[5] = {
        static_cast<uint8_t>(LED0_ON_L + 4 * channel),
        0x00, 0x00, // ON at tick 0
        static_cast<uint8_t>(off & 0xFF),
        static_cast<uint8_t>((off >> 8) & 0x0F)};

    std::lock_guard<std::mutex> lock(bus_mutex_);
    if (fd_ < 0)
        return ACTUATOR_UNAVAILABLE;

    if (write(fd_, buffer, sizeof(buffer)) != static_cast<ssize_t>(sizeof(buffer))) {
        if (errno == ENODEV || errno == EBADF)
            return ACTUATOR_UNAVAILABLE;
        return ACTUATOR_IO_ERROR;
    }
    return ACTUATOR_OK;
}

bool Pca9685ServoDriver::isConnected() {
    std::lock_guard<std::mutex> lock(bus_mutex_);
    uint8_t mode = 0;
    return fd_ >= 0 && readRegister(MODE1, mode);
}
