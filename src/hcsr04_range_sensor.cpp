#include "hcsr04_range_sensor.h"
#include <cerrno>
#include <cmath>
#include <cstring>
#include <fcntl.h>
#include <limits>
#include <thread>
#include <unistd.h>

namespace {
const double SPEED_OF_SOUND = 343.0; // m/s at 20 C

// Echo of a 4 m target takes ~23 ms; allow a little more
const std::chrono::microseconds ECHO_START_TIMEOUT(30000);
const std::chrono::microseconds ECHO_END_TIMEOUT(30000);

bool writeFile(const std::string &path, const std::string &value) {
    int fd = open(path.c_str(), O_WRONLY);
    if (fd < 0)
        return false;
    ssize_t written = write(fd, value.c_str(), value.size());
    close(fd);
    return written == static_cast<ssize_t>(value.size());
}
} // namespace

HcSr04RangeSensor::HcSr04RangeSensor(const Parameters::RangeConfig &config)
    : gpio_root_(config.sysfs_gpio_root),
      trigger_gpio_(config.sysfs_gpio_base + config.trigger_pin),
      echo_gpio_(config.sysfs_gpio_base + config.echo_pin),
      trigger_fd_(-1), echo_fd_(-1), trigger_exported_(false), echo_exported_(false) {}

HcSr04RangeSensor::~HcSr04RangeSensor() {
    releasePins();
}

std::string HcSr04RangeSensor::pinPath(int gpio, const char *attribute) const {
    return gpio_root_ + "/gpio" + std::to_string(gpio) + "/" + attribute;
}

void HcSr04RangeSensor::releasePins() {
    if (trigger_fd_ >= 0) {
        close(trigger_fd_);
        trigger_fd_ = -1;
    }
    if (echo_fd_ >= 0) {
        close(echo_fd_);
        echo_fd_ = -1;
    }
    if (trigger_exported_) {
        unexportPin(trigger_gpio_);
        trigger_exported_ = false;
    }
    if (echo_exported_) {
        unexportPin(echo_gpio_);
        echo_exported_ = false;
    }
}

bool HcSr04RangeSensor::exportPin(int pin, const char *direction) {
    if (access(pinPath(pin, "value").c_str(), F_OK) != 0 &&
        !writeFile(gpio_root_ + "/export", std::to_string(pin))) {
        return false;
    }

    // udev needs a moment to fix permissions on freshly exported pins
    for (int attempt = 0; attempt < 10; ++attempt) {
        if (writeFile(pinPath(pin, "direction"), direction))
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return false;
}

void HcSr04RangeSensor::unexportPin(int pin) {
    if (!writeFile(gpio_root_ + "/unexport", std::to_string(pin))) {
        spider_log::debug("HC-SR04", "Could not unexport GPIO " + std::to_string(pin));
    }
}

bool HcSr04RangeSensor::initialize() {
    trigger_exported_ = exportPin(trigger_gpio_, "out");
    echo_exported_ = trigger_exported_ && exportPin(echo_gpio_, "in");
    if (!trigger_exported_ || !echo_exported_) {
        spider_log::warning("HC-SR04", std::string("GPIO setup failed: ") + std::strerror(errno));
        releasePins();
        return false;
    }

    trigger_fd_ = open(pinPath(trigger_gpio_, "value").c_str(), O_WRONLY);
    echo_fd_ = open(pinPath(echo_gpio_, "value").c_str(), O_RDONLY);
    if (trigger_fd_ < 0 || echo_fd_ < 0) {
        spider_log::warning("HC-SR04", std::string("Cannot open GPIO value files: ") + std::strerror(errno));
        releasePins();
        return false;
    }

    if (pwrite(trigger_fd_, "0", 1, 0) != 1) {
        spider_log::warning("HC-SR04", std::string("Cannot drive trigger low: ") + std::strerror(errno));
        releasePins();
        return false;
    }
    return true;
}

double HcSr04RangeSensor::echoToMeters(double echo_seconds) {
    // Sound travels to the target and back
    return echo_seconds * SPEED_OF_SOUND / 2.0;
}

bool HcSr04RangeSensor::readEcho(int &level) {
    char value = '0';
    if (pread(echo_fd_, &value, 1, 0) != 1)
        return false;
    level = (value == '1') ? 1 : 0;
    return true;
}

bool HcSr04RangeSensor::waitForEcho(int level, std::chrono::steady_clock::time_point deadline, bool &io_error) {
    int current = -1;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!readEcho(current)) {
            io_error = true;
            return false;
        }
        if (current == level)
            return true;
    }
    return false;
}

bool HcSr04RangeSensor::readDistance(double &distance_m) {
    if (trigger_fd_ < 0 || echo_fd_ < 0)
        return false;

    if (pwrite(trigger_fd_, "1", 1, 0) != 1)
        return false;
    std::this_thread::sleep_for(std::chrono::microseconds(10));
    if (pwrite(trigger_fd_, "0", 1, 0) != 1)
        return false;

    bool io_error = false;
    std::chrono::steady_clock::time_point start_deadline = std::chrono::steady_clock::now() + ECHO_START_TIMEOUT;
    if (!waitForEcho(1, start_deadline, io_error)) {
        distance_m = std::numeric_limits<double>::quiet_NaN();
        return !io_error;
    }

    std::chrono::steady_clock::time_point echo_start = std::chrono::steady_clock::now();
    if (!waitForEcho(0, echo_start + ECHO_END_TIMEOUT, io_error)) {
        distance_m = std::numeric_limits<double>::quiet_NaN();
        return !io_error;
    }

    std::chrono::duration<double> echo = std::chrono::steady_clock::now() - echo_start;
    distance_m = echoToMeters(echo.count());
    return true;
}
