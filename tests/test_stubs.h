#ifndef TEST_STUBS_H
#define TEST_STUBS_H

#include "../include/robot_interfaces.h"
#include "../src/robot_model.h"
#include <chrono>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

// Actuator that remembers every command. Optionally slows down each write,
// fails a chosen channel with a chosen error, or throws like a broken driver.
struct RecordingActuator : IActuatorInterface {
    bool init_result = true;
    int fault_channel = -1;
    ActuatorError fault_error = ACTUATOR_IO_ERROR;
    int fault_count = -1; // -1 = fail every command on fault_channel
    int fault_angle = -1; // -1 = fail whatever angle is commanded
    int throw_channel = -1;
    std::chrono::microseconds write_delay{0};

    bool initialize() override { return init_result; }

    ActuatorError setChannelAngle(int channel, int angle) override {
        if (write_delay.count() > 0)
            std::this_thread::sleep_for(write_delay);

        std::lock_guard<std::mutex> lock(mutex);
        if (channel == throw_channel)
            throw std::runtime_error("servo driver exploded");
        if (channel == fault_channel && fault_count != 0 && (fault_angle < 0 || angle == fault_angle)) {
            if (fault_count > 0)
                fault_count--;
            return fault_error;
        }
        commands.push_back(std::make_pair(channel, angle));
        return ACTUATOR_OK;
    }

    bool isConnected() override { return true; }

    // Test helper methods
    size_t commandCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return commands.size();
    }

    std::vector<int> anglesFor(int channel) {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<int> angles;
        for (const std::pair<int, int> &command : commands) {
            if (command.first == channel)
                angles.push_back(command.second);
        }
        return angles;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex);
        commands.clear();
    }

    void clearFault() {
        std::lock_guard<std::mutex> lock(mutex);
        fault_channel = -1;
        throw_channel = -1;
    }

    std::mutex mutex;
    std::vector<std::pair<int, int>> commands; // (channel, angle)
};

// Range sensor returning a scripted sequence of readings, then the last one forever
struct ScriptedRangeSensor : IRangeSensorInterface {
    struct Reading {
        bool read_ok;
        double distance_m;
    };

    bool init_result = true;

    bool initialize() override { return init_result; }

    bool readDistance(double &distance_m) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (script.empty()) {
            distance_m = 1.0;
            return true;
        }
        Reading reading = script.front();
        if (script.size() > 1)
            script.pop_front();
        distance_m = reading.distance_m;
        return reading.read_ok;
    }

    // Test helper method
    void push(bool read_ok, double distance_m) {
        std::lock_guard<std::mutex> lock(mutex);
        script.push_back(Reading{read_ok, distance_m});
    }

    std::mutex mutex;
    std::deque<Reading> script;
};

// Sink that records every notification. Can be told to throw on one mode
// or on distance updates, like a display that went away.
struct RecordingStatusSink : IStatusSink {
    RobotMode throw_on_mode = MODE_COUNT; // MODE_COUNT = never throw
    bool throw_on_distance = false;

    void updateMode(RobotMode mode) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (mode == throw_on_mode)
            throw std::runtime_error("display disconnected");
        modes.push_back(mode);
    }

    void updateDistance(double distance_cm) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (throw_on_distance)
            throw std::runtime_error("display disconnected");
        distances.push_back(distance_cm);
    }

    std::vector<RobotMode> modeHistory() {
        std::lock_guard<std::mutex> lock(mutex);
        return modes;
    }

    std::vector<double> distanceHistory() {
        std::lock_guard<std::mutex> lock(mutex);
        return distances;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex);
        modes.clear();
        distances.clear();
    }

    std::mutex mutex;
    std::vector<RobotMode> modes;
    std::vector<double> distances;
};

// Alternative names for compatibility
typedef RecordingActuator MockActuator;
typedef ScriptedRangeSensor MockRangeSensor;
typedef RecordingStatusSink MockStatusSink;

inline Parameters createTestParameters() {
    Parameters params = createDefaultParameters();
    params.time_scale = 0.01;
    params.startup_servo_delay = 0.0;
    params.range.sample_interval = 0.01;
    params.range.error_backoff = 0.03;
    params.log_level = spider_log::LOG_WARNING;
    spider_log::setLevel(params.log_level);
    return params;
}

inline bool nearlyEqual(double a, double b, double tolerance = 1e-6) {
    return (a > b ? a - b : b - a) <= tolerance;
}

#endif // TEST_STUBS_H
