#include "../src/range_monitor.h"
#include "test_stubs.h"
#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <thread>

static std::vector<double> waitForSamples(RecordingStatusSink &sink, size_t count) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    std::vector<double> samples = sink.distanceHistory();
    while (samples.size() < count && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        samples = sink.distanceHistory();
    }
    return samples;
}

int main() {
    Parameters params = createTestParameters();

    // Conversion to centimeters with the out-of-range sentinel
    {
        ScriptedRangeSensor sensor;
        RangeMonitor monitor(params, &sensor, nullptr);
        bool in_range = false;
        assert(nearlyEqual(monitor.toCentimeters(0.42, in_range), 42.0) && in_range);
        assert(nearlyEqual(monitor.toCentimeters(3.99, in_range), 399.0) && in_range);
        assert(monitor.toCentimeters(4.0, in_range) == 400.0 && !in_range);
        assert(monitor.toCentimeters(12.0, in_range) == 400.0 && !in_range);
        assert(monitor.toCentimeters(0.0, in_range) == 400.0 && !in_range);
        assert(monitor.toCentimeters(-1.0, in_range) == 400.0 && !in_range);
        assert(monitor.toCentimeters(std::numeric_limits<double>::quiet_NaN(), in_range) == 400.0);
        assert(!in_range);
        assert(monitor.toCentimeters(std::numeric_limits<double>::infinity(), in_range) == 400.0);
    }

    // Invalid reading then 42 cm publishes 400 then 42
    {
        ScriptedRangeSensor sensor;
        sensor.push(true, std::numeric_limits<double>::quiet_NaN());
        sensor.push(true, 0.42);
        RecordingStatusSink sink;
        RangeMonitor monitor(params, &sensor, &sink);
        assert(monitor.isAttached());

        assert(monitor.sampleOnce() == SAMPLE_OUT_OF_RANGE);
        assert(monitor.getDistance() == 400.0);
        assert(monitor.sampleOnce() == SAMPLE_VALID);
        assert(nearlyEqual(monitor.getDistance(), 42.0));

        std::vector<double> samples = sink.distanceHistory();
        assert(samples.size() == 2);
        assert(samples[0] == 400.0);
        assert(nearlyEqual(samples[1], 42.0));
        assert(monitor.getSampleCount() == 2);
    }

    // A failed read publishes the fallback and the loop keeps going
    {
        ScriptedRangeSensor sensor;
        sensor.push(false, 0.0);
        sensor.push(true, 1.5);
        RecordingStatusSink sink;
        RangeMonitor monitor(params, &sensor, &sink);

        assert(monitor.start());
        assert(!monitor.start());
        assert(monitor.isRunning());
        std::vector<double> samples = waitForSamples(sink, 3);
        monitor.stop();
        assert(!monitor.isRunning());

        assert(samples.size() >= 3);
        assert(samples[0] == 400.0);
        assert(nearlyEqual(samples[1], 150.0));
        assert(nearlyEqual(samples[2], 150.0));

        // Nothing is published after stop() returns
        size_t published = sink.distanceHistory().size();
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        assert(sink.distanceHistory().size() == published);
    }

    // No sensor, or one that fails to initialize, publishes the placeholder
    {
        RecordingStatusSink sink;
        RangeMonitor monitor(params, nullptr, &sink);
        assert(!monitor.isAttached());
        assert(monitor.getDistance() == 50.0);
        assert(monitor.sampleOnce() == SAMPLE_DETACHED);
        assert(sink.distanceHistory().back() == 50.0);

        ScriptedRangeSensor broken;
        broken.init_result = false;
        RangeMonitor fallback(params, &broken, nullptr);
        assert(!fallback.isAttached());
        assert(fallback.sampleOnce() == SAMPLE_DETACHED);
        assert(fallback.getDistance() == 50.0);
    }

    // A sink that throws does not stop the sampling loop
    {
        ScriptedRangeSensor sensor;
        sensor.push(true, 0.42);
        RecordingStatusSink sink;
        sink.throw_on_distance = true;
        RangeMonitor monitor(params, &sensor, &sink);

        assert(monitor.sampleOnce() == SAMPLE_VALID);
        assert(nearlyEqual(monitor.getDistance(), 42.0));

        assert(monitor.start());
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (monitor.getSampleCount() < 5 && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        assert(monitor.getSampleCount() >= 5);
        assert(monitor.isRunning());
        monitor.stop();
    }

    // Destructor stops a running loop
    {
        ScriptedRangeSensor sensor;
        RecordingStatusSink sink;
        {
            RangeMonitor monitor(params, &sensor, &sink);
            assert(monitor.start());
            waitForSamples(sink, 1);
        }
        size_t published = sink.distanceHistory().size();
        assert(published >= 1);
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        assert(sink.distanceHistory().size() == published);
    }

    std::cout << "range_monitor_test executed successfully" << std::endl;
    return 0;
}
