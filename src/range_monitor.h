#ifndef RANGE_MONITOR_H
#define RANGE_MONITOR_H

#include "../include/robot_interfaces.h"
#include "robot_model.h"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

//
// Result of one sampling cycle.
//
enum SampleOutcome {
    SAMPLE_VALID,        //< In-range reading published
    SAMPLE_OUT_OF_RANGE, //< No echo, invalid or too far: sentinel published
    SAMPLE_READ_FAILED,  //< Sensor read failed: fallback published, loop backs off
    SAMPLE_DETACHED      //< No sensor: placeholder published
};

/**
 * @brief Independent distance sampling loop.
 *
 * Runs on its own thread, unaffected by gait execution. Each cycle reads the
 * sensor, converts meters to centimeters, substitutes the max range sentinel
 * for anything that is not a valid in-range reading, publishes the result and
 * notifies the status sink. A failed read never stops the loop; it publishes
 * the sentinel and waits the longer backoff interval instead.
 *
 * Without a sensor (or when its initialization fails) the loop keeps the same
 * cadence and publishes a constant placeholder distance.
 */
class RangeMonitor {
  public:
    /**
     * @param params Sampling intervals and range limits
     * @param sensor Distance sensor, may be null (not owned)
     * @param sink Distance notifications, may be null (not owned)
     */
    RangeMonitor(const Parameters &params, IRangeSensorInterface *sensor, IStatusSink *sink);

    /** Stops the sampling thread. */
    ~RangeMonitor();

    /** Start the sampling thread. Returns false if it is already running. */
    bool start();

    /** Stop and join the sampling thread. Safe to call repeatedly. */
    void stop();

    bool isRunning() const { return running_.load(); }
    bool isAttached() const { return sensor_ != nullptr; }

    /**
     * @brief Run one sampling cycle without waiting afterwards.
     * @return What was published
     */
    SampleOutcome sampleOnce();

    /** Most recently published distance in centimeters. */
    double getDistance() const { return distance_cm_.load(); }

    /** Number of cycles completed. */
    unsigned long getSampleCount() const { return sample_count_.load(); }

    /**
     * @brief Convert a raw reading to centimeters.
     * @param distance_m Sensor reading in meters
     * @param in_range Set to false when the sentinel was substituted
     */
    double toCentimeters(double distance_m, bool &in_range) const;

  private:
    void run();
    void publish(double distance_cm);
    // Sleep unless stop() is called first; returns false when stopping
    bool waitFor(double seconds);

    Parameters::RangeConfig config_;
    IRangeSensorInterface *sensor_;
    IStatusSink *sink_;

    std::atomic<double> distance_cm_;
    std::atomic<unsigned long> sample_count_;
    std::atomic<bool> running_;

    std::thread thread_;
    std::mutex wait_mutex_;
    std::condition_variable wake_;
    bool stop_requested_;
};

#endif // RANGE_MONITOR_H
