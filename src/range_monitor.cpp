#include "range_monitor.h"
#include "math_utils.h"
#include <chrono>
#include <cmath>
#include <exception>
#include <sstream>

RangeMonitor::RangeMonitor(const Parameters &params, IRangeSensorInterface *sensor, IStatusSink *sink)
    : config_(params.range), sensor_(sensor), sink_(sink), distance_cm_(params.range.max_range_cm),
      sample_count_(0), running_(false), stop_requested_(false) {
    if (!sensor_) {
        spider_log::info("RangeMonitor", "No distance sensor present, publishing placeholder readings");
    } else if (!sensor_->initialize()) {
        spider_log::warning("RangeMonitor", "Distance sensor initialization failed, publishing placeholder readings");
        sensor_ = nullptr;
    } else {
        spider_log::info("RangeMonitor", "Distance sensor initialized");
    }

    if (!sensor_)
        distance_cm_.store(config_.placeholder_cm);
}

RangeMonitor::~RangeMonitor() {
    stop();
}

bool RangeMonitor::start() {
    if (thread_.joinable())
        return false;

    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stop_requested_ = false;
    }
    running_.store(true);
    thread_ = std::thread(&RangeMonitor::run, this);
    return true;
}

void RangeMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stop_requested_ = true;
    }
    wake_.notify_all();

    if (thread_.joinable())
        thread_.join();
    running_.store(false);
}

double RangeMonitor::toCentimeters(double distance_m, bool &in_range) const {
    double distance_cm = math_utils::metersToCentimeters(distance_m);
    // Zero is what the sensor reports on an echo timeout
    in_range = std::isfinite(distance_cm) && distance_cm > 0.0 && distance_cm < config_.max_range_cm;
    return in_range ? distance_cm : config_.max_range_cm;
}

void RangeMonitor::publish(double distance_cm) {
    distance_cm_.store(distance_cm);
    sample_count_++;
    if (!sink_)
        return;
    try {
        sink_->updateDistance(distance_cm);
    } catch (const std::exception &e) {
        spider_log::error("RangeMonitor", std::string("Status sink rejected distance: ") + e.what());
    }
}

SampleOutcome RangeMonitor::sampleOnce() {
    if (!sensor_) {
        publish(config_.placeholder_cm);
        return SAMPLE_DETACHED;
    }

    double distance_m = 0.0;
    bool read_ok = false;
    try {
        read_ok = sensor_->readDistance(distance_m);
    } catch (const std::exception &e) {
        spider_log::error("RangeMonitor", std::string("Distance sensor threw: ") + e.what());
    }

    if (!read_ok) {
        spider_log::warning("RangeMonitor", "Distance reading failed, backing off");
        publish(config_.max_range_cm);
        return SAMPLE_READ_FAILED;
    }

    bool in_range = false;
    double distance_cm = toCentimeters(distance_m, in_range);
    publish(distance_cm);
    return in_range ? SAMPLE_VALID : SAMPLE_OUT_OF_RANGE;
}

bool RangeMonitor::waitFor(double seconds) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wake_.wait_for(lock, std::chrono::duration<double>(seconds), [this]() { return stop_requested_; });
    return !stop_requested_;
}

void RangeMonitor::run() {
    spider_log::debug("RangeMonitor", "Sampling loop started");
    for (;;) {
        SampleOutcome outcome = sampleOnce();
        double interval = (outcome == SAMPLE_READ_FAILED) ? config_.error_backoff : config_.sample_interval;
        if (!waitFor(interval))
            break;
    }
    spider_log::debug("RangeMonitor", "Sampling loop stopped");
}
