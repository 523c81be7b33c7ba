#include "console_status_sink.h"
#include <iomanip>
#include <sstream>

ConsoleStatusSink::ConsoleStatusSink()
    : last_mode_(MODE_IDLE), last_distance_(0.0) {}

void ConsoleStatusSink::updateMode(RobotMode mode) {
    last_mode_.store(mode);
    spider_log::info("Status", std::string("Mode: ") + modeToString(mode));
}

void ConsoleStatusSink::updateDistance(double distance_cm) {
    last_distance_.store(distance_cm);
    std::ostringstream msg;
    msg << "Distance: " << std::fixed << std::setprecision(1) << distance_cm << " cm";
    spider_log::debug("Status", msg.str());
}
