/**
 * @file spider_console.cpp
 * @brief Line oriented command console for the quadruped
 *
 * Reads one command per line from stdin ("walk_forward 3", "turn left",
 * "dance", "status", "quit") and runs it on the PCA9685 servo board and the
 * HC-SR04 sensor. Missing hardware falls back to detached mode.
 */

#include "SpiderMotion.h"
#include "hcsr04_range_sensor.h"
#include "pca9685_servo_driver.h"
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <getopt.h>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

static std::atomic<bool> g_shutdown{false};

void signal_handler(int sig) {
    (void)sig;
    g_shutdown.store(true);
}

static void print_usage(const char *prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  --i2c-bus N         I2C bus of the PCA9685 (default: 1)\n"
              << "  --detached          Do not touch servo or sensor hardware\n"
              << "  --time-scale X      Multiply every gait delay by X (default: 1.0)\n"
              << "  --log-level LEVEL   DEBUG, INFO, WARN, ERROR or NONE (default: INFO)\n"
              << "  --help              Show this help\n";
}

static bool parse_log_level(const std::string &name, spider_log::LogLevel &level) {
    if (name == "DEBUG")
        level = spider_log::LOG_DEBUG;
    else if (name == "INFO")
        level = spider_log::LOG_INFO;
    else if (name == "WARN")
        level = spider_log::LOG_WARNING;
    else if (name == "ERROR")
        level = spider_log::LOG_ERROR;
    else if (name == "NONE")
        level = spider_log::LOG_NONE;
    else
        return false;
    return true;
}

static void print_status(const LocomotionSystem &spider) {
    LocomotionSystem::Status status = spider.getStatus();
    std::cout << std::fixed << std::setprecision(1)
              << "busy=" << (status.busy ? "yes" : "no")
              << " distance=" << status.distance_cm << "cm"
              << " servos=" << (status.actuator_attached ? "attached" : "detached")
              << " sensor=" << (status.sensor_attached ? "attached" : "detached") << "\n";
    for (int joint = 0; joint < JOINT_COUNT; ++joint) {
        JointDesignation designation = static_cast<JointDesignation>(joint);
        std::cout << "  " << std::left << std::setw(14) << jointName(designation) << std::right
                  << status.joint_angles(legNumberOf(designation) - 1, segmentOf(designation)) << "\n";
    }
}

int main(int argc, char **argv) {
    Parameters params = createDefaultParameters();
    bool detached = false;

    static struct option long_options[] = {
        {"i2c-bus", required_argument, 0, 'b'},
        {"detached", no_argument, 0, 'd'},
        {"time-scale", required_argument, 0, 't'},
        {"log-level", required_argument, 0, 'l'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}};

    int opt;
    while ((opt = getopt_long(argc, argv, "b:dt:l:h", long_options, nullptr)) != -1) {
        switch (opt) {
        case 'b':
            params.servo_driver.i2c_bus = std::atoi(optarg);
            break;
        case 'd':
            detached = true;
            break;
        case 't':
            params.time_scale = std::atof(optarg);
            break;
        case 'l':
            if (!parse_log_level(optarg, params.log_level)) {
                print_usage(argv[0]);
                return 1;
            }
            break;
        case 'h':
            print_usage(argv[0]);
            return 0;
        default:
            print_usage(argv[0]);
            return 1;
        }
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::unique_ptr<Pca9685ServoDriver> servos;
    std::unique_ptr<HcSr04RangeSensor> sensor;
    if (!detached) {
        servos.reset(new Pca9685ServoDriver(params.servo_driver));
        sensor.reset(new HcSr04RangeSensor(params.range));
    }

    ConsoleStatusSink sink;
    LocomotionSystem spider(params);
    if (!spider.initialize(servos.get(), sensor.get(), &sink)) {
        std::cerr << "Initialization failed: " << LocomotionSystem::getErrorMessage(spider.getLastError()) << std::endl;
        return 1;
    }

    std::cout << "Commands: walk_forward [N], turn_left [N], turn_right [N], dance, wave, status, quit" << std::endl;

    std::string line;
    while (!g_shutdown.load() && std::getline(std::cin, line)) {
        if (line.empty())
            continue;
        if (line == "quit" || line == "exit")
            break;
        if (line == "status") {
            print_status(spider);
            continue;
        }

        BehaviorResult result = spider.executeText(line);
        std::cout << line << ": " << behaviorResultToString(result) << std::endl;
    }

    spider.shutdown();
    return 0;
}
