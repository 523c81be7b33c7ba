#include "../src/locomotion_system.h"
#include "test_stubs.h"
#include <algorithm>
#include <atomic>
#include <cassert>
#include <iostream>

int main() {
    Parameters params = createTestParameters();

    // Behaviors before initialize fail without touching anything
    {
        LocomotionSystem sys(params);
        assert(!sys.isSystemEnabled());
        assert(sys.walkForward() == BEHAVIOR_FAILED);
        assert(sys.getLastError() == LocomotionSystem::STATE_ERROR);
        assert(!sys.isBusy());
        assert(sys.getDistance() == 400.0);
    }

    // Invalid wiring is refused
    {
        Parameters bad = params;
        bad.channel_map[JOINT_LEG3_FOOT] = bad.channel_map[JOINT_LEG1_FOOT];
        LocomotionSystem sys(bad);
        RecordingStatusSink sink;
        assert(!sys.initialize(nullptr, nullptr, &sink));
        assert(sys.getLastError() == LocomotionSystem::PARAMETER_ERROR);
        assert(sink.modeHistory().empty());
    }

    // Fully detached controller runs every behavior
    {
        LocomotionSystem sys(params);
        RecordingStatusSink sink;
        assert(sys.initialize(nullptr, nullptr, &sink));
        assert(sys.isSystemEnabled());
        assert(sys.getLastError() == LocomotionSystem::NO_ERROR);
        assert(!sys.initialize(nullptr, nullptr, &sink));
        assert(sys.getLastError() == LocomotionSystem::STATE_ERROR);

        LocomotionSystem::Status status = sys.getStatus();
        assert(!status.busy);
        assert(!status.actuator_attached);
        assert(!status.sensor_attached);
        assert(status.distance_cm == 50.0);
        assert((status.joint_angles.array() == 90).all());
        assert(sink.modeHistory().back() == MODE_READY);

        sink.clear();
        assert(sys.walkForward(2) == BEHAVIOR_COMPLETED);
        assert(sys.turnLeft() == BEHAVIOR_COMPLETED);
        assert(sys.turnRight(1) == BEHAVIOR_COMPLETED);
        assert(sys.dance() == BEHAVIOR_COMPLETED);
        assert(sys.wave() == BEHAVIOR_COMPLETED);
        std::vector<RobotMode> modes = sink.modeHistory();
        assert(modes.size() == 10);
        assert(modes[0] == MODE_WALKING && modes[1] == MODE_READY);
        assert(modes[8] == MODE_WAVING && modes[9] == MODE_READY);

        assert(sys.executeText("turn_left 1") == BEHAVIOR_COMPLETED);
        assert(sys.executeText("please dance") == BEHAVIOR_COMPLETED);
        assert(sys.executeText("jump") == BEHAVIOR_INVALID);
        assert(sys.executeText("") == BEHAVIOR_INVALID);
        assert(sys.getJointStateTable().allAt(90));

        sys.reportMode(MODE_ANALYZING);
        assert(sink.modeHistory().back() == MODE_ANALYZING);

        sink.clear();
        sys.shutdown();
        assert(!sys.isSystemEnabled());
        assert(sink.modeHistory().size() == 1);
        assert(sink.modeHistory().back() == MODE_SHUTDOWN);
        sys.shutdown();
        assert(sink.modeHistory().size() == 1);
        assert(sys.dance() == BEHAVIOR_FAILED);
    }

    // Attached hardware: joints are homed to neutral and distances come from the sensor
    {
        RecordingActuator servos;
        ScriptedRangeSensor sensor;
        sensor.push(true, 0.42);
        RecordingStatusSink sink;

        LocomotionSystem sys(params);
        assert(sys.initialize(&servos, &sensor, &sink));
        assert(servos.commandCount() == static_cast<size_t>(TOTAL_JOINTS));
        for (int channel = 0; channel < TOTAL_JOINTS; ++channel)
            assert(servos.anglesFor(channel).size() == 1 && servos.anglesFor(channel)[0] == 90);

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (sink.distanceHistory().empty() && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        assert(nearlyEqual(sys.getDistance(), 42.0));

        LocomotionSystem::Status status = sys.getStatus();
        assert(status.actuator_attached && status.sensor_attached);

        assert(sys.executeText("walk_forward:1") == BEHAVIOR_COMPLETED);
        JointAngleMatrix angles = sys.getStatus().joint_angles;
        assert(angles(0, SEGMENT_SHOULDER) == 110);
        assert(angles(1, SEGMENT_SHOULDER) == 110);
        assert(angles.col(SEGMENT_FOOT).maxCoeff() == 90);
        sys.shutdown();
    }

    // Homing failure is recorded but the controller still comes up
    {
        RecordingActuator servos;
        servos.fault_channel = JOINT_LEG2_FOOT;
        servos.fault_error = ACTUATOR_CHANNEL_OUT_OF_RANGE;
        LocomotionSystem sys(params);
        assert(sys.initialize(&servos, nullptr, nullptr));
        assert(sys.getLastError() == LocomotionSystem::ACTUATOR_ERROR);
        assert(sys.isSystemEnabled());
        assert(!LocomotionSystem::getErrorMessage(sys.getLastError()).empty());
    }

    // Shutdown from one thread while others keep sending commands
    {
        LocomotionSystem sys(params);
        RecordingStatusSink sink;
        assert(sys.initialize(nullptr, nullptr, &sink));

        std::atomic<bool> stop_callers(false);
        std::vector<std::thread> callers;
        for (int i = 0; i < 3; ++i) {
            callers.emplace_back([&sys, &stop_callers]() {
                while (!stop_callers.load()) {
                    BehaviorResult result = sys.turnLeft(1);
                    assert(result != BEHAVIOR_INVALID);
                    (void)result;
                }
            });
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        std::thread closer([&sys]() { sys.shutdown(); });
        sys.shutdown();
        closer.join();
        stop_callers.store(true);
        for (std::thread &caller : callers)
            caller.join();

        assert(!sys.isSystemEnabled());
        assert(sys.dance() == BEHAVIOR_FAILED);
        assert(sys.getLastError() == LocomotionSystem::STATE_ERROR);
        std::vector<RobotMode> modes = sink.modeHistory();
        assert(std::count(modes.begin(), modes.end(), MODE_SHUTDOWN) == 1);
    }

    // A throwing sink at shutdown is logged, not propagated
    {
        LocomotionSystem sys(params);
        RecordingStatusSink sink;
        assert(sys.initialize(nullptr, nullptr, &sink));
        sink.throw_on_mode = MODE_SHUTDOWN;
        sys.shutdown();
        assert(!sys.isSystemEnabled());
    }

    std::cout << "locomotion_system_test executed successfully" << std::endl;
    return 0;
}
