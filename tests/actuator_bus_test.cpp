#include "../src/actuator_bus.h"
#include "test_stubs.h"
#include <cassert>
#include <iostream>

int main() {
    Parameters params = createTestParameters();

    // No driver: every command is accepted and nothing is sent
    ActuatorBus detached(params, nullptr);
    assert(!detached.isAttached());
    assert(detached.setAngle(3, 120) == ACTUATOR_OK);
    assert(detached.setAngle(16, 120) == ACTUATOR_CHANNEL_OUT_OF_RANGE);
    assert(detached.setAngle(-1, 120) == ACTUATOR_CHANNEL_OUT_OF_RANGE);

    // Driver that fails to come up is treated like no driver
    RecordingActuator broken;
    broken.init_result = false;
    ActuatorBus fallback(params, &broken);
    assert(!fallback.isAttached());
    assert(fallback.setAngle(0, 45) == ACTUATOR_OK);
    assert(broken.commandCount() == 0);

    // Attached bus forwards channel and angle, honoring the channel map
    RecordingActuator servos;
    params.channel_map[JOINT_LEG1_SHOULDER] = 15;
    params.channel_map[JOINT_LEG4_FOOT] = 0;
    ActuatorBus bus(params, &servos);
    assert(bus.isAttached());
    assert(bus.channelFor(JOINT_LEG1_SHOULDER) == 15);
    assert(bus.channelFor(JOINT_UNDESIGNATED) == -1);
    assert(bus.setJointAngle(JOINT_LEG1_SHOULDER, 70) == ACTUATOR_OK);
    assert(bus.setJointAngle(JOINT_LEG4_FOOT, 110) == ACTUATOR_OK);
    assert(servos.anglesFor(15).size() == 1 && servos.anglesFor(15)[0] == 70);
    assert(servos.anglesFor(0).size() == 1 && servos.anglesFor(0)[0] == 110);
    assert(bus.setAngle(20, 90) == ACTUATOR_CHANNEL_OUT_OF_RANGE);
    assert(servos.commandCount() == 2);

    // Transient errors are reported but the bus stays attached
    servos.fault_channel = 5;
    servos.fault_error = ACTUATOR_IO_ERROR;
    assert(bus.setAngle(5, 90) == ACTUATOR_IO_ERROR);
    assert(bus.isAttached());

    // A driver that disappears switches the bus to detached mode
    servos.fault_error = ACTUATOR_UNAVAILABLE;
    assert(bus.setAngle(5, 90) == ACTUATOR_UNAVAILABLE);
    assert(!bus.isAttached());
    size_t sent = servos.commandCount();
    assert(bus.setAngle(6, 90) == ACTUATOR_OK);
    assert(servos.commandCount() == sent);

    std::cout << "actuator_bus_test executed successfully" << std::endl;
    return 0;
}
