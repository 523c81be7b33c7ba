#include "../src/command_parser.h"
#include <cassert>
#include <iostream>
#include <string>

int main() {
    assert(parseGaitVerb("walk_forward") == GAIT_WALK_FORWARD);
    assert(parseGaitVerb("TURN_LEFT") == GAIT_TURN_LEFT);
    assert(parseGaitVerb("turn_right") == GAIT_TURN_RIGHT);
    assert(parseGaitVerb("dance") == GAIT_DANCE);
    assert(parseGaitVerb("wave") == GAIT_WAVE);
    assert(parseGaitVerb("fly") == GAIT_UNKNOWN);
    assert(std::string(gaitVerbName(GAIT_TURN_RIGHT)) == "turn_right");

    GaitCommand cmd = parseGaitCommand("walk_forward");
    assert(cmd.isValid() && cmd.verb == GAIT_WALK_FORWARD && !cmd.hasSteps());

    cmd = parseGaitCommand("walk_forward 6");
    assert(cmd.verb == GAIT_WALK_FORWARD && cmd.steps == 6);

    cmd = parseGaitCommand("turn_left:3");
    assert(cmd.verb == GAIT_TURN_LEFT && cmd.steps == 3);

    cmd = parseGaitCommand("  dance  ");
    assert(cmd.verb == GAIT_DANCE);

    // Malformed structured commands are not guessed at
    assert(!parseGaitCommand("").isValid());
    assert(!parseGaitCommand("walk_forward -2").isValid());
    assert(!parseGaitCommand("walk_forward two").isValid());
    assert(!parseGaitCommand("walk_forward 2 3").isValid());
    assert(!parseGaitCommand("jump 2").isValid());

    // Free text uses keyword priority forward/walk/move, left, right, dance, wave
    cmd = interpretFreeText("hey spider, walk forward 3 steps");
    assert(cmd.verb == GAIT_WALK_FORWARD && cmd.steps == 3);
    cmd = interpretFreeText("Move left");
    assert(cmd.verb == GAIT_WALK_FORWARD && !cmd.hasSteps());
    cmd = interpretFreeText("turn LEFT please");
    assert(cmd.verb == GAIT_TURN_LEFT);
    cmd = interpretFreeText("turn right 1");
    assert(cmd.verb == GAIT_TURN_RIGHT && cmd.steps == 1);
    cmd = interpretFreeText("let's dance and wave");
    assert(cmd.verb == GAIT_DANCE);
    cmd = interpretFreeText("wave hello");
    assert(cmd.verb == GAIT_WAVE);
    assert(!interpretFreeText("take a photo").isValid());

    // A negative count is not a step count
    cmd = interpretFreeText("walk -3");
    assert(cmd.verb == GAIT_WALK_FORWARD && !cmd.hasSteps());
    cmd = interpretFreeText("turn left -2 times");
    assert(cmd.verb == GAIT_TURN_LEFT && !cmd.hasSteps());
    cmd = interpretFreeText("walk 5-3");
    assert(cmd.verb == GAIT_WALK_FORWARD && cmd.steps == 5);

    std::cout << "command_parser_test executed successfully" << std::endl;
    return 0;
}
