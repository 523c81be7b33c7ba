#ifndef COMMAND_PARSER_H
#define COMMAND_PARSER_H

#include <string>

//
// Verbs accepted by the gait engine.
//
enum GaitVerb {
    GAIT_WALK_FORWARD,
    GAIT_TURN_LEFT,
    GAIT_TURN_RIGHT,
    GAIT_DANCE,
    GAIT_WAVE,
    GAIT_VERB_COUNT,  //< Misc enum defining number of verbs
    GAIT_UNKNOWN = -1 //< Text did not name a behavior
};

/**
 * @brief A behavior request with an optional step count.
 */
struct GaitCommand {
    GaitVerb verb;
    int steps; //< -1 selects the behavior's default step count

    explicit GaitCommand(GaitVerb v = GAIT_UNKNOWN, int s = -1) : verb(v), steps(s) {}

    bool isValid() const { return verb != GAIT_UNKNOWN; }
    bool hasSteps() const { return steps >= 0; }
};

/** Canonical verb string, e.g. "turn_left". */
const char *gaitVerbName(GaitVerb verb);

/** Exact verb lookup ("walk_forward", "dance", ...), case-insensitive. */
GaitVerb parseGaitVerb(const std::string &verb);

/**
 * @brief Parse a structured command: a verb optionally followed by a step
 * count, separated by whitespace or ':' ("walk_forward 3", "turn_left:2").
 */
GaitCommand parseGaitCommand(const std::string &text);

/**
 * @brief Map free text (voice transcript or dashboard input) to a command.
 *
 * Keywords are checked in order: forward/walk/move, left, right, dance,
 * wave. The first integer found in the text becomes the step count.
 */
GaitCommand interpretFreeText(const std::string &text);

#endif // COMMAND_PARSER_H
