#include "command_parser.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace {
const char *const VERB_NAMES[GAIT_VERB_COUNT] = {
    "walk_forward", "turn_left", "turn_right", "dance", "wave"};

std::string toLower(const std::string &text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

bool contains(const std::string &text, const char *word) {
    return text.find(word) != std::string::npos;
}

// First integer in the text, -1 when there is none or it is negative
int firstNumber(const std::string &text) {
    size_t start = text.find_first_of("0123456789");
    if (start == std::string::npos)
        return -1;
    if (start > 0 && text[start - 1] == '-')
        return -1;
    size_t end = text.find_first_not_of("0123456789", start);
    std::string digits = text.substr(start, end - start);
    if (digits.size() > 4)
        return -1;
    return std::stoi(digits);
}
} // namespace

const char *gaitVerbName(GaitVerb verb) {
    if (verb < 0 || verb >= GAIT_VERB_COUNT)
        return "unknown";
    return VERB_NAMES[verb];
}

GaitVerb parseGaitVerb(const std::string &verb) {
    std::string lowered = toLower(verb);
    for (int i = 0; i < GAIT_VERB_COUNT; ++i) {
        if (lowered == VERB_NAMES[i])
            return static_cast<GaitVerb>(i);
    }
    return GAIT_UNKNOWN;
}

GaitCommand parseGaitCommand(const std::string &text) {
    std::string normalized(text);
    std::replace(normalized.begin(), normalized.end(), ':', ' ');

    std::istringstream tokens(normalized);
    std::string verb_token;
    if (!(tokens >> verb_token))
        return GaitCommand();

    GaitVerb verb = parseGaitVerb(verb_token);
    if (verb == GAIT_UNKNOWN)
        return GaitCommand();

    std::string steps_token;
    if (!(tokens >> steps_token))
        return GaitCommand(verb);

    std::string extra;
    if (tokens >> extra)
        return GaitCommand();
    if (steps_token.size() > 4 ||
        !std::all_of(steps_token.begin(), steps_token.end(), [](unsigned char c) { return std::isdigit(c); }))
        return GaitCommand();

    return GaitCommand(verb, std::stoi(steps_token));
}

GaitCommand interpretFreeText(const std::string &text) {
    std::string lowered = toLower(text);
    GaitVerb verb = GAIT_UNKNOWN;

    if (contains(lowered, "forward") || contains(lowered, "walk") || contains(lowered, "move")) {
        verb = GAIT_WALK_FORWARD;
    } else if (contains(lowered, "left")) {
        verb = GAIT_TURN_LEFT;
    } else if (contains(lowered, "right")) {
        verb = GAIT_TURN_RIGHT;
    } else if (contains(lowered, "dance")) {
        verb = GAIT_DANCE;
    } else if (contains(lowered, "wave")) {
        verb = GAIT_WAVE;
    }

    if (verb == GAIT_UNKNOWN)
        return GaitCommand();
    return GaitCommand(verb, firstNumber(lowered));
}
