#pragma once
#include "../common.hpp"
#include <string>

namespace winprob::cli {

struct CliOptions {
    int goal = kDefaultGoal;  // Points needed to win the race
    bool fraction = false;    // Also print exact coefficients
    bool verbose = false;     // Debug logging on stderr
    bool help = false;
};

// Parses -n/-g/--goal N, --goal=N, --fraction, --verbose, -h/--help.
// Throws InvalidInputError on unknown flags or a bad goal.
CliOptions parse_options(int argc, const char* const* argv);

std::string usage(const std::string& program);

} // namespace winprob::cli
