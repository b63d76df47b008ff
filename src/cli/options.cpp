#include "winprob/cli/options.hpp"
#include <fmt/format.h>
#include <sstream>

namespace winprob::cli {

namespace {

int parse_goal(const std::string& text) {
    std::istringstream in(text);
    int goal = 0;
    char trailing = 0;
    if (!(in >> goal) || (in >> trailing)) {
        throw InvalidInputError(fmt::format("Goal must be an integer, got '{}'", text));
    }
    if (goal < 0) {
        throw InvalidInputError(fmt::format("Goal must not be negative, got {}", goal));
    }
    return goal;
}

} // namespace

CliOptions parse_options(int argc, const char* const* argv) {
    CliOptions options;

    for (int i = 1; i < argc; i++) {
        const std::string arg = argv[i];

        if (arg == "-n" || arg == "-g" || arg == "--goal") {
            if (i + 1 >= argc) {
                throw InvalidInputError(fmt::format("Option {} requires a value", arg));
            }
            options.goal = parse_goal(argv[++i]);
        } else if (arg.rfind("--goal=", 0) == 0) {
            options.goal = parse_goal(arg.substr(7));
        } else if (arg == "--fraction") {
            options.fraction = true;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else {
            throw InvalidInputError(fmt::format("Unknown option '{}'", arg));
        }
    }

    return options;
}

std::string usage(const std::string& program) {
    return fmt::format(
        "usage: {} [-n|-g|--goal N] [--fraction] [--verbose] [-h|--help]\n"
        "\n"
        "Calculate the probability of winning a race to N points.\n"
        "Enter \"WIN LOSE\" to set the score, or w / l to add a point.\n"
        "\n"
        "  -n, -g, --goal N  points needed to win (default {})\n"
        "  --fraction        also print exact coefficients\n"
        "  --verbose         debug logging on stderr\n",
        program, kDefaultGoal);
}

} // namespace winprob::cli
