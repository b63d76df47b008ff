#include "winprob/cli/options.hpp"
#include "winprob/cli/session.hpp"
#include "winprob/log.hpp"
#include <fmt/core.h>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    using namespace winprob;

    cli::CliOptions options;
    try {
        options = cli::parse_options(argc, argv);
    } catch (const InvalidInputError& e) {
        log::error("{}", e.what());
        fmt::print(stderr, "{}", cli::usage(argv[0]));
        return 2;
    }

    if (options.help) {
        fmt::print("{}", cli::usage(argv[0]));
        return 0;
    }
    if (options.verbose) {
        log::set_level(log::Level::Debug);
    }

    log::debug("goal {}, fraction output {}", options.goal, options.fraction);

    cli::Session session(options.goal);
    std::string line;
    while (true) {
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }

        cli::run_line(session, line, options.fraction, std::cout);
        std::cout.flush();
    }

    return 0;
}
