#include "winprob/cli/session.hpp"
#include "winprob/log.hpp"
#include <exception>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <sstream>

namespace winprob::cli {

Session::Session(int goal) : Session(goal, solver::Solver()) {}

Session::Session(int goal, solver::Solver solver)
    : goal_(goal), solver_(std::move(solver)) {}

void Session::reset() {
    score_ = Score{};
}

poly::Polynomial Session::apply(const std::string& line) {
    if (line == "w") {
        score_.win++;
    } else if (line == "l") {
        score_.lose++;
    } else {
        score_ = parse_score(line);
    }
    return solver_.solve(score_, goal_);
}

bool run_line(Session& session, const std::string& line, bool fraction, std::ostream& out) {
    try {
        const auto result = session.apply(line);
        const Score& score = session.score();
        if (fraction) {
            fmt::print(out, "[{:>2}-{:<2}] {}\n", score.win, score.lose, result);
        }
        fmt::print(out, "[{:>2}-{:<2}] {}\n", score.win, score.lose, result.to_display());
        return true;
    } catch (const InvalidInputError& e) {
        log::warn("{}", e.what());
        fmt::print(out, "Invalid input.\n");
    } catch (const OutOfRangeError& e) {
        log::warn("{}", e.what());
        fmt::print(out, "Invalid input.\n");
    } catch (const std::exception& e) {
        // e.g. std::bad_alloc for a goal too large to tabulate
        log::error("{}", e.what());
        fmt::print(out, "Error: {}\n", e.what());
    }
    return false;
}

Score parse_score(const std::string& line) {
    std::istringstream in(line);
    Score score;
    std::string trailing;
    if (!(in >> score.win >> score.lose) || (in >> trailing)) {
        throw InvalidInputError(fmt::format("Expected 'WIN LOSE', got '{}'", line));
    }
    return score;
}

} // namespace winprob::cli
