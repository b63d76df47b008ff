#pragma once
#include "../common.hpp"
#include "../poly/polynomial.hpp"
#include "../solver/solver.hpp"
#include <ostream>
#include <string>

namespace winprob::cli {

// Score entered so far in the interactive shell, and the solver behind it
class Session {
public:
    explicit Session(int goal);
    Session(int goal, solver::Solver solver);

    /**
     * Apply one input line and return the updated win probability.
     *
     * "w" and "l" add a point; "WIN LOSE" replaces the score. The score
     * keeps its new value even when solving it fails.
     *
     * @throws InvalidInputError for an unparseable line
     * @throws OutOfRangeError if the score lies outside [0, goal]
     */
    poly::Polynomial apply(const std::string& line);

    void reset();

    const Score& score() const { return score_; }
    int goal() const { return goal_; }

private:
    int goal_;
    Score score_;
    solver::Solver solver_;
};

/**
 * Handle one shell line: print "[WW-LL] result" (exact form first when
 * `fraction` is set) or "Invalid input." for a bad line or score. Any other
 * failure prints "Error: ..." and leaves the session usable.
 *
 * @return false if the line produced no result
 */
bool run_line(Session& session, const std::string& line, bool fraction, std::ostream& out);

// Parses "WIN LOSE" (exactly two integers)
Score parse_score(const std::string& line);

} // namespace winprob::cli
