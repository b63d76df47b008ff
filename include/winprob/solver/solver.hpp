#pragma once
#include "memo_table.hpp"
#include "../poly/polynomial.hpp"
#include <memory>
#include <optional>

namespace winprob::solver {

/**
 * Probability of reaching `goal` points first from a `win`-`lose` score,
 * each point won independently with probability p, as a cubic in (p - 1/2).
 *
 * Uses the one-step identity
 *
 *   f(w, l) = P * f(w + 1, l) + Q * f(w, l + 1)
 *
 * with f(goal, l) = 1 (checked first) and f(w, goal) = 0, evaluated in the
 * truncated polynomial algebra. States are filled bottom-up and cached in
 * the memo table, so a solve costs O(goal^2) polynomial operations.
 */
class Solver {
public:
    Solver();
    explicit Solver(std::shared_ptr<MemoTable> table);

    /**
     * Win probability polynomial for the given score.
     *
     * @throws OutOfRangeError if win or lose is negative or above goal
     */
    poly::Polynomial solve(int win, int lose, int goal);

    poly::Polynomial solve(const Score& score, int goal) { return solve(score.win, score.lose, goal); }

    const std::shared_ptr<MemoTable>& table() const { return table_; }

private:
    // Fills every state (w, l) with w >= win, l >= lose that is not cached yet
    poly::Polynomial fill(int win, int lose, int goal);

    std::shared_ptr<MemoTable> table_;
};

// Terminal value of a finished race, or nullopt if play continues
std::optional<poly::Polynomial> terminal_value(int win, int lose, int goal);

// Throws OutOfRangeError unless 0 <= win, lose <= goal
void check_score(int win, int lose, int goal);

} // namespace winprob::solver
