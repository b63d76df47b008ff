#include "winprob/solver/solver.hpp"
#include "winprob/log.hpp"
#include <fmt/format.h>
#include <vector>

namespace winprob::solver {

Solver::Solver() : table_(std::make_shared<HashMemoTable>()) {}

Solver::Solver(std::shared_ptr<MemoTable> table) : table_(std::move(table)) {
    if (!table_) {
        throw std::invalid_argument("Solver requires a memo table");
    }
}

void check_score(int win, int lose, int goal) {
    if (win < 0 || lose < 0) {
        throw OutOfRangeError(fmt::format("Score {}-{} is negative", win, lose));
    }
    if (win > goal || lose > goal) {
        throw OutOfRangeError(fmt::format("Score {}-{} is over goal {}", win, lose, goal));
    }
}

std::optional<poly::Polynomial> terminal_value(int win, int lose, int goal) {
    // Win takes precedence; both hold only for the degenerate goal == 0
    if (win == goal) {
        return poly::Polynomial::one();
    }
    if (lose == goal) {
        return poly::Polynomial::zero();
    }
    return std::nullopt;
}

poly::Polynomial Solver::solve(int win, int lose, int goal) {
    check_score(win, lose, goal);

    const ScoreKey key{win, lose, goal};
    if (auto cached = table_->find(key)) {
        return *cached;
    }

    // Finished races need no grid; still cached so every solved key is present
    if (auto terminal = terminal_value(win, lose, goal)) {
        table_->insert(key, *terminal);
        return *terminal;
    }
    return fill(win, lose, goal);
}

poly::Polynomial Solver::fill(int win, int lose, int goal) {
    const poly::Polynomial& p = poly::Polynomial::p();
    const poly::Polynomial& q = poly::Polynomial::q();

    // Sizes in size_t: goal - win + 1 overflows int when goal is INT_MAX
    const std::size_t rows = static_cast<std::size_t>(goal - win) + 1;
    const std::size_t cols = static_cast<std::size_t>(goal - lose) + 1;

    // values[i][j] holds state (win + i, lose + j). Decreasing i, then
    // decreasing j, visits (w + 1, l) and (w, l + 1) before (w, l).
    std::vector<std::vector<poly::Polynomial>> values(rows, std::vector<poly::Polynomial>(cols));
    std::size_t computed = 0;

    for (std::size_t i = rows; i-- > 0;) {
        for (std::size_t j = cols; j-- > 0;) {
            const ScoreKey key{win + static_cast<int>(i), lose + static_cast<int>(j), goal};

            if (auto terminal = terminal_value(key.win, key.lose, goal)) {
                values[i][j] = *terminal;
                continue;
            }
            if (auto cached = table_->find(key)) {
                values[i][j] = *cached;
                continue;
            }

            values[i][j] = p * values[i + 1][j] + q * values[i][j + 1];
            table_->insert(key, values[i][j]);
            ++computed;
        }
    }

    log::debug("goal {}: filled {} new states from {}-{}", goal, computed, win, lose);
    return values[0][0];
}

} // namespace winprob::solver
