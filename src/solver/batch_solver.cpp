#include "winprob/solver/batch_solver.hpp"
#include "winprob/log.hpp"
#include <algorithm>
#include <future>
#include <thread>

namespace winprob::solver {

BatchSolver::BatchSolver(std::shared_ptr<ConcurrentMemoTable> table, int num_threads)
    : table_(std::move(table)), num_threads_(num_threads) {

    if (!table_) {
        throw std::invalid_argument("BatchSolver requires a memo table");
    }
    if (num_threads_ <= 0) {
        num_threads_ = static_cast<int>(std::thread::hardware_concurrency());
        if (num_threads_ <= 0) {
            num_threads_ = 4;  // Fallback
        }
    }
}

std::vector<poly::Polynomial> BatchSolver::solve_batch(const std::vector<Score>& scores, int goal) {
    // Reject bad input before any worker starts
    for (const auto& score : scores) {
        check_score(score.win, score.lose, goal);
    }

    std::vector<poly::Polynomial> results(scores.size());
    const int workers = std::min<int>(num_threads_, static_cast<int>(scores.size()));

    log::debug("solving {} scores for goal {} on {} workers", scores.size(), goal, workers);

    // Worker t takes scores t, t + workers, t + 2 * workers, ...
    std::vector<std::future<void>> futures;
    for (int t = 0; t < workers; t++) {
        futures.push_back(std::async(std::launch::async, [this, t, workers, goal, &scores, &results]() {
            Solver solver(table_);
            for (std::size_t i = t; i < scores.size(); i += workers) {
                results[i] = solver.solve(scores[i], goal);
            }
        }));
    }

    // get() rethrows the first worker failure after all workers are joined
    for (auto& future : futures) {
        future.wait();
    }
    for (auto& future : futures) {
        future.get();
    }

    return results;
}

} // namespace winprob::solver
