#pragma once
#include "../common.hpp"
#include "memo_table.hpp"
#include "solver.hpp"
#include <memory>
#include <vector>

namespace winprob::solver {

/**
 * Parallel evaluation of many scores for one race length.
 *
 * Workers run their own Solver over one shared memo table, so sub-problems
 * computed by one worker are reused by the others.
 */
class BatchSolver {
public:
    /**
     * @param table Memo table shared by all workers
     * @param num_threads Number of workers; <= 0 uses the hardware concurrency
     */
    explicit BatchSolver(std::shared_ptr<ConcurrentMemoTable> table, int num_threads = 4);

    /**
     * Solve every score against `goal`.
     *
     * @return One polynomial per input score, in input order
     * @throws OutOfRangeError if any score lies outside [0, goal]
     */
    std::vector<poly::Polynomial> solve_batch(const std::vector<Score>& scores, int goal);

    int num_threads() const { return num_threads_; }

    const std::shared_ptr<ConcurrentMemoTable>& table() const { return table_; }

private:
    std::shared_ptr<ConcurrentMemoTable> table_;
    int num_threads_;
};

} // namespace winprob::solver
