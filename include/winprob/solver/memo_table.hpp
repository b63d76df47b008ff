#pragma once
#include "../common.hpp"
#include "../poly/polynomial.hpp"
#include <cstddef>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace winprob::solver {

// Cache from (win, lose, goal) to its win-probability polynomial.
// Entries are never evicted; the first value stored for a key is kept.
class MemoTable {
public:
    virtual ~MemoTable() = default;

    virtual std::optional<poly::Polynomial> find(const ScoreKey& key) const = 0;
    virtual void insert(const ScoreKey& key, const poly::Polynomial& value) = 0;
    virtual std::size_t size() const = 0;
};

// Unsynchronized table for a single solver thread
class HashMemoTable : public MemoTable {
public:
    std::optional<poly::Polynomial> find(const ScoreKey& key) const override;
    void insert(const ScoreKey& key, const poly::Polynomial& value) override;
    std::size_t size() const override { return entries_.size(); }

private:
    std::unordered_map<ScoreKey, poly::Polynomial, ScoreKeyHash> entries_;
};

// Mutex-guarded table shared by concurrent solvers
class ConcurrentMemoTable : public MemoTable {
public:
    std::optional<poly::Polynomial> find(const ScoreKey& key) const override;
    void insert(const ScoreKey& key, const poly::Polynomial& value) override;
    std::size_t size() const override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<ScoreKey, poly::Polynomial, ScoreKeyHash> entries_;
};

} // namespace winprob::solver
