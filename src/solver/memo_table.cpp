#include "winprob/solver/memo_table.hpp"

namespace winprob::solver {

std::optional<poly::Polynomial> HashMemoTable::find(const ScoreKey& key) const {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        return it->second;
    }
    return std::nullopt;
}

void HashMemoTable::insert(const ScoreKey& key, const poly::Polynomial& value) {
    entries_.emplace(key, value);
}

std::optional<poly::Polynomial> ConcurrentMemoTable::find(const ScoreKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        return it->second;
    }
    return std::nullopt;
}

void ConcurrentMemoTable::insert(const ScoreKey& key, const poly::Polynomial& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.emplace(key, value);
}

std::size_t ConcurrentMemoTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace winprob::solver
