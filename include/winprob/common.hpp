#pragma once
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>

namespace winprob {

// Number of coefficients kept by the truncated cubic (degrees 0..3)
constexpr std::size_t kNumCoefficients = 4;

// Default race length used by the shell and the Python bindings
constexpr int kDefaultGoal = 30;

// Current score: points won and lost so far
struct Score {
    int win = 0;
    int lose = 0;
};

// Memo table key: a score together with the race length it belongs to
struct ScoreKey {
    int win;
    int lose;
    int goal;

    bool operator==(const ScoreKey& other) const {
        return win == other.win && lose == other.lose && goal == other.goal;
    }
};

struct ScoreKeyHash {
    std::size_t operator()(const ScoreKey& key) const {
        std::size_t seed = std::hash<int>{}(key.win);
        seed ^= std::hash<int>{}(key.lose) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        seed ^= std::hash<int>{}(key.goal) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        return seed;
    }
};

// Score outside [0, goal]
class OutOfRangeError : public std::out_of_range {
public:
    explicit OutOfRangeError(const std::string& what) : std::out_of_range(what) {}
};

// Malformed shell line or command-line option
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace winprob
