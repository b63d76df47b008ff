#include <catch2/catch.hpp>
#include <climits>
#include <memory>
#include <vector>

#include "winprob/common.hpp"
#include "winprob/poly/polynomial.hpp"
#include "winprob/solver/memo_table.hpp"
#include "winprob/solver/solver.hpp"

using winprob::OutOfRangeError;
using winprob::ScoreKey;
using winprob::poly::Polynomial;
using winprob::solver::HashMemoTable;
using winprob::solver::MemoTable;
using winprob::solver::Solver;

namespace {

// Memo table that counts lookups and stores
class CountingMemoTable : public MemoTable {
public:
    std::optional<Polynomial> find(const ScoreKey& key) const override {
        ++finds;
        return inner.find(key);
    }
    void insert(const ScoreKey& key, const Polynomial& value) override {
        ++inserts;
        inner.insert(key, value);
    }
    std::size_t size() const override { return inner.size(); }

    mutable int finds = 0;
    int inserts = 0;

private:
    HashMemoTable inner;
};

} // namespace

TEST_CASE("Race to 2 matches the closed form", "[solver]") {
    Solver solver;

    // p^2 (3 - 2p) expanded around p = 1/2, exact at this size
    REQUIRE(solver.solve(0, 0, 2) == Polynomial(mpq_class(1, 2), mpq_class(3, 2), 0, -2));
    REQUIRE(solver.solve(1, 0, 2) == Polynomial(mpq_class(3, 4), 1, -1, 0));
    REQUIRE(solver.solve(0, 1, 2) == Polynomial(mpq_class(1, 4), 1, 1, 0));
    REQUIRE(solver.solve(1, 1, 2) == Polynomial::p());

    REQUIRE(solver.solve(0, 0, 2).to_string() == "1/2 + 3/2 (p - 1/2) + 0 (p - 1/2)^2 - 2 (p - 1/2)^3");
}

TEST_CASE("Finished races are certain", "[solver]") {
    Solver solver;
    const int goal = 5;

    for (int lose = 0; lose <= goal; lose++) {
        REQUIRE(solver.solve(goal, lose, goal) == Polynomial::one());
    }
    for (int win = 0; win < goal; win++) {
        REQUIRE(solver.solve(win, goal, goal) == Polynomial::zero());
    }

    SECTION("a win takes precedence at goal zero") {
        REQUIRE(solver.solve(0, 0, 0) == Polynomial::one());
    }
}

TEST_CASE("Every state satisfies the one-point identity", "[solver]") {
    Solver solver;
    const int goal = 7;

    for (int win = 0; win < goal; win++) {
        for (int lose = 0; lose < goal; lose++) {
            const Polynomial expected = Polynomial::p() * solver.solve(win + 1, lose, goal)
                                      + Polynomial::q() * solver.solve(win, lose + 1, goal);
            REQUIRE(solver.solve(win, lose, goal) == expected);
        }
    }
}

TEST_CASE("Fair-coin value is the constant term", "[solver]") {
    Solver solver;
    const mpq_class half(1, 2);

    REQUIRE(solver.solve(0, 0, 2).at(half) == half);

    // From 1-0 in a race to 3: at least 2 wins in the next 4 points
    const Polynomial lead = solver.solve(1, 0, 3);
    REQUIRE(lead.coefficient(0) == mpq_class(11, 16));
    REQUIRE(lead.at(half) == mpq_class(11, 16));
}

TEST_CASE("Swapping the score mirrors the polynomial", "[solver]") {
    Solver solver;
    const int goal = 10;

    // f(w, l)(x) = 1 - f(l, w)(-x)
    for (int win = 0; win < goal; win++) {
        for (int lose = 0; lose < goal; lose++) {
            const Polynomial a = solver.solve(win, lose, goal);
            const Polynomial b = solver.solve(lose, win, goal);
            REQUIRE(mpq_class(a.coefficient(0) + b.coefficient(0)) == 1);
            REQUIRE(a.coefficient(1) == b.coefficient(1));
            REQUIRE(a.coefficient(2) == mpq_class(-b.coefficient(2)));
            REQUIRE(a.coefficient(3) == b.coefficient(3));
        }
    }

    SECTION("tied scores are even around one half") {
        for (int k = 0; k < goal; k++) {
            const Polynomial tied = solver.solve(k, k, goal);
            REQUIRE(tied.coefficient(0) == mpq_class(1, 2));
            REQUIRE(tied.coefficient(2) == 0);
        }
    }
}

TEST_CASE("Scores outside the race are rejected", "[solver][errors]") {
    Solver solver;
    const int goal = 4;

    REQUIRE_THROWS_AS(solver.solve(goal + 1, 0, goal), OutOfRangeError);
    REQUIRE_THROWS_AS(solver.solve(0, goal + 1, goal), OutOfRangeError);
    REQUIRE_THROWS_AS(solver.solve(-1, 0, goal), OutOfRangeError);
    REQUIRE_THROWS_AS(solver.solve(0, -1, goal), OutOfRangeError);
    REQUIRE_THROWS_AS(solver.solve(0, 0, -1), OutOfRangeError);

    // Still an std::out_of_range for generic callers
    REQUIRE_THROWS_AS(solver.solve(goal + 1, 0, goal), std::out_of_range);
    REQUIRE(solver.table()->size() == 0);
}

TEST_CASE("Display copy holds the nearest doubles", "[solver][display]") {
    Solver solver;

    SECTION("10-5 in a race to 30") {
        const Polynomial exact = solver.solve(10, 5, 30);
        REQUIRE(exact == Polynomial(mpq_class(mpz_class("6810899127109"), mpz_class("8796093022208")),
                                    mpq_class(mpz_class("4402598375175"), mpz_class("1099511627776")),
                                    mpq_class(mpz_class("-22012991875875"), mpz_class("1099511627776")),
                                    mpq_class(mpz_class("-13207795125525"), mpz_class("274877906944"))));
        REQUIRE(exact.to_display() == winprob::poly::DisplayPolynomial(
                    0x1.8c724e46d14p-1, 0x1.0043d3fbc1cp+2, -0x1.4054c8fab23p+4, -0x1.8065bdf9a2ap+5));
    }

    SECTION("0-0 in a race to 1") {
        REQUIRE(solver.solve(0, 0, 1).to_display() == winprob::poly::DisplayPolynomial(0x1p-1, 0x1p+0, 0.0, 0.0));
    }

    SECTION("5-5 in a race to 10") {
        const Polynomial exact = solver.solve(5, 5, 10);
        REQUIRE(exact == Polynomial(mpq_class(1, 2), mpq_class(315, 128), 0, mpq_class(-105, 8)));
        REQUIRE(exact.to_display() == winprob::poly::DisplayPolynomial(0x1p-1, 0x1.3bp+1, 0.0, -0x1.a4p+3));
    }
}

TEST_CASE("Cached results are returned unchanged", "[solver][memo]") {
    auto table = std::make_shared<CountingMemoTable>();
    Solver solver(table);

    const Polynomial first = solver.solve(0, 0, 2);
    // (0,0), (0,1), (1,0) and (1,1) need the recurrence
    REQUIRE(table->size() == 4);
    REQUIRE(table->inserts == 4);

    const int finds_before = table->finds;
    const Polynomial second = solver.solve(0, 0, 2);
    REQUIRE(second == first);
    REQUIRE(table->finds == finds_before + 1);
    REQUIRE(table->inserts == 4);

    SECTION("sub-problems are reused") {
        REQUIRE(solver.solve(1, 0, 2) == Polynomial(mpq_class(3, 4), 1, -1, 0));
        REQUIRE(table->inserts == 4);
    }

    SECTION("a solved terminal score is cached") {
        solver.solve(0, 0, 0);
        REQUIRE(table->size() == 5);
    }
}

TEST_CASE("Solvers sharing a table agree with a fresh solver", "[solver][memo]") {
    auto table = std::make_shared<HashMemoTable>();
    Solver warm(table);
    Solver other(table);

    // Fill part of the table from a later score first
    warm.solve(3, 4, 12);
    const std::size_t partial = table->size();
    REQUIRE(partial > 0);

    const Polynomial shared = other.solve(0, 0, 12);
    REQUIRE(table->size() > partial);

    Solver fresh;
    REQUIRE(shared == fresh.solve(0, 0, 12));

    SECTION("goals do not collide in one table") {
        const Polynomial short_race = other.solve(0, 0, 3);
        REQUIRE(short_race == Solver().solve(0, 0, 3));
        REQUIRE(short_race != shared);
    }
}

TEST_CASE("Scores next to the largest goal", "[solver]") {
    Solver solver;

    // Finished races answer without building a grid
    REQUIRE(solver.solve(INT_MAX, 0, INT_MAX) == Polynomial::one());
    REQUIRE(solver.solve(0, INT_MAX, INT_MAX) == Polynomial::zero());

    // Only the points still needed matter
    REQUIRE(solver.solve(INT_MAX - 2, INT_MAX - 1, INT_MAX) == solver.solve(1, 2, 3));
    REQUIRE(solver.solve(INT_MAX - 1, INT_MAX - 1, INT_MAX) == Polynomial::p());

    REQUIRE_THROWS_AS(solver.solve(INT_MAX, -1, INT_MAX), OutOfRangeError);
}

TEST_CASE("Solver rejects a missing table", "[solver]") {
    REQUIRE_THROWS_AS(Solver(std::shared_ptr<MemoTable>()), std::invalid_argument);
}

TEST_CASE("Terminal values and score checks", "[solver]") {
    REQUIRE(winprob::solver::terminal_value(3, 1, 3) == Polynomial::one());
    REQUIRE(winprob::solver::terminal_value(1, 3, 3) == Polynomial::zero());
    REQUIRE_FALSE(winprob::solver::terminal_value(1, 1, 3).has_value());

    REQUIRE_NOTHROW(winprob::solver::check_score(0, 3, 3));
    REQUIRE_THROWS_AS(winprob::solver::check_score(4, 0, 3), OutOfRangeError);
}
