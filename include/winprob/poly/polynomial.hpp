#pragma once
#include "../common.hpp"
#include "display_polynomial.hpp"
#include <array>
#include <fmt/ostream.h>
#include <gmpxx.h>
#include <ostream>
#include <string>

namespace winprob::poly {

/**
 * Win probability as a cubic in x = p - 1/2 with exact rational coefficients:
 *
 *   c0 + c1 x + c2 x^2 + c3 x^3
 *
 * Terms of degree 4 and above are never represented. Products drop them by
 * construction (truncated Taylor expansion around p = 1/2).
 *
 * Values are immutable; every operator returns a new polynomial.
 */
class Polynomial {
public:
    using Coefficients = std::array<mpq_class, kNumCoefficients>;

    // Zero polynomial
    Polynomial();
    Polynomial(const mpq_class& c0, const mpq_class& c1, const mpq_class& c2, const mpq_class& c3);
    explicit Polynomial(const Coefficients& coefficients);

    // Distinguished values
    static const Polynomial& p();     // 1/2 + x, probability of winning a point
    static const Polynomial& q();     // 1/2 - x, probability of losing a point
    static const Polynomial& one();   // certain win
    static const Polynomial& zero();  // certain loss

    const mpq_class& coefficient(std::size_t degree) const { return coefficients_.at(degree); }
    const Coefficients& coefficients() const { return coefficients_; }

    Polynomial operator+(const Polynomial& other) const;
    Polynomial operator-(const Polynomial& other) const;

    /**
     * Product truncated to degree 3. Only the pairs (i, j) with i + j <= 3
     * are multiplied; e.g. c1*c3 or c2*c2 never contribute.
     */
    Polynomial operator*(const Polynomial& other) const;

    bool operator==(const Polynomial& other) const { return coefficients_ == other.coefficients_; }
    bool operator!=(const Polynomial& other) const { return !(*this == other); }

    // Exact value of the cubic at win probability p
    mpq_class at(const mpq_class& p) const;

    // Nearest-double copy of each coefficient
    DisplayPolynomial to_display() const;

    // Reduced fractions, e.g. "1/2 + 3/2 (p - 1/2) + 0 (p - 1/2)^2 - 2 (p - 1/2)^3"
    std::string to_string() const;

private:
    Coefficients coefficients_;
};

std::ostream& operator<<(std::ostream& out, const Polynomial& poly);

} // namespace winprob::poly

template <>
struct fmt::formatter<winprob::poly::Polynomial> : fmt::ostream_formatter {};
