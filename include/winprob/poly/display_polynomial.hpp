#pragma once
#include "../common.hpp"
#include <array>
#include <fmt/ostream.h>
#include <ostream>
#include <string>

namespace winprob::poly {

// Floating-point copy of a Polynomial, for output only (no arithmetic)
class DisplayPolynomial {
public:
    using Coefficients = std::array<double, kNumCoefficients>;

    DisplayPolynomial();
    DisplayPolynomial(double c0, double c1, double c2, double c3);
    explicit DisplayPolynomial(const Coefficients& coefficients);

    double coefficient(std::size_t degree) const { return coefficients_.at(degree); }
    const Coefficients& coefficients() const { return coefficients_; }

    // Value of the cubic at win probability p
    double at(double p) const;

    // Coefficients with 4 decimal digits, e.g. "0.6562 + 1.2345 (p - 1/2) ..."
    std::string to_string() const;

    bool operator==(const DisplayPolynomial& other) const { return coefficients_ == other.coefficients_; }

private:
    Coefficients coefficients_;
};

std::ostream& operator<<(std::ostream& out, const DisplayPolynomial& poly);

} // namespace winprob::poly

template <>
struct fmt::formatter<winprob::poly::DisplayPolynomial> : fmt::ostream_formatter {};
