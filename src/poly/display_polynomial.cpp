#include "winprob/poly/display_polynomial.hpp"
#include "winprob/poly/render.hpp"
#include <fmt/format.h>

namespace winprob::poly {

DisplayPolynomial::DisplayPolynomial() : coefficients_{} {}

DisplayPolynomial::DisplayPolynomial(double c0, double c1, double c2, double c3)
    : coefficients_{c0, c1, c2, c3} {}

DisplayPolynomial::DisplayPolynomial(const Coefficients& coefficients)
    : coefficients_(coefficients) {}

double DisplayPolynomial::at(double p) const {
    const double x = p - 0.5;
    return ((coefficients_[3] * x + coefficients_[2]) * x + coefficients_[1]) * x + coefficients_[0];
}

std::string DisplayPolynomial::to_string() const {
    return render_terms(coefficients_, [](double value) {
        return fmt::format("{:.4f}", value);
    });
}

std::ostream& operator<<(std::ostream& out, const DisplayPolynomial& poly) {
    return out << poly.to_string();
}

} // namespace winprob::poly
