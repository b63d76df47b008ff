#include "winprob/poly/polynomial.hpp"
#include "winprob/poly/rational.hpp"
#include "winprob/poly/render.hpp"

namespace winprob::poly {

Polynomial::Polynomial() : coefficients_{} {}

Polynomial::Polynomial(const mpq_class& c0, const mpq_class& c1, const mpq_class& c2, const mpq_class& c3)
    : coefficients_{c0, c1, c2, c3} {
    for (auto& c : coefficients_) {
        c.canonicalize();
    }
}

Polynomial::Polynomial(const Coefficients& coefficients) : coefficients_(coefficients) {
    for (auto& c : coefficients_) {
        c.canonicalize();
    }
}

const Polynomial& Polynomial::p() {
    static const Polynomial value(mpq_class(1, 2), mpq_class(1), mpq_class(0), mpq_class(0));
    return value;
}

const Polynomial& Polynomial::q() {
    static const Polynomial value(mpq_class(1, 2), mpq_class(-1), mpq_class(0), mpq_class(0));
    return value;
}

const Polynomial& Polynomial::one() {
    static const Polynomial value(mpq_class(1), mpq_class(0), mpq_class(0), mpq_class(0));
    return value;
}

const Polynomial& Polynomial::zero() {
    static const Polynomial value;
    return value;
}

Polynomial Polynomial::operator+(const Polynomial& other) const {
    Coefficients sum;
    for (std::size_t i = 0; i < kNumCoefficients; ++i) {
        sum[i] = coefficients_[i] + other.coefficients_[i];
    }
    return Polynomial(sum);
}

Polynomial Polynomial::operator-(const Polynomial& other) const {
    Coefficients difference;
    for (std::size_t i = 0; i < kNumCoefficients; ++i) {
        difference[i] = coefficients_[i] - other.coefficients_[i];
    }
    return Polynomial(difference);
}

Polynomial Polynomial::operator*(const Polynomial& other) const {
    const Coefficients& a = coefficients_;
    const Coefficients& b = other.coefficients_;

    // Degree k collects a[i] * b[k - i]; nothing above degree 3 is formed
    Coefficients product;
    for (std::size_t k = 0; k < kNumCoefficients; ++k) {
        mpq_class term = 0;
        for (std::size_t i = 0; i <= k; ++i) {
            term += a[i] * b[k - i];
        }
        product[k] = term;
    }
    return Polynomial(product);
}

mpq_class Polynomial::at(const mpq_class& p) const {
    const mpq_class x = p - mpq_class(1, 2);
    mpq_class value = coefficients_[3];
    for (std::size_t degree = kNumCoefficients - 1; degree-- > 0;) {
        value = value * x + coefficients_[degree];
    }
    return value;
}

DisplayPolynomial Polynomial::to_display() const {
    DisplayPolynomial::Coefficients converted;
    for (std::size_t i = 0; i < kNumCoefficients; ++i) {
        converted[i] = to_nearest_double(coefficients_[i]);
    }
    return DisplayPolynomial(converted);
}

std::string Polynomial::to_string() const {
    return render_terms(coefficients_, [](const mpq_class& value) {
        return to_fraction_string(value);
    });
}

std::ostream& operator<<(std::ostream& out, const Polynomial& poly) {
    return out << poly.to_string();
}

} // namespace winprob::poly
