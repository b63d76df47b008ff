#include "winprob/poly/rational.hpp"
#include "winprob/common.hpp"
#include <fmt/format.h>
#include <limits>
#include <mpfr.h>

namespace winprob::poly {

namespace {

// RAII holder for an mpfr_t of fixed precision
struct MpfrValue {
    explicit MpfrValue(mpfr_prec_t precision) {
        mpfr_init2(value, precision);
    }
    ~MpfrValue() {
        mpfr_clear(value);
    }
    MpfrValue(const MpfrValue&) = delete;
    MpfrValue& operator=(const MpfrValue&) = delete;

    mpfr_t value;
};

} // namespace

double to_nearest_double(const mpq_class& value) {
    // One rounding at double precision, then an exact read-out
    MpfrValue rounded(std::numeric_limits<double>::digits);
    mpfr_set_q(rounded.value, value.get_mpq_t(), MPFR_RNDN);
    return mpfr_get_d(rounded.value, MPFR_RNDN);
}

mpq_class parse_rational(const std::string& text) {
    mpq_class result;
    if (result.set_str(text, 10) != 0) {
        throw InvalidInputError(fmt::format("Not a rational number: '{}'", text));
    }
    // set_str accepts "N/0"; canonicalize() would divide by zero
    if (sgn(result.get_den()) == 0) {
        throw InvalidInputError(fmt::format("Zero denominator in '{}'", text));
    }
    result.canonicalize();
    return result;
}

std::string to_fraction_string(const mpq_class& value) {
    return value.get_str();
}

} // namespace winprob::poly
