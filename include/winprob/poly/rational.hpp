#pragma once
#include <gmpxx.h>
#include <string>

namespace winprob::poly {

// Nearest double to an exact rational (round half to even).
// mpq_class::get_d() truncates toward zero, so this goes through MPFR.
double to_nearest_double(const mpq_class& value);

// Parses "N" or "N/D" into lowest terms.
// Throws InvalidInputError for malformed text or a zero denominator.
mpq_class parse_rational(const std::string& text);

// Reduced fraction text: "3/8", "-1/4", "1", "0"
std::string to_fraction_string(const mpq_class& value);

} // namespace winprob::poly
