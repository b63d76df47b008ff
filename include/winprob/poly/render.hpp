#pragma once
#include "../common.hpp"
#include <array>
#include <string>

namespace winprob::poly {

/*
 * Shared text form of both polynomial flavors:
 *
 *   "{c0} {+|-} {|c1|} (p - 1/2) {+|-} {|c2|} (p - 1/2)^2 {+|-} {|c3|} (p - 1/2)^3"
 *
 * c0 is written as-is; higher coefficients are written as a sign and a
 * magnitude. `format` turns one coefficient into text.
 */
template <typename Coefficient, typename Format>
std::string render_terms(const std::array<Coefficient, kNumCoefficients>& coefficients,
                         Format format) {
    static const char* const kPowers[kNumCoefficients] = {
        "", " (p - 1/2)", " (p - 1/2)^2", " (p - 1/2)^3"
    };

    std::string text = format(coefficients[0]);
    for (std::size_t degree = 1; degree < kNumCoefficients; ++degree) {
        Coefficient magnitude = coefficients[degree];
        const bool negative = magnitude < 0;
        if (negative) {
            magnitude = -magnitude;
        }
        text += negative ? " - " : " + ";
        text += format(magnitude);
        text += kPowers[degree];
    }
    return text;
}

} // namespace winprob::poly
