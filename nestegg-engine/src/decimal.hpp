#ifndef NESTEGG_DECIMAL_HPP
#define NESTEGG_DECIMAL_HPP

#include <boost/multiprecision/cpp_dec_float.hpp>
#include <string>

namespace nestegg {

// Base-10 number used for every monetary value and rate in the engine.
// 50 significant digits keeps long compounding chains exact to the cent.
using Decimal = boost::multiprecision::cpp_dec_float_50;

// Parse "[+-]digits[.digits][e[+-]digits]". Throws std::invalid_argument on
// anything else (thousands separators, percent signs, empty input).
Decimal parse_decimal(const std::string& text);

// Quantize to 0.01, ties away from zero
Decimal round_cents(const Decimal& value);

// round_cents(amount * (1 + rate))
Decimal apply_rate(const Decimal& amount, const Decimal& rate);

// round_cents(amount * (1 + rate)^years). The factor is built exactly and the
// result rounded once. years <= 0 returns the amount rounded to cents.
Decimal compound(const Decimal& amount, const Decimal& rate, int years);

// Fixed notation with two decimals ("530000.00"); never prints "-0.00"
std::string format_money(const Decimal& value);

// Shortest fixed notation for a rate ("0.06", "0.055")
std::string format_rate(const Decimal& rate);

} // namespace nestegg

#endif // NESTEGG_DECIMAL_HPP
