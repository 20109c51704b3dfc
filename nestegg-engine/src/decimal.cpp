#include "decimal.hpp"
#include <cctype>
#include <ios>
#include <stdexcept>

namespace nestegg {

namespace {

// Exponents beyond three digits are never meaningful for money or rates
constexpr size_t MAX_EXPONENT_DIGITS = 3;

} // anonymous namespace

Decimal parse_decimal(const std::string& text) {
    size_t pos = 0;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        ++pos;
    }

    size_t digits = 0;
    bool seen_point = false;
    for (; pos < text.size(); ++pos) {
        const unsigned char c = static_cast<unsigned char>(text[pos]);
        if (std::isdigit(c)) {
            ++digits;
        } else if (c == '.' && !seen_point) {
            seen_point = true;
        } else {
            break;
        }
    }

    if (digits == 0) {
        throw std::invalid_argument("Not a decimal number: '" + text + "'");
    }

    // Optional exponent, as JSON writes very small or large numbers ("1e-05")
    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
        ++pos;
        if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
            ++pos;
        }
        size_t exponent_digits = 0;
        for (; pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])); ++pos) {
            ++exponent_digits;
        }
        if (exponent_digits == 0 || exponent_digits > MAX_EXPONENT_DIGITS) {
            throw std::invalid_argument("Not a decimal number: '" + text + "'");
        }
    }

    if (pos != text.size()) {
        throw std::invalid_argument("Not a decimal number: '" + text + "'");
    }
    return Decimal(text);
}

Decimal round_cents(const Decimal& value) {
    static const Decimal hundred(100);
    return boost::multiprecision::round(value * hundred) / hundred;
}

Decimal apply_rate(const Decimal& amount, const Decimal& rate) {
    return round_cents(amount * (Decimal(1) + rate));
}

Decimal compound(const Decimal& amount, const Decimal& rate, int years) {
    if (years <= 0) {
        return round_cents(amount);
    }
    const Decimal step = Decimal(1) + rate;
    Decimal factor(1);
    for (int i = 0; i < years; ++i) {
        factor *= step;
    }
    return round_cents(amount * factor);
}

std::string format_money(const Decimal& value) {
    const Decimal rounded = round_cents(value);
    if (rounded.is_zero()) {
        return "0.00";
    }
    return rounded.str(2, std::ios_base::fixed);
}

std::string format_rate(const Decimal& rate) {
    std::string s = rate.str(12, std::ios_base::fixed);
    const size_t point = s.find('.');
    if (point == std::string::npos) {
        return s;
    }
    size_t end = s.find_last_not_of('0');
    if (end == point) {
        ++end;  // keep one digit after the point
    }
    s.erase(end + 1);
    return s == "-0.0" ? "0.0" : s;
}

} // namespace nestegg
