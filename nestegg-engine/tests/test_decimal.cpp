#include <catch2/catch_test_macros.hpp>
#include "decimal.hpp"
#include <stdexcept>

using namespace nestegg;

TEST_CASE("parse_decimal accepts plain decimal text", "[decimal]") {
    REQUIRE(parse_decimal("500000") == Decimal(500000));
    REQUIRE(parse_decimal("0.06") == Decimal("0.06"));
    REQUIRE(parse_decimal("-12.5") == Decimal("-12.5"));
    REQUIRE(parse_decimal("+3") == Decimal(3));
}

TEST_CASE("parse_decimal accepts exponent notation", "[decimal]") {
    REQUIRE(parse_decimal("1e-05") == Decimal("0.00001"));
    REQUIRE(parse_decimal("2.5E+3") == Decimal(2500));
    REQUIRE(parse_decimal("1e5") == Decimal(100000));
    REQUIRE(parse_decimal("-4.2e-2") == Decimal("-0.042"));
}

TEST_CASE("parse_decimal rejects anything else", "[decimal]") {
    REQUIRE_THROWS_AS(parse_decimal(""), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_decimal("-"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_decimal("abc"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_decimal("1e"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_decimal("1e+"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_decimal("e5"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_decimal("1e5x"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_decimal("1e99999"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_decimal("1,000"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_decimal("1.2.3"), std::invalid_argument);
}

TEST_CASE("round_cents rounds half away from zero", "[decimal]") {
    REQUIRE(round_cents(Decimal("2.675")) == Decimal("2.68"));
    REQUIRE(round_cents(Decimal("2.674")) == Decimal("2.67"));
    REQUIRE(round_cents(Decimal("0.005")) == Decimal("0.01"));
    REQUIRE(round_cents(Decimal("-0.005")) == Decimal("-0.01"));
    REQUIRE(round_cents(Decimal("669112.7888")) == Decimal("669112.79"));
}

TEST_CASE("apply_rate compounds one year", "[decimal]") {
    REQUIRE(apply_rate(Decimal(500000), Decimal("0.06")) == Decimal("530000.00"));
    REQUIRE(apply_rate(Decimal("631238.48"), Decimal("0.06")) == Decimal("669112.79"));
    REQUIRE(apply_rate(Decimal(-20000), Decimal("0.06")) == Decimal(-21200));
    REQUIRE(apply_rate(Decimal(1000), Decimal(0)) == Decimal(1000));
}

TEST_CASE("compound builds the factor exactly and rounds once", "[decimal]") {
    SECTION("Multiple years") {
        // 20000 * 1.028^2 = 21135.68
        REQUIRE(compound(Decimal(20000), Decimal("0.028"), 2) == Decimal("21135.68"));
    }

    SECTION("Zero or negative years returns the amount") {
        REQUIRE(compound(Decimal("20000.004"), Decimal("0.028"), 0) == Decimal("20000.00"));
        REQUIRE(compound(Decimal(20000), Decimal("0.028"), -3) == Decimal(20000));
    }
}

TEST_CASE("format_money prints two decimals", "[decimal]") {
    REQUIRE(format_money(Decimal(530000)) == "530000.00");
    REQUIRE(format_money(Decimal("669112.7888")) == "669112.79");
    REQUIRE(format_money(Decimal("-12.5")) == "-12.50");
    REQUIRE(format_money(Decimal(0)) == "0.00");
    REQUIRE(format_money(Decimal("-0.001")) == "0.00");
}

TEST_CASE("format_rate trims trailing zeros", "[decimal]") {
    REQUIRE(format_rate(Decimal("0.06")) == "0.06");
    REQUIRE(format_rate(Decimal("0.055")) == "0.055");
    REQUIRE(format_rate(Decimal(0)) == "0.0");
}
