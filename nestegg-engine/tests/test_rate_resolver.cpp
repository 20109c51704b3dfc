#include <catch2/catch_test_macros.hpp>
#include "rate_resolver.hpp"
#include "errors.hpp"
#include "fixtures.hpp"

using namespace nestegg;
using fixtures::dec;

TEST_CASE("DEFAULT growth follows the default rate", "[rate_resolver]") {
    GrowthConfig config;
    REQUIRE(config.type() == GrowthType::Default);
    REQUIRE(effective_rate(config, 2025, dec("0.06")) == dec("0.06"));
    REQUIRE(effective_rate(config, 2090, dec("0.04")) == dec("0.04"));
}

TEST_CASE("OVERRIDE growth ignores the default rate", "[rate_resolver]") {
    GrowthConfig config = GrowthConfig::fixed(dec("0.09"));
    REQUIRE(config.type() == GrowthType::Override);
    REQUIRE(effective_rate(config, 2025, dec("0.06")) == dec("0.09"));
    REQUIRE(effective_rate(config, 2060, dec("0.01")) == dec("0.09"));
}

TEST_CASE("STEPWISE growth fills gaps with the default rate", "[rate_resolver]") {
    SECTION("Single interval") {
        GrowthConfig config = GrowthConfig::stepwise({RateInterval(2026, 2030, dec("0.05"))});
        REQUIRE(effective_rate(config, 2027, dec("0.06")) == dec("0.05"));
        REQUIRE(effective_rate(config, 2031, dec("0.06")) == dec("0.06"));
        REQUIRE(effective_rate(config, 2025, dec("0.06")) == dec("0.06"));
    }

    SECTION("Two intervals") {
        GrowthConfig config = GrowthConfig::stepwise({
            RateInterval(2024, 2026, dec("0.08")),
            RateInterval(2027, 2030, dec("0.06"))
        });
        REQUIRE(effective_rate(config, 2024, dec("0.055")) == dec("0.08"));
        REQUIRE(effective_rate(config, 2026, dec("0.055")) == dec("0.08"));
        REQUIRE(effective_rate(config, 2028, dec("0.055")) == dec("0.06"));
        REQUIRE(effective_rate(config, 2031, dec("0.055")) == dec("0.055"));
    }

    SECTION("Gap between intervals") {
        GrowthConfig config = GrowthConfig::stepwise({
            RateInterval(2025, 2026, dec("0.02")),
            RateInterval(2029, 2030, dec("0.03"))
        });
        REQUIRE(effective_rate(config, 2027, dec("0.07")) == dec("0.07"));
        REQUIRE(effective_rate(config, 2028, dec("0.07")) == dec("0.07"));
        REQUIRE(effective_rate(config, 2029, dec("0.07")) == dec("0.03"));
        REQUIRE(config.interval_for(2027) == nullptr);
        REQUIRE(config.interval_for(2030) != nullptr);
    }

    SECTION("Open-ended interval runs forever") {
        GrowthConfig config = GrowthConfig::stepwise({
            RateInterval(2025, 2027, dec("0.02")),
            RateInterval(2030, std::nullopt, dec("0.04"))
        });
        REQUIRE(effective_rate(config, 2030, dec("0.06")) == dec("0.04"));
        REQUIRE(effective_rate(config, 2099, dec("0.06")) == dec("0.04"));
        REQUIRE(effective_rate(config, 2028, dec("0.06")) == dec("0.06"));
    }
}

TEST_CASE("STEPWISE construction rejects malformed intervals", "[rate_resolver]") {
    SECTION("Overlap") {
        REQUIRE_THROWS_AS(GrowthConfig::stepwise({
            RateInterval(2024, 2027, dec("0.08")),
            RateInterval(2027, 2030, dec("0.06"))
        }), OverlappingIntervals);
    }

    SECTION("Out of order") {
        REQUIRE_THROWS_AS(GrowthConfig::stepwise({
            RateInterval(2030, 2032, dec("0.08")),
            RateInterval(2024, 2026, dec("0.06"))
        }), OverlappingIntervals);
    }

    SECTION("Ends before it starts") {
        REQUIRE_THROWS_AS(GrowthConfig::stepwise({RateInterval(2030, 2028, dec("0.08"))}),
                          OverlappingIntervals);
    }

    SECTION("Open-ended interval followed by another") {
        REQUIRE_THROWS_AS(GrowthConfig::stepwise({
            RateInterval(2024, std::nullopt, dec("0.08")),
            RateInterval(2030, 2032, dec("0.06"))
        }), OverlappingIntervals);
    }

    SECTION("Error names the entity") {
        try {
            GrowthConfig::stepwise({
                RateInterval(2024, 2027, dec("0.08")),
                RateInterval(2025, 2030, dec("0.06"))
            }, "asset 7");
            FAIL("expected OverlappingIntervals");
        } catch (const OverlappingIntervals& e) {
            REQUIRE(e.entity() == "asset 7");
            REQUIRE(std::string(e.what()).find("asset 7") != std::string::npos);
        }
    }
}

TEST_CASE("Growth type names round-trip", "[rate_resolver]") {
    REQUIRE(parse_growth_type("stepwise") == GrowthType::Stepwise);
    REQUIRE(parse_growth_type("OVERRIDE") == GrowthType::Override);
    REQUIRE(growth_type_to_string(GrowthType::Default) == "DEFAULT");
    REQUIRE_THROWS_AS(parse_growth_type("linear"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_growth_type("\xC3\xA9tapes"), std::invalid_argument);
}
