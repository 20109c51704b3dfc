#include <catch2/catch_test_macros.hpp>
#include "comparison.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "fixtures.hpp"

using namespace nestegg;
using namespace fixtures;

namespace {

void quiet_logger() {
    LoggerConfig config;
    config.enable_console = false;
    Logger::get_instance().configure(config);
}

ScenarioSet make_scenarios() {
    ScenarioSet set;
    set.add(make_spending_scenario());

    Scenario early = make_spending_scenario();
    early.scenario_id = 101;
    early.name = "Retire at 62";
    early.assumptions.retirement_age_1 = 62;
    set.add(early);

    Scenario growth;
    growth.scenario_id = 102;
    growth.name = "Higher growth";
    growth.assumptions.default_growth_rate = dec("0.07");
    set.add(growth);
    return set;
}

Scenario make_broken_scenario() {
    Scenario broken;
    broken.scenario_id = 103;
    broken.name = "Broken";
    broken.overrides.push_back(Override::patch(1, OverrideTarget::Asset, 404, "value", "1"));
    return broken;
}

} // anonymous namespace

TEST_CASE("Base case comes first, scenarios follow in input order", "[comparison]") {
    quiet_logger();
    Household h = make_household();
    Plan plan = make_plan();

    ComparisonResult result = compare_scenarios(h, plan, make_scenarios());

    REQUIRE(result.plan_name == "Test plan");
    REQUIRE(result.series.size() == 4);
    REQUIRE(result.base().is_base);
    REQUIRE(result.base().name == "base");
    REQUIRE(result.base().deltas.empty());
    REQUIRE(result.series[1].name == "Spending");
    REQUIRE(result.series[2].name == "Retire at 62");
    REQUIRE(result.series[3].name == "Higher growth");
    REQUIRE(result.series[1].scenario_id == 100u);
    REQUIRE(result.scenarios_failed == 0);
    REQUIRE(result.window.retirement_year == 2030);
}

TEST_CASE("Scenario spending produces negative deltas from retirement", "[comparison]") {
    quiet_logger();
    Household h = make_household();
    Plan plan = make_plan();
    ScenarioSet scenarios;
    scenarios.add(make_spending_scenario());

    ComparisonResult result = compare_scenarios(h, plan, scenarios);
    const ScenarioSeries* spending = result.find("Spending");
    REQUIRE(spending != nullptr);

    REQUIRE(spending->projection.at(2030)->nest_egg == dec("688059.56"));
    REQUIRE(spending->projection.at(2031)->nest_egg == dec("707549.53"));
    REQUIRE(spending->projection.at(2032)->nest_egg == dec("727598.68"));

    REQUIRE(spending->deltas.size() == 8);
    for (const YearDelta& d : spending->deltas) {
        INFO("year " << d.year);
        if (d.year < 2030) {
            REQUIRE(d.nest_egg == 0);
            REQUIRE(d.net_worth == 0);
        }
    }
    REQUIRE(spending->deltas[5].year == 2030);
    REQUIRE(spending->deltas[5].nest_egg == dec("-21200.00"));
    REQUIRE(spending->deltas[6].nest_egg == dec("-44265.60"));
    REQUIRE(spending->deltas[7].nest_egg == dec("-69325.36"));
}

TEST_CASE("Scenario retirement age moves its spending start", "[comparison]") {
    quiet_logger();
    Household h = make_household();
    Plan plan = make_plan();

    ComparisonResult result = compare_scenarios(h, plan, make_scenarios());
    const ScenarioSeries* early = result.find("Retire at 62");
    REQUIRE(early != nullptr);

    REQUIRE(early->projection.window.start_year == 2025);
    REQUIRE(early->projection.window.retirement_year == 2027);
    REQUIRE(early->projection.window.end_year == 2032);

    REQUIRE(early->projection.at(2026)->nest_egg == dec("561800.00"));
    REQUIRE(early->projection.at(2027)->nest_egg == dec("574308.00"));
    REQUIRE(early->projection.at(2032)->nest_egg == dec("639043.17"));
    REQUIRE(early->deltas[1].nest_egg == 0);
    REQUIRE(early->deltas[2].nest_egg == dec("-21200.00"));
}

TEST_CASE("Scenario growth assumption replaces the default rate", "[comparison]") {
    quiet_logger();
    Household h = make_household();
    Plan plan = make_plan();

    ComparisonResult result = compare_scenarios(h, plan, make_scenarios());
    const ScenarioSeries* growth = result.find("Higher growth");
    REQUIRE(growth != nullptr);

    REQUIRE(growth->projection.first_year().nest_egg == dec("535000.00"));
    REQUIRE(growth->projection.final_year().nest_egg == dec("859093.09"));
    REQUIRE(growth->deltas.front().nest_egg == dec("5000.00"));
}

TEST_CASE("Scenarios never change the base case", "[comparison]") {
    quiet_logger();
    Household h = make_household();
    Plan plan = make_plan();

    ComparisonResult alone = compare_scenarios(h, plan, ScenarioSet());
    ComparisonResult with_scenarios = compare_scenarios(h, plan, make_scenarios());

    REQUIRE(alone.series.size() == 1);
    const ProjectionResult& a = alone.base().projection;
    const ProjectionResult& b = with_scenarios.base().projection;
    REQUIRE(a.years.size() == b.years.size());
    for (size_t i = 0; i < a.years.size(); ++i) {
        REQUIRE(a.years[i].nest_egg == b.years[i].nest_egg);
        REQUIRE(a.years[i].net_worth == b.years[i].net_worth);
    }
    REQUIRE(b.final_year().nest_egg == dec("796924.04"));
}

TEST_CASE("Sequential and parallel runs agree", "[comparison]") {
    quiet_logger();
    Household h = make_household();
    Plan plan = make_plan();

    ComparisonConfig sequential;
    sequential.parallel = false;
    ComparisonConfig parallel;
    parallel.parallel = true;

    ComparisonResult s = compare_scenarios(h, plan, make_scenarios(), sequential);
    ComparisonResult p = compare_scenarios(h, plan, make_scenarios(), parallel);

    REQUIRE(s.series.size() == p.series.size());
    for (size_t i = 0; i < s.series.size(); ++i) {
        REQUIRE(s.series[i].name == p.series[i].name);
        REQUIRE(s.series[i].projection.years.size() == p.series[i].projection.years.size());
        for (size_t y = 0; y < s.series[i].projection.years.size(); ++y) {
            REQUIRE(s.series[i].projection.years[y].nest_egg == p.series[i].projection.years[y].nest_egg);
        }
    }
}

TEST_CASE("Scenario failures", "[comparison]") {
    quiet_logger();
    Household h = make_household();
    Plan plan = make_plan();
    ScenarioSet scenarios = make_scenarios();
    scenarios.add(make_broken_scenario());

    SECTION("Stop on error rethrows the original fault") {
        REQUIRE_THROWS_AS(compare_scenarios(h, plan, scenarios), DanglingOverrideReference);
    }

    SECTION("Continue on error flags the series") {
        ComparisonConfig config;
        config.stop_on_error = false;
        ComparisonResult result = compare_scenarios(h, plan, scenarios, config);

        REQUIRE(result.series.size() == 5);
        REQUIRE(result.scenarios_failed == 1);
        const ScenarioSeries* broken = result.find("Broken");
        REQUIRE(broken != nullptr);
        REQUIRE(broken->failed);
        REQUIRE_FALSE(broken->error.empty());
        REQUIRE(broken->deltas.empty());
        REQUIRE_FALSE(result.find("Spending")->failed);
        REQUIRE(result.find("Spending")->deltas.size() == 8);
    }

    SECTION("Retirement age outside the window") {
        Scenario late;
        late.scenario_id = 104;
        late.name = "Retire at 70";
        late.assumptions.retirement_age_1 = 70;
        ScenarioSet only_late;
        only_late.add(late);
        REQUIRE_THROWS_AS(compare_scenarios(h, plan, only_late), InvalidWindow);
    }

    SECTION("Base case failure always propagates") {
        plan.base_facts.entities.assets.push_back(make_asset(1, "1"));
        ComparisonConfig config;
        config.stop_on_error = false;
        REQUIRE_THROWS_AS(compare_scenarios(h, plan, ScenarioSet(), config), IncompleteEntity);
    }
}

TEST_CASE("compute_deltas requires aligned series", "[comparison]") {
    ProjectionResult base;
    base.years.resize(3);
    ProjectionResult shorter;
    shorter.years.resize(2);
    REQUIRE_THROWS_AS(compute_deltas(base, shorter), std::logic_error);
}
