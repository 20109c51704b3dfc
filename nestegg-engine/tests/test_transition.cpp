#include <catch2/catch_test_macros.hpp>
#include "transition.hpp"
#include "errors.hpp"
#include "fixtures.hpp"

using namespace nestegg;
using namespace fixtures;

namespace {

// Household with both persons; every entity kind present, with and without
// nest egg inclusion, inflation and growth.
struct TransitionModel {
    Household household;
    Plan plan;

    TransitionModel() {
        household.household_id = 1;
        household.person1 = make_person("Alex", 1960);
        household.person2 = make_person("Sam", 1962);

        plan.plan_id = 20;
        plan.household_id = 1;
        plan.plan_creation_year = 2025;
        plan.reference_person = PersonSelector::Person1;

        BaseAssumptions& a = plan.base_facts.assumptions;
        a.default_growth_rate = dec("0.05");
        a.inflation_rate = dec("0.02");
        a.retirement_age_1 = 70;      // 2030
        a.final_age_1 = 72;           // 2032

        EntityCollections& e = plan.base_facts.entities;
        e.assets.push_back(make_asset(1, "100000", true));
        e.assets.push_back(make_asset(2, "50000", false, GrowthConfig::fixed(dec("0.03"))));
        e.liabilities.push_back(make_liability(1, "20000", dec("0.04"), true));
        e.liabilities.push_back(make_liability(2, "10000", std::nullopt, false));
        e.flows.push_back(make_flow(1, FlowType::Inflow, "1000", 2025, 2026, true));
        e.flows.push_back(make_flow(2, FlowType::Outflow, "500", 2026, std::nullopt, false));
        e.income_streams.push_back(make_income(1, Owner::Person1, "12000", 67, std::nullopt, true, true));

        RetirementIncomeStream pension = make_income(2, Owner::Person2, "3000", 64, std::nullopt, false, false);
        pension.growth = GrowthConfig::fixed(dec("0.01"));
        e.income_streams.push_back(pension);
    }

    EffectiveEntitySet base_set() const {
        return resolve(plan.base_facts, std::vector<Override>{});
    }
};

} // anonymous namespace

TEST_CASE("prepare_assumptions converts income ages to years", "[transition]") {
    TransitionModel m;
    TimeResolver time(m.household, m.plan);
    ProjectionWindow window = time.window();
    ProjectionAssumptions pa = prepare_assumptions(m.base_set(), window, time);

    REQUIRE(pa.retirement_year == 2030);
    REQUIRE(pa.annual_retirement_spending == 0);
    REQUIRE(pa.income_years.at(1).start_year == 2027);
    REQUIRE(pa.income_years.at(2).start_year == 2026);
    REQUIRE_FALSE(pa.income_years.at(1).end_year.has_value());

    SECTION("Income owned by a missing person") {
        m.household.person2.reset();
        TimeResolver without_person2(m.household, m.plan);
        REQUIRE_THROWS_AS(prepare_assumptions(m.base_set(), window, without_person2), IncompleteEntity);
    }
}

TEST_CASE("Seed balances hold the stored values", "[transition]") {
    TransitionModel m;
    Balances seed = Balances::seed(m.plan.base_facts.entities);

    REQUIRE(seed.nest_egg_cash == 0);
    REQUIRE(seed.other_cash == 0);
    REQUIRE(seed.assets.at(2) == dec("50000"));
    REQUIRE(seed.nest_egg_total == dec("80000"));
    REQUIRE(seed.net_worth_total == dec("120000"));
}

TEST_CASE("advance applies the seven steps in order", "[transition]") {
    TransitionModel m;
    TimeResolver time(m.household, m.plan);
    EffectiveEntitySet set = m.base_set();
    ProjectionAssumptions pa = prepare_assumptions(set, time.window(), time);

    Balances b2025 = advance(Balances::seed(set.entities), set.entities, 2025, pa);

    SECTION("First year") {
        REQUIRE(b2025.activity.inflows == dec("1000.00"));
        REQUIRE(b2025.activity.outflows == 0);
        REQUIRE(b2025.activity.retirement_income == 0);
        REQUIRE(b2025.activity.growth == dec("6550.00"));
        REQUIRE(b2025.activity.liability_interest == dec("800.00"));
        REQUIRE(b2025.nest_egg_cash == dec("1050.00"));
        REQUIRE(b2025.assets.at(1) == dec("105000.00"));
        REQUIRE(b2025.assets.at(2) == dec("51500.00"));
        REQUIRE(b2025.liabilities.at(1) == dec("20800.00"));
        REQUIRE(b2025.liabilities.at(2) == dec("10000.00"));
        REQUIRE(b2025.nest_egg_total == dec("85250.00"));
        REQUIRE(b2025.net_worth_total == dec("126750.00"));
    }

    SECTION("Second year") {
        Balances b2026 = advance(b2025, set.entities, 2026, pa);
        // Inflated inflow, flat outflow, person2's pension lands in other cash
        REQUIRE(b2026.activity.inflows == dec("1020.00"));
        REQUIRE(b2026.activity.outflows == dec("500.00"));
        REQUIRE(b2026.activity.retirement_income == dec("3000.00"));
        REQUIRE(b2026.activity.growth == dec("7023.50"));
        REQUIRE(b2026.activity.liability_interest == dec("832.00"));
        REQUIRE(b2026.nest_egg_cash == dec("1648.50"));
        REQUIRE(b2026.other_cash == dec("3150.00"));
        REQUIRE(b2026.nest_egg_total == dec("90266.50"));
        REQUIRE(b2026.net_worth_total == dec("136461.50"));
    }

    SECTION("Prior balances are not modified") {
        const Balances copy = b2025;
        advance(b2025, set.entities, 2026, pa);
        REQUIRE(b2025.nest_egg_cash == copy.nest_egg_cash);
        REQUIRE(b2025.assets == copy.assets);
        REQUIRE(b2025.liabilities == copy.liabilities);
    }
}

TEST_CASE("Eight years of transitions", "[transition]") {
    TransitionModel m;
    TimeResolver time(m.household, m.plan);
    EffectiveEntitySet set = m.base_set();
    ProjectionAssumptions pa = prepare_assumptions(set, time.window(), time);

    const char* nest_egg[] = {"85250.00", "90266.50", "107071.15", "124976.69",
                              "144043.53", "164335.27", "185918.74", "208864.28"};
    const char* net_worth[] = {"126750.00", "136461.50", "158196.50", "181278.90",
                               "205780.78", "231778.01", "259350.25", "288581.28"};

    Balances b = Balances::seed(set.entities);
    for (int year = 2025; year <= 2032; ++year) {
        b = advance(b, set.entities, year, pa);
        const int i = year - 2025;
        INFO("year " << year);
        REQUIRE(b.nest_egg_total == dec(nest_egg[i]));
        REQUIRE(b.net_worth_total == dec(net_worth[i]));

        if (year == 2027) {
            REQUIRE(b.nest_egg_cash == dec("13805.93"));
            REQUIRE(b.assets.at(1) == dec("115762.50"));
            REQUIRE(b.liabilities.at(1) == dec("22497.28"));
        }
    }
}

TEST_CASE("Retirement spending starts in the retirement year", "[transition]") {
    TransitionModel m;
    TimeResolver time(m.household, m.plan);
    EffectiveEntitySet set = m.base_set();
    set.assumptions.annual_retirement_spending = dec("20000");
    ProjectionAssumptions pa = prepare_assumptions(set, time.window(), time);

    const char* nest_egg[] = {"85250.00", "90266.50", "107071.15", "124976.69",
                              "144043.53", "143335.27", "142448.74", "141372.38"};

    Balances b = Balances::seed(set.entities);
    for (int year = 2025; year <= 2032; ++year) {
        b = advance(b, set.entities, year, pa);
        INFO("year " << year);
        REQUIRE(b.nest_egg_total == dec(nest_egg[year - 2025]));
        if (year < 2030) {
            REQUIRE(b.activity.retirement_spending == 0);
        }
    }
    // 20000 inflated two years from 2030
    REQUIRE(b.activity.retirement_spending == dec("20808.00"));
}

TEST_CASE("grown_income compounds once per elapsed year", "[transition]") {
    RetirementIncomeStream income = make_income(1, Owner::Person1, "3000", 64);

    REQUIRE(grown_income(income, 2026, 2028, dec("0.05")) == dec("3000.00"));

    income.growth = GrowthConfig::fixed(dec("0.01"));
    REQUIRE(grown_income(income, 2026, 2026, dec("0.05")) == dec("3000.00"));
    REQUIRE(grown_income(income, 2026, 2027, dec("0.05")) == dec("3030.00"));
    REQUIRE(grown_income(income, 2026, 2028, dec("0.05")) == dec("3060.30"));

    income.growth = GrowthConfig();
    REQUIRE(grown_income(income, 2026, 2027, dec("0.05")) == dec("3150.00"));
}

TEST_CASE("Cash pools may go negative", "[transition]") {
    TransitionModel m;
    m.plan.base_facts.entities.flows.push_back(make_flow(3, FlowType::Outflow, "50000", 2025, 2025));
    TimeResolver time(m.household, m.plan);
    EffectiveEntitySet set = m.base_set();
    ProjectionAssumptions pa = prepare_assumptions(set, time.window(), time);

    Balances b = advance(Balances::seed(set.entities), set.entities, 2025, pa);
    // (1000 - 50000) * 1.05
    REQUIRE(b.nest_egg_cash == dec("-51450.00"));
}
