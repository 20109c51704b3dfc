#ifndef NESTEGG_TESTS_FIXTURES_HPP
#define NESTEGG_TESTS_FIXTURES_HPP

#include "plan.hpp"
#include "scenario.hpp"
#include "decimal.hpp"
#include <string>

// ============================================================================
// Helper functions for setting up test data
// ============================================================================

namespace fixtures {

using namespace nestegg;

inline Decimal dec(const std::string& text) {
    return parse_decimal(text);
}

inline Person make_person(const std::string& name, int birth_year) {
    Person p;
    p.name = name;
    p.dob.year = birth_year;
    p.dob.month = 6;
    p.dob.day = 15;
    return p;
}

// person1 born 1965 (age 60 in 2025), no person2
inline Household make_household() {
    Household h;
    h.household_id = 1;
    h.name = "Test household";
    h.person1 = make_person("Alex", 1965);
    return h;
}

inline Asset make_asset(EntityId id, const std::string& value, bool include = true,
                        const GrowthConfig& growth = GrowthConfig()) {
    Asset a;
    a.asset_id = id;
    a.name = "Asset " + std::to_string(id);
    a.value = dec(value);
    a.include_in_nest_egg = include;
    a.growth = growth;
    return a;
}

inline Liability make_liability(EntityId id, const std::string& value,
                                std::optional<Decimal> rate = std::nullopt, bool include = true) {
    Liability l;
    l.liability_id = id;
    l.name = "Liability " + std::to_string(id);
    l.value = dec(value);
    l.interest_rate = rate;
    l.include_in_nest_egg = include;
    return l;
}

inline ScheduledFlow make_flow(EntityId id, FlowType type, const std::string& amount,
                               int start_year, std::optional<int> end_year,
                               bool apply_inflation = false) {
    ScheduledFlow f;
    f.flow_id = id;
    f.name = "Flow " + std::to_string(id);
    f.type = type;
    f.annual_amount = dec(amount);
    f.start_year = start_year;
    f.end_year = end_year;
    f.apply_inflation = apply_inflation;
    return f;
}

inline RetirementIncomeStream make_income(EntityId id, Owner owner, const std::string& amount,
                                          int start_age, std::optional<int> end_age = std::nullopt,
                                          bool apply_inflation = false, bool include = true) {
    RetirementIncomeStream r;
    r.income_id = id;
    r.name = "Income " + std::to_string(id);
    r.owner = owner;
    r.annual_income = dec(amount);
    r.start_age = start_age;
    r.end_age = end_age;
    r.apply_inflation = apply_inflation;
    r.include_in_nest_egg = include;
    return r;
}

// Plan created in 2025, person1 retires at 65 (2030), final age 67 (2032).
// One asset of 500000 on DEFAULT growth, default rate 6%, inflation 2.8%.
inline Plan make_plan() {
    Plan plan;
    plan.plan_id = 10;
    plan.household_id = 1;
    plan.name = "Test plan";
    plan.plan_creation_year = 2025;
    plan.reference_person = PersonSelector::Person1;

    BaseAssumptions& a = plan.base_facts.assumptions;
    a.default_growth_rate = dec("0.06");
    a.inflation_rate = dec("0.028");
    a.retirement_age_1 = 65;
    a.final_age_1 = 67;
    a.final_age_selector = PersonSelector::Person1;

    plan.base_facts.entities.assets.push_back(make_asset(1, "500000"));
    return plan;
}

inline Scenario make_spending_scenario(const std::string& spending = "20000") {
    Scenario s;
    s.scenario_id = 100;
    s.name = "Spending";
    s.annual_retirement_spending = dec(spending);
    return s;
}

} // namespace fixtures

#endif // NESTEGG_TESTS_FIXTURES_HPP
