#ifndef NESTEGG_ASSUMPTIONS_HPP
#define NESTEGG_ASSUMPTIONS_HPP

#include "decimal.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace nestegg {

enum class PersonSelector : uint8_t {
    Person1 = 1,
    Person2 = 2
};

// Plan-level global assumptions. There is deliberately no retirement spending
// here: spending only exists on a scenario.
struct BaseAssumptions {
    Decimal default_growth_rate;
    Decimal inflation_rate;
    std::optional<int> retirement_age_1;
    std::optional<int> retirement_age_2;
    std::optional<int> final_age_1;
    std::optional<int> final_age_2;
    PersonSelector final_age_selector = PersonSelector::Person1;

    std::optional<int> retirement_age(PersonSelector person) const;
    std::optional<int> final_age(PersonSelector person) const;
};

// Subset of the base assumptions a scenario may replace. Final ages are not
// overridable: every scenario shares the plan's window.
struct ScenarioAssumptions {
    std::optional<Decimal> default_growth_rate;
    std::optional<Decimal> inflation_rate;
    std::optional<int> retirement_age_1;
    std::optional<int> retirement_age_2;

    bool empty() const;
};

// Assumptions in force for one evaluation (base case or a scenario)
struct EffectiveAssumptions {
    Decimal default_growth_rate;
    Decimal inflation_rate;
    std::optional<int> retirement_age_1;
    std::optional<int> retirement_age_2;
    Decimal annual_retirement_spending;   // zero for the base case

    std::optional<int> retirement_age(PersonSelector person) const;
};

// Field-by-field merge: scenario value when present, base value otherwise
EffectiveAssumptions merge_assumptions(const BaseAssumptions& base,
                                       const ScenarioAssumptions& scenario,
                                       const Decimal& annual_retirement_spending);

EffectiveAssumptions base_case_assumptions(const BaseAssumptions& base);

std::string person_to_string(PersonSelector person);
PersonSelector parse_person_selector(const std::string& text);  // throws std::invalid_argument

} // namespace nestegg

#endif // NESTEGG_ASSUMPTIONS_HPP
