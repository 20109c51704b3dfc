#include "assumptions.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace nestegg {

std::optional<int> BaseAssumptions::retirement_age(PersonSelector person) const {
    return person == PersonSelector::Person1 ? retirement_age_1 : retirement_age_2;
}

std::optional<int> BaseAssumptions::final_age(PersonSelector person) const {
    return person == PersonSelector::Person1 ? final_age_1 : final_age_2;
}

bool ScenarioAssumptions::empty() const {
    return !default_growth_rate && !inflation_rate && !retirement_age_1 && !retirement_age_2;
}

std::optional<int> EffectiveAssumptions::retirement_age(PersonSelector person) const {
    return person == PersonSelector::Person1 ? retirement_age_1 : retirement_age_2;
}

EffectiveAssumptions merge_assumptions(const BaseAssumptions& base,
                                       const ScenarioAssumptions& scenario,
                                       const Decimal& annual_retirement_spending) {
    EffectiveAssumptions effective;
    effective.default_growth_rate = scenario.default_growth_rate.value_or(base.default_growth_rate);
    effective.inflation_rate = scenario.inflation_rate.value_or(base.inflation_rate);
    effective.retirement_age_1 = scenario.retirement_age_1 ? scenario.retirement_age_1 : base.retirement_age_1;
    effective.retirement_age_2 = scenario.retirement_age_2 ? scenario.retirement_age_2 : base.retirement_age_2;
    effective.annual_retirement_spending = annual_retirement_spending;
    return effective;
}

EffectiveAssumptions base_case_assumptions(const BaseAssumptions& base) {
    return merge_assumptions(base, ScenarioAssumptions(), Decimal(0));
}

std::string person_to_string(PersonSelector person) {
    return person == PersonSelector::Person1 ? "person1" : "person2";
}

PersonSelector parse_person_selector(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "1" || lower == "person1") return PersonSelector::Person1;
    if (lower == "2" || lower == "person2") return PersonSelector::Person2;
    throw std::invalid_argument("Unknown person selector: '" + text + "'");
}

} // namespace nestegg
