#include "time_resolver.hpp"
#include "errors.hpp"

namespace nestegg {

int age_for_year(const BirthDate& dob, int year) {
    return year - dob.year;
}

int year_for_age(const BirthDate& dob, int age) {
    return dob.year + age;
}

std::map<int, int> age_table(const BirthDate& dob, int start_year, int end_year) {
    std::map<int, int> table;
    for (int year = start_year; year <= end_year; ++year) {
        table[year] = age_for_year(dob, year);
    }
    return table;
}

// ============================================================================
// ProjectionWindow Implementation
// ============================================================================

ProjectionWindow::ProjectionWindow()
    : start_year(0), retirement_year(1), end_year(2) {}

ProjectionWindow::ProjectionWindow(int start, int retirement, int end)
    : start_year(start), retirement_year(retirement), end_year(end) {
    if (retirement_year <= start_year || end_year <= retirement_year) {
        throw InvalidWindow(start_year, retirement_year, end_year);
    }
}

// ============================================================================
// TimeResolver Implementation
// ============================================================================

TimeResolver::TimeResolver(const Household& household, const Plan& plan)
    : household_(household), plan_(plan), reference_person_(plan.reference_person) {}

bool TimeResolver::has_person(PersonSelector person) const {
    return household_.person(person) != nullptr;
}

const BirthDate& TimeResolver::birth_date(PersonSelector person) const {
    const Person* p = household_.person(person);
    if (!p) {
        throw IncompleteEntity(describe_entity("household", household_.household_id),
                               person_to_string(person) + ".dob",
                               person_to_string(person) + " is not part of the household");
    }
    return p->dob;
}

const BirthDate& TimeResolver::birth_date_for(Owner owner) const {
    switch (owner) {
        case Owner::Person1: return birth_date(PersonSelector::Person1);
        case Owner::Person2: return birth_date(PersonSelector::Person2);
        case Owner::Joint:
        default:
            return birth_date(reference_person_);
    }
}

int TimeResolver::reference_age(int year) const {
    return age_for_year(birth_date(reference_person_), year);
}

int TimeResolver::year_for_owner_age(Owner owner, int age) const {
    return year_for_age(birth_date_for(owner), age);
}

int TimeResolver::retirement_year(std::optional<int> retirement_age) const {
    if (!retirement_age) {
        throw IncompleteEntity(describe_entity("plan", plan_.plan_id),
                               "retirement_age_" + std::to_string(static_cast<int>(reference_person_)),
                               "no retirement age for the reference person");
    }
    return year_for_age(birth_date(reference_person_), *retirement_age);
}

int TimeResolver::end_year() const {
    const BaseAssumptions& base = plan_.base_facts.assumptions;
    const PersonSelector selector = base.final_age_selector;
    const std::optional<int> final_age = base.final_age(selector);
    if (!final_age) {
        throw IncompleteEntity(describe_entity("plan", plan_.plan_id),
                               "final_age_" + std::to_string(static_cast<int>(selector)),
                               "no final age for " + person_to_string(selector));
    }
    return year_for_age(birth_date(selector), *final_age);
}

ProjectionWindow TimeResolver::window() const {
    return window(base_case_assumptions(plan_.base_facts.assumptions));
}

ProjectionWindow TimeResolver::window(const EffectiveAssumptions& assumptions) const {
    const int start = plan_.plan_creation_year;
    const int retirement = retirement_year(assumptions.retirement_age(reference_person_));
    return ProjectionWindow(start, retirement, end_year());
}

ProjectionWindow projection_window(const Household& household, const Plan& plan) {
    return TimeResolver(household, plan).window();
}

} // namespace nestegg
