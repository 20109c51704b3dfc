#ifndef NESTEGG_TIME_RESOLVER_HPP
#define NESTEGG_TIME_RESOLVER_HPP

#include "assumptions.hpp"
#include "entities.hpp"
#include "plan.hpp"
#include <map>

namespace nestegg {

// Age attained during the calendar year (no partial years)
int age_for_year(const BirthDate& dob, int year);
int year_for_age(const BirthDate& dob, int age);

// year -> age for every year in [start_year, end_year]
std::map<int, int> age_table(const BirthDate& dob, int start_year, int end_year);

/**
 * Fixed projection window shared by a plan's base case and all of its
 * scenarios. Invariant: start_year < retirement_year < end_year.
 */
struct ProjectionWindow {
    int start_year;
    int retirement_year;
    int end_year;

    ProjectionWindow();
    ProjectionWindow(int start, int retirement, int end);  // throws InvalidWindow

    int num_years() const { return end_year - start_year + 1; }
    bool contains(int year) const { return start_year <= year && year <= end_year; }
};

/**
 * Converts between birth dates, ages and calendar years for one household
 * and plan. The plan creation year is the only time anchor; there is no
 * clock access.
 */
class TimeResolver {
public:
    TimeResolver(const Household& household, const Plan& plan);

    // Throws IncompleteEntity when the person is missing from the household
    const BirthDate& birth_date(PersonSelector person) const;

    // Birth date gating an entity's ages; joint ownership uses the reference person
    const BirthDate& birth_date_for(Owner owner) const;

    bool has_person(PersonSelector person) const;

    int reference_age(int year) const;
    int year_for_owner_age(Owner owner, int age) const;

    // Window for the plan's base assumptions
    ProjectionWindow window() const;

    // Same start and end year, retirement year from the effective retirement ages
    ProjectionWindow window(const EffectiveAssumptions& assumptions) const;

    PersonSelector reference_person() const { return reference_person_; }

private:
    int retirement_year(std::optional<int> retirement_age) const;
    int end_year() const;

    const Household& household_;
    const Plan& plan_;
    PersonSelector reference_person_;
};

// Window for the plan's base case
ProjectionWindow projection_window(const Household& household, const Plan& plan);

} // namespace nestegg

#endif // NESTEGG_TIME_RESOLVER_HPP
