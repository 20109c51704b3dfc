#ifndef NESTEGG_TRANSITION_HPP
#define NESTEGG_TRANSITION_HPP

#include "decimal.hpp"
#include "entities.hpp"
#include "override_resolver.hpp"
#include "time_resolver.hpp"
#include <map>
#include <optional>

namespace nestegg {

// Inclusive calendar-year range; end_year == nullopt means open-ended
struct YearRange {
    int start_year = 0;
    std::optional<int> end_year;

    bool contains(int year) const;
};

// Everything advance() needs besides the entities, resolved once per run so
// the year loop never touches birth dates or merges assumptions
struct ProjectionAssumptions {
    Decimal default_growth_rate;
    Decimal inflation_rate;
    Decimal annual_retirement_spending;
    int retirement_year = 0;
    std::map<EntityId, YearRange> income_years;     // age gates converted to years
};

/**
 * Resolve the per-run inputs of the transition function. Income age gates are
 * converted to years through the owner's birth date (joint streams use the
 * reference person).
 *
 * Throws IncompleteEntity when an income stream's owner has no birth date or
 * when spending is negative.
 */
ProjectionAssumptions prepare_assumptions(const EffectiveEntitySet& set,
                                          const ProjectionWindow& window,
                                          const TimeResolver& time);

// Amounts applied during one year, all rounded to cents
struct YearActivity {
    Decimal inflows;
    Decimal outflows;
    Decimal retirement_income;
    Decimal retirement_spending;
    Decimal growth;                 // assets and both cash pools
    Decimal liability_interest;
};

/**
 * Year-end state. Flows, nest-egg income and spending settle in the nest-egg
 * cash pool; income excluded from the nest egg settles in other cash. Both
 * pools start at zero and can go negative.
 */
struct Balances {
    std::map<EntityId, Decimal> assets;
    std::map<EntityId, Decimal> liabilities;
    Decimal nest_egg_cash;
    Decimal other_cash;
    Decimal nest_egg_total;
    Decimal net_worth_total;
    YearActivity activity;

    // Stored values of every entity, empty pools, totals summed
    static Balances seed(const EntityCollections& entities);
};

/**
 * One year of the projection, in fixed order:
 *   1. scheduled inflows      (inflated from the flow's start year)
 *   2. scheduled outflows
 *   3. retirement income      (grown and inflated from the stream's start year)
 *   4. retirement spending    (from retirement_year, inflated from it)
 *   5. asset growth           (effective rate per asset, default rate for cash)
 *   6. liability interest     (static when no rate)
 *   7. nest egg and net worth totals
 *
 * Pure: `prior` is not modified.
 */
Balances advance(const Balances& prior,
                 const EntityCollections& entities,
                 int year,
                 const ProjectionAssumptions& assumptions);

// Income amount for `year` before inflation: annual_income compounded once per
// elapsed year since start_year when the stream has a growth config
Decimal grown_income(const RetirementIncomeStream& income, int start_year, int year,
                     const Decimal& default_growth_rate);

} // namespace nestegg

#endif // NESTEGG_TRANSITION_HPP
