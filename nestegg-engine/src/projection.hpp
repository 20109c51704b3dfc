#ifndef NESTEGG_PROJECTION_HPP
#define NESTEGG_PROJECTION_HPP

#include "decimal.hpp"
#include "override_resolver.hpp"
#include "time_resolver.hpp"
#include "transition.hpp"
#include <map>
#include <string>
#include <vector>

namespace nestegg {

// Year-end values for one year of a projection
struct YearlySnapshot {
    int year;
    int reference_age;              // Reference person's age during `year`
    Decimal nest_egg;
    Decimal net_worth;

    // Populated only for detailed projections
    Decimal total_assets;
    Decimal total_liabilities;
    Decimal cash;                   // Both cash pools
    YearActivity activity;
    std::map<std::string, Decimal> category_totals;  // Assets add, liabilities subtract

    YearlySnapshot();
};

// Configuration options for projection
struct ProjectionConfig {
    bool detailed;                  // If true, populate totals, activity and categories

    ProjectionConfig();
};

// Result of projecting one effective entity set over a window
struct ProjectionResult {
    std::string label;
    ProjectionWindow window;
    std::vector<YearlySnapshot> years;  // start_year..end_year, one per year
    double execution_time_ms;

    const YearlySnapshot& first_year() const;
    const YearlySnapshot& final_year() const;
    const YearlySnapshot* at(int year) const;

    ProjectionResult();
};

// Project an effective entity set over the window
//
// The projection logic:
// - Seed balances from each entity's stored value
// - For every year from start_year to end_year inclusive, run advance() on the
//   prior year's balances (the first year already compounds)
// - Record nest egg and net worth per year
//
// Deterministic: identical inputs give identical series. Any fault aborts the
// whole call and no partial series is returned.
ProjectionResult project(
    const EffectiveEntitySet& set,
    const ProjectionWindow& window,
    const TimeResolver& time,
    const ProjectionConfig& config = ProjectionConfig()
);

// Category label used for assets and liabilities without one
extern const char* const UNCATEGORIZED;

} // namespace nestegg

#endif // NESTEGG_PROJECTION_HPP
