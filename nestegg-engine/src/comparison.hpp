#ifndef NESTEGG_COMPARISON_HPP
#define NESTEGG_COMPARISON_HPP

#include "plan.hpp"
#include "projection.hpp"
#include "scenario.hpp"
#include "time_resolver.hpp"
#include <string>
#include <vector>

namespace nestegg {

// Scenario minus base for one year
struct YearDelta {
    int year;
    Decimal nest_egg;
    Decimal net_worth;
};

// One run of the comparison: the base case or one scenario
struct ScenarioSeries {
    std::string name;
    EntityId scenario_id;               // 0 for the base case
    bool is_base;
    OverrideSummary overrides;
    ProjectionResult projection;
    std::vector<YearDelta> deltas;      // Empty for the base case and failed runs

    // Set only when ComparisonConfig::stop_on_error is false
    bool failed;
    std::string error;

    ScenarioSeries();
};

// Configuration options for comparison
struct ComparisonConfig {
    bool parallel;                      // Run scenarios on OpenMP threads when available
    bool stop_on_error;                 // Rethrow the first scenario failure (input order)
    bool detailed;                      // Detailed snapshots in every series

    ComparisonConfig();
};

// Base case first, then scenarios in input order, all over the plan's window
struct ComparisonResult {
    std::string plan_name;
    ProjectionWindow window;            // Base case window
    std::vector<ScenarioSeries> series;
    int scenarios_failed;
    bool detailed;                      // Snapshots carry totals, activity and categories
    double execution_time_ms;

    const ScenarioSeries& base() const;
    const ScenarioSeries* find(const std::string& name) const;

    ComparisonResult();
};

// Project the base case and every scenario of a plan
//
// For each run:
//   1. Resolve the effective entity set (base: no overrides)
//   2. Resolve its window: plan start and end year, retirement year from the
//      run's effective retirement ages
//   3. Project it
// Then compute per-year deltas of every scenario against the base.
//
// Runs only read the household and plan, and each writes its own slot, so
// scenarios may run in parallel. A base case failure is always rethrown.
ComparisonResult compare_scenarios(
    const Household& household,
    const Plan& plan,
    const ScenarioSet& scenarios,
    const ComparisonConfig& config = ComparisonConfig()
);

// Single run helpers used by compare_scenarios and the CLI
ProjectionResult project_base_case(const Household& household, const Plan& plan,
                                   const ProjectionConfig& config = ProjectionConfig());
ProjectionResult project_scenario(const Household& household, const Plan& plan,
                                  const Scenario& scenario,
                                  const ProjectionConfig& config = ProjectionConfig());

std::vector<YearDelta> compute_deltas(const ProjectionResult& base, const ProjectionResult& scenario);

} // namespace nestegg

#endif // NESTEGG_COMPARISON_HPP
