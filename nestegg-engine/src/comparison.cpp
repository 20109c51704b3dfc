#include "comparison.hpp"
#include "logger.hpp"
#include "override_resolver.hpp"
#include <chrono>
#include <exception>
#include <stdexcept>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace nestegg {

// ============================================================================
// ScenarioSeries / ComparisonConfig / ComparisonResult
// ============================================================================

ScenarioSeries::ScenarioSeries()
    : scenario_id(0), is_base(false), failed(false) {}

ComparisonConfig::ComparisonConfig()
    : parallel(true), stop_on_error(true), detailed(false) {}

ComparisonResult::ComparisonResult()
    : scenarios_failed(0), detailed(false), execution_time_ms(0.0) {}

const ScenarioSeries& ComparisonResult::base() const {
    if (series.empty() || !series.front().is_base) {
        throw std::logic_error("Comparison has no base series");
    }
    return series.front();
}

const ScenarioSeries* ComparisonResult::find(const std::string& name) const {
    for (const auto& s : series) {
        if (s.name == name) {
            return &s;
        }
    }
    return nullptr;
}

// ============================================================================
// Single runs
// ============================================================================

namespace {

ProjectionResult run(const Household& household, const Plan& plan,
                     const EffectiveEntitySet& set, const ProjectionConfig& config) {
    Logger& logger = Logger::get_instance();

    TimeResolver time(household, plan);
    const ProjectionWindow window = time.window(set.assumptions);
    logger.log_window_resolved(set.label, window);

    ProjectionResult result = project(set, window, time, config);
    logger.log_projection_complete(result);
    return result;
}

} // anonymous namespace

ProjectionResult project_base_case(const Household& household, const Plan& plan,
                                   const ProjectionConfig& config) {
    return run(household, plan, resolve(plan.base_facts, std::vector<Override>()), config);
}

ProjectionResult project_scenario(const Household& household, const Plan& plan,
                                  const Scenario& scenario, const ProjectionConfig& config) {
    EffectiveEntitySet set = resolve(plan.base_facts, scenario);
    Logger::get_instance().log_scenario_resolved(scenario, summarize_overrides(scenario.overrides),
                                                 set.entities.size());
    return run(household, plan, set, config);
}

std::vector<YearDelta> compute_deltas(const ProjectionResult& base, const ProjectionResult& scenario) {
    if (base.years.size() != scenario.years.size()) {
        throw std::logic_error("Series '" + scenario.label + "' is not aligned with '" + base.label + "'");
    }

    std::vector<YearDelta> deltas;
    deltas.reserve(base.years.size());
    for (size_t i = 0; i < base.years.size(); ++i) {
        YearDelta delta;
        delta.year = scenario.years[i].year;
        delta.nest_egg = scenario.years[i].nest_egg - base.years[i].nest_egg;
        delta.net_worth = scenario.years[i].net_worth - base.years[i].net_worth;
        deltas.push_back(delta);
    }
    return deltas;
}

// ============================================================================
// Comparison Implementation
// ============================================================================

ComparisonResult compare_scenarios(
    const Household& household,
    const Plan& plan,
    const ScenarioSet& scenarios,
    const ComparisonConfig& config)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    ProjectionConfig proj_config;
    proj_config.detailed = config.detailed;

    ComparisonResult result;
    result.plan_name = plan.name;
    result.detailed = config.detailed;

    // Base case: its failure makes every delta meaningless
    ScenarioSeries base;
    base.name = "base";
    base.is_base = true;
    base.projection = project_base_case(household, plan, proj_config);
    result.window = base.projection.window;

    // One slot per scenario; a run only ever writes its own slot
    const size_t n = scenarios.size();
    std::vector<ScenarioSeries> slots(n);
    std::vector<std::exception_ptr> errors(n);

    const long long count = static_cast<long long>(n);
#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(dynamic, 1) if(config.parallel)
#endif
    for (long long i = 0; i < count; ++i) {
        const size_t s = static_cast<size_t>(i);
        const Scenario& scenario = scenarios.get(s);
        ScenarioSeries& slot = slots[s];
        slot.name = scenario.name;
        slot.scenario_id = scenario.scenario_id;
        slot.overrides = summarize_overrides(scenario.overrides);
        try {
            slot.projection = project_scenario(household, plan, scenario, proj_config);
        } catch (const std::exception& e) {
            errors[s] = std::current_exception();
            slot.failed = true;
            slot.error = e.what();
        }
    }

    result.series.reserve(n + 1);
    result.series.push_back(std::move(base));

    for (size_t s = 0; s < n; ++s) {
        if (errors[s]) {
            if (config.stop_on_error) {
                std::rethrow_exception(errors[s]);
            }
            Logger::get_instance().log_warning("Scenario projection failed", {
                {"scenario", slots[s].name},
                {"error", slots[s].error}
            });
            ++result.scenarios_failed;
        } else {
            slots[s].deltas = compute_deltas(result.series.front().projection, slots[s].projection);
        }
        result.series.push_back(std::move(slots[s]));
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    Logger::get_instance().log_comparison_complete(result);
    return result;
}

} // namespace nestegg
