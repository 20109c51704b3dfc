#include "projection.hpp"
#include <chrono>
#include <stdexcept>

namespace nestegg {

const char* const UNCATEGORIZED = "uncategorized";

// ============================================================================
// YearlySnapshot / ProjectionConfig / ProjectionResult
// ============================================================================

YearlySnapshot::YearlySnapshot() : year(0), reference_age(0) {}

ProjectionConfig::ProjectionConfig() : detailed(false) {}

ProjectionResult::ProjectionResult() : execution_time_ms(0.0) {}

const YearlySnapshot& ProjectionResult::first_year() const {
    if (years.empty()) {
        throw std::out_of_range("Projection has no years");
    }
    return years.front();
}

const YearlySnapshot& ProjectionResult::final_year() const {
    if (years.empty()) {
        throw std::out_of_range("Projection has no years");
    }
    return years.back();
}

const YearlySnapshot* ProjectionResult::at(int year) const {
    if (years.empty() || year < years.front().year || year > years.back().year) {
        return nullptr;
    }
    return &years[static_cast<size_t>(year - years.front().year)];
}

// ============================================================================
// Projection Implementation
// ============================================================================

namespace {

std::string category_label(const std::string& category) {
    return category.empty() ? UNCATEGORIZED : category;
}

void fill_details(YearlySnapshot& snapshot, const Balances& balances,
                  const EntityCollections& entities) {
    Decimal assets = 0;
    Decimal liabilities = 0;

    for (const Asset& asset : entities.assets) {
        const Decimal& value = balances.assets.at(asset.asset_id);
        assets += value;
        snapshot.category_totals[category_label(asset.category)] += value;
    }
    for (const Liability& liability : entities.liabilities) {
        const Decimal& value = balances.liabilities.at(liability.liability_id);
        liabilities += value;
        snapshot.category_totals[category_label(liability.category)] -= value;
    }

    snapshot.total_assets = assets;
    snapshot.total_liabilities = liabilities;
    snapshot.cash = balances.nest_egg_cash + balances.other_cash;
    snapshot.activity = balances.activity;
}

} // anonymous namespace

ProjectionResult project(
    const EffectiveEntitySet& set,
    const ProjectionWindow& window,
    const TimeResolver& time,
    const ProjectionConfig& config)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    // Fail fast: every fault that depends on inputs surfaces here, before the loop
    validate_entities(set.entities);
    const ProjectionAssumptions assumptions = prepare_assumptions(set, window, time);
    const int first_age = time.reference_age(window.start_year);

    std::vector<YearlySnapshot> years;
    years.reserve(static_cast<size_t>(window.num_years()));

    Balances balances = Balances::seed(set.entities);
    for (int year = window.start_year; year <= window.end_year; ++year) {
        balances = advance(balances, set.entities, year, assumptions);

        YearlySnapshot snapshot;
        snapshot.year = year;
        snapshot.reference_age = first_age + (year - window.start_year);
        snapshot.nest_egg = balances.nest_egg_total;
        snapshot.net_worth = balances.net_worth_total;
        if (config.detailed) {
            fill_details(snapshot, balances, set.entities);
        }
        years.push_back(std::move(snapshot));
    }

    ProjectionResult result;
    result.label = set.label;
    result.window = window;
    result.years = std::move(years);

    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();
    return result;
}

} // namespace nestegg
