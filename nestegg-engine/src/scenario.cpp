#include "scenario.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace nestegg {

// ============================================================================
// Override Implementation
// ============================================================================

Override Override::patch(EntityId id, OverrideTarget target, EntityId target_id,
                         const std::string& field, const std::string& value) {
    Override o;
    o.override_id = id;
    o.target = target;
    o.target_id = target_id;
    o.remove = false;
    o.field = field;
    o.value = value;
    return o;
}

Override Override::removal(EntityId id, OverrideTarget target, EntityId target_id) {
    Override o;
    o.override_id = id;
    o.target = target;
    o.target_id = target_id;
    o.remove = true;
    return o;
}

OverrideSummary summarize_overrides(const std::vector<Override>& overrides) {
    OverrideSummary summary;
    summary.total = overrides.size();
    for (const auto& o : overrides) {
        ++summary.by_target[o.target];
        if (o.remove) {
            ++summary.removals;
        }
    }
    return summary;
}

// ============================================================================
// ScenarioSet Implementation
// ============================================================================

ScenarioSet::ScenarioSet() = default;

void ScenarioSet::add(const Scenario& scenario) {
    scenarios_.push_back(scenario);
}

void ScenarioSet::add(Scenario&& scenario) {
    scenarios_.push_back(std::move(scenario));
}

const Scenario& ScenarioSet::get(size_t index) const {
    if (index >= scenarios_.size()) {
        throw std::out_of_range("Scenario index out of range");
    }
    return scenarios_[index];
}

const Scenario* ScenarioSet::find(const std::string& name) const {
    auto it = std::find_if(scenarios_.begin(), scenarios_.end(),
                           [&name](const Scenario& s) { return s.name == name; });
    return it == scenarios_.end() ? nullptr : &(*it);
}

size_t ScenarioSet::size() const {
    return scenarios_.size();
}

bool ScenarioSet::empty() const {
    return scenarios_.empty();
}

ScenarioSet ScenarioSet::select(const std::vector<std::string>& names) const {
    ScenarioSet subset;
    for (const auto& name : names) {
        const Scenario* scenario = find(name);
        if (!scenario) {
            throw std::invalid_argument("Unknown scenario: '" + name + "'");
        }
        subset.add(*scenario);
    }
    return subset;
}

// ============================================================================
// Enum conversions
// ============================================================================

std::string override_target_to_string(OverrideTarget target) {
    switch (target) {
        case OverrideTarget::Asset: return "asset";
        case OverrideTarget::Liability: return "liability";
        case OverrideTarget::ScheduledFlow: return "flow";
        case OverrideTarget::RetirementIncome: return "income";
        default: return "unknown";
    }
}

OverrideTarget parse_override_target(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "asset") return OverrideTarget::Asset;
    if (lower == "liability") return OverrideTarget::Liability;
    if (lower == "flow" || lower == "scheduled_flow") return OverrideTarget::ScheduledFlow;
    if (lower == "income" || lower == "retirement_income") return OverrideTarget::RetirementIncome;
    throw std::invalid_argument("Unknown override target: '" + text + "'");
}

} // namespace nestegg
