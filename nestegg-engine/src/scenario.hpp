#ifndef NESTEGG_SCENARIO_HPP
#define NESTEGG_SCENARIO_HPP

#include "assumptions.hpp"
#include "decimal.hpp"
#include "entities.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace nestegg {

enum class OverrideTarget : uint8_t {
    Asset = 0,
    Liability = 1,
    ScheduledFlow = 2,
    RetirementIncome = 3
};

// One scenario-scoped patch as it is stored: a (field, text value) pair on a
// target entity, or a removal marker for that entity. Field names and values
// are typed when the scenario is resolved.
struct Override {
    EntityId override_id = 0;
    OverrideTarget target = OverrideTarget::Asset;
    EntityId target_id = 0;
    bool remove = false;
    std::string field;
    std::string value;

    static Override patch(EntityId id, OverrideTarget target, EntityId target_id,
                          const std::string& field, const std::string& value);
    static Override removal(EntityId id, OverrideTarget target, EntityId target_id);
};

// Override layer over a plan's base facts. annual_retirement_spending only
// exists here.
struct Scenario {
    EntityId scenario_id = 0;
    std::string name;
    ScenarioAssumptions assumptions;
    Decimal annual_retirement_spending;
    std::vector<Override> overrides;
};

struct OverrideSummary {
    size_t total = 0;
    size_t removals = 0;
    std::map<OverrideTarget, size_t> by_target;
};

OverrideSummary summarize_overrides(const std::vector<Override>& overrides);

// Scenarios of one plan, in the order they were defined
class ScenarioSet {
public:
    ScenarioSet();

    void add(const Scenario& scenario);
    void add(Scenario&& scenario);

    const Scenario& get(size_t index) const;
    const Scenario* find(const std::string& name) const;
    size_t size() const;
    bool empty() const;

    const std::vector<Scenario>& scenarios() const { return scenarios_; }

    // Subset in the requested order; throws std::invalid_argument on an unknown name
    ScenarioSet select(const std::vector<std::string>& names) const;

private:
    std::vector<Scenario> scenarios_;
};

std::string override_target_to_string(OverrideTarget target);
OverrideTarget parse_override_target(const std::string& text);  // throws std::invalid_argument

} // namespace nestegg

#endif // NESTEGG_SCENARIO_HPP
