#include "override_resolver.hpp"
#include "errors.hpp"
#include "override_fields.hpp"
#include <algorithm>
#include <set>
#include <utility>

namespace nestegg {

namespace {

using TargetKey = std::pair<OverrideTarget, EntityId>;

bool target_exists(const EntityCollections& entities, OverrideTarget target, EntityId id) {
    switch (target) {
        case OverrideTarget::Asset: return entities.find_asset(id) != nullptr;
        case OverrideTarget::Liability: return entities.find_liability(id) != nullptr;
        case OverrideTarget::ScheduledFlow: return entities.find_flow(id) != nullptr;
        case OverrideTarget::RetirementIncome: return entities.find_income(id) != nullptr;
    }
    return false;
}

template <typename T, typename IdFn>
T& find_mutable(std::vector<T>& items, EntityId id, IdFn id_of) {
    auto it = std::find_if(items.begin(), items.end(), [&](const T& item) {
        return id_of(item) == id;
    });
    // Existence was checked against the same collection before any patch ran
    return *it;
}

template <typename T, typename IdFn>
void erase_removed(std::vector<T>& items, OverrideTarget target,
                   const std::set<TargetKey>& removed, IdFn id_of) {
    items.erase(std::remove_if(items.begin(), items.end(), [&](const T& item) {
        return removed.count(TargetKey(target, id_of(item))) > 0;
    }), items.end());
}

// Applies one typed override to the working copy; removals were collected up front
struct PatchVisitor {
    EntityCollections& entities;
    const std::set<TargetKey>& removed;

    void operator()(const AssetPatch& p) const {
        if (removed.count(TargetKey(OverrideTarget::Asset, p.target_id))) return;
        apply_patch(find_mutable(entities.assets, p.target_id,
                                 [](const Asset& a) { return a.asset_id; }), p);
    }

    void operator()(const LiabilityPatch& p) const {
        if (removed.count(TargetKey(OverrideTarget::Liability, p.target_id))) return;
        apply_patch(find_mutable(entities.liabilities, p.target_id,
                                 [](const Liability& l) { return l.liability_id; }), p);
    }

    void operator()(const FlowPatch& p) const {
        if (removed.count(TargetKey(OverrideTarget::ScheduledFlow, p.target_id))) return;
        apply_patch(find_mutable(entities.flows, p.target_id,
                                 [](const ScheduledFlow& f) { return f.flow_id; }), p);
    }

    void operator()(const IncomePatch& p) const {
        if (removed.count(TargetKey(OverrideTarget::RetirementIncome, p.target_id))) return;
        apply_patch(find_mutable(entities.income_streams, p.target_id,
                                 [](const RetirementIncomeStream& r) { return r.income_id; }), p);
    }

    void operator()(const Removal&) const {}
};

} // anonymous namespace

EntityCollections resolve_entities(const EntityCollections& base,
                                   const std::vector<Override>& overrides) {
    // Type and check every override before touching anything
    std::vector<TypedOverride> typed;
    typed.reserve(overrides.size());
    std::set<TargetKey> removed;

    for (const Override& o : overrides) {
        typed.push_back(type_override(o));
        if (!target_exists(base, o.target, o.target_id)) {
            throw DanglingOverrideReference(o.override_id, override_target_to_string(o.target),
                                            o.target_id);
        }
        if (o.remove) {
            removed.insert(TargetKey(o.target, o.target_id));
        }
    }

    EntityCollections effective = base;

    PatchVisitor visitor{effective, removed};
    for (const TypedOverride& t : typed) {
        std::visit(visitor, t);
    }

    erase_removed(effective.assets, OverrideTarget::Asset, removed,
                  [](const Asset& a) { return a.asset_id; });
    erase_removed(effective.liabilities, OverrideTarget::Liability, removed,
                  [](const Liability& l) { return l.liability_id; });
    erase_removed(effective.flows, OverrideTarget::ScheduledFlow, removed,
                  [](const ScheduledFlow& f) { return f.flow_id; });
    erase_removed(effective.income_streams, OverrideTarget::RetirementIncome, removed,
                  [](const RetirementIncomeStream& r) { return r.income_id; });

    validate_entities(effective);
    return effective;
}

EffectiveEntitySet resolve(const BaseFacts& base_facts, const std::vector<Override>& overrides) {
    EffectiveEntitySet result;
    result.label = "base";
    result.entities = resolve_entities(base_facts.entities, overrides);
    result.assumptions = base_case_assumptions(base_facts.assumptions);
    return result;
}

EffectiveEntitySet resolve(const BaseFacts& base_facts, const Scenario& scenario) {
    if (scenario.annual_retirement_spending < 0) {
        throw IncompleteEntity(describe_entity("scenario", scenario.scenario_id),
                               "annual_retirement_spending", "negative spending");
    }

    EffectiveEntitySet result;
    result.label = scenario.name;
    result.entities = resolve_entities(base_facts.entities, scenario.overrides);
    result.assumptions = merge_assumptions(base_facts.assumptions, scenario.assumptions,
                                           scenario.annual_retirement_spending);
    return result;
}

} // namespace nestegg
