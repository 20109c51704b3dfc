#include "entities.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>

namespace nestegg {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

template <typename T, typename IdFn>
const T* find_by_id(const std::vector<T>& items, EntityId id, IdFn id_of) {
    auto it = std::find_if(items.begin(), items.end(), [&](const T& item) {
        return id_of(item) == id;
    });
    return it == items.end() ? nullptr : &(*it);
}

template <typename T, typename IdFn>
void check_unique_ids(const std::vector<T>& items, const std::string& kind, IdFn id_of) {
    std::set<EntityId> seen;
    for (const T& item : items) {
        if (!seen.insert(id_of(item)).second) {
            throw IncompleteEntity(describe_entity(kind, id_of(item)), "id", "duplicate id");
        }
    }
}

} // anonymous namespace

// ============================================================================
// Entity comparisons
// ============================================================================

bool Asset::operator==(const Asset& other) const {
    return asset_id == other.asset_id &&
           name == other.name &&
           category == other.category &&
           owner == other.owner &&
           value == other.value &&
           include_in_nest_egg == other.include_in_nest_egg &&
           growth == other.growth;
}

bool Liability::operator==(const Liability& other) const {
    return liability_id == other.liability_id &&
           name == other.name &&
           category == other.category &&
           owner == other.owner &&
           value == other.value &&
           interest_rate == other.interest_rate &&
           include_in_nest_egg == other.include_in_nest_egg;
}

bool ScheduledFlow::is_active(int year) const {
    return start_year <= year && (!end_year || year <= *end_year);
}

bool ScheduledFlow::operator==(const ScheduledFlow& other) const {
    return flow_id == other.flow_id &&
           name == other.name &&
           owner == other.owner &&
           type == other.type &&
           annual_amount == other.annual_amount &&
           start_year == other.start_year &&
           end_year == other.end_year &&
           apply_inflation == other.apply_inflation;
}

bool RetirementIncomeStream::operator==(const RetirementIncomeStream& other) const {
    return income_id == other.income_id &&
           name == other.name &&
           owner == other.owner &&
           annual_income == other.annual_income &&
           start_age == other.start_age &&
           end_age == other.end_age &&
           apply_inflation == other.apply_inflation &&
           include_in_nest_egg == other.include_in_nest_egg &&
           growth == other.growth;
}

// ============================================================================
// EntityCollections Implementation
// ============================================================================

const Asset* EntityCollections::find_asset(EntityId id) const {
    return find_by_id(assets, id, [](const Asset& a) { return a.asset_id; });
}

const Liability* EntityCollections::find_liability(EntityId id) const {
    return find_by_id(liabilities, id, [](const Liability& l) { return l.liability_id; });
}

const ScheduledFlow* EntityCollections::find_flow(EntityId id) const {
    return find_by_id(flows, id, [](const ScheduledFlow& f) { return f.flow_id; });
}

const RetirementIncomeStream* EntityCollections::find_income(EntityId id) const {
    return find_by_id(income_streams, id, [](const RetirementIncomeStream& r) { return r.income_id; });
}

size_t EntityCollections::size() const {
    return assets.size() + liabilities.size() + flows.size() + income_streams.size();
}

bool EntityCollections::operator==(const EntityCollections& other) const {
    return assets == other.assets &&
           liabilities == other.liabilities &&
           flows == other.flows &&
           income_streams == other.income_streams;
}

// ============================================================================
// Validation
// ============================================================================

void validate_entities(const EntityCollections& entities) {
    check_unique_ids(entities.assets, "asset", [](const Asset& a) { return a.asset_id; });
    check_unique_ids(entities.liabilities, "liability", [](const Liability& l) { return l.liability_id; });
    check_unique_ids(entities.flows, "flow", [](const ScheduledFlow& f) { return f.flow_id; });
    check_unique_ids(entities.income_streams, "income", [](const RetirementIncomeStream& r) { return r.income_id; });

    for (const Asset& asset : entities.assets) {
        if (asset.growth.type() == GrowthType::Stepwise) {
            validate_intervals(asset.growth.intervals(), describe_entity("asset", asset.asset_id));
        }
    }

    for (const ScheduledFlow& flow : entities.flows) {
        if (flow.end_year && *flow.end_year < flow.start_year) {
            throw IncompleteEntity(describe_entity("flow", flow.flow_id), "end_year",
                                   "end_year " + std::to_string(*flow.end_year) +
                                   " precedes start_year " + std::to_string(flow.start_year));
        }
    }

    for (const RetirementIncomeStream& income : entities.income_streams) {
        const std::string entity = describe_entity("income", income.income_id);
        if (income.start_age < 0) {
            throw IncompleteEntity(entity, "start_age", "negative age");
        }
        if (income.end_age && *income.end_age < income.start_age) {
            throw IncompleteEntity(entity, "end_age",
                                   "end_age " + std::to_string(*income.end_age) +
                                   " precedes start_age " + std::to_string(income.start_age));
        }
        if (income.growth && income.growth->type() == GrowthType::Stepwise) {
            validate_intervals(income.growth->intervals(), entity);
        }
    }
}

// ============================================================================
// Enum conversions
// ============================================================================

std::string owner_to_string(Owner owner) {
    switch (owner) {
        case Owner::Person1: return "person1";
        case Owner::Person2: return "person2";
        case Owner::Joint: return "joint";
        default: return "unknown";
    }
}

Owner parse_owner(const std::string& text) {
    const std::string lower = to_lower(text);
    if (lower == "person1" || lower == "1") return Owner::Person1;
    if (lower == "person2" || lower == "2") return Owner::Person2;
    if (lower == "joint") return Owner::Joint;
    throw std::invalid_argument("Unknown owner: '" + text + "'");
}

std::string flow_type_to_string(FlowType type) {
    return type == FlowType::Inflow ? "inflow" : "outflow";
}

FlowType parse_flow_type(const std::string& text) {
    const std::string lower = to_lower(text);
    if (lower == "inflow") return FlowType::Inflow;
    if (lower == "outflow") return FlowType::Outflow;
    throw std::invalid_argument("Unknown flow type: '" + text + "'");
}

} // namespace nestegg
