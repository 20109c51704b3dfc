#ifndef NESTEGG_ENTITIES_HPP
#define NESTEGG_ENTITIES_HPP

#include "decimal.hpp"
#include "rate_resolver.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace nestegg {

using EntityId = uint64_t;

enum class Owner : uint8_t {
    Person1 = 0,
    Person2 = 1,
    Joint = 2
};

enum class FlowType : uint8_t {
    Inflow = 0,
    Outflow = 1
};

// Assets grow; they never carry an interest rate
struct Asset {
    EntityId asset_id = 0;
    std::string name;
    std::string category;
    Owner owner = Owner::Joint;
    Decimal value;                      // As of plan creation
    bool include_in_nest_egg = true;
    GrowthConfig growth;

    bool operator==(const Asset& other) const;
};

// Liabilities accrue interest at a fixed rate, or stay static without one
struct Liability {
    EntityId liability_id = 0;
    std::string name;
    std::string category;
    Owner owner = Owner::Joint;
    Decimal value;
    std::optional<Decimal> interest_rate;
    bool include_in_nest_egg = true;

    bool operator==(const Liability& other) const;
};

// Discrete inflow/outflow between two calendar years (inheritance, tuition)
struct ScheduledFlow {
    EntityId flow_id = 0;
    std::string name;
    Owner owner = Owner::Joint;
    FlowType type = FlowType::Inflow;
    Decimal annual_amount;
    int start_year = 0;
    std::optional<int> end_year;        // nullopt: through the plan's end year
    bool apply_inflation = false;

    bool is_active(int year) const;
    bool operator==(const ScheduledFlow& other) const;
};

// Age-gated income (Social Security, pension, deferred comp)
struct RetirementIncomeStream {
    EntityId income_id = 0;
    std::string name;
    Owner owner = Owner::Person1;
    Decimal annual_income;
    int start_age = 0;
    std::optional<int> end_age;         // nullopt: lifetime
    bool apply_inflation = false;
    bool include_in_nest_egg = true;
    std::optional<GrowthConfig> growth; // nullopt: the amount does not grow

    bool operator==(const RetirementIncomeStream& other) const;
};

struct EntityCollections {
    std::vector<Asset> assets;
    std::vector<Liability> liabilities;
    std::vector<ScheduledFlow> flows;
    std::vector<RetirementIncomeStream> income_streams;

    const Asset* find_asset(EntityId id) const;
    const Liability* find_liability(EntityId id) const;
    const ScheduledFlow* find_flow(EntityId id) const;
    const RetirementIncomeStream* find_income(EntityId id) const;

    size_t size() const;
    bool operator==(const EntityCollections& other) const;
};

// Checks what the type system cannot: unique ids per kind, year/age ordering,
// well formed stepwise configs. Throws IncompleteEntity or OverlappingIntervals.
void validate_entities(const EntityCollections& entities);

std::string owner_to_string(Owner owner);
Owner parse_owner(const std::string& text);            // throws std::invalid_argument

std::string flow_type_to_string(FlowType type);
FlowType parse_flow_type(const std::string& text);     // throws std::invalid_argument

} // namespace nestegg

#endif // NESTEGG_ENTITIES_HPP
