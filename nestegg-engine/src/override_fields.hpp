#ifndef NESTEGG_OVERRIDE_FIELDS_HPP
#define NESTEGG_OVERRIDE_FIELDS_HPP

#include "decimal.hpp"
#include "entities.hpp"
#include "rate_resolver.hpp"
#include "scenario.hpp"
#include <optional>
#include <string>
#include <variant>

namespace nestegg {

// Overridable fields, one closed set per target kind

enum class AssetField : uint8_t {
    Value,
    IncludeInNestEgg,
    Name,
    Category,
    Owner,
    GrowthRate,     // switches the config to OVERRIDE
    GrowthType      // only "default" is accepted
};

enum class LiabilityField : uint8_t {
    Value,
    InterestRate,   // nullable: null makes the liability static
    IncludeInNestEgg,
    Name,
    Category,
    Owner
};

enum class FlowField : uint8_t {
    Type,
    AnnualAmount,
    StartYear,
    EndYear,        // nullable
    ApplyInflation,
    Name,
    Owner
};

enum class IncomeField : uint8_t {
    AnnualIncome,
    StartAge,
    EndAge,         // nullable
    ApplyInflation,
    IncludeInNestEgg,
    GrowthRate,
    Name,
    Owner
};

// Coerced override value. The alternative held always matches the field's
// native type; type_override() guarantees it.
using FieldValue = std::variant<Decimal,
                                std::optional<Decimal>,
                                bool,
                                int,
                                std::optional<int>,
                                std::string,
                                Owner,
                                FlowType,
                                GrowthType>;

template <typename Field>
struct FieldPatch {
    EntityId override_id;
    EntityId target_id;
    Field field;
    FieldValue value;
};

using AssetPatch = FieldPatch<AssetField>;
using LiabilityPatch = FieldPatch<LiabilityField>;
using FlowPatch = FieldPatch<FlowField>;
using IncomePatch = FieldPatch<IncomeField>;

struct Removal {
    EntityId override_id;
    OverrideTarget target;
    EntityId target_id;
};

using TypedOverride = std::variant<AssetPatch, LiabilityPatch, FlowPatch, IncomePatch, Removal>;

/**
 * Type a stored override: look up its field in the target kind's field set
 * and coerce the text value to the field's native type.
 *
 * Throws UnknownOverrideField when the field is not overridable for the
 * target kind, IncompleteEntity when the value does not coerce.
 */
TypedOverride type_override(const Override& o);

void apply_patch(Asset& asset, const AssetPatch& patch);
void apply_patch(Liability& liability, const LiabilityPatch& patch);
void apply_patch(ScheduledFlow& flow, const FlowPatch& patch);
void apply_patch(RetirementIncomeStream& income, const IncomePatch& patch);

std::optional<AssetField> parse_asset_field(const std::string& name);
std::optional<LiabilityField> parse_liability_field(const std::string& name);
std::optional<FlowField> parse_flow_field(const std::string& name);
std::optional<IncomeField> parse_income_field(const std::string& name);

// Token sets (case-insensitive)
//   true:  true 1 yes y on
//   false: false 0 no n off
//   null:  "" null none
std::optional<bool> parse_truth_token(const std::string& text);
bool is_null_token(const std::string& text);

} // namespace nestegg

#endif // NESTEGG_OVERRIDE_FIELDS_HPP
