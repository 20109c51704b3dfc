#include "override_fields.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace nestegg {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

// Context shared by every coercion failure of one override
struct CoercionContext {
    const Override& o;

    [[noreturn]] void fail(const std::string& expected) const {
        throw IncompleteEntity(describe_entity("override", o.override_id), o.field,
                               "cannot coerce '" + o.value + "' to " + expected + " for " +
                               describe_entity(override_target_to_string(o.target), o.target_id));
    }

    Decimal as_decimal() const {
        try {
            return parse_decimal(trim(o.value));
        } catch (const std::invalid_argument&) {
            fail("decimal");
        }
    }

    std::optional<Decimal> as_nullable_decimal() const {
        if (is_null_token(o.value)) return std::nullopt;
        return as_decimal();
    }

    bool as_bool() const {
        std::optional<bool> b = parse_truth_token(o.value);
        if (!b) fail("boolean");
        return *b;
    }

    int as_int() const {
        const std::string text = trim(o.value);
        size_t digits_from = (!text.empty() && (text[0] == '-' || text[0] == '+')) ? 1 : 0;
        const size_t digit_count = text.size() - digits_from;
        if (digit_count == 0 || digit_count > 9) fail("integer");
        for (size_t i = digits_from; i < text.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(text[i]))) fail("integer");
        }
        return std::stoi(text);
    }

    std::optional<int> as_nullable_int() const {
        if (is_null_token(o.value)) return std::nullopt;
        return as_int();
    }

    std::string as_text() const {
        return o.value;
    }

    Owner as_owner() const {
        try {
            return parse_owner(trim(o.value));
        } catch (const std::invalid_argument&) {
            fail("owner (person1, person2, joint)");
        }
    }

    FlowType as_flow_type() const {
        try {
            return parse_flow_type(trim(o.value));
        } catch (const std::invalid_argument&) {
            fail("flow type (inflow, outflow)");
        }
    }

    GrowthType as_default_growth_type() const {
        if (to_lower(trim(o.value)) != "default") {
            fail("growth type 'default'");
        }
        return GrowthType::Default;
    }
};

FieldValue coerce_asset(AssetField field, const CoercionContext& ctx) {
    switch (field) {
        case AssetField::Value: return ctx.as_decimal();
        case AssetField::IncludeInNestEgg: return ctx.as_bool();
        case AssetField::Name: return ctx.as_text();
        case AssetField::Category: return ctx.as_text();
        case AssetField::Owner: return ctx.as_owner();
        case AssetField::GrowthRate: return ctx.as_decimal();
        case AssetField::GrowthType: return ctx.as_default_growth_type();
    }
    throw std::logic_error("unhandled asset field");
}

FieldValue coerce_liability(LiabilityField field, const CoercionContext& ctx) {
    switch (field) {
        case LiabilityField::Value: return ctx.as_decimal();
        case LiabilityField::InterestRate: return ctx.as_nullable_decimal();
        case LiabilityField::IncludeInNestEgg: return ctx.as_bool();
        case LiabilityField::Name: return ctx.as_text();
        case LiabilityField::Category: return ctx.as_text();
        case LiabilityField::Owner: return ctx.as_owner();
    }
    throw std::logic_error("unhandled liability field");
}

FieldValue coerce_flow(FlowField field, const CoercionContext& ctx) {
    switch (field) {
        case FlowField::Type: return ctx.as_flow_type();
        case FlowField::AnnualAmount: return ctx.as_decimal();
        case FlowField::StartYear: return ctx.as_int();
        case FlowField::EndYear: return ctx.as_nullable_int();
        case FlowField::ApplyInflation: return ctx.as_bool();
        case FlowField::Name: return ctx.as_text();
        case FlowField::Owner: return ctx.as_owner();
    }
    throw std::logic_error("unhandled flow field");
}

FieldValue coerce_income(IncomeField field, const CoercionContext& ctx) {
    switch (field) {
        case IncomeField::AnnualIncome: return ctx.as_decimal();
        case IncomeField::StartAge: return ctx.as_int();
        case IncomeField::EndAge: return ctx.as_nullable_int();
        case IncomeField::ApplyInflation: return ctx.as_bool();
        case IncomeField::IncludeInNestEgg: return ctx.as_bool();
        case IncomeField::GrowthRate: return ctx.as_decimal();
        case IncomeField::Name: return ctx.as_text();
        case IncomeField::Owner: return ctx.as_owner();
    }
    throw std::logic_error("unhandled income field");
}

template <typename Field>
FieldPatch<Field> make_patch(const Override& o, std::optional<Field> field,
                             FieldValue (*coerce)(Field, const CoercionContext&)) {
    if (!field) {
        throw UnknownOverrideField(o.override_id, override_target_to_string(o.target), o.field);
    }
    CoercionContext ctx{o};
    return FieldPatch<Field>{o.override_id, o.target_id, *field, coerce(*field, ctx)};
}

} // anonymous namespace

// ============================================================================
// Token parsing
// ============================================================================

std::optional<bool> parse_truth_token(const std::string& text) {
    const std::string lower = to_lower(trim(text));
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "y" || lower == "on") {
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "no" || lower == "n" || lower == "off") {
        return false;
    }
    return std::nullopt;
}

bool is_null_token(const std::string& text) {
    const std::string lower = to_lower(trim(text));
    return lower.empty() || lower == "null" || lower == "none";
}

// ============================================================================
// Field lookup
// ============================================================================

std::optional<AssetField> parse_asset_field(const std::string& name) {
    if (name == "value") return AssetField::Value;
    if (name == "include_in_nest_egg") return AssetField::IncludeInNestEgg;
    if (name == "name") return AssetField::Name;
    if (name == "category") return AssetField::Category;
    if (name == "owner") return AssetField::Owner;
    if (name == "growth_rate") return AssetField::GrowthRate;
    if (name == "growth_type") return AssetField::GrowthType;
    return std::nullopt;
}

std::optional<LiabilityField> parse_liability_field(const std::string& name) {
    if (name == "value") return LiabilityField::Value;
    if (name == "interest_rate") return LiabilityField::InterestRate;
    if (name == "include_in_nest_egg") return LiabilityField::IncludeInNestEgg;
    if (name == "name") return LiabilityField::Name;
    if (name == "category") return LiabilityField::Category;
    if (name == "owner") return LiabilityField::Owner;
    return std::nullopt;
}

std::optional<FlowField> parse_flow_field(const std::string& name) {
    if (name == "type") return FlowField::Type;
    if (name == "annual_amount") return FlowField::AnnualAmount;
    if (name == "start_year") return FlowField::StartYear;
    if (name == "end_year") return FlowField::EndYear;
    if (name == "apply_inflation") return FlowField::ApplyInflation;
    if (name == "name") return FlowField::Name;
    if (name == "owner") return FlowField::Owner;
    return std::nullopt;
}

std::optional<IncomeField> parse_income_field(const std::string& name) {
    if (name == "annual_income") return IncomeField::AnnualIncome;
    if (name == "start_age") return IncomeField::StartAge;
    if (name == "end_age") return IncomeField::EndAge;
    if (name == "apply_inflation") return IncomeField::ApplyInflation;
    if (name == "include_in_nest_egg") return IncomeField::IncludeInNestEgg;
    if (name == "growth_rate") return IncomeField::GrowthRate;
    if (name == "name") return IncomeField::Name;
    if (name == "owner") return IncomeField::Owner;
    return std::nullopt;
}

// ============================================================================
// Typing
// ============================================================================

TypedOverride type_override(const Override& o) {
    if (o.remove) {
        return Removal{o.override_id, o.target, o.target_id};
    }

    switch (o.target) {
        case OverrideTarget::Asset:
            return make_patch<AssetField>(o, parse_asset_field(o.field), coerce_asset);
        case OverrideTarget::Liability:
            return make_patch<LiabilityField>(o, parse_liability_field(o.field), coerce_liability);
        case OverrideTarget::ScheduledFlow:
            return make_patch<FlowField>(o, parse_flow_field(o.field), coerce_flow);
        case OverrideTarget::RetirementIncome:
            return make_patch<IncomeField>(o, parse_income_field(o.field), coerce_income);
    }
    throw std::logic_error("unhandled override target");
}

// ============================================================================
// Patch application
// ============================================================================

void apply_patch(Asset& asset, const AssetPatch& patch) {
    const FieldValue& v = patch.value;
    switch (patch.field) {
        case AssetField::Value: asset.value = std::get<Decimal>(v); break;
        case AssetField::IncludeInNestEgg: asset.include_in_nest_egg = std::get<bool>(v); break;
        case AssetField::Name: asset.name = std::get<std::string>(v); break;
        case AssetField::Category: asset.category = std::get<std::string>(v); break;
        case AssetField::Owner: asset.owner = std::get<Owner>(v); break;
        case AssetField::GrowthRate: asset.growth = GrowthConfig::fixed(std::get<Decimal>(v)); break;
        case AssetField::GrowthType: asset.growth = GrowthConfig::default_rate(); break;
    }
}

void apply_patch(Liability& liability, const LiabilityPatch& patch) {
    const FieldValue& v = patch.value;
    switch (patch.field) {
        case LiabilityField::Value: liability.value = std::get<Decimal>(v); break;
        case LiabilityField::InterestRate:
            liability.interest_rate = std::get<std::optional<Decimal>>(v);
            break;
        case LiabilityField::IncludeInNestEgg: liability.include_in_nest_egg = std::get<bool>(v); break;
        case LiabilityField::Name: liability.name = std::get<std::string>(v); break;
        case LiabilityField::Category: liability.category = std::get<std::string>(v); break;
        case LiabilityField::Owner: liability.owner = std::get<Owner>(v); break;
    }
}

void apply_patch(ScheduledFlow& flow, const FlowPatch& patch) {
    const FieldValue& v = patch.value;
    switch (patch.field) {
        case FlowField::Type: flow.type = std::get<FlowType>(v); break;
        case FlowField::AnnualAmount: flow.annual_amount = std::get<Decimal>(v); break;
        case FlowField::StartYear: flow.start_year = std::get<int>(v); break;
        case FlowField::EndYear: flow.end_year = std::get<std::optional<int>>(v); break;
        case FlowField::ApplyInflation: flow.apply_inflation = std::get<bool>(v); break;
        case FlowField::Name: flow.name = std::get<std::string>(v); break;
        case FlowField::Owner: flow.owner = std::get<Owner>(v); break;
    }
}

void apply_patch(RetirementIncomeStream& income, const IncomePatch& patch) {
    const FieldValue& v = patch.value;
    switch (patch.field) {
        case IncomeField::AnnualIncome: income.annual_income = std::get<Decimal>(v); break;
        case IncomeField::StartAge: income.start_age = std::get<int>(v); break;
        case IncomeField::EndAge: income.end_age = std::get<std::optional<int>>(v); break;
        case IncomeField::ApplyInflation: income.apply_inflation = std::get<bool>(v); break;
        case IncomeField::IncludeInNestEgg: income.include_in_nest_egg = std::get<bool>(v); break;
        case IncomeField::GrowthRate: income.growth = GrowthConfig::fixed(std::get<Decimal>(v)); break;
        case IncomeField::Name: income.name = std::get<std::string>(v); break;
        case IncomeField::Owner: income.owner = std::get<Owner>(v); break;
    }
}

} // namespace nestegg
