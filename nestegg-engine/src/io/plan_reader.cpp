#include "plan_reader.hpp"
#include "../errors.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace nestegg {
namespace io {

namespace {

std::string child_path(const std::string& path, const std::string& key) {
    return path.empty() ? key : path + "." + key;
}

std::string index_path(const std::string& path, size_t index) {
    return path + "[" + std::to_string(index) + "]";
}

const json& require(const json& j, const std::string& key, const std::string& path) {
    if (!j.is_object() || !j.contains(key) || j[key].is_null()) {
        throw PlanParseError("Missing required field: " + child_path(path, key));
    }
    return j[key];
}

bool has(const json& j, const std::string& key) {
    return j.is_object() && j.contains(key) && !j[key].is_null();
}

std::string read_string(const json& j, const std::string& path) {
    if (!j.is_string()) {
        throw PlanParseError("Expected string at " + path);
    }
    return j.get<std::string>();
}

std::string optional_string(const json& j, const std::string& key, const std::string& path,
                            const std::string& fallback = "") {
    return has(j, key) ? read_string(j[key], child_path(path, key)) : fallback;
}

int read_int(const json& j, const std::string& path) {
    if (!j.is_number_integer()) {
        throw PlanParseError("Expected integer at " + path);
    }
    if (j.is_number_unsigned()) {
        if (j.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            throw PlanParseError("Integer out of range at " + path);
        }
    } else {
        const int64_t value = j.get<int64_t>();
        if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
            throw PlanParseError("Integer out of range at " + path);
        }
    }
    return j.get<int>();
}

std::optional<int> optional_int(const json& j, const std::string& key, const std::string& path) {
    if (!has(j, key)) return std::nullopt;
    return read_int(j[key], child_path(path, key));
}

EntityId read_id(const json& j, const std::string& path) {
    if (!j.is_number_unsigned()) {
        throw PlanParseError("Expected non-negative integer id at " + path);
    }
    return j.get<EntityId>();
}

bool optional_bool(const json& j, const std::string& key, const std::string& path, bool fallback) {
    if (!has(j, key)) return fallback;
    if (!j[key].is_boolean()) {
        throw PlanParseError("Expected boolean at " + child_path(path, key));
    }
    return j[key].get<bool>();
}

Decimal read_decimal(const json& j, const std::string& path) {
    std::string text;
    if (j.is_string()) {
        text = j.get<std::string>();
    } else if (j.is_number()) {
        text = j.dump();
    } else {
        throw PlanParseError("Expected decimal at " + path);
    }
    try {
        return parse_decimal(text);
    } catch (const std::invalid_argument& e) {
        throw PlanParseError("Invalid decimal at " + path + ": " + e.what());
    }
}

std::optional<Decimal> optional_decimal(const json& j, const std::string& key, const std::string& path) {
    if (!has(j, key)) return std::nullopt;
    return read_decimal(j[key], child_path(path, key));
}

// Enum fields: the parse_* functions throw std::invalid_argument
template <typename T, typename ParseFn>
T read_enum(const json& j, const std::string& path, ParseFn parse) {
    const std::string text = j.is_number_integer() ? j.dump() : read_string(j, path);
    try {
        return parse(text);
    } catch (const std::invalid_argument& e) {
        throw PlanParseError("Invalid value at " + path + ": " + e.what());
    }
}

template <typename T, typename ParseFn>
T optional_enum(const json& j, const std::string& key, const std::string& path,
                T fallback, ParseFn parse) {
    if (!has(j, key)) return fallback;
    return read_enum<T>(j[key], child_path(path, key), parse);
}

const json& optional_array(const json& j, const std::string& key, const std::string& path) {
    static const json empty = json::array();
    if (!has(j, key)) return empty;
    if (!j[key].is_array()) {
        throw PlanParseError("Expected array at " + child_path(path, key));
    }
    return j[key];
}

// ============================================================================
// Household and plan
// ============================================================================

Person parse_person(const json& j, const std::string& path) {
    Person person;
    person.name = optional_string(j, "name", path);
    const std::string dob_path = child_path(path, "dob");
    try {
        person.dob = BirthDate::parse(read_string(require(j, "dob", path), dob_path));
    } catch (const std::invalid_argument& e) {
        throw PlanParseError("Invalid date at " + dob_path + ": " + e.what());
    }
    return person;
}

Household parse_household(const json& j, const std::string& path) {
    Household household;
    household.household_id = has(j, "id") ? read_id(j["id"], child_path(path, "id")) : 0;
    household.name = optional_string(j, "name", path);
    if (has(j, "person1")) {
        household.person1 = parse_person(j["person1"], child_path(path, "person1"));
    }
    if (has(j, "person2")) {
        household.person2 = parse_person(j["person2"], child_path(path, "person2"));
    }
    return household;
}

BaseAssumptions parse_base_assumptions(const json& j, const std::string& path) {
    BaseAssumptions a;
    a.default_growth_rate = read_decimal(require(j, "default_growth_rate", path),
                                         child_path(path, "default_growth_rate"));
    a.inflation_rate = read_decimal(require(j, "inflation_rate", path),
                                    child_path(path, "inflation_rate"));
    a.retirement_age_1 = optional_int(j, "retirement_age_1", path);
    a.retirement_age_2 = optional_int(j, "retirement_age_2", path);
    a.final_age_1 = optional_int(j, "final_age_1", path);
    a.final_age_2 = optional_int(j, "final_age_2", path);
    a.final_age_selector = optional_enum<PersonSelector>(j, "final_age_selector", path,
                                                         PersonSelector::Person1,
                                                         parse_person_selector);
    return a;
}

// ============================================================================
// Entities
// ============================================================================

GrowthConfig parse_growth(const json& j, const std::string& path, const std::string& entity) {
    const GrowthType type = read_enum<GrowthType>(require(j, "type", path),
                                                  child_path(path, "type"), parse_growth_type);
    switch (type) {
        case GrowthType::Override:
            return GrowthConfig::fixed(read_decimal(require(j, "rate", path), child_path(path, "rate")));
        case GrowthType::Stepwise: {
            const std::string intervals_path = child_path(path, "intervals");
            const json& items = require(j, "intervals", path);
            if (!items.is_array()) {
                throw PlanParseError("Expected array at " + intervals_path);
            }
            std::vector<RateInterval> intervals;
            for (size_t i = 0; i < items.size(); ++i) {
                const std::string p = index_path(intervals_path, i);
                const json& item = items[i];
                intervals.emplace_back(read_int(require(item, "start_year", p), child_path(p, "start_year")),
                                       optional_int(item, "end_year", p),
                                       read_decimal(require(item, "rate", p), child_path(p, "rate")));
            }
            return GrowthConfig::stepwise(std::move(intervals), entity);
        }
        case GrowthType::Default:
        default:
            return GrowthConfig::default_rate();
    }
}

Asset parse_asset(const json& j, const std::string& path) {
    Asset asset;
    asset.asset_id = read_id(require(j, "id", path), child_path(path, "id"));
    asset.name = optional_string(j, "name", path);
    asset.category = optional_string(j, "category", path);
    asset.owner = optional_enum<Owner>(j, "owner", path, Owner::Joint, parse_owner);
    asset.value = read_decimal(require(j, "value", path), child_path(path, "value"));
    asset.include_in_nest_egg = optional_bool(j, "include_in_nest_egg", path, true);
    if (has(j, "growth")) {
        asset.growth = parse_growth(j["growth"], child_path(path, "growth"),
                                    describe_entity("asset", asset.asset_id));
    }
    return asset;
}

Liability parse_liability(const json& j, const std::string& path) {
    Liability liability;
    liability.liability_id = read_id(require(j, "id", path), child_path(path, "id"));
    liability.name = optional_string(j, "name", path);
    liability.category = optional_string(j, "category", path);
    liability.owner = optional_enum<Owner>(j, "owner", path, Owner::Joint, parse_owner);
    liability.value = read_decimal(require(j, "value", path), child_path(path, "value"));
    liability.interest_rate = optional_decimal(j, "interest_rate", path);
    liability.include_in_nest_egg = optional_bool(j, "include_in_nest_egg", path, true);
    return liability;
}

ScheduledFlow parse_flow(const json& j, const std::string& path) {
    ScheduledFlow flow;
    flow.flow_id = read_id(require(j, "id", path), child_path(path, "id"));
    flow.name = optional_string(j, "name", path);
    flow.owner = optional_enum<Owner>(j, "owner", path, Owner::Joint, parse_owner);
    flow.type = read_enum<FlowType>(require(j, "type", path), child_path(path, "type"), parse_flow_type);
    flow.annual_amount = read_decimal(require(j, "annual_amount", path), child_path(path, "annual_amount"));
    flow.start_year = read_int(require(j, "start_year", path), child_path(path, "start_year"));
    flow.end_year = optional_int(j, "end_year", path);
    flow.apply_inflation = optional_bool(j, "apply_inflation", path, false);
    return flow;
}

RetirementIncomeStream parse_income(const json& j, const std::string& path) {
    RetirementIncomeStream income;
    income.income_id = read_id(require(j, "id", path), child_path(path, "id"));
    income.name = optional_string(j, "name", path);
    income.owner = optional_enum<Owner>(j, "owner", path, Owner::Person1, parse_owner);
    income.annual_income = read_decimal(require(j, "annual_income", path), child_path(path, "annual_income"));
    income.start_age = read_int(require(j, "start_age", path), child_path(path, "start_age"));
    income.end_age = optional_int(j, "end_age", path);
    income.apply_inflation = optional_bool(j, "apply_inflation", path, false);
    income.include_in_nest_egg = optional_bool(j, "include_in_nest_egg", path, true);
    if (has(j, "growth")) {
        income.growth = parse_growth(j["growth"], child_path(path, "growth"),
                                     describe_entity("income", income.income_id));
    }
    return income;
}

template <typename T, typename ParseFn>
std::vector<T> parse_list(const json& j, const std::string& key, const std::string& path, ParseFn parse) {
    const json& items = optional_array(j, key, path);
    const std::string list_path = child_path(path, key);
    std::vector<T> result;
    result.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        result.push_back(parse(items[i], index_path(list_path, i)));
    }
    return result;
}

BaseFacts parse_base_facts(const json& j, const std::string& path) {
    BaseFacts facts;
    facts.assumptions = parse_base_assumptions(require(j, "assumptions", path),
                                               child_path(path, "assumptions"));
    facts.entities.assets = parse_list<Asset>(j, "assets", path, parse_asset);
    facts.entities.liabilities = parse_list<Liability>(j, "liabilities", path, parse_liability);
    facts.entities.flows = parse_list<ScheduledFlow>(j, "scheduled_flows", path, parse_flow);
    facts.entities.income_streams = parse_list<RetirementIncomeStream>(j, "retirement_income", path, parse_income);
    validate_entities(facts.entities);
    return facts;
}

// ============================================================================
// Scenarios
// ============================================================================

// Override values are stored as text and typed when the scenario is resolved
std::string override_value_text(const json& j) {
    if (j.is_string()) return j.get<std::string>();
    if (j.is_null()) return "null";
    if (j.is_boolean()) return j.get<bool>() ? "true" : "false";
    return j.dump();
}

Override parse_override(const json& j, const std::string& path) {
    Override o;
    o.override_id = read_id(require(j, "id", path), child_path(path, "id"));
    o.target = read_enum<OverrideTarget>(require(j, "target", path), child_path(path, "target"),
                                         parse_override_target);
    o.target_id = read_id(require(j, "target_id", path), child_path(path, "target_id"));
    o.remove = optional_bool(j, "remove", path, false);
    if (!o.remove) {
        o.field = read_string(require(j, "field", path), child_path(path, "field"));
        o.value = j.contains("value") ? override_value_text(j["value"]) : "";
    }
    return o;
}

ScenarioAssumptions parse_scenario_assumptions(const json& j, const std::string& path) {
    ScenarioAssumptions a;
    a.default_growth_rate = optional_decimal(j, "default_growth_rate", path);
    a.inflation_rate = optional_decimal(j, "inflation_rate", path);
    a.retirement_age_1 = optional_int(j, "retirement_age_1", path);
    a.retirement_age_2 = optional_int(j, "retirement_age_2", path);
    return a;
}

Scenario parse_scenario(const json& j, const std::string& path) {
    Scenario scenario;
    scenario.scenario_id = read_id(require(j, "id", path), child_path(path, "id"));
    scenario.name = read_string(require(j, "name", path), child_path(path, "name"));
    if (has(j, "assumptions")) {
        scenario.assumptions = parse_scenario_assumptions(j["assumptions"], child_path(path, "assumptions"));
    }
    scenario.annual_retirement_spending =
        optional_decimal(j, "annual_retirement_spending", path).value_or(Decimal(0));
    scenario.overrides = parse_list<Override>(j, "overrides", path, parse_override);
    return scenario;
}

PlanDocument parse_document(const json& j) {
    if (!j.is_object()) {
        throw PlanParseError("Plan document must be a JSON object");
    }

    PlanDocument doc;
    doc.household = parse_household(require(j, "household", ""), "household");

    const json& plan = require(j, "plan", "");
    doc.plan.plan_id = has(plan, "id") ? read_id(plan["id"], "plan.id") : 0;
    doc.plan.household_id = doc.household.household_id;
    doc.plan.name = optional_string(plan, "name", "plan");
    doc.plan.plan_creation_year = read_int(require(plan, "plan_creation_year", "plan"),
                                           "plan.plan_creation_year");
    doc.plan.reference_person = optional_enum<PersonSelector>(plan, "reference_person", "plan",
                                                              PersonSelector::Person1,
                                                              parse_person_selector);
    doc.plan.base_facts = parse_base_facts(require(j, "base_facts", ""), "base_facts");

    for (Scenario& scenario : parse_list<Scenario>(j, "scenarios", "", parse_scenario)) {
        if (doc.scenarios.find(scenario.name)) {
            throw PlanParseError("Duplicate scenario name: '" + scenario.name + "'");
        }
        doc.scenarios.add(std::move(scenario));
    }
    return doc;
}

} // anonymous namespace

PlanDocument parse_plan_json(const std::string& json_string) {
    json j;
    try {
        j = json::parse(json_string);
    } catch (const json::parse_error& e) {
        throw PlanParseError(std::string("JSON parse error: ") + e.what());
    }

    try {
        return parse_document(j);
    } catch (const json::exception& e) {
        throw PlanParseError(std::string("JSON error: ") + e.what());
    }
}

PlanDocument read_plan_json(std::istream& is) {
    std::ostringstream buffer;
    buffer << is.rdbuf();
    return parse_plan_json(buffer.str());
}

PlanDocument read_plan_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw PlanParseError("Failed to open plan file: " + filepath);
    }
    return read_plan_json(file);
}

} // namespace io
} // namespace nestegg
