#ifndef NESTEGG_IO_PLAN_READER_HPP
#define NESTEGG_IO_PLAN_READER_HPP

#include "../plan.hpp"
#include "../scenario.hpp"
#include <istream>
#include <stdexcept>
#include <string>

namespace nestegg {
namespace io {

// Exception thrown when a plan document is malformed. The message names the
// JSON path of the offending value ("base_facts.assets[2].value").
class PlanParseError : public std::runtime_error {
public:
    explicit PlanParseError(const std::string& message)
        : std::runtime_error(message) {}
};

// Everything the engine needs to project a plan and its scenarios
struct PlanDocument {
    Household household;
    Plan plan;
    ScenarioSet scenarios;
};

// Read a plan document:
//   {
//     "household": { "id", "name", "person1": { "name", "dob" }, "person2"? },
//     "plan": { "id", "name", "plan_creation_year", "reference_person" },
//     "base_facts": {
//       "assumptions": { "default_growth_rate", "inflation_rate",
//                        "retirement_age_1"?, "retirement_age_2"?,
//                        "final_age_1"?, "final_age_2"?, "final_age_selector" },
//       "assets": [...], "liabilities": [...],
//       "scheduled_flows": [...], "retirement_income": [...]
//     },
//     "scenarios": [ { "id", "name", "assumptions"?, "annual_retirement_spending"?,
//                      "overrides": [ { "id", "target", "target_id",
//                                       "field", "value" } | { ..., "remove": true } ] } ]
//   }
//
// Decimal fields accept JSON numbers or strings. JSON numbers are read through
// a double and keep at most 15 significant digits; give longer values as
// strings ("1234567890123.4567"), which are parsed exactly. Stepwise growth configs and
// entity collections are validated while reading, so engine faults
// (OverlappingIntervals, IncompleteEntity) propagate as they are.
PlanDocument read_plan_json(const std::string& filepath);
PlanDocument read_plan_json(std::istream& is);
PlanDocument parse_plan_json(const std::string& json_string);

} // namespace io
} // namespace nestegg

#endif // NESTEGG_IO_PLAN_READER_HPP
