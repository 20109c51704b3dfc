#include "errors.hpp"

namespace nestegg {

InvalidWindow::InvalidWindow(int start_year, int retirement_year, int end_year)
    : ProjectionError("Invalid projection window: start_year=" + std::to_string(start_year) +
                      ", retirement_year=" + std::to_string(retirement_year) +
                      ", end_year=" + std::to_string(end_year) +
                      " (expected start < retirement < end)"),
      start_year_(start_year),
      retirement_year_(retirement_year),
      end_year_(end_year) {}

OverlappingIntervals::OverlappingIntervals(const std::string& entity, const std::string& detail)
    : ProjectionError("Overlapping growth intervals for " + entity + ": " + detail),
      entity_(entity) {}

DanglingOverrideReference::DanglingOverrideReference(uint64_t override_id,
                                                     const std::string& target_kind,
                                                     uint64_t target_id)
    : ProjectionError("Override " + std::to_string(override_id) + " references unknown " +
                      describe_entity(target_kind, target_id)),
      override_id_(override_id),
      target_id_(target_id) {}

UnknownOverrideField::UnknownOverrideField(uint64_t override_id,
                                           const std::string& target_kind,
                                           const std::string& field)
    : ProjectionError("Override " + std::to_string(override_id) + " names unknown " +
                      target_kind + " field '" + field + "'"),
      override_id_(override_id),
      field_(field) {}

IncompleteEntity::IncompleteEntity(const std::string& entity,
                                   const std::string& field,
                                   const std::string& detail)
    : ProjectionError("Incomplete " + entity + ", field '" + field + "': " + detail),
      entity_(entity),
      field_(field) {}

std::string describe_entity(const std::string& kind, uint64_t id) {
    return kind + " " + std::to_string(id);
}

} // namespace nestegg
