#ifndef NESTEGG_ERRORS_HPP
#define NESTEGG_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace nestegg {

// Base class for every fault raised by the projection engine. All faults are
// caller contract violations; none of them is retryable.
class ProjectionError : public std::runtime_error {
public:
    explicit ProjectionError(const std::string& message)
        : std::runtime_error(message) {}
};

// Start/retirement/end year ordering violated
class InvalidWindow : public ProjectionError {
public:
    InvalidWindow(int start_year, int retirement_year, int end_year);

    int start_year() const { return start_year_; }
    int retirement_year() const { return retirement_year_; }
    int end_year() const { return end_year_; }

private:
    int start_year_;
    int retirement_year_;
    int end_year_;
};

// Malformed stepwise growth configuration
class OverlappingIntervals : public ProjectionError {
public:
    OverlappingIntervals(const std::string& entity, const std::string& detail);

    const std::string& entity() const { return entity_; }

private:
    std::string entity_;
};

// Override pointing at an entity that does not exist in the base facts
class DanglingOverrideReference : public ProjectionError {
public:
    DanglingOverrideReference(uint64_t override_id, const std::string& target_kind, uint64_t target_id);

    uint64_t override_id() const { return override_id_; }
    uint64_t target_id() const { return target_id_; }

private:
    uint64_t override_id_;
    uint64_t target_id_;
};

// Override naming a field that is not overridable for its target kind
class UnknownOverrideField : public ProjectionError {
public:
    UnknownOverrideField(uint64_t override_id, const std::string& target_kind, const std::string& field);

    uint64_t override_id() const { return override_id_; }
    const std::string& field() const { return field_; }

private:
    uint64_t override_id_;
    std::string field_;
};

// Required field missing, malformed or inconsistent
class IncompleteEntity : public ProjectionError {
public:
    IncompleteEntity(const std::string& entity, const std::string& field, const std::string& detail);

    const std::string& entity() const { return entity_; }
    const std::string& field() const { return field_; }

private:
    std::string entity_;
    std::string field_;
};

// "asset 3", "liability 7" - used to build error context
std::string describe_entity(const std::string& kind, uint64_t id);

} // namespace nestegg

#endif // NESTEGG_ERRORS_HPP
