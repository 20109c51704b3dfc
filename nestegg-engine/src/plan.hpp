#ifndef NESTEGG_PLAN_HPP
#define NESTEGG_PLAN_HPP

#include "assumptions.hpp"
#include "entities.hpp"
#include <optional>
#include <string>

namespace nestegg {

struct BirthDate {
    int year = 0;
    unsigned month = 1;
    unsigned day = 1;

    // Accepts "YYYY-MM-DD"; throws std::invalid_argument otherwise
    static BirthDate parse(const std::string& text);
    std::string to_string() const;

    bool operator==(const BirthDate& other) const;
};

struct Person {
    std::string name;
    BirthDate dob;
};

struct Household {
    EntityId household_id = 0;
    std::string name;
    std::optional<Person> person1;
    std::optional<Person> person2;

    // nullptr when the selected person is not part of the household
    const Person* person(PersonSelector selector) const;
};

// Plan-level facts shared by the base case and every scenario
struct BaseFacts {
    BaseAssumptions assumptions;
    EntityCollections entities;
};

struct Plan {
    EntityId plan_id = 0;
    EntityId household_id = 0;
    std::string name;
    int plan_creation_year = 0;     // Frozen at creation; first tick of every projection
    PersonSelector reference_person = PersonSelector::Person1;
    BaseFacts base_facts;
};

} // namespace nestegg

#endif // NESTEGG_PLAN_HPP
