#ifndef NESTEGG_OVERRIDE_RESOLVER_HPP
#define NESTEGG_OVERRIDE_RESOLVER_HPP

#include "assumptions.hpp"
#include "entities.hpp"
#include "plan.hpp"
#include "scenario.hpp"
#include <string>
#include <vector>

namespace nestegg {

// Entities and assumptions in force for one evaluation. Owns its data: it
// shares nothing mutable with the BaseFacts it was resolved from.
struct EffectiveEntitySet {
    std::string label;                  // "base" or the scenario name
    EntityCollections entities;
    EffectiveAssumptions assumptions;
};

/**
 * Apply overrides to a copy of the base entities.
 *
 * Every override is typed and checked against the base entities first
 * (UnknownOverrideField, IncompleteEntity, DanglingOverrideReference). Patches
 * are then applied in list order, so the last writer of an (entity, field)
 * wins. A removal deletes its target whatever its position in the list; patches
 * on a removed entity are discarded with it. The result is re-validated.
 */
EntityCollections resolve_entities(const EntityCollections& base,
                                   const std::vector<Override>& overrides);

// Base case: base assumptions, no spending
EffectiveEntitySet resolve(const BaseFacts& base_facts, const std::vector<Override>& overrides);

// Scenario: its overrides plus its assumptions merged field by field over the
// base assumptions. Negative spending is IncompleteEntity.
EffectiveEntitySet resolve(const BaseFacts& base_facts, const Scenario& scenario);

} // namespace nestegg

#endif // NESTEGG_OVERRIDE_RESOLVER_HPP
