// Character creation rules: archetype application, primary point budget,
// and derivation of secondary, save and combat traits.
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "Archetypes.h"

namespace Forge::RPG {

// Tunable chargen constants (data-driven, see loadChargenConfig).
struct ChargenConfig {
    int totalPrimaryPoints{30};
    int primaryMin{1};
    int primaryMax{10};
    int magicMin{0};  // MAG alone may drop below primaryMin
    double carryFactor{10.0};
    double liftFactor{20.0};
    double pushFactor{40.0};
    double manaMaxWhenMagical{10.0};
};

// The host-side shape chargen writes into: the archetype name and the live trait store.
struct Character {
    std::optional<std::string> archetype{};
    TraitTable traits{};
};

struct PrimaryTraitCheck {
    bool valid{false};
    std::optional<std::string> message{};
};

// Makes `character` the named archetype, replacing its whole trait store.
// A second call with a different name turns it into the dual archetype;
// reset=true discards the current archetype first.
void applyArchetype(Character& character, std::string_view name, bool reset = false,
                    const ArchetypeRegistry& registry = ArchetypeRegistry::builtin());

// Points left to allocate; negative when over budget.
double getRemainingAllocation(const TraitTable& traits, const ChargenConfig& cfg = {});

// Checks the primary point total only. Per-trait bounds are checkPrimaryTraitBounds.
PrimaryTraitCheck validatePrimaryTraits(const TraitTable& traits, const ChargenConfig& cfg = {});

PrimaryTraitCheck checkPrimaryTraitBounds(const TraitTable& traits, const ChargenConfig& cfg = {});

// Adds `delta` to one primary trait's base if it stays in bounds and within budget.
// The table is left untouched on rejection.
PrimaryTraitCheck allocatePrimaryTrait(TraitTable& traits, std::string_view code, int delta,
                                       const ChargenConfig& cfg = {});

// Recomputes dependent traits from finalized primary traits. Idempotent.
// Input is expected to be validated already.
void calculateSecondaryTraits(TraitTable& traits, const ChargenConfig& cfg = {});

}  // namespace Forge::RPG
