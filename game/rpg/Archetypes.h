// Archetype content: the trait definition table, the three base archetypes,
// name resolution and the dual-archetype merge.
#pragma once

#include <array>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "../../engine/traits/Trait.h"
#include "HealthRoll.h"

namespace Forge::RPG {

using Traits::Trait;
using Traits::TraitKind;
using Traits::TraitTable;

inline constexpr std::array<std::string_view, 3> kValidArchetypes{"Arcanist", "Scout", "Warrior"};

inline constexpr std::array<std::string_view, 7> kPrimaryTraits{"STR", "PER", "INT", "DEX", "CHA", "VIT", "MAG"};
inline constexpr std::array<std::string_view, 4> kSecondaryTraits{"HP", "SP", "BM", "WM"};
inline constexpr std::array<std::string_view, 3> kSaveRolls{"FORT", "REFL", "WILL"};
inline constexpr std::array<std::string_view, 5> kCombatTraits{"ATKM", "ATKR", "ATKU", "DEF", "PP"};
inline constexpr std::array<std::string_view, 5> kOtherTraits{"LV", "XP", "ENC", "MV", "ACT"};

// Primary, secondary, saves, combat, then misc.
const std::vector<std::string_view>& allTraits();

bool isPrimaryTrait(std::string_view code);
bool isValidArchetype(std::string_view name);

enum class ArchetypeErrorKind {
    InvalidArchetype,
    AlreadyApplied,
    TripleArchetype,
    SelfDual,
    UnresolvedDual,
    IncompleteRegistry
};

class ArchetypeError : public std::runtime_error {
public:
    ArchetypeError(ArchetypeErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ArchetypeErrorKind kind() const { return kind_; }

private:
    ArchetypeErrorKind kind_;
};

// Fresh copy of the default trait definitions. Every call returns an
// independent table.
TraitTable baseTraitTable();

// A named trait table plus its health roll token. The name is fixed at
// construction; the table is copied into a character and the archetype dropped.
class Archetype {
public:
    // Unnamed archetype carrying the default table and no health roll.
    Archetype();
    Archetype(std::string name, TraitTable traits, std::optional<std::string> healthRoll);

    const std::string& name() const { return name_; }
    bool isDual() const { return name_.find('-') != std::string::npos; }
    const TraitTable& traits() const { return traits_; }
    const std::optional<std::string>& healthRoll() const { return healthRoll_; }

private:
    std::string name_;
    TraitTable traits_;
    std::optional<std::string> healthRoll_;
};

struct TraitOverride {
    std::string code;
    std::optional<double> base{};
    std::optional<int> modifier{};
};

// Declarative description of one base archetype.
struct ArchetypeSpec {
    std::string name;
    std::vector<TraitOverride> overrides;
    std::string healthRoll;
};

std::vector<ArchetypeSpec> defaultArchetypeSpecs();

// Canonical name -> archetype spec. Construction rejects registries that miss
// a valid archetype, name an unknown one, or override an unknown trait code.
class ArchetypeRegistry {
public:
    explicit ArchetypeRegistry(std::vector<ArchetypeSpec> specs);

    // Registry built from defaultArchetypeSpecs().
    static const ArchetypeRegistry& builtin();

    const ArchetypeSpec* find(std::string_view canonicalName) const;
    Archetype instantiate(std::string_view canonicalName) const;
    const std::vector<ArchetypeSpec>& specs() const { return specs_; }

private:
    std::vector<ArchetypeSpec> specs_;
};

// "warrior-scout" -> "Warrior-Scout": first letter of each alphabetic run upper, rest lower.
std::string titleCase(std::string_view name);
// "wARRIOR" -> "Warrior".
std::string capitalize(std::string_view name);

// Canonical dual name for an unordered pair of base names.
std::string resolveDualName(std::string_view a, std::string_view b);

// Loads a single ("scout") or dual ("warrior-scout") archetype by name.
Archetype loadArchetype(std::string_view name, const ArchetypeRegistry& registry = ArchetypeRegistry::builtin(),
                        const RollComparator& lowerRoll = lowerExpectedRoll);

// Blends two single archetypes. Each base and modifier is the floor of the
// pair's mean; the health roll is the lower of the two under `lowerRoll`,
// with ties keeping `a`'s.
Archetype makeDual(const Archetype& a, const Archetype& b, const RollComparator& lowerRoll = lowerExpectedRoll);

}  // namespace Forge::RPG
