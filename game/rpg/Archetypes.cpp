#include "Archetypes.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

#include "../../engine/core/Logger.h"

namespace Forge::RPG {

using Traits::makeCounter;
using Traits::makeGauge;
using Traits::makeTrait;

namespace {
// Integer division rounding toward negative infinity.
int floorDivide(int value, int divisor) {
    int q = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) --q;
    return q;
}

const Trait& traitOr(const TraitTable& table, const std::string& code, const Trait& fallback) {
    auto it = table.find(code);
    return it != table.end() ? it->second : fallback;
}

struct DualName {
    std::string_view first;
    std::string_view second;
    std::string_view canonical;
};

constexpr std::array<DualName, 3> kDualNames{{
    {"Warrior", "Scout", "Warrior-Scout"},
    {"Warrior", "Arcanist", "Warrior-Arcanist"},
    {"Scout", "Arcanist", "Arcanist-Scout"},
}};
}  // namespace

const std::vector<std::string_view>& allTraits() {
    static const std::vector<std::string_view> codes = [] {
        std::vector<std::string_view> out;
        out.insert(out.end(), kPrimaryTraits.begin(), kPrimaryTraits.end());
        out.insert(out.end(), kSecondaryTraits.begin(), kSecondaryTraits.end());
        out.insert(out.end(), kSaveRolls.begin(), kSaveRolls.end());
        out.insert(out.end(), kCombatTraits.begin(), kCombatTraits.end());
        out.insert(out.end(), kOtherTraits.begin(), kOtherTraits.end());
        return out;
    }();
    return codes;
}

bool isPrimaryTrait(std::string_view code) {
    return std::find(kPrimaryTraits.begin(), kPrimaryTraits.end(), code) != kPrimaryTraits.end();
}

bool isValidArchetype(std::string_view name) {
    return std::find(kValidArchetypes.begin(), kValidArchetypes.end(), name) != kValidArchetypes.end();
}

TraitTable baseTraitTable() {
    TraitTable t;
    // primary
    t["STR"] = makeTrait("Strength", 1);
    t["PER"] = makeTrait("Perception", 1);
    t["INT"] = makeTrait("Intelligence", 1);
    t["DEX"] = makeTrait("Dexterity", 1);
    t["CHA"] = makeTrait("Charisma", 1);
    t["VIT"] = makeTrait("Vitality", 1);
    // magic; mana stays capped at 0 until derivation sees MAG > 0
    t["MAG"] = makeTrait("Magic", 0);
    t["BM"] = makeGauge("Black Mana", 0, 0.0, 0.0);
    t["WM"] = makeGauge("White Mana", 0, 0.0, 0.0);
    // secondary
    t["HP"] = makeGauge("Health", 0);
    t["SP"] = makeGauge("Stamina", 0);
    // saves
    t["FORT"] = makeTrait("Fortitude Save", 0);
    t["REFL"] = makeTrait("Reflex Save", 0);
    t["WILL"] = makeTrait("Will Save", 0);
    // combat
    t["ATKM"] = makeTrait("Melee Attack", 0);
    t["ATKR"] = makeTrait("Ranged Attack", 0);
    t["ATKU"] = makeTrait("Unarmed Attack", 0);
    t["DEF"] = makeTrait("Defense", 0);
    t["ACT"] = makeCounter("Action Points", 0);
    t["PP"] = makeCounter("Power Points", 0);
    // misc
    t["ENC"] = makeCounter("Carry Weight", 0);
    t["MV"] = makeTrait("Movement Points", 6);
    t["LV"] = makeTrait("Level", 0);
    t["XP"] = makeTrait("Experience", 0);
    t["XP"].extra["level_boundaries"] = nlohmann::json::array({500, 2000, 4500, "unlimited"});
    return t;
}

Archetype::Archetype() : traits_(baseTraitTable()) {}

Archetype::Archetype(std::string name, TraitTable traits, std::optional<std::string> healthRoll)
    : name_(std::move(name)), traits_(std::move(traits)), healthRoll_(std::move(healthRoll)) {}

std::vector<ArchetypeSpec> defaultArchetypeSpecs() {
    std::vector<ArchetypeSpec> specs;
    specs.push_back({"Arcanist",
                     {{"PER", 4, {}}, {"INT", 6, {}}, {"CHA", 4, {}}, {"MAG", 6, {}}, {"SP", {}, -2}, {"MV", 7, {}}},
                     "1d6-1"});
    specs.push_back({"Scout", {{"STR", 4, {}}, {"PER", 6, {}}, {"INT", 6, {}}, {"DEX", 4, {}}}, "1d6"});
    specs.push_back({"Warrior",
                     {{"STR", 6, {}}, {"DEX", 4, {}}, {"CHA", 4, {}}, {"VIT", 6, {}}, {"PP", 2, {}}, {"MV", 5, {}}},
                     "1d6+1"});
    return specs;
}

ArchetypeRegistry::ArchetypeRegistry(std::vector<ArchetypeSpec> specs) : specs_(std::move(specs)) {
    const TraitTable defaults = baseTraitTable();
    for (const auto& spec : specs_) {
        if (!isValidArchetype(spec.name)) {
            throw ArchetypeError(ArchetypeErrorKind::IncompleteRegistry,
                                 "Registry entry '" + spec.name + "' is not a known archetype.");
        }
        const auto dupes = std::count_if(specs_.begin(), specs_.end(),
                                         [&](const ArchetypeSpec& s) { return s.name == spec.name; });
        if (dupes > 1) {
            throw ArchetypeError(ArchetypeErrorKind::IncompleteRegistry,
                                 "Registry lists archetype '" + spec.name + "' more than once.");
        }
        for (const auto& o : spec.overrides) {
            if (defaults.count(o.code) == 0) {
                throw ArchetypeError(ArchetypeErrorKind::IncompleteRegistry,
                                     "Archetype '" + spec.name + "' overrides unknown trait '" + o.code + "'.");
            }
        }
    }
    for (std::string_view name : kValidArchetypes) {
        if (find(name) == nullptr) {
            throw ArchetypeError(ArchetypeErrorKind::IncompleteRegistry,
                                 "Registry has no entry for archetype '" + std::string(name) + "'.");
        }
    }
}

const ArchetypeRegistry& ArchetypeRegistry::builtin() {
    static const ArchetypeRegistry registry(defaultArchetypeSpecs());
    return registry;
}

const ArchetypeSpec* ArchetypeRegistry::find(std::string_view canonicalName) const {
    auto it = std::find_if(specs_.begin(), specs_.end(),
                           [&](const ArchetypeSpec& s) { return s.name == canonicalName; });
    return it != specs_.end() ? &*it : nullptr;
}

Archetype ArchetypeRegistry::instantiate(std::string_view canonicalName) const {
    const ArchetypeSpec* spec = find(canonicalName);
    if (spec == nullptr) {
        throw ArchetypeError(ArchetypeErrorKind::InvalidArchetype, "Invalid archetype specified.");
    }
    TraitTable traits = baseTraitTable();
    for (const auto& o : spec->overrides) {
        Trait& t = traits.at(o.code);
        if (o.base.has_value()) t.base = *o.base;
        if (o.modifier.has_value()) t.modifier = *o.modifier;
    }
    return Archetype(spec->name, std::move(traits), spec->healthRoll);
}

std::string titleCase(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    bool startOfWord = true;
    for (char c : name) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalpha(uc)) {
            out.push_back(static_cast<char>(startOfWord ? std::toupper(uc) : std::tolower(uc)));
            startOfWord = false;
        } else {
            out.push_back(c);
            startOfWord = true;
        }
    }
    return out;
}

std::string capitalize(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (std::size_t i = 0; i < name.size(); ++i) {
        const auto uc = static_cast<unsigned char>(name[i]);
        out.push_back(static_cast<char>(i == 0 ? std::toupper(uc) : std::tolower(uc)));
    }
    return out;
}

std::string resolveDualName(std::string_view a, std::string_view b) {
    for (const auto& entry : kDualNames) {
        if ((entry.first == a && entry.second == b) || (entry.first == b && entry.second == a)) {
            return std::string(entry.canonical);
        }
    }
    throw ArchetypeError(ArchetypeErrorKind::UnresolvedDual,
                         "No dual archetype for '" + std::string(a) + "' and '" + std::string(b) + "'.");
}

Archetype loadArchetype(std::string_view name, const ArchetypeRegistry& registry, const RollComparator& lowerRoll) {
    const std::string normalized = titleCase(name);
    const auto dash = normalized.find('-');
    if (dash != std::string::npos) {
        // Only the first hyphen splits; "A-B-C" becomes A + (B-C) and is rejected by the merge.
        Archetype a = loadArchetype(std::string_view(normalized).substr(0, dash), registry, lowerRoll);
        Archetype b = loadArchetype(std::string_view(normalized).substr(dash + 1), registry, lowerRoll);
        return makeDual(a, b, lowerRoll);
    }
    return registry.instantiate(normalized);
}

Archetype makeDual(const Archetype& a, const Archetype& b, const RollComparator& lowerRoll) {
    if (a.isDual() || b.isDual()) {
        throw ArchetypeError(ArchetypeErrorKind::TripleArchetype, "Cannot create Triple-Archetype");
    }
    if (a.name() == b.name()) {
        throw ArchetypeError(ArchetypeErrorKind::SelfDual, "Cannot create dual of the same Archetype");
    }
    std::string name = resolveDualName(a.name(), b.name());

    TraitTable merged = baseTraitTable();
    for (auto& [code, trait] : merged) {
        // A side missing the code contributes the merged table's own value.
        const Trait& fromA = traitOr(a.traits(), code, trait);
        const Trait& fromB = traitOr(b.traits(), code, trait);
        const double base = std::floor((fromA.base + fromB.base) / 2.0);
        const int modifier = floorDivide(fromA.modifier + fromB.modifier, 2);
        trait.base = base;
        trait.modifier = modifier;
    }

    std::optional<std::string> healthRoll = a.healthRoll();
    if (b.healthRoll().has_value() && (!healthRoll.has_value() || lowerRoll(*b.healthRoll(), *healthRoll))) {
        healthRoll = b.healthRoll();
    }

    Core::logDebug("Merged " + a.name() + " and " + b.name() + " into " + name);
    return Archetype(std::move(name), std::move(merged), std::move(healthRoll));
}

}  // namespace Forge::RPG
