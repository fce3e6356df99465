#include "Chargen.h"

#include "../../engine/core/Logger.h"

namespace Forge::RPG {

namespace {
double allocatedPoints(const TraitTable& traits) {
    double total = 0.0;
    for (std::string_view code : kPrimaryTraits) {
        total += traits.at(std::string(code)).base;
    }
    return total;
}

int lowerBoundFor(std::string_view code, const ChargenConfig& cfg) {
    return code == "MAG" ? cfg.magicMin : cfg.primaryMin;
}

Trait& traitAt(TraitTable& traits, const char* code) { return traits.at(code); }
}  // namespace

void applyArchetype(Character& character, std::string_view name, bool reset, const ArchetypeRegistry& registry) {
    const std::string requested = capitalize(name);
    if (!isValidArchetype(requested)) {
        throw ArchetypeError(ArchetypeErrorKind::InvalidArchetype, "Invalid archetype.");
    }

    std::string target = requested;
    if (character.archetype.has_value() && !reset) {
        if (*character.archetype == requested) {
            throw ArchetypeError(ArchetypeErrorKind::AlreadyApplied, "Character is already a " + requested);
        }
        target = *character.archetype + "-" + requested;
    }

    Archetype archetype = loadArchetype(target, registry);
    character.traits = archetype.traits();
    character.archetype = archetype.name();
    Core::logInfo("Applied archetype " + archetype.name());
}

double getRemainingAllocation(const TraitTable& traits, const ChargenConfig& cfg) {
    return static_cast<double>(cfg.totalPrimaryPoints) - allocatedPoints(traits);
}

PrimaryTraitCheck validatePrimaryTraits(const TraitTable& traits, const ChargenConfig& cfg) {
    const double total = allocatedPoints(traits);
    if (total > cfg.totalPrimaryPoints) return {false, "Too many trait points allocated."};
    if (total < cfg.totalPrimaryPoints) return {false, "Not enough trait points allocated."};
    return {true, std::nullopt};
}

PrimaryTraitCheck checkPrimaryTraitBounds(const TraitTable& traits, const ChargenConfig& cfg) {
    for (std::string_view code : kPrimaryTraits) {
        const double base = traits.at(std::string(code)).base;
        const int lo = lowerBoundFor(code, cfg);
        if (base < lo || base > cfg.primaryMax) {
            return {false, std::string(code) + " must be between " + std::to_string(lo) + " and " +
                               std::to_string(cfg.primaryMax) + "."};
        }
    }
    return {true, std::nullopt};
}

PrimaryTraitCheck allocatePrimaryTrait(TraitTable& traits, std::string_view code, int delta, const ChargenConfig& cfg) {
    if (!isPrimaryTrait(code)) return {false, std::string(code) + " is not a primary trait."};
    Trait& trait = traits.at(std::string(code));
    const double next = trait.base + delta;
    const int lo = lowerBoundFor(code, cfg);
    if (next < lo || next > cfg.primaryMax) {
        return {false, std::string(code) + " must be between " + std::to_string(lo) + " and " +
                           std::to_string(cfg.primaryMax) + "."};
    }
    if (delta > 0 && delta > getRemainingAllocation(traits, cfg)) {
        return {false, "Not enough trait points remaining."};
    }
    trait.base = next;
    return {true, std::nullopt};
}

void calculateSecondaryTraits(TraitTable& traits, const ChargenConfig& cfg) {
    const double str = traitAt(traits, "STR").actual();
    const double per = traitAt(traits, "PER").actual();
    const double intel = traitAt(traits, "INT").actual();
    const double dex = traitAt(traits, "DEX").actual();
    const double vit = traitAt(traits, "VIT").actual();

    // secondary
    traitAt(traits, "HP").base = vit;
    traitAt(traits, "SP").base = vit;
    // save rolls
    traitAt(traits, "FORT").base = vit;
    traitAt(traits, "REFL").base = dex;
    traitAt(traits, "WILL").base = intel;
    // combat
    traitAt(traits, "ATKM").base = str;
    traitAt(traits, "ATKR").base = per;
    traitAt(traits, "ATKU").base = dex;
    traitAt(traits, "DEF").base = dex;
    // mana
    const double manaMax = traitAt(traits, "MAG").base > 0 ? cfg.manaMaxWhenMagical : 0.0;
    traitAt(traits, "BM").max = manaMax;
    traitAt(traits, "WM").max = manaMax;
    // carrying capacity
    Trait& strength = traitAt(traits, "STR");
    strength.extra["carry_factor"] = cfg.carryFactor;
    strength.extra["lift_factor"] = cfg.liftFactor;
    strength.extra["push_factor"] = cfg.pushFactor;
    traitAt(traits, "ENC").max = strength.extraNumber("lift_factor") * str;
}

}  // namespace Forge::RPG
