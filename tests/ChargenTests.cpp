// Unit tests for archetype application, point allocation and trait derivation.
#include <cassert>
#include <string>

#include "../game/rpg/Chargen.h"

using namespace Forge::RPG;

namespace {
template <typename Fn>
bool throwsKind(Fn&& fn, ArchetypeErrorKind kind) {
    try {
        fn();
    } catch (const ArchetypeError& e) {
        return e.kind() == kind;
    }
    return false;
}

void setPrimaries(TraitTable& t, double str, double per, double intel, double dex, double cha, double vit,
                  double mag) {
    t.at("STR").base = str;
    t.at("PER").base = per;
    t.at("INT").base = intel;
    t.at("DEX").base = dex;
    t.at("CHA").base = cha;
    t.at("VIT").base = vit;
    t.at("MAG").base = mag;
}
}  // namespace

int main() {
    // First application sets the archetype and replaces the whole store
    {
        Character ch{};
        ch.traits["JUNK"] = Forge::Traits::makeTrait("Leftover", 3);
        applyArchetype(ch, "warrior");
        assert(ch.archetype == "Warrior");
        assert(ch.traits == loadArchetype("Warrior").traits());
        assert(ch.traits.count("JUNK") == 0);
    }

    // Re-applying the same archetype fails; a different one makes a dual
    {
        Character ch{};
        applyArchetype(ch, "warrior");
        assert(throwsKind([&] { applyArchetype(ch, "Warrior"); }, ArchetypeErrorKind::AlreadyApplied));
        assert(ch.archetype == "Warrior");

        ch.traits.at("STR").base = 9;
        applyArchetype(ch, "Scout");
        assert(ch.archetype == "Warrior-Scout");
        assert(ch.traits == loadArchetype("Scout-Warrior").traits());
        assert(ch.traits.at("STR").base == 5.0);

        // No triple archetypes, including re-adding one half of the dual
        assert(throwsKind([&] { applyArchetype(ch, "Arcanist"); }, ArchetypeErrorKind::TripleArchetype));
        assert(throwsKind([&] { applyArchetype(ch, "Warrior"); }, ArchetypeErrorKind::TripleArchetype));
        assert(ch.archetype == "Warrior-Scout");
    }

    // Dual name is canonical regardless of application order
    {
        Character ch{};
        applyArchetype(ch, "scout");
        applyArchetype(ch, "arcanist");
        assert(ch.archetype == "Arcanist-Scout");
    }

    // Reset discards the existing archetype
    {
        Character ch{};
        applyArchetype(ch, "Warrior");
        applyArchetype(ch, "Scout");
        applyArchetype(ch, "arcanist", true);
        assert(ch.archetype == "Arcanist");
        assert(ch.traits == loadArchetype("Arcanist").traits());
        applyArchetype(ch, "Arcanist", true);
        assert(ch.archetype == "Arcanist");
    }

    // Only the three base names may be applied
    {
        Character ch{};
        assert(throwsKind([&] { applyArchetype(ch, "paladin"); }, ArchetypeErrorKind::InvalidArchetype));
        assert(throwsKind([&] { applyArchetype(ch, "warrior-scout"); }, ArchetypeErrorKind::InvalidArchetype));
        assert(throwsKind([&] { applyArchetype(ch, ""); }, ArchetypeErrorKind::InvalidArchetype));
        assert(!ch.archetype.has_value());
        assert(ch.traits.empty());
    }

    // Remaining allocation, including over-allocation
    {
        assert(getRemainingAllocation(loadArchetype("Warrior").traits()) == 8);
        assert(getRemainingAllocation(loadArchetype("Scout").traits()) == 8);
        assert(getRemainingAllocation(loadArchetype("Arcanist").traits()) == 7);

        TraitTable t = baseTraitTable();
        setPrimaries(t, 10, 10, 10, 1, 1, 1, 0);
        assert(getRemainingAllocation(t) == -3);

        ChargenConfig cfg{};
        cfg.totalPrimaryPoints = 40;
        assert(getRemainingAllocation(t, cfg) == 7);
    }

    // Fractional primaries are summed before comparing against the budget
    {
        TraitTable t = baseTraitTable();
        setPrimaries(t, 4.5, 5.5, 5, 5, 5, 5, 0);
        assert(getRemainingAllocation(t) == 0.0);
        assert(validatePrimaryTraits(t).valid);

        t.at("STR").base = 4.0;
        assert(getRemainingAllocation(t) == 0.5);
        assert(validatePrimaryTraits(t).message == "Not enough trait points allocated.");

        t.at("STR").base = 5.0;
        assert(getRemainingAllocation(t) == -0.5);
        assert(validatePrimaryTraits(t).message == "Too many trait points allocated.");
    }

    // Validation distinguishes over and under allocation
    {
        TraitTable t = loadArchetype("Warrior").traits();
        auto under = validatePrimaryTraits(t);
        assert(!under.valid);
        assert(under.message == "Not enough trait points allocated.");

        t.at("STR").base += 3;
        t.at("VIT").base += 3;
        t.at("DEX").base += 2;
        auto exact = validatePrimaryTraits(t);
        assert(exact.valid);
        assert(!exact.message.has_value());

        t.at("CHA").base += 1;
        auto over = validatePrimaryTraits(t);
        assert(!over.valid);
        assert(over.message == "Too many trait points allocated.");
    }

    // Total check ignores per-trait bounds; the bounds check is separate
    {
        TraitTable t = baseTraitTable();
        setPrimaries(t, 14, 0, 4, 4, 4, 4, 0);
        assert(validatePrimaryTraits(t).valid);
        auto bounds = checkPrimaryTraitBounds(t);
        assert(!bounds.valid);
        assert(bounds.message == "STR must be between 1 and 10.");

        setPrimaries(t, 10, 0, 6, 6, 4, 4, 0);
        bounds = checkPrimaryTraitBounds(t);
        assert(!bounds.valid);
        assert(bounds.message == "PER must be between 1 and 10.");

        setPrimaries(t, 10, 1, 5, 6, 4, 4, 0);
        assert(checkPrimaryTraitBounds(t).valid);
    }

    // Point allocation respects bounds and the remaining budget
    {
        TraitTable t = loadArchetype("Warrior").traits();
        assert(allocatePrimaryTrait(t, "STR", 4).valid);
        assert(t.at("STR").base == 10.0);
        assert(getRemainingAllocation(t) == 4);

        auto tooHigh = allocatePrimaryTrait(t, "STR", 1);
        assert(!tooHigh.valid);
        assert(t.at("STR").base == 10.0);

        auto broke = allocatePrimaryTrait(t, "CHA", 5);
        assert(!broke.valid);
        assert(broke.message == "Not enough trait points remaining.");
        assert(t.at("CHA").base == 4.0);

        assert(!allocatePrimaryTrait(t, "MAG", -1).valid);
        assert(allocatePrimaryTrait(t, "MAG", 1).valid);
        assert(!allocatePrimaryTrait(t, "PER", -1).valid);
        assert(!allocatePrimaryTrait(t, "HP", 1).valid);

        assert(allocatePrimaryTrait(t, "STR", -2).valid);
        assert(getRemainingAllocation(t) == 5);
    }

    // Returning points is allowed while over budget
    {
        TraitTable t = baseTraitTable();
        setPrimaries(t, 10, 10, 10, 1, 1, 1, 0);
        assert(allocatePrimaryTrait(t, "PER", -2).valid);
        assert(getRemainingAllocation(t) == -1);
    }

    // Derivation from finalized primary traits
    {
        Character ch{};
        applyArchetype(ch, "Warrior");
        setPrimaries(ch.traits, 9, 2, 1, 5, 4, 9, 0);
        assert(validatePrimaryTraits(ch.traits).valid);
        calculateSecondaryTraits(ch.traits);

        const TraitTable& t = ch.traits;
        assert(t.at("HP").base == 9.0);
        assert(t.at("SP").base == 9.0);
        assert(t.at("FORT").base == 9.0);
        assert(t.at("REFL").base == 5.0);
        assert(t.at("WILL").base == 1.0);
        assert(t.at("ATKM").base == 9.0);
        assert(t.at("ATKR").base == 2.0);
        assert(t.at("ATKU").base == 5.0);
        assert(t.at("DEF").base == 5.0);
        assert(t.at("BM").max == 0.0);
        assert(t.at("WM").max == 0.0);
        assert(t.at("STR").extraNumber("carry_factor") == 10.0);
        assert(t.at("STR").extraNumber("lift_factor") == 20.0);
        assert(t.at("STR").extraNumber("push_factor") == 40.0);
        assert(t.at("ENC").max == 180.0);
        assert(t.at("ENC").actual() == 0.0);
        assert(t.at("MV").actual() == 5.0);

        // Idempotent
        const TraitTable once = ch.traits;
        calculateSecondaryTraits(ch.traits);
        assert(ch.traits == once);
    }

    // Derivation reads actual values (modifiers included) and opens mana for casters
    {
        Character ch{};
        applyArchetype(ch, "Arcanist");
        ch.traits.at("VIT").base = 4;
        ch.traits.at("STR").modifier = 2;
        calculateSecondaryTraits(ch.traits);
        assert(ch.traits.at("SP").base == 4.0);
        assert(ch.traits.at("SP").actual() == 2.0);
        assert(ch.traits.at("ATKM").base == 3.0);
        assert(ch.traits.at("ENC").max == 60.0);
        assert(ch.traits.at("BM").max == 10.0);
        assert(ch.traits.at("WM").max == 10.0);

        ChargenConfig cfg{};
        cfg.liftFactor = 25.0;
        cfg.manaMaxWhenMagical = 12.0;
        calculateSecondaryTraits(ch.traits, cfg);
        assert(ch.traits.at("ENC").max == 75.0);
        assert(ch.traits.at("BM").max == 12.0);

        ch.traits.at("MAG").base = 0;
        calculateSecondaryTraits(ch.traits);
        assert(ch.traits.at("BM").max == 0.0);
    }
    return 0;
}
