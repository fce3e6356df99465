// Trait definitions and the per-character trait table.
// A Trait is plain data: copying a TraitTable copies every trait and its metadata.
#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace Forge::Traits {

enum class TraitKind {
    Trait,    // scalar base + modifier
    Gauge,    // ranged pool (mana, health)
    Counter   // floored accumulator (encumbrance, action points)
};

struct Trait {
    TraitKind kind{TraitKind::Trait};
    double base{0.0};
    int modifier{0};
    std::optional<double> min{};
    std::optional<double> max{};
    std::string displayName{};
    // Free-form metadata (level boundaries, strength multipliers).
    nlohmann::json extra = nlohmann::json::object();

    // base + modifier, raised to min and lowered to max where those are set.
    double actual() const;

    // Numeric entry from `extra`, or `fallback` when absent or not a number.
    double extraNumber(std::string_view key, double fallback = 0.0) const;
};

bool operator==(const Trait& a, const Trait& b);
inline bool operator!=(const Trait& a, const Trait& b) { return !(a == b); }

// Ordered by code so snapshots and iteration are deterministic.
using TraitTable = std::map<std::string, Trait>;

std::string_view toString(TraitKind kind);
std::optional<TraitKind> parseTraitKind(std::string_view text);

// Convenience constructors used by the definition tables.
Trait makeTrait(std::string displayName, double base, int modifier = 0);
Trait makeGauge(std::string displayName, double base, std::optional<double> min = std::nullopt,
                std::optional<double> max = std::nullopt);
Trait makeCounter(std::string displayName, double base, double min = 0.0);

}  // namespace Forge::Traits
