#include "Trait.h"

#include <algorithm>
#include <utility>

namespace Forge::Traits {

double Trait::actual() const {
    double value = base + static_cast<double>(modifier);
    if (min.has_value()) value = std::max(value, *min);
    if (max.has_value()) value = std::min(value, *max);
    return value;
}

double Trait::extraNumber(std::string_view key, double fallback) const {
    if (!extra.is_object()) return fallback;
    auto it = extra.find(std::string(key));
    if (it == extra.end() || !it->is_number()) return fallback;
    return it->get<double>();
}

bool operator==(const Trait& a, const Trait& b) {
    return a.kind == b.kind && a.base == b.base && a.modifier == b.modifier && a.min == b.min && a.max == b.max &&
           a.displayName == b.displayName && a.extra == b.extra;
}

std::string_view toString(TraitKind kind) {
    switch (kind) {
        case TraitKind::Gauge:
            return "gauge";
        case TraitKind::Counter:
            return "counter";
        case TraitKind::Trait:
        default:
            return "trait";
    }
}

std::optional<TraitKind> parseTraitKind(std::string_view text) {
    if (text == "trait") return TraitKind::Trait;
    if (text == "gauge") return TraitKind::Gauge;
    if (text == "counter") return TraitKind::Counter;
    return std::nullopt;
}

Trait makeTrait(std::string displayName, double base, int modifier) {
    Trait t{};
    t.kind = TraitKind::Trait;
    t.base = base;
    t.modifier = modifier;
    t.displayName = std::move(displayName);
    return t;
}

Trait makeGauge(std::string displayName, double base, std::optional<double> min, std::optional<double> max) {
    Trait t{};
    t.kind = TraitKind::Gauge;
    t.base = base;
    t.min = min;
    t.max = max;
    t.displayName = std::move(displayName);
    return t;
}

Trait makeCounter(std::string displayName, double base, double min) {
    Trait t{};
    t.kind = TraitKind::Counter;
    t.base = base;
    t.min = min;
    t.displayName = std::move(displayName);
    return t;
}

}  // namespace Forge::Traits
