// Helper loaders for chargen JSON data.
#include "ArchetypeLoaders.h"

#include <filesystem>
#include <fstream>
#include <map>

#include "../../engine/core/Logger.h"

namespace Forge::RPG {

using nlohmann::json;

namespace {
std::optional<json> readJsonFile(const std::string& path) {
    if (!std::filesystem::exists(path)) return std::nullopt;
    std::ifstream f(path);
    if (!f.is_open()) {
        Core::logWarn("Unable to open " + path);
        return std::nullopt;
    }
    json j;
    try {
        f >> j;
    } catch (const json::exception& e) {
        Core::logWarn("Malformed JSON in " + path + ": " + e.what());
        return std::nullopt;
    }
    return j;
}

// Overwrites `out` with j[key] when present and of the right type; a bad key keeps its default.
template <typename T>
void readKey(const json& j, const char* key, T& out, const std::string& path) {
    if (!j.contains(key)) return;
    try {
        out = j.at(key).get<T>();
    } catch (const json::exception& e) {
        Core::logWarn("Ignoring '" + std::string(key) + "' in " + path + ": " + e.what());
    }
}

std::optional<TraitOverride> parseOverride(const std::string& code, const json& j) {
    if (!j.is_object()) return std::nullopt;
    TraitOverride o{};
    o.code = code;
    if (j.contains("base")) {
        if (!j["base"].is_number()) return std::nullopt;
        o.base = j["base"].get<double>();
    }
    if (j.contains("modifier")) {
        if (!j["modifier"].is_number_integer()) return std::nullopt;
        o.modifier = j["modifier"].get<int>();
    }
    return o;
}
}  // namespace

ChargenConfig loadChargenConfig(const std::string& path) {
    ChargenConfig cfg{};
    auto doc = readJsonFile(path);
    if (!doc.has_value() || !doc->is_object()) return cfg;
    const json& j = *doc;
    readKey(j, "totalPrimaryPoints", cfg.totalPrimaryPoints, path);
    readKey(j, "primaryMin", cfg.primaryMin, path);
    readKey(j, "primaryMax", cfg.primaryMax, path);
    readKey(j, "magicMin", cfg.magicMin, path);
    readKey(j, "carryFactor", cfg.carryFactor, path);
    readKey(j, "liftFactor", cfg.liftFactor, path);
    readKey(j, "pushFactor", cfg.pushFactor, path);
    readKey(j, "manaMaxWhenMagical", cfg.manaMaxWhenMagical, path);
    return cfg;
}

ArchetypeRegistry loadArchetypeRegistry(const std::string& path) {
    std::map<std::string, ArchetypeSpec> specs;
    for (auto& spec : defaultArchetypeSpecs()) specs[spec.name] = spec;

    auto doc = readJsonFile(path);
    if (!doc.has_value() || !doc->contains("archetypes") || !(*doc)["archetypes"].is_array()) {
        std::vector<ArchetypeSpec> out;
        for (auto& [name, spec] : specs) out.push_back(spec);
        return ArchetypeRegistry(std::move(out));
    }

    const TraitTable defaults = baseTraitTable();
    for (const auto& a : (*doc)["archetypes"]) {
        if (!a.is_object() || !a.contains("name") || !a["name"].is_string()) {
            Core::logWarn("Skipping archetype entry without a name in " + path);
            continue;
        }
        ArchetypeSpec spec{};
        spec.name = titleCase(a["name"].get<std::string>());
        if (!isValidArchetype(spec.name)) {
            Core::logWarn("Skipping unknown archetype '" + spec.name + "' in " + path);
            continue;
        }
        spec.healthRoll = specs[spec.name].healthRoll;
        if (a.contains("healthRoll") && a["healthRoll"].is_string()) {
            spec.healthRoll = a["healthRoll"].get<std::string>();
            if (!parseDiceExpression(spec.healthRoll).has_value()) {
                Core::logWarn("Archetype '" + spec.name + "' has an unparsable health roll '" + spec.healthRoll + "'");
            }
        }
        if (a.contains("traits") && a["traits"].is_object()) {
            for (const auto& kv : a["traits"].items()) {
                if (defaults.count(kv.key()) == 0) {
                    Core::logWarn("Archetype '" + spec.name + "' overrides unknown trait '" + kv.key() + "'");
                    continue;
                }
                auto o = parseOverride(kv.key(), kv.value());
                if (!o.has_value()) {
                    Core::logWarn("Archetype '" + spec.name + "' has a malformed entry for '" + kv.key() + "'");
                    continue;
                }
                spec.overrides.push_back(*o);
            }
        }
        specs[spec.name] = std::move(spec);
    }

    std::vector<ArchetypeSpec> out;
    for (auto& [name, spec] : specs) out.push_back(std::move(spec));
    return ArchetypeRegistry(std::move(out));
}

json traitTableToJson(const TraitTable& traits) {
    json out = json::object();
    for (const auto& [code, t] : traits) {
        json entry;
        entry["kind"] = std::string(Traits::toString(t.kind));
        entry["name"] = t.displayName;
        entry["base"] = t.base;
        entry["modifier"] = t.modifier;
        entry["actual"] = t.actual();
        if (t.min.has_value()) entry["min"] = *t.min;
        if (t.max.has_value()) entry["max"] = *t.max;
        if (!t.extra.empty()) entry["extra"] = t.extra;
        out[code] = entry;
    }
    return out;
}

std::optional<TraitTable> traitTableFromJson(const json& j) {
    if (!j.is_object()) return std::nullopt;
    TraitTable out;
    try {
        for (const auto& kv : j.items()) {
            const json& e = kv.value();
            if (!e.is_object()) return std::nullopt;
            auto kind = Traits::parseTraitKind(e.value("kind", std::string("trait")));
            if (!kind.has_value()) return std::nullopt;
            if (!e.contains("base") || !e["base"].is_number()) return std::nullopt;
            Trait t{};
            t.kind = *kind;
            t.base = e["base"].get<double>();
            t.modifier = e.value("modifier", 0);
            t.displayName = e.value("name", kv.key());
            if (e.contains("min") && e["min"].is_number()) t.min = e["min"].get<double>();
            if (e.contains("max") && e["max"].is_number()) t.max = e["max"].get<double>();
            if (e.contains("extra") && e["extra"].is_object()) t.extra = e["extra"];
            out[kv.key()] = std::move(t);
        }
    } catch (const json::exception& e) {
        Core::logWarn(std::string("Rejected trait snapshot: ") + e.what());
        return std::nullopt;
    }
    return out;
}

}  // namespace Forge::RPG
