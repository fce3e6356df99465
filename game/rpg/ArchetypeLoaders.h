// JSON loaders for chargen data (data/rpg/*.json) and trait table snapshots.
#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "Chargen.h"

namespace Forge::RPG {

// Reads chargen constants; a missing file keeps every default, and a missing
// or mistyped key keeps that key's default.
ChargenConfig loadChargenConfig(const std::string& path);

// Reads archetype overrides and health rolls. Archetypes absent from the file
// (or the whole file, if missing) fall back to the built-in table.
ArchetypeRegistry loadArchetypeRegistry(const std::string& path);

// Snapshot of a trait store keyed by trait code, for the host to persist.
nlohmann::json traitTableToJson(const TraitTable& traits);
// Inverse of traitTableToJson; nullopt when the document is not a valid snapshot.
std::optional<TraitTable> traitTableFromJson(const nlohmann::json& j);

}  // namespace Forge::RPG
