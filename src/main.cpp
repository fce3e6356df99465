// forge_sheet: applies archetypes to a blank character and prints its trait table as JSON.
#include <iostream>
#include <string>
#include <vector>

#include "../engine/core/Logger.h"
#include "../game/rpg/ArchetypeLoaders.h"
#include "../game/rpg/Chargen.h"

namespace {
void printUsage() {
    std::cerr << "usage: forge_sheet [--config <dir>] [--derive] [--verbose] <archetype> [<archetype>]\n";
}
}  // namespace

int main(int argc, char** argv) {
    using namespace Forge;

    std::string configDir = "data/rpg";
    bool derive = false;
    std::vector<std::string> names;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configDir = argv[++i];
        } else if (arg == "--derive") {
            derive = true;
        } else if (arg == "--verbose") {
            Core::Logger::setMinLevel(Core::LogLevel::Debug);
        } else if (!arg.empty() && arg[0] == '-') {
            printUsage();
            return 2;
        } else {
            names.push_back(arg);
        }
    }
    if (names.empty() || names.size() > 2) {
        printUsage();
        return 2;
    }

    const RPG::ChargenConfig cfg = RPG::loadChargenConfig(configDir + "/chargen.json");
    RPG::Character character{};
    try {
        const RPG::ArchetypeRegistry registry = RPG::loadArchetypeRegistry(configDir + "/archetypes.json");
        for (const auto& name : names) {
            RPG::applyArchetype(character, name, false, registry);
        }
    } catch (const RPG::ArchetypeError& e) {
        Core::logError(e.what());
        return 1;
    }

    if (derive) {
        const auto bounds = RPG::checkPrimaryTraitBounds(character.traits, cfg);
        if (!bounds.valid) Core::logWarn(*bounds.message);
        RPG::calculateSecondaryTraits(character.traits, cfg);
    }

    nlohmann::json out;
    out["archetype"] = *character.archetype;
    out["remaining"] = RPG::getRemainingAllocation(character.traits, cfg);
    out["traits"] = RPG::traitTableToJson(character.traits);
    std::cout << out.dump(2) << '\n';
    return 0;
}
