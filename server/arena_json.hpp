#ifndef SPACEARENA_ARENA_JSON_HPP
#define SPACEARENA_ARENA_JSON_HPP

#include <nlohmann/json.hpp>
#include <string>

#include "../engine/arena_config.hpp"
#include "../engine/arena_manager.hpp"

namespace spacearena {

// Positions travel as [x, y].
void to_json(nlohmann::json &j, const Position &p);
void from_json(const nlohmann::json &j, Position &p);

void to_json(nlohmann::json &j, const PlayerView &p);
void to_json(nlohmann::json &j, const LaserView &l);
void to_json(nlohmann::json &j, const StateView &s);
void to_json(nlohmann::json &j, const PlayerStateView &s);
void to_json(nlohmann::json &j, const EnvironmentView &e);
void to_json(nlohmann::json &j, const PlayerStats &s);

// Overrides fields of cfg with whatever the object names. Throws
// ValidationError on a wrong type or shape.
void applyConfigJson(ArenaConfig &cfg, const nlohmann::json &j);

// defaultArenaConfig() plus the overrides in the file.
ArenaConfig loadArenaConfig(const std::string &path);

}

#endif
