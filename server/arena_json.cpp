#include "arena_json.hpp"
#include "../engine/arena_errors.hpp"

#include <fstream>
#include <iostream>

using nlohmann::json;

namespace spacearena {

void to_json(json &j, const Position &p) {
    j = json::array({p.x, p.y});
}

void from_json(const json &j, Position &p) {
    if (!j.is_array() || j.size() != 2 ||
        !j[0].is_number_integer() || !j[1].is_number_integer()) {
        throw ValidationError("a cell must be [x, y], got " + j.dump());
    }
    p.x = j[0].get<int>();
    p.y = j[1].get<int>();
}

static json playerMap(const std::vector<PlayerView> &players) {
    json m = json::object();
    for (const auto &p : players)
        m[p.id] = p;
    return m;
}

void to_json(json &j, const PlayerView &p) {
    j = json{
        {"position", p.position},
        {"rotation", p.rotation},
        {"lives", p.lives},
        {"shield_active", p.shieldActive},
        {"shield_available", p.shieldAvailable},
        {"active", p.active},
        {"name", p.name}
    };
}

void to_json(json &j, const LaserView &l) {
    j = json{
        {"position", l.position},
        {"direction", l.direction},
        {"owner_id", l.ownerId}
    };
}

void to_json(json &j, const StateView &s) {
    j = json{
        {"width", s.width},
        {"height", s.height},
        {"players", playerMap(s.players)},
        {"walls", s.walls},
        {"mines", s.mines},
        {"lasers", s.lasers},
        {"game_over", s.gameOver}
    };
}

void to_json(json &j, const PlayerStateView &s) {
    j = json{{"players", playerMap(s.players)}};
}

void to_json(json &j, const EnvironmentView &e) {
    j = json{
        {"player_id", e.playerId},
        {"radius", e.radius},
        {"walls", e.walls},
        {"mines", e.mines},
        {"lasers", e.lasers},
        {"game_over", e.gameOver}
    };
}

void to_json(json &j, const PlayerStats &s) {
    j = json{
        {"player_id", s.playerId},
        {"name", s.name},
        {"seconds_survived", s.secondsSurvived},
        {"laser_hits", s.laserHits},
        {"lives_lost", s.livesLost},
        {"is_last_surviving", s.lastSurviving}
    };
}

// ========================================================
// Config
// ========================================================

static int intField(const json &j, const char *key, int current) {
    if (!j.contains(key)) return current;
    if (!j[key].is_number_integer())
        throw ValidationError(std::string("config field '") + key + "' must be an integer");
    return j[key].get<int>();
}

static std::vector<Position> cellList(const json &j, const char *key) {
    if (!j[key].is_array())
        throw ValidationError(std::string("config field '") + key + "' must be a list of [x, y]");
    std::vector<Position> out;
    for (const auto &c : j[key])
        out.push_back(c.get<Position>());
    return out;
}

void applyConfigJson(ArenaConfig &cfg, const json &j) {
    if (!j.is_object())
        throw ValidationError("arena config must be a JSON object");

    cfg.width = intField(j, "width", cfg.width);
    cfg.height = intField(j, "height", cfg.height);
    cfg.maxPlayers = intField(j, "max_players", cfg.maxPlayers);
    cfg.initialLives = intField(j, "initial_lives", cfg.initialLives);
    cfg.shieldDuration = std::chrono::milliseconds(
        intField(j, "shield_duration_ms", (int)cfg.shieldDuration.count()));
    cfg.mineDamage = intField(j, "mine_damage", cfg.mineDamage);
    cfg.laserDamage = intField(j, "laser_damage", cfg.laserDamage);
    cfg.laserRange = intField(j, "laser_range", cfg.laserRange);
    cfg.environmentRadius = intField(j, "environment_radius", cfg.environmentRadius);

    if (j.contains("walls"))        cfg.walls = cellList(j, "walls");
    if (j.contains("mines"))        cfg.mines = cellList(j, "mines");
    if (j.contains("spawn_points")) cfg.spawnPoints = cellList(j, "spawn_points");

    // {"border": {"top_row": 1}} surrounds the final grid with walls.
    if (j.contains("border")) {
        const json &b = j["border"];
        if (!b.is_object())
            throw ValidationError("config field 'border' must be an object");
        auto ring = borderWalls(cfg.width, cfg.height, intField(b, "top_row", 0));
        cfg.walls.insert(cfg.walls.end(), ring.begin(), ring.end());
    }

    if (j.contains("verbose")) {
        if (!j["verbose"].is_boolean())
            throw ValidationError("config field 'verbose' must be a boolean");
        cfg.verbose = j["verbose"].get<bool>();
    }

    validateConfig(cfg);
}

ArenaConfig loadArenaConfig(const std::string &path) {
    std::ifstream in(path);
    if (!in.is_open())
        throw ValidationError("cannot open arena config '" + path + "'");

    json j;
    try {
        in >> j;
    } catch (const json::exception &e) {
        throw ValidationError("arena config '" + path + "' is not valid JSON: " + e.what());
    }

    ArenaConfig cfg = defaultArenaConfig();
    applyConfigJson(cfg, j);
    std::cout << "[Config] Loaded arena " << cfg.width << "x" << cfg.height
              << " from " << path << "\n";
    return cfg;
}

}
