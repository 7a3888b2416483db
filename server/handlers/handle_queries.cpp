#include "../arena_server.hpp"
#include "../arena_json.hpp"
#include "../../engine/arena_errors.hpp"

using namespace spacearena;

json handleGetState(ArenaManager &arena, const json &) {
    return arena.getState();
}

json handleGetPlayerState(ArenaManager &arena, const json &) {
    return arena.getPlayerState();
}

json handleGetEnvironmentState(ArenaManager &arena, const json &d) {
    std::string id = requirePlayerId(d);

    int radius = -1;
    if (d.contains("radius")) {
        if (!d["radius"].is_number_integer() || d["radius"].get<int>() < 0)
            throw ValidationError("radius must be a non-negative integer");
        radius = d["radius"].get<int>();
    }

    return arena.getEnvironmentState(id, radius);
}

json handleGetStats(ArenaManager &arena, const json &) {
    json rows = json::array();
    for (const auto &s : arena.getStats())
        rows.push_back(s);
    return json{{"players", rows}};
}
