#include "../arena_server.hpp"
#include "../arena_json.hpp"
#include "../../engine/arena_errors.hpp"

using namespace spacearena;

std::string requirePlayerId(const json &d) {
    if (!d.is_object() || !d.contains("player_id"))
        throw ValidationError("missing player_id");
    if (!d["player_id"].is_string())
        throw ValidationError("player_id must be a string");

    std::string id = d["player_id"].get<std::string>();
    if (id.empty())
        throw ValidationError("player_id must not be empty");
    return id;
}

json handleRegister(ArenaManager &arena, const json &d) {
    std::string id = requirePlayerId(d);

    std::string name;
    if (d.contains("name") && !d["name"].is_null()) {
        if (!d["name"].is_string())
            throw ValidationError("name must be a string");
        name = d["name"].get<std::string>();
    }

    return arena.registerPlayer(id, name);
}

json handleUnregister(ArenaManager &arena, const json &d) {
    return arena.unregisterPlayer(requirePlayerId(d));
}
