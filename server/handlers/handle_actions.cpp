#include "../arena_server.hpp"
#include "../arena_json.hpp"
#include "../../engine/arena_errors.hpp"

using namespace spacearena;

json handleMove(ArenaManager &arena, const json &d) {
    return arena.move(requirePlayerId(d));
}

json handleRotate(ArenaManager &arena, const json &d) {
    std::string id = requirePlayerId(d);
    if (!d.contains("direction") || !d["direction"].is_string())
        throw ValidationError("rotate needs a direction of 'left' or 'right'");

    Turn turn = parseTurn(d["direction"].get<std::string>());
    return arena.rotate(id, turn);
}

json handleFire(ArenaManager &arena, const json &d) {
    return arena.fire(requirePlayerId(d));
}

json handleShield(ArenaManager &arena, const json &d) {
    return arena.shield(requirePlayerId(d));
}
