#include "world.hpp"

namespace spacearena {

Spaceship* findPlayer(GameState &state, const std::string &playerId) {
    for (auto &p : state.players) {
        if (p.id == playerId) return &p;
    }
    return nullptr;
}

const Spaceship* findPlayer(const GameState &state, const std::string &playerId) {
    for (auto &p : state.players) {
        if (p.id == playerId) return &p;
    }
    return nullptr;
}

int activePlayerCount(const GameState &state) {
    int n = 0;
    for (const auto &p : state.players)
        if (p.active) n++;
    return n;
}

bool hasMineAt(const GameState &state, Position p) {
    for (const auto &m : state.mines)
        if (m.position == p) return true;
    return false;
}

bool hasShipAt(const GameState &state, Position p) {
    for (const auto &s : state.players)
        if (s.active && s.position == p) return true;
    return false;
}

} 
