#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "entities.hpp"

namespace spacearena {

// The authoritative world. Copies are cheap apart from the roster and
// hazard lists; walls are shared.
struct GameState {
    Grid grid;

    // Registration order: tie-break order and "Player N" ordinal.
    std::vector<Spaceship> players;

    std::vector<Mine> mines;
    std::vector<Laser> lasers;

    // Set once two ships have been active together.
    bool started = false;
    bool gameOver = false;

    std::uint64_t nextLaserSeq = 1;
};

Spaceship* findPlayer(GameState &state, const std::string &playerId);
const Spaceship* findPlayer(const GameState &state, const std::string &playerId);

int activePlayerCount(const GameState &state);

bool hasMineAt(const GameState &state, Position p);
bool hasShipAt(const GameState &state, Position p);

} 
