#pragma once
#include <chrono>
#include <vector>

#include "position.hpp"

namespace spacearena {

struct ArenaConfig {
    int width = 30;
    int height = 20;

    int maxPlayers = 4;
    int initialLives = 5;

    std::chrono::milliseconds shieldDuration{3000};

    int mineDamage = 3;
    int laserDamage = 1;

    // Cells a laser may travel before it fizzles. 0 = max(width, height).
    int laserRange = 0;

    int environmentRadius = 5;

    std::vector<Position> walls;
    std::vector<Position> mines;

    // Tried in order on register; see ArenaManager::registerPlayer.
    std::vector<Position> spawnPoints;

    bool verbose = false;

    int effectiveLaserRange() const;
};

// The classic 30x20 arena: border walls, obstacle field and mine field.
ArenaConfig defaultArenaConfig();

// An empty arena of the given size with no walls, mines or spawn points.
ArenaConfig emptyArenaConfig(int width, int height);

std::vector<Position> borderWalls(int width, int height, int topRow);

// Throws ValidationError when the config cannot describe a playable arena.
void validateConfig(const ArenaConfig &config);

} 
