#include "arena_config.hpp"
#include "arena_errors.hpp"

#include <algorithm>
#include <iterator>
#include <string>
#include <unordered_set>

namespace spacearena {

namespace {

const Position kObstacleWalls[] = {
    {6, 3}, {7, 3}, {8, 3},
    {10, 4}, {11, 5}, {12, 6},
    {14, 4}, {15, 4}, {16, 4},

    {20, 3}, {21, 3}, {22, 4}, {22, 5},
    {19, 6}, {18, 7}, {17, 8},

    {6, 9}, {7, 9}, {8, 10}, {9, 11},
    {10, 12}, {11, 12}, {12, 12},

    {14, 10}, {15, 10}, {16, 10}, {17, 10},
    {18, 11}, {19, 12}, {20, 13},

    {8, 15}, {9, 15}, {10, 15},
    {12, 16}, {13, 17}, {14, 17},

    {16, 16}, {17, 15}, {18, 15},
    {21, 14}, {22, 13}, {23, 12}
};

const Position kMines[] = {
    // upper section
    {2, 2}, {13, 2}, {18, 2}, {25, 4},
    // left corridor
    {3, 7}, {5, 11}, {4, 14},
    // centre
    {9, 7}, {13, 8}, {19, 9}, {24, 10},
    // right corridor
    {26, 7}, {27, 11}, {25, 15},
    // lower section
    {11, 14}, {15, 13}, {20, 16}
};

}

int ArenaConfig::effectiveLaserRange() const {
    if (laserRange > 0) return laserRange;
    return std::max(width, height);
}

std::vector<Position> borderWalls(int width, int height, int topRow) {
    std::vector<Position> out;
    std::unordered_set<Position, PositionHash> seen;
    auto add = [&](int x, int y) {
        Position p{x, y};
        if (seen.insert(p).second) out.push_back(p);
    };

    for (int x = 0; x < width; ++x) {
        add(x, topRow);
        add(x, height - 1);
    }
    for (int y = 0; y < height; ++y) {
        add(0, y);
        add(width - 1, y);
    }
    return out;
}

ArenaConfig defaultArenaConfig() {
    ArenaConfig cfg;

    // Row 0 is reserved for the viewer's status strip, so the top border sits on row 1.
    cfg.walls = borderWalls(cfg.width, cfg.height, 1);
    for (const auto &w : kObstacleWalls)
        cfg.walls.push_back(w);

    cfg.mines.assign(std::begin(kMines), std::end(kMines));

    const int cx = cfg.width / 2;
    const int cy = cfg.height / 2;
    cfg.spawnPoints = {
        {cx, cy},
        {cx + 3, cy},
        {cx - 3, cy},
        {cx, cy + 3}
    };
    return cfg;
}

ArenaConfig emptyArenaConfig(int width, int height) {
    ArenaConfig cfg;
    cfg.width = width;
    cfg.height = height;
    return cfg;
}

void validateConfig(const ArenaConfig &config) {
    if (config.width <= 0 || config.height <= 0)
        throw ValidationError("arena size must be positive");
    if (config.maxPlayers <= 0)
        throw ValidationError("maxPlayers must be positive");
    if (config.initialLives <= 0)
        throw ValidationError("initialLives must be positive");
    if (config.shieldDuration.count() < 0)
        throw ValidationError("shieldDuration must not be negative");
    if (config.mineDamage < 0 || config.laserDamage < 0)
        throw ValidationError("damage values must not be negative");
    if (config.laserRange < 0)
        throw ValidationError("laserRange must not be negative");
    if (config.environmentRadius < 0)
        throw ValidationError("environmentRadius must not be negative");

    auto check = [&](const std::vector<Position> &cells, const char *what) {
        for (const auto &p : cells) {
            if (!inBounds(p, config.width, config.height)) {
                throw ValidationError(std::string(what) + " cell (" +
                                      std::to_string(p.x) + "," +
                                      std::to_string(p.y) + ") is outside the arena");
            }
        }
    };
    check(config.walls, "wall");
    check(config.mines, "mine");
    check(config.spawnPoints, "spawn");
}

} 
