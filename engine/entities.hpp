#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "position.hpp"

namespace spacearena {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

struct Spaceship {
    std::string id;
    std::string name;
    Position position;
    int rotation = 0;
    int lives = 0;

    bool shieldUsed = false;
    TimePoint shieldExpiresAt{};

    bool active = true;

    // Derived on every call; there is no cached shield flag to go stale.
    bool shieldActive(TimePoint now) const {
        return shieldUsed && now < shieldExpiresAt;
    }
};

struct Laser {
    std::uint64_t seq = 0;     // creation order
    Position position;
    int direction = 0;
    std::string ownerId;
    int remainingRange = 0;
};

struct Mine {
    Position position;
};

// Immutable wall cells, shared between world copies.
class WallSet {
public:
    WallSet() = default;
    explicit WallSet(const std::vector<Position> &cells);

    bool contains(Position p) const;
    const std::vector<Position> &cells() const { return m_cells; }
    std::size_t size() const { return m_cells.size(); }

private:
    std::vector<Position> m_cells;
    std::unordered_set<Position, PositionHash> m_lookup;
};

struct Grid {
    int width = 0;
    int height = 0;
    std::shared_ptr<const WallSet> walls;

    bool inBounds(Position p) const { return spacearena::inBounds(p, width, height); }
    bool isWall(Position p) const { return walls && walls->contains(p); }
    bool isOpen(Position p) const { return inBounds(p) && !isWall(p); }
};

// Target cell of a forward move. Throws IllegalMoveError on a wall or the edge.
Position moveForward(const Spaceship &ship, const Grid &grid);

void rotateShip(Spaceship &ship, Turn turn);

// Laser one cell ahead of the ship, same heading. Throws InactivePlayerError.
Laser fireLaser(const Spaceship &ship, int range, std::uint64_t seq);

// Throws ShieldAlreadyUsedError if the ship already spent its shield.
void activateShield(Spaceship &ship, TimePoint now, std::chrono::milliseconds duration);

// Returns the lives actually lost (0 while shielded).
int applyDamage(Spaceship &ship, int amount, TimePoint now);

// "left" / "right"; anything else throws ValidationError.
Turn parseTurn(const std::string &s);

} 
