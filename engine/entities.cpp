#include "entities.hpp"
#include "arena_errors.hpp"

namespace spacearena {

WallSet::WallSet(const std::vector<Position> &cells) {
    for (const auto &c : cells) {
        if (m_lookup.insert(c).second)
            m_cells.push_back(c);
    }
}

bool WallSet::contains(Position p) const {
    return m_lookup.count(p) != 0;
}

static std::string cellString(Position p) {
    return "(" + std::to_string(p.x) + "," + std::to_string(p.y) + ")";
}

Position moveForward(const Spaceship &ship, const Grid &grid) {
    Position target = translate(ship.position, ship.rotation);

    if (!grid.inBounds(target))
        throw IllegalMoveError("move to " + cellString(target) + " leaves the arena");
    if (grid.isWall(target))
        throw IllegalMoveError("move to " + cellString(target) + " is blocked by a wall");

    return target;
}

void rotateShip(Spaceship &ship, Turn turn) {
    ship.rotation = rotate90(ship.rotation, turn);
}

Laser fireLaser(const Spaceship &ship, int range, std::uint64_t seq) {
    if (!ship.active)
        throw InactivePlayerError("player '" + ship.id + "' is eliminated");

    Laser l;
    l.seq = seq;
    l.position = translate(ship.position, ship.rotation);
    l.direction = ship.rotation;
    l.ownerId = ship.id;
    l.remainingRange = range;
    return l;
}

void activateShield(Spaceship &ship, TimePoint now, std::chrono::milliseconds duration) {
    if (ship.shieldUsed)
        throw ShieldAlreadyUsedError("player '" + ship.id + "' already used the shield");

    ship.shieldUsed = true;
    ship.shieldExpiresAt = now + duration;
}

int applyDamage(Spaceship &ship, int amount, TimePoint now) {
    if (amount <= 0 || ship.shieldActive(now))
        return 0;

    int before = ship.lives;
    ship.lives -= amount;
    if (ship.lives <= 0) {
        ship.lives = 0;
        ship.active = false;
    }
    return before - ship.lives;
}

Turn parseTurn(const std::string &s) {
    if (s == "left") return Turn::Left;
    if (s == "right") return Turn::Right;
    throw ValidationError("direction must be 'left' or 'right', got '" + s + "'");
}

} 
