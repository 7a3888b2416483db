#include "physics.hpp"
#include "arena_errors.hpp"

#include <algorithm>

namespace spacearena {

RuleSet rulesFromConfig(const ArenaConfig &config) {
    RuleSet r;
    r.mineDamage = config.mineDamage;
    r.laserDamage = config.laserDamage;
    r.laserRange = config.effectiveLaserRange();
    r.shieldDuration = config.shieldDuration;
    return r;
}

static Spaceship& actingShip(GameState &world, const std::string &playerId) {
    Spaceship *ship = findPlayer(world, playerId);
    if (!ship)
        throw NotFoundError("unknown player '" + playerId + "'");
    if (world.gameOver)
        throw GameOverError("the game is over");
    if (!ship->active)
        throw InactivePlayerError("player '" + playerId + "' is eliminated");
    return *ship;
}

// Ships that were alive when the pass began stay targets for the whole pass.
static std::vector<bool> targetsAtStart(const GameState &world) {
    std::vector<bool> t;
    t.reserve(world.players.size());
    for (const auto &p : world.players)
        t.push_back(p.active);
    return t;
}

static void damageShip(Resolution &r, Spaceship &ship, HitKind kind,
                       const std::string &source, int amount, TimePoint now) {
    HitEvent e;
    e.kind = kind;
    e.targetId = ship.id;
    e.sourceId = source;
    e.at = ship.position;
    e.shielded = ship.shieldActive(now);
    e.damage = applyDamage(ship, amount, now);
    e.eliminated = e.damage > 0 && ship.lives == 0;
    r.hits.push_back(e);
}

static bool detonateMineUnder(Resolution &r, Spaceship &ship,
                              const RuleSet &rules, TimePoint now) {
    auto &mines = r.world.mines;
    for (auto it = mines.begin(); it != mines.end(); ++it) {
        if (it->position == ship.position) {
            mines.erase(it);
            damageShip(r, ship, HitKind::Mine, "", rules.mineDamage, now);
            return true;
        }
    }
    return false;
}

// Returns false when the laser is destroyed entering the cell.
static bool laserEnters(Resolution &r, const Laser &laser, Position cell,
                        const std::vector<bool> &targets,
                        const RuleSet &rules, TimePoint now) {
    GameState &w = r.world;

    if (!w.grid.inBounds(cell) || w.grid.isWall(cell))
        return false;

    for (auto it = w.mines.begin(); it != w.mines.end(); ++it) {
        if (it->position == cell) {
            w.mines.erase(it);
            r.minesShot.push_back(cell);
            return false;
        }
    }

    for (std::size_t i = 0; i < w.players.size(); ++i) {
        Spaceship &ship = w.players[i];
        if (!targets[i] || ship.id == laser.ownerId) continue;
        if (ship.position == cell) {
            damageShip(r, ship, HitKind::Laser, laser.ownerId, rules.laserDamage, now);
            return false;
        }
    }
    return true;
}

Resolution resolveMove(const GameState &world, const std::string &playerId,
                       const RuleSet &rules, TimePoint now) {
    Resolution r;
    r.world = world;
    Spaceship &ship = actingShip(r.world, playerId);

    ship.position = moveForward(ship, r.world.grid);

    // Mine first, then enemy lasers sitting on the cell, oldest first.
    detonateMineUnder(r, ship, rules, now);

    auto &lasers = r.world.lasers;
    for (auto it = lasers.begin(); it != lasers.end();) {
        if (it->position == ship.position && it->ownerId != ship.id) {
            std::string owner = it->ownerId;
            it = lasers.erase(it);
            damageShip(r, ship, HitKind::Laser, owner, rules.laserDamage, now);
        } else {
            ++it;
        }
    }

    r.gameEnded = updateGameOver(r.world);
    return r;
}

Resolution resolveRotate(const GameState &world, const std::string &playerId,
                         Turn turn, const RuleSet &, TimePoint) {
    Resolution r;
    r.world = world;
    Spaceship &ship = actingShip(r.world, playerId);
    rotateShip(ship, turn);
    return r;
}

Resolution resolveFire(const GameState &world, const std::string &playerId,
                       const RuleSet &rules, TimePoint now) {
    Resolution r;
    r.world = world;
    Spaceship &ship = actingShip(r.world, playerId);

    Laser laser = fireLaser(ship, rules.laserRange, r.world.nextLaserSeq++);

    std::vector<bool> targets = targetsAtStart(r.world);
    if (laserEnters(r, laser, laser.position, targets, rules, now))
        r.world.lasers.push_back(laser);

    r.gameEnded = updateGameOver(r.world);
    return r;
}

Resolution resolveShield(const GameState &world, const std::string &playerId,
                         const RuleSet &rules, TimePoint now) {
    Resolution r;
    r.world = world;
    Spaceship &ship = actingShip(r.world, playerId);
    activateShield(ship, now, rules.shieldDuration);
    return r;
}

Resolution resolveAdvance(const GameState &world, const RuleSet &rules, TimePoint now) {
    Resolution r;
    r.world = world;
    GameState &w = r.world;
    if (w.gameOver)
        return r;

    std::vector<bool> targets = targetsAtStart(w);

    std::vector<Laser> moving;
    moving.swap(w.lasers);
    std::sort(moving.begin(), moving.end(),
              [](const Laser &a, const Laser &b) { return a.seq < b.seq; });

    for (auto &laser : moving) {
        if (laser.remainingRange <= 0)
            continue;
        Position next = translate(laser.position, laser.direction);
        if (!laserEnters(r, laser, next, targets, rules, now))
            continue;
        laser.position = next;
        laser.remainingRange--;
        w.lasers.push_back(laser);
    }

    for (std::size_t i = 0; i < w.players.size(); ++i) {
        if (targets[i])
            detonateMineUnder(r, w.players[i], rules, now);
    }

    r.gameEnded = updateGameOver(w);
    return r;
}

bool updateGameOver(GameState &world) {
    if (world.gameOver)
        return false;

    int alive = activePlayerCount(world);
    if (alive >= 2)
        world.started = true;

    // A lone ship keeps playing until it is eliminated.
    bool ended = world.started ? alive <= 1 : (alive == 0 && !world.players.empty());
    if (ended) {
        world.gameOver = true;
        return true;
    }
    return false;
}

bool isFreeCell(const GameState &world, Position p) {
    return world.grid.isOpen(p) && !hasMineAt(world, p) && !hasShipAt(world, p);
}

bool findSpawn(const GameState &world, const std::vector<Position> &preferred, Position &out) {
    for (const auto &p : preferred) {
        if (isFreeCell(world, p)) {
            out = p;
            return true;
        }
    }

    // Rings of growing Chebyshev radius around the centre, row-major inside a ring.
    const Position centre{world.grid.width / 2, world.grid.height / 2};
    const int maxRadius = std::max(world.grid.width, world.grid.height);
    for (int radius = 0; radius <= maxRadius; ++radius) {
        for (int y = centre.y - radius; y <= centre.y + radius; ++y) {
            for (int x = centre.x - radius; x <= centre.x + radius; ++x) {
                Position p{x, y};
                if (chebyshevDistance(p, centre) != radius) continue;
                if (isFreeCell(world, p)) {
                    out = p;
                    return true;
                }
            }
        }
    }
    return false;
}

}
