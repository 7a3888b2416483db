#include "entities.hpp"
#include "arena_config.hpp"
#include "arena_errors.hpp"
#include "../shared/test_check.hpp"

using namespace spacearena;

static Grid makeGrid(int w, int h, const std::vector<Position> &walls) {
    Grid g;
    g.width = w;
    g.height = h;
    g.walls = std::make_shared<const WallSet>(walls);
    return g;
}

static Spaceship makeShip(const std::string &id, Position at, int rotation, int lives = 5) {
    Spaceship s;
    s.id = id;
    s.name = id;
    s.position = at;
    s.rotation = rotation;
    s.lives = lives;
    return s;
}

static int test_walls() {
    WallSet set({{1, 1}, {2, 2}, {1, 1}});
    EXPECT(set.size() == 2, "duplicate wall cells collapse");
    EXPECT(set.contains(Position{2, 2}), "contains wall");
    EXPECT(!set.contains(Position{3, 3}), "open cell");

    Grid g = makeGrid(5, 5, {{1, 1}});
    EXPECT(g.isWall(Position{1, 1}) && !g.isOpen(Position{1, 1}), "wall cell is closed");
    EXPECT(!g.isOpen(Position{5, 0}), "outside is closed");
    EXPECT(g.isOpen(Position{0, 0}), "open cell");
    return 0;
}

static int test_move_forward() {
    Grid g = makeGrid(5, 5, {{2, 1}});

    Spaceship s = makeShip("a", Position{2, 3}, 0);
    EXPECT(moveForward(s, g) == (Position{2, 2}), "step up");

    s.position = Position{2, 2};
    EXPECT(throwsAs<IllegalMoveError>([&] { moveForward(s, g); }), "wall blocks");

    s.position = Position{4, 4};
    s.rotation = 90;
    EXPECT(throwsAs<IllegalMoveError>([&] { moveForward(s, g); }), "edge blocks");
    return 0;
}

static int test_fire() {
    Spaceship s = makeShip("a", Position{3, 3}, 180);
    Laser l = fireLaser(s, 7, 42);
    EXPECT(l.position == (Position{3, 4}), "laser spawns one cell ahead");
    EXPECT(l.direction == 180, "laser keeps heading");
    EXPECT(l.ownerId == "a", "laser owner");
    EXPECT(l.remainingRange == 7 && l.seq == 42, "range and sequence");

    s.active = false;
    EXPECT(throwsAs<InactivePlayerError>([&] { fireLaser(s, 7, 43); }), "eliminated ship cannot fire");
    return 0;
}

static int test_shield_window() {
    Spaceship s = makeShip("a", Position{0, 0}, 0);
    TimePoint t = Clock::now();

    EXPECT(!s.shieldActive(t), "no shield before use");
    activateShield(s, t, std::chrono::milliseconds(3000));

    EXPECT(s.shieldActive(t), "active at activation");
    EXPECT(s.shieldActive(t + std::chrono::milliseconds(2999)), "active just before expiry");
    EXPECT(!s.shieldActive(t + std::chrono::milliseconds(3000)), "expired at 3 s");

    EXPECT(throwsAs<ShieldAlreadyUsedError>([&] {
        activateShield(s, t + std::chrono::seconds(10), std::chrono::milliseconds(3000));
    }), "shield is single use");
    return 0;
}

static int test_damage() {
    TimePoint t = Clock::now();

    Spaceship s = makeShip("a", Position{0, 0}, 0, 5);
    EXPECT(applyDamage(s, 1, t) == 1 && s.lives == 4, "one life lost");

    activateShield(s, t, std::chrono::milliseconds(3000));
    EXPECT(applyDamage(s, 3, t + std::chrono::seconds(1)) == 0, "shield absorbs");
    EXPECT(s.lives == 4, "lives untouched under shield");
    EXPECT(applyDamage(s, 1, t + std::chrono::milliseconds(3000)) == 1, "expired at exactly three seconds");
    EXPECT(applyDamage(s, 2, t + std::chrono::seconds(10)) == 2 && s.lives == 1, "full damage after expiry");

    Spaceship low = makeShip("b", Position{0, 0}, 0, 2);
    EXPECT(applyDamage(low, 3, t) == 2, "loss clamps at remaining lives");
    EXPECT(low.lives == 0 && !low.active, "zero lives eliminates");
    EXPECT(applyDamage(low, 1, t) == 0 && low.lives == 0, "no negative lives");
    return 0;
}

static int test_parse_turn() {
    EXPECT(parseTurn("left") == Turn::Left, "left");
    EXPECT(parseTurn("right") == Turn::Right, "right");
    EXPECT(throwsAs<ValidationError>([] { parseTurn("up"); }), "bad direction");
    return 0;
}

static int test_config() {
    ArenaConfig cfg = defaultArenaConfig();
    EXPECT(cfg.width == 30 && cfg.height == 20, "default size");
    EXPECT(cfg.effectiveLaserRange() == 30, "range defaults to the long side");
    validateConfig(cfg);

    ArenaConfig bad = emptyArenaConfig(5, 5);
    bad.walls.push_back(Position{5, 0});
    EXPECT(throwsAs<ValidationError>([&] { validateConfig(bad); }), "wall outside the arena");

    bad = emptyArenaConfig(5, 5);
    bad.initialLives = 0;
    EXPECT(throwsAs<ValidationError>([&] { validateConfig(bad); }), "zero lives");

    std::vector<Position> ring = borderWalls(4, 3, 0);
    EXPECT(ring.size() == 10, "4x3 border has 10 distinct cells");
    return 0;
}

int main() {
    RUN(test_walls);
    RUN(test_move_forward);
    RUN(test_fire);
    RUN(test_shield_window);
    RUN(test_damage);
    RUN(test_parse_turn);
    RUN(test_config);
    return 0;
}
