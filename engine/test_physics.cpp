#include "physics.hpp"
#include "arena_errors.hpp"
#include "../shared/test_check.hpp"

using namespace spacearena;

static GameState makeWorld(int w, int h, const std::vector<Position> &walls = {}) {
    GameState world;
    world.grid.width = w;
    world.grid.height = h;
    world.grid.walls = std::make_shared<const WallSet>(walls);
    return world;
}

static void addShip(GameState &world, const std::string &id, Position at, int rotation, int lives = 5) {
    Spaceship s;
    s.id = id;
    s.name = id;
    s.position = at;
    s.rotation = rotation;
    s.lives = lives;
    world.players.push_back(s);
    updateGameOver(world);
}

static Laser makeLaser(std::uint64_t seq, Position at, int direction, const std::string &owner, int range = 30) {
    Laser l;
    l.seq = seq;
    l.position = at;
    l.direction = direction;
    l.ownerId = owner;
    l.remainingRange = range;
    return l;
}

static RuleSet rules() {
    RuleSet r;
    r.mineDamage = 3;
    r.laserDamage = 1;
    r.laserRange = 30;
    r.shieldDuration = std::chrono::milliseconds(3000);
    return r;
}

static int test_laser_travels_and_hits() {
    TimePoint t = Clock::now();
    GameState w = makeWorld(10, 10);
    addShip(w, "a", Position{1, 5}, 90);
    addShip(w, "b", Position{5, 5}, 0);

    Resolution r = resolveFire(w, "a", rules(), t);
    EXPECT(r.world.lasers.size() == 1, "laser created");
    EXPECT(r.world.lasers[0].position == (Position{2, 5}), "laser one cell ahead");
    EXPECT(r.hits.empty(), "no hit on spawn");

    r = resolveAdvance(r.world, rules(), t);
    EXPECT(r.world.lasers[0].position == (Position{3, 5}), "first step");
    r = resolveAdvance(r.world, rules(), t);
    EXPECT(r.world.lasers[0].position == (Position{4, 5}), "second step");

    r = resolveAdvance(r.world, rules(), t);
    EXPECT(r.world.lasers.empty(), "laser consumed by the hit");
    EXPECT(r.hits.size() == 1, "one hit");
    EXPECT(r.hits[0].kind == HitKind::Laser, "laser hit");
    EXPECT(r.hits[0].targetId == "b" && r.hits[0].sourceId == "a", "hit attribution");
    EXPECT(findPlayer(r.world, "b")->lives == 4, "target lost a life");
    EXPECT(findPlayer(r.world, "a")->lives == 5, "shooter untouched");
    return 0;
}

static int test_point_blank_fire() {
    TimePoint t = Clock::now();
    GameState w = makeWorld(10, 10);
    addShip(w, "a", Position{1, 5}, 90);
    addShip(w, "b", Position{2, 5}, 0);

    Resolution r = resolveFire(w, "a", rules(), t);
    EXPECT(r.world.lasers.empty(), "no laser left in flight");
    EXPECT(findPlayer(r.world, "b")->lives == 4, "adjacent enemy hit at once");
    return 0;
}

static int test_laser_blocked() {
    TimePoint t = Clock::now();

    GameState w = makeWorld(10, 10, {{3, 5}});
    addShip(w, "a", Position{1, 5}, 90);
    Resolution r = resolveFire(w, "a", rules(), t);
    r = resolveAdvance(r.world, rules(), t);
    EXPECT(r.world.lasers.empty(), "wall destroys laser");

    w = makeWorld(10, 10);
    addShip(w, "a", Position{1, 5}, 90);
    w.mines.push_back(Mine{Position{3, 5}});
    r = resolveFire(w, "a", rules(), t);
    r = resolveAdvance(r.world, rules(), t);
    EXPECT(r.world.lasers.empty(), "mine destroys laser");
    EXPECT(r.world.mines.empty(), "laser destroys mine");
    EXPECT(r.minesShot.size() == 1 && r.minesShot[0] == (Position{3, 5}), "mine reported");

    w = makeWorld(4, 4);
    addShip(w, "a", Position{1, 1}, 270);
    r = resolveFire(w, "a", rules(), t);
    EXPECT(r.world.lasers.size() == 1, "laser at the edge column");
    r = resolveAdvance(r.world, rules(), t);
    EXPECT(r.world.lasers.empty(), "laser leaves the arena");
    return 0;
}

static int test_laser_range() {
    TimePoint t = Clock::now();
    RuleSet rs = rules();
    rs.laserRange = 2;

    GameState w = makeWorld(20, 20);
    addShip(w, "a", Position{1, 5}, 90);

    Resolution r = resolveFire(w, "a", rs, t);
    r = resolveAdvance(r.world, rs, t);
    r = resolveAdvance(r.world, rs, t);
    EXPECT(r.world.lasers.size() == 1, "still flying after range steps");
    EXPECT(r.world.lasers[0].position == (Position{4, 5}), "travelled two cells");
    r = resolveAdvance(r.world, rs, t);
    EXPECT(r.world.lasers.empty(), "fizzles after range");
    return 0;
}

static int test_lasers_step_in_creation_order() {
    TimePoint t = Clock::now();
    GameState w = makeWorld(10, 10);
    addShip(w, "a", Position{0, 0}, 90);
    addShip(w, "b", Position{9, 9}, 0);
    addShip(w, "c", Position{5, 5}, 0, 1);

    // Both lasers enter (5,5) this step; the older one lands the kill.
    w.lasers.push_back(makeLaser(7, Position{5, 4}, 180, "b"));
    w.lasers.push_back(makeLaser(3, Position{4, 5}, 90, "a"));

    Resolution r = resolveAdvance(w, rules(), t);
    EXPECT(r.hits.size() == 2, "both lasers strike the target alive at pass start");
    EXPECT(r.hits[0].sourceId == "a" && r.hits[0].eliminated, "older laser first");
    EXPECT(r.hits[1].sourceId == "b" && r.hits[1].damage == 0, "nothing left to lose");
    EXPECT(r.world.lasers.empty(), "both lasers consumed");
    EXPECT(findPlayer(r.world, "c")->lives == 0, "lives never negative");
    return 0;
}

static int test_own_laser_is_harmless() {
    TimePoint t = Clock::now();
    GameState w = makeWorld(10, 10);
    addShip(w, "a", Position{1, 5}, 90);

    Resolution r = resolveFire(w, "a", rules(), t);
    r = resolveMove(r.world, "a", rules(), t);
    EXPECT(findPlayer(r.world, "a")->position == (Position{2, 5}), "moved onto own laser");
    EXPECT(findPlayer(r.world, "a")->lives == 5, "own laser does no damage");
    EXPECT(r.world.lasers.size() == 1, "own laser keeps flying");
    return 0;
}

static int test_move_into_hazards() {
    TimePoint t = Clock::now();

    GameState w = makeWorld(10, 10);
    addShip(w, "a", Position{1, 5}, 90);
    addShip(w, "b", Position{8, 8}, 0);
    w.lasers.push_back(makeLaser(1, Position{2, 5}, 270, "b"));

    Resolution r = resolveMove(w, "a", rules(), t);
    EXPECT(findPlayer(r.world, "a")->lives == 4, "enemy laser hurts on entry");
    EXPECT(r.world.lasers.empty(), "laser consumed");
    EXPECT(r.hits.size() == 1 && r.hits[0].sourceId == "b", "hit credited to owner");

    w = makeWorld(10, 10);
    addShip(w, "a", Position{1, 5}, 90);
    w.mines.push_back(Mine{Position{2, 5}});
    r = resolveMove(w, "a", rules(), t);
    EXPECT(findPlayer(r.world, "a")->lives == 2, "mine costs three lives");
    EXPECT(r.world.mines.empty(), "mine detonates");
    EXPECT(r.hits.size() == 1 && r.hits[0].kind == HitKind::Mine, "mine hit");
    return 0;
}

static int test_shield_absorbs_mine() {
    TimePoint t = Clock::now();
    GameState w = makeWorld(10, 10);
    addShip(w, "a", Position{1, 5}, 90);
    w.mines.push_back(Mine{Position{2, 5}});

    Resolution r = resolveShield(w, "a", rules(), t);
    r = resolveMove(r.world, "a", rules(), t + std::chrono::seconds(1));
    EXPECT(findPlayer(r.world, "a")->lives == 5, "no loss under shield");
    EXPECT(r.world.mines.empty(), "mine still goes off");
    EXPECT(r.hits.size() == 1 && r.hits[0].shielded, "absorbed hit reported");

    EXPECT(throwsAs<ShieldAlreadyUsedError>([&] {
        resolveShield(r.world, "a", rules(), t + std::chrono::seconds(5));
    }), "second shield rejected");
    return 0;
}

static int test_shield_expiry_restores_damage() {
    TimePoint t = Clock::now();
    GameState w = makeWorld(10, 10);
    addShip(w, "a", Position{1, 5}, 90);
    addShip(w, "b", Position{8, 8}, 0);
    w.mines.push_back(Mine{Position{2, 5}});
    w.mines.push_back(Mine{Position{3, 5}});

    Resolution r = resolveShield(w, "a", rules(), t);
    r = resolveMove(r.world, "a", rules(), t + std::chrono::milliseconds(3000));
    EXPECT(findPlayer(r.world, "a")->lives == 2, "mine at expiry takes full damage");
    EXPECT(r.hits.size() == 1 && !r.hits[0].shielded, "hit not absorbed");

    r = resolveMove(r.world, "a", rules(), t + std::chrono::seconds(4));
    EXPECT(findPlayer(r.world, "a")->lives == 0, "later mine also lands in full");
    EXPECT(r.gameEnded && r.world.gameOver, "last ship standing ends the game");
    return 0;
}

static int test_ship_standing_on_mine() {
    TimePoint t = Clock::now();
    GameState w = makeWorld(10, 10);
    addShip(w, "a", Position{4, 4}, 0);
    w.mines.push_back(Mine{Position{4, 4}});

    Resolution r = resolveAdvance(w, rules(), t);
    EXPECT(findPlayer(r.world, "a")->lives == 2, "mine under ship detonates on advance");
    EXPECT(r.world.mines.empty(), "mine removed");
    return 0;
}

static int test_rejection_order() {
    TimePoint t = Clock::now();
    GameState w = makeWorld(10, 10);
    addShip(w, "a", Position{1, 1}, 0);
    addShip(w, "b", Position{5, 5}, 0);
    findPlayer(w, "b")->active = false;
    findPlayer(w, "b")->lives = 0;

    EXPECT(throwsAs<NotFoundError>([&] { resolveMove(w, "nobody", rules(), t); }), "unknown player");
    EXPECT(throwsAs<InactivePlayerError>([&] { resolveFire(w, "b", rules(), t); }), "eliminated player");

    w.gameOver = true;
    EXPECT(throwsAs<GameOverError>([&] { resolveFire(w, "b", rules(), t); }), "game over before inactive");
    EXPECT(throwsAs<NotFoundError>([&] { resolveMove(w, "nobody", rules(), t); }), "unknown before game over");
    return 0;
}

static int test_game_over_rule() {
    GameState w = makeWorld(10, 10);
    addShip(w, "a", Position{1, 1}, 0);
    EXPECT(!w.started && !w.gameOver, "a lone ship does not end the game");

    addShip(w, "b", Position{5, 5}, 0);
    EXPECT(w.started && !w.gameOver, "two ships start the game");

    findPlayer(w, "b")->active = false;
    EXPECT(updateGameOver(w), "transition reported");
    EXPECT(w.gameOver, "one ship left ends the game");
    EXPECT(!updateGameOver(w), "transition reported once");

    GameState lone = makeWorld(10, 10);
    EXPECT(!updateGameOver(lone), "an empty arena is not over");
    addShip(lone, "solo", Position{1, 1}, 0);
    findPlayer(lone, "solo")->active = false;
    EXPECT(updateGameOver(lone), "eliminating the only ship ends the game");
    EXPECT(lone.gameOver && !lone.started, "ended without ever starting");
    return 0;
}

static int test_spawn_search() {
    GameState w = makeWorld(5, 5, {{2, 2}});
    w.mines.push_back(Mine{Position{1, 1}});
    addShip(w, "a", Position{3, 3}, 0);

    Position p;
    EXPECT(findSpawn(w, {{3, 3}, {4, 4}}, p) && p == (Position{4, 4}), "first free preferred cell");

    // Centre is a wall: the ring around it is scanned row by row.
    EXPECT(findSpawn(w, {}, p) && p == (Position{2, 1}), "nearest free cell to the centre");

    EXPECT(!isFreeCell(w, Position{1, 1}), "mine cell is not free");
    EXPECT(!isFreeCell(w, Position{3, 3}), "occupied cell is not free");
    EXPECT(!isFreeCell(w, Position{5, 0}), "outside is not free");
    return 0;
}

int main() {
    RUN(test_laser_travels_and_hits);
    RUN(test_point_blank_fire);
    RUN(test_laser_blocked);
    RUN(test_laser_range);
    RUN(test_lasers_step_in_creation_order);
    RUN(test_own_laser_is_harmless);
    RUN(test_move_into_hazards);
    RUN(test_shield_absorbs_mine);
    RUN(test_shield_expiry_restores_damage);
    RUN(test_ship_standing_on_mine);
    RUN(test_rejection_order);
    RUN(test_game_over_rule);
    RUN(test_spawn_search);
    return 0;
}
