#include "agent.hpp"
#include "arena_client.hpp"
#include "../shared/test_check.hpp"

using namespace spacearena;

static Observation flying(int rotation) {
    Observation obs;
    obs.present = true;
    obs.active = true;
    obs.rotation = rotation;
    obs.lives = 5;
    obs.shieldAvailable = true;
    return obs;
}

static int test_make_observation() {
    json players = {
        {"players", {
            {"me",  {{"position", {4, 4}}, {"rotation", 90}, {"lives", 3}, {"active", true},
                     {"shield_available", false}, {"shield_active", true}, {"name", "Me"}}},
            {"foe", {{"position", {7, 4}}, {"rotation", 0}, {"lives", 5}, {"active", true},
                     {"shield_available", true}, {"shield_active", false}, {"name", "Foe"}}},
            {"dead", {{"position", {1, 1}}, {"rotation", 0}, {"lives", 0}, {"active", false},
                      {"shield_available", true}, {"shield_active", false}, {"name", "Dead"}}}
        }}
    };
    json env = {
        {"player_id", "me"},
        {"radius", 5},
        {"walls", json::array({json::array({1, 0})})},
        {"mines", json::array()},
        {"lasers", json::array({json::array({0, -1})})},
        {"game_over", false}
    };

    Observation obs = makeObservation(players, env, "me");
    EXPECT(obs.present && obs.active, "self found");
    EXPECT(obs.position == (Position{4, 4}) && obs.rotation == 90, "pose");
    EXPECT(obs.lives == 3 && !obs.shieldAvailable && obs.shieldActive, "status");
    EXPECT(obs.walls.size() == 1 && obs.walls[0] == (Position{1, 0}), "relative walls");
    EXPECT(obs.enemies.size() == 1 && obs.enemies[0] == (Position{3, 0}), "only active enemies, relative");

    Observation missing = makeObservation(players, env, "nobody");
    EXPECT(!missing.present, "unknown self");
    return 0;
}

static int test_helpers() {
    Observation obs = flying(90);
    obs.walls.push_back(Position{1, 0});
    EXPECT(blockedAhead(obs), "wall ahead");
    obs.rotation = 0;
    EXPECT(!blockedAhead(obs), "wall to the side");

    obs = flying(0);
    obs.enemies.push_back(Position{0, -4});
    EXPECT(enemyInLine(obs), "enemy straight ahead");
    obs.walls.push_back(Position{0, -2});
    EXPECT(!enemyInLine(obs), "wall covers the enemy");

    obs = flying(180);
    obs.enemies.push_back(Position{0, -4});
    EXPECT(!enemyInLine(obs), "enemy behind");

    obs = flying(0);
    obs.lasers.push_back(Position{1, 1});
    EXPECT(laserAdjacent(obs), "diagonal laser is adjacent");
    obs.lasers[0] = Position{2, 0};
    EXPECT(!laserAdjacent(obs), "two cells away is not");
    return 0;
}

static int test_wall_follower() {
    WallFollowingAgent agent(100);

    Observation obs = flying(0);
    EXPECT(agent.decide(obs) == AgentAction::Move, "open space: fly on");

    obs.walls.push_back(Position{0, -1});
    EXPECT(agent.decide(obs) == AgentAction::RotateRight, "wall ahead: turn");

    obs = flying(0);
    obs.enemies.push_back(Position{0, -3});
    EXPECT(agent.decide(obs) == AgentAction::Fire, "enemy in line: fire");

    obs = flying(0);
    obs.lasers.push_back(Position{0, -1});
    EXPECT(agent.decide(obs) == AgentAction::Shield, "laser adjacent: shield");
    obs.shieldAvailable = false;
    EXPECT(agent.decide(obs) != AgentAction::Shield, "no shield left");

    agent.onRejected(AgentAction::Move, "IllegalMoveError");
    EXPECT(agent.decide(flying(0)) == AgentAction::RotateRight, "edge bump forces a turn");
    EXPECT(agent.decide(flying(0)) == AgentAction::Move, "then flies on");

    Observation out = flying(0);
    out.active = false;
    EXPECT(agent.decide(out) == AgentAction::Wait, "eliminated ships wait");
    return 0;
}

static int test_periodic_fire() {
    WallFollowingAgent agent(3);
    Observation obs = flying(0);
    EXPECT(agent.decide(obs) == AgentAction::Move, "step 1");
    EXPECT(agent.decide(obs) == AgentAction::Move, "step 2");
    EXPECT(agent.decide(obs) == AgentAction::Fire, "step 3 fires");
    return 0;
}

static int test_random_agent() {
    RandomAgent agent(7);
    Observation obs = flying(0);
    obs.walls.push_back(Position{0, -1});
    for (int i = 0; i < 200; ++i)
        EXPECT(agent.decide(obs) != AgentAction::Move, "never flies into a visible wall");

    Observation over = flying(0);
    over.gameOver = true;
    EXPECT(agent.decide(over) == AgentAction::Wait, "waits once the game is over");

    RandomAgent a(99), b(99);
    Observation open = flying(90);
    open.shieldAvailable = false;
    for (int i = 0; i < 50; ++i)
        EXPECT(a.decide(open) == b.decide(open), "same seed, same choices");
    return 0;
}

int main() {
    RUN(test_make_observation);
    RUN(test_helpers);
    RUN(test_wall_follower);
    RUN(test_periodic_fire);
    RUN(test_random_agent);
    return 0;
}
