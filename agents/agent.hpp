#pragma once
#include <random>
#include <string>
#include <vector>

#include "../engine/position.hpp"

namespace spacearena {

enum class AgentAction {
    Wait,
    Move,
    RotateLeft,
    RotateRight,
    Fire,
    Shield
};

const char *actionName(AgentAction a);

// What an agent sees each step. Hazard and enemy cells are relative to the
// agent's own ship.
struct Observation {
    bool present = false;
    bool active = false;
    bool gameOver = false;

    Position position;
    int rotation = 0;
    int lives = 0;
    bool shieldAvailable = false;
    bool shieldActive = false;

    std::vector<Position> walls;
    std::vector<Position> mines;
    std::vector<Position> lasers;
    std::vector<Position> enemies;
};

class Agent {
public:
    virtual ~Agent() = default;

    virtual AgentAction decide(const Observation &obs) = 0;

    // The server turned the last action down; error is the error name.
    virtual void onRejected(AgentAction action, const std::string &error) {
        (void)action;
        (void)error;
    }

    virtual const char *policyName() const = 0;
};

// Picks weighted random actions, never walking into a wall it can see.
class RandomAgent : public Agent {
public:
    explicit RandomAgent(unsigned seed);

    AgentAction decide(const Observation &obs) override;
    const char *policyName() const override { return "random"; }

private:
    std::mt19937 m_rng;
};

/*
  Flies straight until something blocks the cell ahead, then turns right.
  Shoots at enemies lined up in front of it and otherwise every fireEvery
  steps, and raises the shield when a laser gets adjacent.
*/
class WallFollowingAgent : public Agent {
public:
    explicit WallFollowingAgent(int fireEvery = 20);

    AgentAction decide(const Observation &obs) override;
    void onRejected(AgentAction action, const std::string &error) override;
    const char *policyName() const override { return "wall"; }

private:
    int m_fireEvery;
    int m_steps = 0;
    bool m_forceTurn = false;
};

// Shared helpers, also used by the runner.
bool blockedAhead(const Observation &obs);
bool enemyInLine(const Observation &obs);
bool laserAdjacent(const Observation &obs);

} 
