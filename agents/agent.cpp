#include "agent.hpp"

#include <algorithm>
#include <cstdlib>

namespace spacearena {

const char *actionName(AgentAction a) {
    switch (a) {
        case AgentAction::Wait:        return "wait";
        case AgentAction::Move:        return "move";
        case AgentAction::RotateLeft:  return "rotate-left";
        case AgentAction::RotateRight: return "rotate-right";
        case AgentAction::Fire:        return "fire";
        case AgentAction::Shield:      return "shield";
    }
    return "unknown";
}

static bool contains(const std::vector<Position> &cells, Position p) {
    return std::find(cells.begin(), cells.end(), p) != cells.end();
}

bool blockedAhead(const Observation &obs) {
    Position ahead = unitVector(obs.rotation);
    return contains(obs.walls, ahead) || contains(obs.mines, ahead);
}

bool enemyInLine(const Observation &obs) {
    Position d = unitVector(obs.rotation);
    for (const auto &e : obs.enemies) {
        bool inLine = (d.x != 0) ? (e.y == 0 && e.x * d.x > 0)
                                 : (e.x == 0 && e.y * d.y > 0);
        if (!inLine) continue;

        // A wall between us and the enemy soaks the shot.
        bool covered = false;
        int dist = std::max(std::abs(e.x), std::abs(e.y));
        for (int s = 1; s < dist && !covered; ++s) {
            if (contains(obs.walls, Position{d.x * s, d.y * s}))
                covered = true;
        }
        if (!covered) return true;
    }
    return false;
}

bool laserAdjacent(const Observation &obs) {
    for (const auto &l : obs.lasers) {
        if (chebyshevDistance(l, Position{0, 0}) <= 1) return true;
    }
    return false;
}

// ========================================================
// RandomAgent
// ========================================================

RandomAgent::RandomAgent(unsigned seed)
    : m_rng(seed)
{
}

AgentAction RandomAgent::decide(const Observation &obs) {
    if (!obs.present || !obs.active || obs.gameOver)
        return AgentAction::Wait;

    if (obs.shieldAvailable && laserAdjacent(obs))
        return AgentAction::Shield;

    // move, left, right, fire
    std::discrete_distribution<int> pick({5, 2, 2, 3});
    switch (pick(m_rng)) {
        case 0:
            if (!blockedAhead(obs)) return AgentAction::Move;
            return AgentAction::RotateRight;
        case 1:  return AgentAction::RotateLeft;
        case 2:  return AgentAction::RotateRight;
        default: return AgentAction::Fire;
    }
}

// ========================================================
// WallFollowingAgent
// ========================================================

WallFollowingAgent::WallFollowingAgent(int fireEvery)
    : m_fireEvery(std::max(1, fireEvery))
{
}

AgentAction WallFollowingAgent::decide(const Observation &obs) {
    if (!obs.present || !obs.active || obs.gameOver)
        return AgentAction::Wait;

    m_steps++;

    if (obs.shieldAvailable && laserAdjacent(obs))
        return AgentAction::Shield;

    if (enemyInLine(obs) || m_steps % m_fireEvery == 0)
        return AgentAction::Fire;

    if (m_forceTurn || blockedAhead(obs)) {
        m_forceTurn = false;
        return AgentAction::RotateRight;
    }
    return AgentAction::Move;
}

void WallFollowingAgent::onRejected(AgentAction action, const std::string &error) {
    // The arena edge rejects moves without any wall in view.
    if (action == AgentAction::Move && error == "IllegalMoveError")
        m_forceTurn = true;
}

} 
