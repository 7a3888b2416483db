#pragma once
#include <chrono>
#include <string>
#include <vector>

#include "arena_config.hpp"
#include "world.hpp"

namespace spacearena {

struct RuleSet {
    int mineDamage = 3;
    int laserDamage = 1;
    int laserRange = 30;
    std::chrono::milliseconds shieldDuration{3000};
};

RuleSet rulesFromConfig(const ArenaConfig &config);

enum class HitKind {
    Laser,
    Mine
};

struct HitEvent {
    HitKind kind = HitKind::Laser;
    std::string targetId;
    std::string sourceId;   // laser owner, empty for mines
    Position at;
    int damage = 0;         // lives actually lost
    bool shielded = false;
    bool eliminated = false;
};

// Outcome of one accepted action. Rejections are thrown instead, before
// anything is committed, so the caller only ever swaps in a whole world.
struct Resolution {
    GameState world;
    std::vector<HitEvent> hits;
    std::vector<Position> minesShot;
    bool gameEnded = false;
};

/*
  Player actions. Each one checks, in order: unknown player (NotFoundError),
  finished game (GameOverError), eliminated ship (InactivePlayerError), then
  the rule of the action itself.
*/
Resolution resolveMove(const GameState &world, const std::string &playerId,
                       const RuleSet &rules, TimePoint now);
Resolution resolveRotate(const GameState &world, const std::string &playerId,
                         Turn turn, const RuleSet &rules, TimePoint now);
Resolution resolveFire(const GameState &world, const std::string &playerId,
                       const RuleSet &rules, TimePoint now);
Resolution resolveShield(const GameState &world, const std::string &playerId,
                         const RuleSet &rules, TimePoint now);

// One advance step: every laser moves one cell in creation order, then
// ships standing on mines detonate them in roster order.
Resolution resolveAdvance(const GameState &world, const RuleSet &rules, TimePoint now);

// Marks the game over once it has started and at most one ship is left.
// Returns true on the transition.
bool updateGameOver(GameState &world);

// A cell a new ship may appear on: open, no mine, no active ship.
bool isFreeCell(const GameState &world, Position p);

// First free preferred cell, else the free cell nearest the arena centre.
bool findSpawn(const GameState &world, const std::vector<Position> &preferred, Position &out);

}
