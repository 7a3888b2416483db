#pragma once
#include <functional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "arena_config.hpp"
#include "physics.hpp"
#include "player_stats.hpp"
#include "world.hpp"

namespace spacearena {

struct PlayerView {
    std::string id;
    std::string name;
    Position position;
    int rotation = 0;
    int lives = 0;
    bool shieldActive = false;
    bool shieldAvailable = false;
    bool active = false;
};

struct LaserView {
    Position position;
    int direction = 0;
    std::string ownerId;
};

struct StateView {
    int width = 0;
    int height = 0;
    std::vector<PlayerView> players;
    std::vector<Position> walls;
    std::vector<Position> mines;
    std::vector<LaserView> lasers;
    bool gameOver = false;
};

struct PlayerStateView {
    std::vector<PlayerView> players;
};

// Hazards relative to the requesting ship, within a Chebyshev radius.
struct EnvironmentView {
    std::string playerId;
    int radius = 0;
    std::vector<Position> walls;
    std::vector<Position> mines;
    std::vector<Position> lasers;
    bool gameOver = false;
};

/*
  Owns the authoritative world. Every mutation runs under one exclusive lock
  and is resolved on a copy that is swapped in only when the whole action is
  accepted; reads share the lock and copy a view out.

  Lasers never move on player actions. Something outside (the server's tick
  thread, or a test) calls advance() at a fixed cadence.
*/
class ArenaManager {
public:
    using ClockFn = std::function<TimePoint()>;

    explicit ArenaManager(ArenaConfig config = defaultArenaConfig(), ClockFn clock = ClockFn());

    ArenaManager(const ArenaManager &) = delete;
    ArenaManager &operator=(const ArenaManager &) = delete;

    // An empty name means "Player N". Registering after game over starts a
    // fresh game first.
    StateView registerPlayer(const std::string &playerId, const std::string &name = "");
    StateView unregisterPlayer(const std::string &playerId);

    StateView move(const std::string &playerId);
    StateView rotate(const std::string &playerId, Turn turn);
    StateView fire(const std::string &playerId);
    StateView shield(const std::string &playerId);

    // Returns true when this step ended the game.
    bool advance();
    bool advance(TimePoint now);

    void reset();

    StateView getState() const;
    PlayerStateView getPlayerState() const;
    // radius < 0 uses the configured radius.
    EnvironmentView getEnvironmentState(const std::string &playerId, int radius = -1) const;
    std::vector<PlayerStats> getStats() const;

    bool isGameOver() const;
    int activePlayers() const;
    const ArenaConfig &config() const { return m_config; }

    // Called with the finished scoreboard whenever a game ends, while the
    // world lock is held; the callback must not call back into the manager.
    void onGameOver(std::function<void(const ScoreBoard &)> cb);

private:
    GameState freshWorld() const;
    void resetUnlocked();
    StateView commit(Resolution &&res, TimePoint now, const char *action, const std::string &playerId);
    void finishGameUnlocked(TimePoint now);

    StateView stateViewUnlocked(TimePoint now) const;
    PlayerView playerView(const Spaceship &ship, TimePoint now) const;

    void log(const std::string &msg) const;

    ArenaConfig m_config;
    RuleSet m_rules;
    ClockFn m_clock;
    std::shared_ptr<const WallSet> m_walls;

    mutable std::shared_mutex m_mutex;
    GameState m_state;
    ScoreBoard m_stats;
    std::function<void(const ScoreBoard &)> m_onGameOver;
};

}
