#include "arena_manager.hpp"
#include "arena_errors.hpp"

#include <iostream>
#include <mutex>

namespace spacearena {

ArenaManager::ArenaManager(ArenaConfig config, ClockFn clock)
    : m_config(std::move(config)),
      m_clock(std::move(clock))
{
    validateConfig(m_config);
    if (!m_clock)
        m_clock = [] { return Clock::now(); };

    m_rules = rulesFromConfig(m_config);
    m_walls = std::make_shared<const WallSet>(m_config.walls);
    resetUnlocked();
}

void ArenaManager::log(const std::string &msg) const {
    if (m_config.verbose)
        std::cout << "[Arena] " << msg << "\n";
}

void ArenaManager::onGameOver(std::function<void(const ScoreBoard &)> cb) {
    std::unique_lock<std::shared_mutex> lk(m_mutex);
    m_onGameOver = std::move(cb);
}

// ========================================================
// World lifecycle
// ========================================================

GameState ArenaManager::freshWorld() const {
    GameState w;
    w.grid.width = m_config.width;
    w.grid.height = m_config.height;
    w.grid.walls = m_walls;

    for (const auto &p : m_config.mines) {
        if (!m_walls->contains(p))
            w.mines.push_back(Mine{p});
    }
    return w;
}

void ArenaManager::resetUnlocked() {
    m_state = freshWorld();
    m_stats.clear();
}

void ArenaManager::reset() {
    std::unique_lock<std::shared_mutex> lk(m_mutex);
    resetUnlocked();
    log("arena reset");
}

void ArenaManager::finishGameUnlocked(TimePoint now) {
    m_stats.updateSurvival(m_state, now);

    std::string winner;
    for (const auto &p : m_state.players) {
        if (p.active) {
            winner = p.id;
            m_stats.setLastSurviving(p.id);
        }
    }

    if (winner.empty())
        log("game over: no ship left");
    else
        log("game over: '" + winner + "' is the last ship flying");

    if (m_onGameOver)
        m_onGameOver(m_stats);
}

StateView ArenaManager::commit(Resolution &&res, TimePoint now,
                               const char *action, const std::string &playerId) {
    for (const auto &h : res.hits) {
        std::string what = (h.kind == HitKind::Mine) ? "mine"
                         : "laser from '" + h.sourceId + "'";
        if (h.shielded) {
            log(what + " absorbed by the shield of '" + h.targetId + "'");
        } else {
            log(what + " hit '" + h.targetId + "' for " + std::to_string(h.damage) +
                (h.eliminated ? " (eliminated)" : ""));
        }
    }
    for (const auto &m : res.minesShot)
        log("laser detonated mine at (" + std::to_string(m.x) + "," + std::to_string(m.y) + ")");

    m_state = std::move(res.world);
    m_stats.recordHits(res.hits);
    m_stats.updateSurvival(m_state, now);

    if (action && !playerId.empty())
        log(std::string(action) + " by '" + playerId + "'");

    if (res.gameEnded)
        finishGameUnlocked(now);

    return stateViewUnlocked(now);
}

// ========================================================
// Roster
// ========================================================

StateView ArenaManager::registerPlayer(const std::string &playerId, const std::string &name) {
    if (playerId.empty())
        throw ValidationError("player_id must not be empty");

    std::unique_lock<std::shared_mutex> lk(m_mutex);
    TimePoint now = m_clock();

    if (findPlayer(m_state, playerId) && !m_state.gameOver)
        throw DuplicateIdError("player '" + playerId + "' is already registered");

    int alive = activePlayerCount(m_state);
    if (!m_state.gameOver && alive >= m_config.maxPlayers)
        throw CapacityError("arena is full (" + std::to_string(m_config.maxPlayers) + " players)");

    // Work on a copy so a failed spawn leaves the finished game untouched.
    GameState next = m_state;
    bool newGame = next.gameOver;
    if (newGame) {
        next = freshWorld();
        alive = 0;
    }

    Position spawn;
    if (!findSpawn(next, m_config.spawnPoints, spawn))
        throw CapacityError("no free cell to spawn player '" + playerId + "'");

    Spaceship ship;
    ship.id = playerId;
    ship.name = name.empty() ? "Player " + std::to_string(alive + 1) : name;
    ship.position = spawn;
    ship.rotation = 0;
    ship.lives = m_config.initialLives;
    ship.active = true;
    next.players.push_back(ship);

    updateGameOver(next);

    m_state = std::move(next);
    if (newGame) {
        m_stats.clear();
        log("new game started");
    }
    m_stats.addPlayer(ship.id, ship.name, now);

    log("registered '" + ship.id + "' as \"" + ship.name + "\" at (" +
        std::to_string(spawn.x) + "," + std::to_string(spawn.y) + ")");

    return stateViewUnlocked(now);
}

StateView ArenaManager::unregisterPlayer(const std::string &playerId) {
    std::unique_lock<std::shared_mutex> lk(m_mutex);
    TimePoint now = m_clock();

    auto &players = m_state.players;
    auto it = players.begin();
    while (it != players.end() && it->id != playerId)
        ++it;
    if (it == players.end())
        throw NotFoundError("unknown player '" + playerId + "'");

    players.erase(it);
    m_stats.removePlayer(playerId);
    log("unregistered '" + playerId + "'");

    if (updateGameOver(m_state))
        finishGameUnlocked(now);

    return stateViewUnlocked(now);
}

// ========================================================
// Player actions
// ========================================================

StateView ArenaManager::move(const std::string &playerId) {
    std::unique_lock<std::shared_mutex> lk(m_mutex);
    TimePoint now = m_clock();
    return commit(resolveMove(m_state, playerId, m_rules, now), now, "move", playerId);
}

StateView ArenaManager::rotate(const std::string &playerId, Turn turn) {
    std::unique_lock<std::shared_mutex> lk(m_mutex);
    TimePoint now = m_clock();
    return commit(resolveRotate(m_state, playerId, turn, m_rules, now), now,
                  turn == Turn::Left ? "rotate left" : "rotate right", playerId);
}

StateView ArenaManager::fire(const std::string &playerId) {
    std::unique_lock<std::shared_mutex> lk(m_mutex);
    TimePoint now = m_clock();
    return commit(resolveFire(m_state, playerId, m_rules, now), now, "fire", playerId);
}

StateView ArenaManager::shield(const std::string &playerId) {
    std::unique_lock<std::shared_mutex> lk(m_mutex);
    TimePoint now = m_clock();
    return commit(resolveShield(m_state, playerId, m_rules, now), now, "shield", playerId);
}

bool ArenaManager::advance() {
    return advance(m_clock());
}

bool ArenaManager::advance(TimePoint now) {
    std::unique_lock<std::shared_mutex> lk(m_mutex);
    if (m_state.gameOver)
        return false;
    Resolution res = resolveAdvance(m_state, m_rules, now);
    bool ended = res.gameEnded;
    commit(std::move(res), now, nullptr, "");
    return ended;
}

// ========================================================
// Views
// ========================================================

PlayerView ArenaManager::playerView(const Spaceship &ship, TimePoint now) const {
    PlayerView v;
    v.id = ship.id;
    v.name = ship.name;
    v.position = ship.position;
    v.rotation = ship.rotation;
    v.lives = ship.lives;
    v.shieldActive = ship.shieldActive(now);
    v.shieldAvailable = !ship.shieldUsed;
    v.active = ship.active;
    return v;
}

StateView ArenaManager::stateViewUnlocked(TimePoint now) const {
    StateView v;
    v.width = m_state.grid.width;
    v.height = m_state.grid.height;
    for (const auto &p : m_state.players)
        v.players.push_back(playerView(p, now));
    v.walls = m_walls->cells();
    for (const auto &m : m_state.mines)
        v.mines.push_back(m.position);
    for (const auto &l : m_state.lasers)
        v.lasers.push_back(LaserView{l.position, l.direction, l.ownerId});
    v.gameOver = m_state.gameOver;
    return v;
}

StateView ArenaManager::getState() const {
    std::shared_lock<std::shared_mutex> lk(m_mutex);
    return stateViewUnlocked(m_clock());
}

PlayerStateView ArenaManager::getPlayerState() const {
    std::shared_lock<std::shared_mutex> lk(m_mutex);
    TimePoint now = m_clock();
    PlayerStateView v;
    for (const auto &p : m_state.players)
        v.players.push_back(playerView(p, now));
    return v;
}

EnvironmentView ArenaManager::getEnvironmentState(const std::string &playerId, int radius) const {
    if (radius < 0)
        radius = m_config.environmentRadius;

    std::shared_lock<std::shared_mutex> lk(m_mutex);
    const Spaceship *ship = findPlayer(m_state, playerId);
    if (!ship)
        throw NotFoundError("unknown player '" + playerId + "'");

    EnvironmentView v;
    v.playerId = playerId;
    v.radius = radius;
    v.gameOver = m_state.gameOver;

    const Position origin = ship->position;
    auto inRadius = [&](Position p) { return chebyshevDistance(p, origin) <= radius; };

    for (const auto &w : m_walls->cells())
        if (inRadius(w)) v.walls.push_back(relativeTo(w, origin));
    for (const auto &m : m_state.mines)
        if (inRadius(m.position)) v.mines.push_back(relativeTo(m.position, origin));
    for (const auto &l : m_state.lasers)
        if (inRadius(l.position)) v.lasers.push_back(relativeTo(l.position, origin));

    return v;
}

std::vector<PlayerStats> ArenaManager::getStats() const {
    std::shared_lock<std::shared_mutex> lk(m_mutex);
    return m_stats.snapshot();
}

bool ArenaManager::isGameOver() const {
    std::shared_lock<std::shared_mutex> lk(m_mutex);
    return m_state.gameOver;
}

int ArenaManager::activePlayers() const {
    std::shared_lock<std::shared_mutex> lk(m_mutex);
    return activePlayerCount(m_state);
}

}
