#ifndef SPACEARENA_ARENA_SERVER_HPP
#define SPACEARENA_ARENA_SERVER_HPP

#include <nlohmann/json.hpp>
#include "../shared/tcp.hpp"
#include "../shared/protocol.hpp"
#include "../engine/arena_manager.hpp"
#include "rate_limiter.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>

using json = nlohmann::json;

struct ServerOptions {
    int port = 8000;
    std::chrono::milliseconds tickPeriod{100};
    double ratePerSec = 10.0;
    double burst = 5.0;
    std::string statsDir = "game_stats";
};

class ArenaServer {
public:
    ArenaServer(spacearena::ArenaManager &arena, ServerOptions opts);
    ~ArenaServer();

    ArenaServer(const ArenaServer &) = delete;
    ArenaServer &operator=(const ArenaServer &) = delete;

    // Opens the socket and starts the tick thread.
    bool start();
    void stop();

    // Bound port once started (ServerOptions::port may be 0).
    int port() const { return m_server.port(); }

    const RateLimiter &rateLimiter() const { return m_limiter; }

    // One request in, one response out. Never throws.
    Packet dispatch(const Packet &req);

    using HandlerFunc = std::function<json(spacearena::ArenaManager&, const json&)>;
    void addHandler(PacketType type, HandlerFunc func);

private:
    void onClient(TCPConnection conn);
    void tickLoop();

    static bool isThrottled(PacketType type);

    spacearena::ArenaManager &m_arena;
    ServerOptions m_opts;
    RateLimiter m_limiter;

    TCPServer m_server;
    std::atomic<bool> m_running{false};
    std::thread m_tickThread;

    std::unordered_map<PacketType, HandlerFunc> m_handlers;

    // Open client sockets, so stop() can unblock their threads.
    std::mutex m_clientsMutex;
    std::condition_variable m_clientsDone;
    std::set<int> m_clientFds;
};

// Returns the player_id string of a request; ValidationError if absent.
std::string requirePlayerId(const json &d);

json handleRegister(spacearena::ArenaManager&, const json&);
json handleUnregister(spacearena::ArenaManager&, const json&);
json handleMove(spacearena::ArenaManager&, const json&);
json handleRotate(spacearena::ArenaManager&, const json&);
json handleFire(spacearena::ArenaManager&, const json&);
json handleShield(spacearena::ArenaManager&, const json&);
json handleGetState(spacearena::ArenaManager&, const json&);
json handleGetPlayerState(spacearena::ArenaManager&, const json&);
json handleGetEnvironmentState(spacearena::ArenaManager&, const json&);
json handleGetStats(spacearena::ArenaManager&, const json&);

#endif
