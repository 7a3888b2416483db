#include "arena_server.hpp"
#include "../engine/arena_errors.hpp"

#include <sys/socket.h>
#include <iostream>

using namespace spacearena;

ArenaServer::ArenaServer(ArenaManager &arena, ServerOptions opts)
    : m_arena(arena),
      m_opts(std::move(opts)),
      m_limiter(m_opts.ratePerSec, m_opts.burst)
{
    addHandler(PacketType::REGISTER,              handleRegister);
    addHandler(PacketType::UNREGISTER,            handleUnregister);
    addHandler(PacketType::MOVE,                  handleMove);
    addHandler(PacketType::ROTATE,                handleRotate);
    addHandler(PacketType::FIRE,                  handleFire);
    addHandler(PacketType::SHIELD,                handleShield);
    addHandler(PacketType::GET_STATE,             handleGetState);
    addHandler(PacketType::GET_PLAYER_STATE,      handleGetPlayerState);
    addHandler(PacketType::GET_ENVIRONMENT_STATE, handleGetEnvironmentState);
    addHandler(PacketType::GET_STATS,             handleGetStats);
}

ArenaServer::~ArenaServer() {
    stop();
}

void ArenaServer::addHandler(PacketType type, HandlerFunc func) {
    m_handlers[type] = std::move(func);
}

bool ArenaServer::isThrottled(PacketType type) {
    switch (type) {
        case PacketType::MOVE:
        case PacketType::ROTATE:
        case PacketType::FIRE:
        case PacketType::SHIELD:
            return true;
        default:
            return false;
    }
}

// ========================================================
// Start / stop
// ========================================================

bool ArenaServer::start() {
    if (m_running)
        return false;

    const std::string statsDir = m_opts.statsDir;
    m_arena.onGameOver([statsDir](const ScoreBoard &board) {
        std::cout << "[ArenaServer] Game over.\n";
        for (const auto &s : board.snapshot()) {
            std::cout << "[ArenaServer]   " << s.playerId << " (" << s.name << ")"
                      << " survived=" << s.secondsSurvived << "s"
                      << " hits=" << s.laserHits
                      << " lost=" << s.livesLost
                      << (s.lastSurviving ? " WINNER" : "") << "\n";
        }
        if (statsDir.empty())
            return;
        std::string path = board.exportCsv(statsDir);
        if (!path.empty())
            std::cout << "[ArenaServer] Stats written to " << path << "\n";
    });

    bool ok = m_server.start(m_opts.port, [this](TCPConnection conn) {
        {
            std::lock_guard<std::mutex> lk(m_clientsMutex);
            m_clientFds.insert(conn.fd());
        }
        std::thread(&ArenaServer::onClient, this, std::move(conn)).detach();
    });
    if (!ok) {
        std::cerr << "[ArenaServer] Failed to listen on port " << m_opts.port << "\n";
        return false;
    }

    m_running = true;
    m_tickThread = std::thread(&ArenaServer::tickLoop, this);

    std::cout << "[ArenaServer] Listening on port " << m_server.port()
              << ", tick " << m_opts.tickPeriod.count() << " ms\n";
    return true;
}

void ArenaServer::stop() {
    if (!m_running.exchange(false))
        return;

    m_server.stop();
    if (m_tickThread.joinable())
        m_tickThread.join();

    std::unique_lock<std::mutex> lk(m_clientsMutex);
    for (int fd : m_clientFds)
        ::shutdown(fd, SHUT_RDWR);
    m_clientsDone.wait(lk, [this] { return m_clientFds.empty(); });

    std::cout << "[ArenaServer] Stopped.\n";
}

// ========================================================
// Tick loop
// ========================================================

void ArenaServer::tickLoop() {
    auto next = std::chrono::steady_clock::now();
    while (m_running) {
        next += m_opts.tickPeriod;
        std::this_thread::sleep_until(next);
        if (!m_running)
            break;

        if (m_arena.advance())
            std::cout << "[ArenaServer] Waiting for players to start a new game.\n";
    }
}

// ========================================================
// Per-client thread
// ========================================================

void ArenaServer::onClient(TCPConnection conn) {
    const int fd = conn.fd();
    const std::string peer = conn.peer();
    std::cout << "[ArenaServer] Client connected from " << peer << "\n";

    std::string line;
    while (conn.recvLine(line)) {
        Packet res;
        try {
            res = dispatch(Packet::deserialize(line));
        } catch (const json::exception &e) {
            res = Packet::make(PacketType::ERROR_RESPONSE, {
                {"kind", "UNKNOWN"},
                {"ok", false},
                {"error", "ValidationError"},
                {"msg", std::string("malformed packet: ") + e.what()}
            });
        }

        if (!conn.sendPacket(res))
            break;
    }

    std::cout << "[ArenaServer] Client " << peer << " disconnected\n";

    std::lock_guard<std::mutex> lk(m_clientsMutex);
    m_clientFds.erase(fd);
    m_clientsDone.notify_all();
}

// ========================================================
// Dispatch
// ========================================================

Packet ArenaServer::dispatch(const Packet &req) {
    Packet res;
    res.type = PacketType::SERVER_RESPONSE;
    res.data["kind"] = packetTypeName(req.type);

    auto fail = [&](const char *error, const std::string &msg) {
        res.type = PacketType::ERROR_RESPONSE;
        res.data["ok"] = false;
        res.data["error"] = error;
        res.data["msg"] = msg;
    };

    if (req.type == PacketType::KEEPALIVE) {
        res.data["ok"] = true;
        return res;
    }

    auto it = m_handlers.find(req.type);
    if (it == m_handlers.end()) {
        fail("ValidationError", "unknown request type " + std::to_string((int)req.type));
        return res;
    }

    std::string throttledId;
    try {
        if (isThrottled(req.type)) {
            throttledId = requirePlayerId(req.data);
            if (!m_limiter.tryAcquire(throttledId, Clock::now()))
                throw RateLimitError("too many requests from '" + throttledId + "'");
        }

        json state = it->second(m_arena, req.data);

        if (req.type == PacketType::UNREGISTER)
            m_limiter.forget(requirePlayerId(req.data));

        res.data["ok"] = true;
        res.data["state"] = std::move(state);
    } catch (const NotFoundError &e) {
        // Unknown ids get no bucket.
        if (!throttledId.empty())
            m_limiter.forget(throttledId);
        fail(e.name(), e.what());
    } catch (const ArenaError &e) {
        fail(e.name(), e.what());
    } catch (const json::exception &e) {
        fail("ValidationError", e.what());
    } catch (const std::exception &e) {
        std::cerr << "[ArenaServer] Internal error on " << packetTypeName(req.type)
                  << ": " << e.what() << "\n";
        fail("InternalError", e.what());
    }
    return res;
}
