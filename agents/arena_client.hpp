#ifndef SPACEARENA_ARENA_CLIENT_HPP
#define SPACEARENA_ARENA_CLIENT_HPP

#include "../shared/tcp.hpp"
#include "agent.hpp"

#include <string>

using json = nlohmann::json;

// Blocking request/response client for the arena server.
class ArenaClient {
public:
    static constexpr int kReplyTimeoutMs = 3000;

    bool connect(const std::string &host, int port);
    bool connected() const { return m_conn.isOpen(); }

    // On an ok response fills state and returns true. On a rejection fills
    // error with the error name; on a dead connection error is "ConnectionLost".
    bool call(PacketType type, const json &data, json &state, std::string &error);

    bool registerPlayer(const std::string &id, const std::string &name, std::string &error);
    bool unregisterPlayer(const std::string &id);

    bool observe(const std::string &id, spacearena::Observation &obs, std::string &error);
    bool perform(const std::string &id, spacearena::AgentAction action, std::string &error);

private:
    TCPConnection m_conn;
};

// Builds an agent's view from GET_PLAYER_STATE and GET_ENVIRONMENT_STATE payloads.
spacearena::Observation makeObservation(const json &playerState,
                                        const json &environment,
                                        const std::string &selfId);

#endif
