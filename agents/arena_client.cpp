#include "arena_client.hpp"

#include <iostream>

using namespace spacearena;

bool ArenaClient::connect(const std::string &host, int port) {
    if (!m_conn.connectToServer(host, port))
        return false;
    // A stalled server shows up as a lost connection instead of a hang.
    if (!m_conn.setRecvTimeout(kReplyTimeoutMs))
        std::cerr << "[Agent] Replies will be awaited without a timeout\n";
    return true;
}

bool ArenaClient::call(PacketType type, const json &data, json &state, std::string &error) {
    Packet res;
    if (!m_conn.request(Packet::make(type, data), res)) {
        m_conn.close();
        error = "ConnectionLost";
        return false;
    }

    if (!res.ok()) {
        error = res.error();
        std::string msg = res.data.value("msg", std::string());
        if (!msg.empty())
            std::cerr << "[Agent] " << packetTypeName(type) << " rejected: " << msg << "\n";
        return false;
    }

    state = res.data.contains("state") ? res.data["state"] : json::object();
    return true;
}

bool ArenaClient::registerPlayer(const std::string &id, const std::string &name, std::string &error) {
    json d{{"player_id", id}};
    if (!name.empty())
        d["name"] = name;
    json state;
    return call(PacketType::REGISTER, d, state, error);
}

bool ArenaClient::unregisterPlayer(const std::string &id) {
    json state;
    std::string error;
    return call(PacketType::UNREGISTER, json{{"player_id", id}}, state, error);
}

bool ArenaClient::observe(const std::string &id, Observation &obs, std::string &error) {
    json players, env;
    if (!call(PacketType::GET_PLAYER_STATE, json::object(), players, error))
        return false;
    if (!call(PacketType::GET_ENVIRONMENT_STATE, json{{"player_id", id}}, env, error))
        return false;

    obs = makeObservation(players, env, id);
    return true;
}

bool ArenaClient::perform(const std::string &id, AgentAction action, std::string &error) {
    json d{{"player_id", id}};
    PacketType type;

    switch (action) {
        case AgentAction::Wait:
            return true;
        case AgentAction::Move:
            type = PacketType::MOVE;
            break;
        case AgentAction::RotateLeft:
            type = PacketType::ROTATE;
            d["direction"] = "left";
            break;
        case AgentAction::RotateRight:
            type = PacketType::ROTATE;
            d["direction"] = "right";
            break;
        case AgentAction::Fire:
            type = PacketType::FIRE;
            break;
        case AgentAction::Shield:
            type = PacketType::SHIELD;
            break;
        default:
            return true;
    }

    json state;
    return call(type, d, state, error);
}

static std::vector<Position> cells(const json &j, const char *key) {
    std::vector<Position> out;
    if (!j.contains(key)) return out;
    for (const auto &c : j[key])
        out.push_back(Position{c.at(0).get<int>(), c.at(1).get<int>()});
    return out;
}

Observation makeObservation(const json &playerState, const json &environment,
                            const std::string &selfId) {
    Observation obs;
    obs.gameOver = environment.value("game_over", false);
    obs.walls = cells(environment, "walls");
    obs.mines = cells(environment, "mines");
    obs.lasers = cells(environment, "lasers");

    if (!playerState.contains("players"))
        return obs;
    const json &players = playerState["players"];

    auto self = players.find(selfId);
    if (self == players.end())
        return obs;

    obs.present = true;
    obs.position = Position{self->at("position").at(0).get<int>(),
                            self->at("position").at(1).get<int>()};
    obs.rotation = self->value("rotation", 0);
    obs.lives = self->value("lives", 0);
    obs.active = self->value("active", false);
    obs.shieldAvailable = self->value("shield_available", false);
    obs.shieldActive = self->value("shield_active", false);

    for (auto it = players.begin(); it != players.end(); ++it) {
        if (it.key() == selfId || !it.value().value("active", false))
            continue;
        Position p{it.value().at("position").at(0).get<int>(),
                   it.value().at("position").at(1).get<int>()};
        obs.enemies.push_back(relativeTo(p, obs.position));
    }
    return obs;
}
