#ifndef SPACEARENA_PACKET_HPP
#define SPACEARENA_PACKET_HPP

#include <nlohmann/json.hpp>
#include "protocol.hpp"
#include <string>

// One wire message: {"type": <int>, "data": {...}} followed by '\n'.
struct Packet {
    PacketType type = PacketType::KEEPALIVE;
    nlohmann::json data = nlohmann::json::object();

    static Packet make(PacketType type, nlohmann::json data = nlohmann::json::object()) {
        Packet p;
        p.type = type;
        p.data = std::move(data);
        return p;
    }

    // Accepted server replies carry "ok": true.
    bool ok() const {
        return type == PacketType::SERVER_RESPONSE && data.value("ok", false);
    }

    // Error name of a rejected reply, e.g. "IllegalMoveError".
    std::string error() const {
        return data.value("error", std::string("UnknownError"));
    }

    // Player names come from clients; bad UTF-8 is replaced, not thrown.
    std::string serialize() const {
        nlohmann::json j = {{"type", (int)type}, {"data", data}};
        return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
    }

    // Throws nlohmann::json exceptions on malformed input.
    static Packet deserialize(const std::string &line) {
        nlohmann::json j = nlohmann::json::parse(line);
        Packet p;
        p.type = (PacketType)j.at("type").get<int>();
        auto d = j.find("data");
        if (d != j.end() && !d->is_null())
            p.data = *d;
        return p;
    }
};

#endif
