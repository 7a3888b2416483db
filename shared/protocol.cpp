#include "protocol.hpp"

const char *packetTypeName(PacketType type) {
    switch (type) {
        case PacketType::REGISTER:              return "REGISTER";
        case PacketType::UNREGISTER:            return "UNREGISTER";
        case PacketType::MOVE:                  return "MOVE";
        case PacketType::ROTATE:                return "ROTATE";
        case PacketType::FIRE:                  return "FIRE";
        case PacketType::SHIELD:                return "SHIELD";
        case PacketType::GET_STATE:             return "GET_STATE";
        case PacketType::GET_PLAYER_STATE:      return "GET_PLAYER_STATE";
        case PacketType::GET_ENVIRONMENT_STATE: return "GET_ENVIRONMENT_STATE";
        case PacketType::GET_STATS:             return "GET_STATS";
        case PacketType::SERVER_RESPONSE:       return "SERVER_RESPONSE";
        case PacketType::ERROR_RESPONSE:        return "ERROR_RESPONSE";
        case PacketType::KEEPALIVE:             return "KEEPALIVE";
    }
    return "UNKNOWN";
}
