#ifndef SPACEARENA_PROTOCOL_HPP
#define SPACEARENA_PROTOCOL_HPP

enum class PacketType {

    // Player actions
    REGISTER = 1,
    UNREGISTER,
    MOVE,
    ROTATE,
    FIRE,
    SHIELD,

    // Read-only queries
    GET_STATE = 100,
    GET_PLAYER_STATE,
    GET_ENVIRONMENT_STATE,
    GET_STATS,

    // Generic
    SERVER_RESPONSE = 300,
    ERROR_RESPONSE,
    KEEPALIVE = 99

};

const char *packetTypeName(PacketType type);

#endif
