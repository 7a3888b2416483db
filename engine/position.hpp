#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>

namespace spacearena {

struct Position {
    int x = 0;
    int y = 0;
};

inline bool operator==(const Position &a, const Position &b) {
    return a.x == b.x && a.y == b.y;
}
inline bool operator!=(const Position &a, const Position &b) {
    return !(a == b);
}
inline Position operator+(const Position &a, const Position &b) {
    return Position{a.x + b.x, a.y + b.y};
}
inline Position operator-(const Position &a, const Position &b) {
    return Position{a.x - b.x, a.y - b.y};
}

struct PositionHash {
    std::size_t operator()(const Position &p) const {
        std::uint64_t key = ((std::uint64_t)(std::uint32_t)p.x << 32) | (std::uint32_t)p.y;
        return std::hash<std::uint64_t>()(key);
    }
};

enum class Turn {
    Left,
    Right
};

// Headings are degrees: 0 = up, 90 = right, 180 = down, 270 = left.
// y grows downwards.
int normalizeRotation(int degrees);
bool isCardinal(int degrees);
Position unitVector(int rotation);
int rotate90(int rotation, Turn turn);

bool inBounds(Position p, int width, int height);
Position translate(Position p, int rotation, int steps = 1);

Position relativeTo(Position p, Position origin);
int chebyshevDistance(Position a, Position b);
int manhattanDistance(Position a, Position b);

const char *turnName(Turn turn);

} 
