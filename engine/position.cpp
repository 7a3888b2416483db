#include "position.hpp"
#include <cstdlib>
#include <algorithm>

namespace spacearena {

int normalizeRotation(int degrees) {
    int r = degrees % 360;
    if (r < 0) r += 360;
    return r;
}

bool isCardinal(int degrees) {
    return normalizeRotation(degrees) % 90 == 0;
}

Position unitVector(int rotation) {
    switch (normalizeRotation(rotation)) {
        case 0:   return Position{ 0, -1};
        case 90:  return Position{ 1,  0};
        case 180: return Position{ 0,  1};
        case 270: return Position{-1,  0};
        default:  return Position{ 0,  0};
    }
}

int rotate90(int rotation, Turn turn) {
    int delta = (turn == Turn::Right) ? 90 : -90;
    return normalizeRotation(rotation + delta);
}

bool inBounds(Position p, int width, int height) {
    return p.x >= 0 && p.y >= 0 && p.x < width && p.y < height;
}

Position translate(Position p, int rotation, int steps) {
    Position d = unitVector(rotation);
    return Position{p.x + d.x * steps, p.y + d.y * steps};
}

Position relativeTo(Position p, Position origin) {
    return p - origin;
}

int chebyshevDistance(Position a, Position b) {
    return std::max(std::abs(a.x - b.x), std::abs(a.y - b.y));
}

int manhattanDistance(Position a, Position b) {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

const char *turnName(Turn turn) {
    return turn == Turn::Left ? "left" : "right";
}

} 
