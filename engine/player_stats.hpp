#pragma once
#include <chrono>
#include <string>
#include <vector>

#include "physics.hpp"

namespace spacearena {

struct PlayerStats {
    std::string playerId;
    std::string name;
    double secondsSurvived = 0.0;
    int laserHits = 0;       // hits this player's lasers landed
    int livesLost = 0;
    bool lastSurviving = false;
};

/*
  Per-game scoreboard. Survival time keeps counting while a ship is active
  and freezes when it is eliminated. Rows keep registration order.
*/
class ScoreBoard {
public:
    void addPlayer(const std::string &playerId, const std::string &name, TimePoint now);
    void removePlayer(const std::string &playerId);
    void clear();

    void recordHits(const std::vector<HitEvent> &hits);
    void updateSurvival(const GameState &world, TimePoint now);
    void setLastSurviving(const std::string &playerId);

    std::vector<PlayerStats> snapshot() const;

    // Writes <dir>/<YYYY_MM_DD_HH_MM_SS>_gamestats.csv. Returns the path, or
    // an empty string when the file could not be written.
    std::string exportCsv(const std::string &dir) const;

private:
    struct Row {
        PlayerStats stats;
        TimePoint joinedAt;
    };

    Row* find(const std::string &playerId);

    std::vector<Row> m_rows;
};

} 
