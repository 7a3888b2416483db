#include "player_stats.hpp"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace spacearena {

// Quotes fields holding a separator, quote or line break.
static std::string csvField(const std::string &value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos)
        return value;

    std::string out = "\"";
    for (char c : value) {
        if (c == '"')
            out += '"';
        out += c;
    }
    out += '"';
    return out;
}

ScoreBoard::Row* ScoreBoard::find(const std::string &playerId) {
    for (auto &r : m_rows) {
        if (r.stats.playerId == playerId) return &r;
    }
    return nullptr;
}

void ScoreBoard::addPlayer(const std::string &playerId, const std::string &name, TimePoint now) {
    removePlayer(playerId);
    Row r;
    r.stats.playerId = playerId;
    r.stats.name = name;
    r.joinedAt = now;
    m_rows.push_back(r);
}

void ScoreBoard::removePlayer(const std::string &playerId) {
    for (auto it = m_rows.begin(); it != m_rows.end(); ++it) {
        if (it->stats.playerId == playerId) {
            m_rows.erase(it);
            return;
        }
    }
}

void ScoreBoard::clear() {
    m_rows.clear();
}

void ScoreBoard::recordHits(const std::vector<HitEvent> &hits) {
    for (const auto &h : hits) {
        if (Row *target = find(h.targetId))
            target->stats.livesLost += h.damage;

        if (h.kind == HitKind::Laser && !h.shielded && !h.sourceId.empty()) {
            if (Row *shooter = find(h.sourceId))
                shooter->stats.laserHits++;
        }
    }
}

void ScoreBoard::updateSurvival(const GameState &world, TimePoint now) {
    for (auto &r : m_rows) {
        const Spaceship *ship = findPlayer(world, r.stats.playerId);
        if (!ship || !ship->active) continue;
        r.stats.secondsSurvived =
            std::chrono::duration<double>(now - r.joinedAt).count();
    }
}

void ScoreBoard::setLastSurviving(const std::string &playerId) {
    if (Row *r = find(playerId))
        r->stats.lastSurviving = true;
}

std::vector<PlayerStats> ScoreBoard::snapshot() const {
    std::vector<PlayerStats> out;
    out.reserve(m_rows.size());
    for (const auto &r : m_rows)
        out.push_back(r.stats);
    return out;
}

std::string ScoreBoard::exportCsv(const std::string &dir) const {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        std::cerr << "[Stats] Cannot create '" << dir << "': " << ec.message() << "\n";
        return "";
    }

    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm;
    localtime_r(&t, &tm);
    std::ostringstream name;
    name << std::put_time(&tm, "%Y_%m_%d_%H_%M_%S") << "_gamestats.csv";

    std::string path = (std::filesystem::path(dir) / name.str()).string();
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        std::cerr << "[Stats] Failed to open '" << path << "' for writing\n";
        return "";
    }

    out << "player_id,seconds_survived,laser_hits,lives_lost,is_last_surviving\n";
    for (const auto &r : m_rows) {
        out << csvField(r.stats.playerId) << ","
            << std::fixed << std::setprecision(2) << r.stats.secondsSurvived << ","
            << r.stats.laserHits << ","
            << r.stats.livesLost << ","
            << (r.stats.lastSurviving ? "True" : "False") << "\n";
    }
    out.flush();

    if (!out.good()) {
        std::cerr << "[Stats] Write error when saving '" << path << "'\n";
        return "";
    }
    return path;
}

} 
