#ifndef SPACEARENA_RATE_LIMITER_HPP
#define SPACEARENA_RATE_LIMITER_HPP

#include "../engine/entities.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

// Token bucket per player id. Sits in front of the arena and has its own
// lock, so a throttled request never touches the world lock.
class RateLimiter {
public:
    // ratePerSec <= 0 disables limiting.
    RateLimiter(double ratePerSec, double burst);

    bool tryAcquire(const std::string &key, spacearena::TimePoint now);
    void forget(const std::string &key);

    // Drops buckets that have refilled to the burst; they carry no state.
    void prune(spacearena::TimePoint now);

    bool enabled() const { return m_rate > 0.0; }
    std::size_t size() const;

private:
    struct Bucket {
        double tokens;
        spacearena::TimePoint last;
    };

    static constexpr std::size_t kMinPruneAt = 256;

    void pruneUnlocked(spacearena::TimePoint now);

    double m_rate;
    double m_burst;
    std::size_t m_pruneAt = kMinPruneAt;

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Bucket> m_buckets;
};

#endif
