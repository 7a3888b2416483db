#include "rate_limiter.hpp"

#include <algorithm>
#include <chrono>

RateLimiter::RateLimiter(double ratePerSec, double burst)
    : m_rate(ratePerSec),
      m_burst(std::max(1.0, burst))
{
}

bool RateLimiter::tryAcquire(const std::string &key, spacearena::TimePoint now) {
    if (!enabled())
        return true;

    std::lock_guard<std::mutex> lk(m_mutex);

    auto it = m_buckets.find(key);
    if (it == m_buckets.end()) {
        if (m_buckets.size() >= m_pruneAt) {
            pruneUnlocked(now);
            m_pruneAt = std::max(kMinPruneAt, 2 * m_buckets.size());
        }
        it = m_buckets.emplace(key, Bucket{m_burst, now}).first;
    }

    Bucket &b = it->second;
    if (now > b.last) {
        double elapsed = std::chrono::duration<double>(now - b.last).count();
        b.tokens = std::min(m_burst, b.tokens + elapsed * m_rate);
        b.last = now;
    }

    if (b.tokens < 1.0)
        return false;

    b.tokens -= 1.0;
    return true;
}

void RateLimiter::forget(const std::string &key) {
    std::lock_guard<std::mutex> lk(m_mutex);
    m_buckets.erase(key);
}

void RateLimiter::prune(spacearena::TimePoint now) {
    std::lock_guard<std::mutex> lk(m_mutex);
    pruneUnlocked(now);
}

void RateLimiter::pruneUnlocked(spacearena::TimePoint now) {
    for (auto it = m_buckets.begin(); it != m_buckets.end();) {
        const Bucket &b = it->second;
        double elapsed = now > b.last ? std::chrono::duration<double>(now - b.last).count() : 0.0;
        if (b.tokens + elapsed * m_rate >= m_burst)
            it = m_buckets.erase(it);
        else
            ++it;
    }
}

std::size_t RateLimiter::size() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_buckets.size();
}
