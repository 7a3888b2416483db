#include "rate_limiter.hpp"
#include "../shared/test_check.hpp"

#include <string>

using namespace spacearena;
using std::chrono::milliseconds;

static int test_burst_then_refill() {
    RateLimiter limiter(10.0, 5.0);
    TimePoint t = Clock::now();

    for (int i = 0; i < 5; ++i)
        EXPECT(limiter.tryAcquire("a", t), "burst allowed");
    EXPECT(!limiter.tryAcquire("a", t), "sixth request throttled");

    EXPECT(limiter.tryAcquire("a", t + milliseconds(100)), "one token back after 100 ms");
    EXPECT(!limiter.tryAcquire("a", t + milliseconds(100)), "and only one");

    EXPECT(limiter.tryAcquire("b", t), "buckets are per player");

    // Idle time never buys more than the burst.
    TimePoint later = t + std::chrono::seconds(60);
    for (int i = 0; i < 5; ++i)
        EXPECT(limiter.tryAcquire("a", later), "refilled to burst");
    EXPECT(!limiter.tryAcquire("a", later), "capped at burst");
    return 0;
}

static int test_forget_and_disable() {
    RateLimiter limiter(1.0, 1.0);
    TimePoint t = Clock::now();
    EXPECT(limiter.tryAcquire("a", t), "first");
    EXPECT(!limiter.tryAcquire("a", t), "throttled");
    limiter.forget("a");
    EXPECT(limiter.tryAcquire("a", t), "fresh bucket after forget");

    RateLimiter off(0.0, 5.0);
    EXPECT(!off.enabled(), "zero rate disables");
    for (int i = 0; i < 100; ++i)
        EXPECT(off.tryAcquire("a", t), "never throttles when disabled");
    return 0;
}

static int test_idle_buckets_pruned() {
    RateLimiter limiter(10.0, 5.0);
    TimePoint t = Clock::now();

    for (int i = 0; i < 300; ++i)
        limiter.tryAcquire("ghost" + std::to_string(i), t);
    EXPECT(limiter.tryAcquire("busy", t + milliseconds(1000)), "busy first");
    for (int i = 0; i < 4; ++i)
        limiter.tryAcquire("busy", t + milliseconds(1000));
    EXPECT(limiter.size() == 301, "one bucket per key seen");

    limiter.prune(t + milliseconds(1000));
    EXPECT(limiter.size() == 1, "refilled buckets dropped");
    EXPECT(!limiter.tryAcquire("busy", t + milliseconds(1000)), "drained bucket kept");

    // A stream of one-off keys stays bounded once old buckets refill.
    RateLimiter churn(10.0, 5.0);
    for (int i = 0; i < 5000; ++i)
        churn.tryAcquire("k" + std::to_string(i), t + std::chrono::seconds(i));
    EXPECT(churn.size() <= 256, "map does not grow with distinct keys");
    return 0;
}

int main() {
    RUN(test_burst_then_refill);
    RUN(test_forget_and_disable);
    RUN(test_idle_buckets_pruned);
    return 0;
}
