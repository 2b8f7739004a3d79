#pragma once
#include <chrono>
#include <mutex>

// Token bucket shared by every acquirer. Passed around as a shared handle so
// tests can substitute their own.
class TokenBucket {
public:
    TokenBucket(double rate_per_sec, int capacity);

    // Blocks until a token is available.
    void acquire();
    bool try_acquire();
    double available();

private:
    void refill_locked(std::chrono::steady_clock::time_point now);

    std::mutex mtx_;
    double rate_;
    double capacity_;
    double tokens_;
    std::chrono::steady_clock::time_point last_;
};
