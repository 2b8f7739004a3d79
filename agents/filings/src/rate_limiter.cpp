#include "../include/rate_limiter.hpp"
#include <algorithm>
#include <stdexcept>
#include <thread>

TokenBucket::TokenBucket(double rate_per_sec, int capacity)
    : rate_(rate_per_sec), capacity_(capacity), tokens_(capacity),
      last_(std::chrono::steady_clock::now()) {
    if (rate_per_sec <= 0.0 || capacity <= 0) {
        throw std::invalid_argument("token bucket needs a positive rate and capacity");
    }
}

void TokenBucket::refill_locked(std::chrono::steady_clock::time_point now) {
    std::chrono::duration<double> elapsed = now - last_;
    tokens_ = std::min(capacity_, tokens_ + elapsed.count() * rate_);
    last_ = now;
}

void TokenBucket::acquire() {
    std::unique_lock<std::mutex> lock(mtx_);
    for (;;) {
        refill_locked(std::chrono::steady_clock::now());
        if (tokens_ >= 1.0) {
            tokens_ -= 1.0;
            return;
        }
        auto wait = std::chrono::duration<double>((1.0 - tokens_) / rate_);
        // Sleep without holding the lock so other callers can refill and check.
        lock.unlock();
        std::this_thread::sleep_for(wait);
        lock.lock();
    }
}

bool TokenBucket::try_acquire() {
    std::lock_guard<std::mutex> lock(mtx_);
    refill_locked(std::chrono::steady_clock::now());
    if (tokens_ < 1.0) return false;
    tokens_ -= 1.0;
    return true;
}

double TokenBucket::available() {
    std::lock_guard<std::mutex> lock(mtx_);
    refill_locked(std::chrono::steady_clock::now());
    return tokens_;
}
