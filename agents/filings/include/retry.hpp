#pragma once
#include "config.hpp"
#include "errors.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

// Runs fn, retrying retryable PipelineErrors with exponential backoff.
// Non-retryable errors and the last failed attempt propagate unchanged.
template <typename Fn>
auto with_retry(const RetryPolicy& policy, const std::string& what, Fn&& fn) -> decltype(fn()) {
    int backoff_ms = policy.initial_backoff_ms;
    for (int attempt = 1;; ++attempt) {
        try {
            return fn();
        } catch (const PipelineError& e) {
            if (!e.retryable() || attempt >= policy.max_attempts) throw;
            std::cerr << "[retry] " << what << " attempt " << attempt << "/" << policy.max_attempts
                      << " failed: " << e.what() << "; backing off " << backoff_ms << "ms\n";
            std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
            backoff_ms = std::min(policy.max_backoff_ms, backoff_ms * 2);
        }
    }
}
