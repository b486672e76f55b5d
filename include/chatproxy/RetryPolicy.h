//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RetryPolicy.h
// Purpose: Exponential backoff for upstream retries
//==========================================================================================================

#pragma once

#include <algorithm>
#include <cstdint>
#include <random>

namespace chatproxy {

//==========================================================================================================
// RetryPolicy
// Fields:
//   baseDelayMs: Delay before the first retry.
//   maxDelayMs: Cap on the exponential term.
//   jitterMs: Upper bound of the uniformly random delay added to each wait.
//==========================================================================================================
struct RetryPolicy {
    int64_t baseDelayMs{1000};
    int64_t maxDelayMs{10000};
    int64_t jitterMs{200};
};

//==========================================================================================================
// BackoffDelayMs
// Purpose: Deterministic part of the wait before retry number `attempt` (1-based):
//          min(baseDelayMs * 2^(attempt-1), maxDelayMs). Non-decreasing in attempt.
//==========================================================================================================
inline int64_t BackoffDelayMs(int attempt, const RetryPolicy& policy = RetryPolicy()) {
    if (attempt < 1) {
        return 0;
    }
    int64_t delay = policy.baseDelayMs;
    for (int i = 1; i < attempt && delay < policy.maxDelayMs; ++i) {
        delay *= 2;
    }
    return std::min(delay, policy.maxDelayMs);
}

// Random jitter in [0, jitterMs].
inline int64_t JitterMs(const RetryPolicy& policy) {
    if (policy.jitterMs <= 0) {
        return 0;
    }
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<int64_t> dis(0, policy.jitterMs);
    return dis(gen);
}

} // namespace chatproxy
