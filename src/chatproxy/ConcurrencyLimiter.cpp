//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/chatproxy/ConcurrencyLimiter.cpp
// Purpose: Per-provider concurrency semaphores
//==========================================================================================================

#include "chatproxy/ConcurrencyLimiter.hpp"
#include "logging/Logger.h"

namespace chatproxy {

std::shared_ptr<async::AsyncSemaphore> ConcurrencyLimiter::semaphoreFor(const std::string& key,
                                                                        std::size_t capacity) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = semaphores.find(key);
    if (it == semaphores.end()) {
        it = semaphores.emplace(key, std::make_shared<async::AsyncSemaphore>(capacity)).first;
        LOG_DEBUG("Created concurrency limiter for '{}' (max_concurrent={})", key, capacity);
    }
    return it->second;
}

boost::asio::awaitable<ConcurrencyLimiter::Permit> ConcurrencyLimiter::Acquire(
    const std::string& key, std::optional<std::size_t> capacity) {
    std::size_t cap = capacity.value_or(defaultCapacity);
    if (cap == 0) {
        cap = defaultCapacity;
    }
    auto sem = semaphoreFor(key, cap);
    if (sem->Available() == 0) {
        LOG_DEBUG("Provider '{}' at concurrency limit, queued={}", key, sem->Queued() + 1);
    }
    co_await sem->Acquire();
    co_return Permit(std::move(sem));
}

ConcurrencyLimiter::LimiterStats ConcurrencyLimiter::Stats(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mtx);
    LimiterStats s;
    auto it = semaphores.find(key);
    if (it == semaphores.end()) {
        s.capacity = defaultCapacity;
        s.available = defaultCapacity;
        return s;
    }
    s.capacity = it->second->Capacity();
    s.available = it->second->Available();
    s.queued = it->second->Queued();
    return s;
}

void ConcurrencyLimiter::Reset() {
    std::lock_guard<std::mutex> lock(mtx);
    semaphores.clear();
}

} // namespace chatproxy
