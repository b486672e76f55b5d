//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConcurrencyLimiter.hpp
// Purpose: Per-provider bound on in-flight upstream requests
//==========================================================================================================

#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "chatproxy/async/AsyncSemaphore.hpp"

namespace chatproxy {

//==========================================================================================================
// ConcurrencyLimiter
// Purpose: Lazily creates one AsyncSemaphore per provider key and hands out scoped permits.
// Notes:
//   - The capacity is fixed when the key is first used; later Acquire() calls reuse that semaphore.
//   - Entries are only added, never removed, until Reset().
//==========================================================================================================
class ConcurrencyLimiter {
public:
    static constexpr std::size_t kDefaultMaxConcurrent = 25;

    //==========================================================================================================
    // Permit
    // Purpose: One held unit of concurrency. Released exactly once: by Release() or by the destructor,
    //          whichever comes first. Moved-from permits release nothing.
    //==========================================================================================================
    class Permit {
    public:
        Permit() = default;
        explicit Permit(std::shared_ptr<async::AsyncSemaphore> sem) : sem(std::move(sem)) {}
        Permit(Permit&& other) noexcept : sem(std::move(other.sem)) {}
        Permit& operator=(Permit&& other) noexcept {
            if (this != &other) {
                Release();
                sem = std::move(other.sem);
            }
            return *this;
        }
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        ~Permit() { Release(); }

        void Release() {
            if (sem) {
                sem->Release();
                sem.reset();
            }
        }
        bool Held() const { return sem != nullptr; }

    private:
        std::shared_ptr<async::AsyncSemaphore> sem;
    };

    struct LimiterStats {
        std::size_t capacity{0};
        std::size_t available{0};
        std::size_t queued{0};
    };

    explicit ConcurrencyLimiter(std::size_t defaultCapacity = kDefaultMaxConcurrent)
        : defaultCapacity(defaultCapacity) {}

    //==========================================================================================================
    // Acquire
    // Purpose: Suspends until a permit for key is available (FIFO among waiters).
    // Args:
    //   key: Provider identifier.
    //   capacity: Semaphore size used when the key is first seen; the default capacity when unset.
    //==========================================================================================================
    boost::asio::awaitable<Permit> Acquire(const std::string& key,
                                           std::optional<std::size_t> capacity = std::nullopt);

    // Snapshot for key. Unknown keys report the default capacity, all available and nothing queued.
    LimiterStats Stats(const std::string& key) const;

    // Drops all semaphores; outstanding permits keep their semaphore alive until released.
    void Reset();

private:
    std::shared_ptr<async::AsyncSemaphore> semaphoreFor(const std::string& key, std::size_t capacity);

    const std::size_t defaultCapacity;
    mutable std::mutex mtx;
    std::map<std::string, std::shared_ptr<async::AsyncSemaphore>> semaphores;
};

} // namespace chatproxy
