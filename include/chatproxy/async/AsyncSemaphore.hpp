//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AsyncSemaphore.hpp
// Purpose: FIFO counting semaphore for Boost.Asio coroutines
//==========================================================================================================

#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/system/system_error.hpp>

namespace chatproxy {
namespace async {

//==========================================================================================================
// AsyncSemaphore
// Purpose: Counting semaphore whose Acquire() suspends the calling coroutine instead of blocking the
//          I/O thread. Waiters are granted permits strictly in arrival order.
// Notes:
//   - Each waiter parks on a steady_timer that expires only at its deadline, if it has one. Release()
//     hands the permit to the oldest waiter and cancels its timer to resume it. The permit count is
//     never observable below zero.
//   - Release() must be called on the I/O thread that runs the waiting coroutines.
//==========================================================================================================
class AsyncSemaphore {
public:
    explicit AsyncSemaphore(std::size_t permits)
        : capacity(permits), available(permits) {}

    AsyncSemaphore(const AsyncSemaphore&) = delete;
    AsyncSemaphore& operator=(const AsyncSemaphore&) = delete;

    //==========================================================================================================
    // Acquire
    // Purpose: Takes one permit, suspending until one is available.
    // Throws:
    //   boost::system::system_error(operation_aborted) when CancelAll() wakes the waiter.
    //==========================================================================================================
    boost::asio::awaitable<void> Acquire() {
        co_await Acquire(boost::asio::steady_timer::time_point::max());
    }

    //==========================================================================================================
    // Acquire (bounded)
    // Purpose: As Acquire(), but gives up at the deadline and leaves the queue.
    // Throws:
    //   boost::system::system_error(boost::beast::error::timeout) when the deadline passes first.
    //   boost::system::system_error(operation_aborted) when CancelAll() wakes the waiter.
    //==========================================================================================================
    boost::asio::awaitable<void> Acquire(boost::asio::steady_timer::time_point deadline) {
        auto ex = co_await boost::asio::this_coro::executor;
        std::shared_ptr<Waiter> waiter;
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (available > 0 && waiters.empty()) {
                --available;
                co_return;
            }
            waiter = std::make_shared<Waiter>(ex, deadline);
            waiters.push_back(waiter);
        }
        boost::system::error_code ec;
        co_await waiter->timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        std::lock_guard<std::mutex> lock(mtx);
        if (!waiter->granted) {
            waiters.erase(std::remove(waiters.begin(), waiters.end(), waiter), waiters.end());
            if (!ec) {
                throw boost::system::system_error(boost::beast::error::timeout);
            }
            throw boost::system::system_error(boost::asio::error::operation_aborted);
        }
    }

    // Takes a permit without waiting; false when none is free or others are queued.
    bool TryAcquire() {
        std::lock_guard<std::mutex> lock(mtx);
        if (available > 0 && waiters.empty()) {
            --available;
            return true;
        }
        return false;
    }

    void Release() {
        std::shared_ptr<Waiter> next;
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (waiters.empty()) {
                available = std::min(available + 1, capacity);
                return;
            }
            next = waiters.front();
            waiters.pop_front();
            next->granted = true;
        }
        next->timer.cancel();
    }

    // Wakes every waiter with operation_aborted (used on shutdown).
    void CancelAll() {
        std::deque<std::shared_ptr<Waiter>> pending;
        {
            std::lock_guard<std::mutex> lock(mtx);
            pending.swap(waiters);
        }
        for (auto& w : pending) {
            w->timer.cancel();
        }
    }

    std::size_t Capacity() const { return capacity; }

    std::size_t Available() const {
        std::lock_guard<std::mutex> lock(mtx);
        return available;
    }

    std::size_t Queued() const {
        std::lock_guard<std::mutex> lock(mtx);
        return waiters.size();
    }

private:
    struct Waiter {
        Waiter(const boost::asio::any_io_executor& ex, boost::asio::steady_timer::time_point deadline)
            : timer(ex, deadline) {}
        boost::asio::steady_timer timer;
        bool granted{false};
    };

    const std::size_t capacity;
    std::size_t available;
    std::deque<std::shared_ptr<Waiter>> waiters;
    mutable std::mutex mtx;
};

} // namespace async
} // namespace chatproxy
