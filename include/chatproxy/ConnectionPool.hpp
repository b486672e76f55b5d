//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectionPool.hpp
// Purpose: Keep-alive upstream connection pools, one per provider origin, with TLS session reuse
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/ssl.h>

#include "chatproxy/Url.h"
#include "chatproxy/async/AsyncSemaphore.hpp"

namespace chatproxy {

//==========================================================================================================
// PoolOptions
// Purpose: Per-origin pool limits.
// Fields:
//   maxConnections: Open connections per origin (leased + idle).
//   keepAliveTimeout: Idle lifetime when the server sends no Keep-Alive hint.
//   keepAliveMaxTimeout: Ceiling for a server-provided Keep-Alive timeout.
//   keepAliveTimeoutThreshold: Subtracted from a server hint so sockets are recycled before the server
//                              drops them.
//   maxCachedTlsSessions: TLS sessions kept for resumption across all origins.
//   connectTimeout: Upper bound for TCP connect plus TLS handshake.
//==========================================================================================================
struct PoolOptions {
    std::size_t maxConnections{50};
    std::chrono::milliseconds keepAliveTimeout{60000};
    std::chrono::milliseconds keepAliveMaxTimeout{300000};
    std::chrono::milliseconds keepAliveTimeoutThreshold{10000};
    std::size_t maxCachedTlsSessions{100};
    std::chrono::milliseconds connectTimeout{10000};
};

struct PoolStats {
    std::size_t open{0};
    std::size_t idle{0};
    std::size_t leased{0};
};

//==========================================================================================================
// ComputeKeepAlive
// Purpose: Idle lifetime for a connection after a response.
// Args:
//   keepAliveHeader: Value of the response Keep-Alive header, if any (e.g. "timeout=5, max=100").
// Returns:
//   keepAliveTimeout without a timeout hint; otherwise hint - threshold clamped to keepAliveMaxTimeout.
//   std::nullopt when the hinted lifetime is too short to reuse the connection.
//==========================================================================================================
std::optional<std::chrono::milliseconds> ComputeKeepAlive(std::optional<std::string_view> keepAliveHeader,
                                                          const PoolOptions& opts);

//==========================================================================================================
// TlsSessionCache
// Purpose: Bounded LRU of client TLS sessions keyed by "host:port".
//==========================================================================================================
class TlsSessionCache {
public:
    explicit TlsSessionCache(std::size_t capacity) : capacity(capacity) {}
    ~TlsSessionCache();
    TlsSessionCache(const TlsSessionCache&) = delete;
    TlsSessionCache& operator=(const TlsSessionCache&) = delete;

    // Applies a cached session to ssl for resumption; false when none is cached.
    bool Apply(const std::string& key, SSL* ssl);

    // Stores the current session of ssl (takes its own reference).
    void Store(const std::string& key, SSL* ssl);

    std::size_t Size() const;

private:
    struct Entry {
        std::string key;
        SSL_SESSION* session;
    };
    const std::size_t capacity;
    std::list<Entry> lru;
    mutable std::mutex mtx;
};

//==========================================================================================================
// UpstreamConnection
// Purpose: One HTTP/1.1 connection to an upstream origin, plain TCP or TLS, with its read buffer.
//==========================================================================================================
class UpstreamConnection {
public:
    using TlsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;

    explicit UpstreamConnection(boost::beast::tcp_stream plain);
    explicit UpstreamConnection(std::unique_ptr<TlsStream> tls);
    UpstreamConnection(const UpstreamConnection&) = delete;
    UpstreamConnection& operator=(const UpstreamConnection&) = delete;

    bool IsTls() const { return tls != nullptr; }
    bool IsOpen();

    // TCP layer, for deadlines.
    boost::beast::tcp_stream& Tcp();
    SSL* NativeSsl() { return tls ? tls->native_handle() : nullptr; }

    boost::beast::flat_buffer& Buffer() { return buffer; }

    //==========================================================================================================
    // Visit
    // Purpose: Invokes f with the concrete stream (tcp_stream& or TlsStream&).
    //==========================================================================================================
    template <class F>
    decltype(auto) Visit(F&& f) {
        if (tls) {
            return f(*tls);
        }
        return f(plain);
    }

    // Best-effort socket close; never throws.
    void Close();

    std::size_t UsageCount() const { return usage; }
    void MarkUsed() { ++usage; }

    std::chrono::steady_clock::time_point idleUntil{};

private:
    boost::beast::tcp_stream plain;
    std::unique_ptr<TlsStream> tls;
    boost::beast::flat_buffer buffer;
    std::size_t usage{0};
};

//==========================================================================================================
// ConnectionPool
// Purpose: Keep-alive pool for a single origin.
// Notes:
//   - Acquire() reuses the most recently returned idle connection that has not passed its idle deadline,
//     otherwise opens a new one. At most maxConnections are open; further acquirers wait FIFO.
//   - A Lease returns its connection to the pool only when MarkReusable() was called; otherwise the
//     connection is closed on release.
//   - Runs on a single I/O thread; Stats() may be read from any thread.
//==========================================================================================================
class ConnectionPool : public std::enable_shared_from_this<ConnectionPool> {
public:
    class Lease {
    public:
        Lease() = default;
        Lease(std::shared_ptr<ConnectionPool> pool, std::unique_ptr<UpstreamConnection> conn, bool reused);
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        ~Lease();

        UpstreamConnection& operator*() { return *conn; }
        UpstreamConnection* operator->() { return conn.get(); }
        explicit operator bool() const { return conn != nullptr; }

        // True when the connection came from the idle set rather than a fresh connect.
        bool Reused() const { return reused; }

        // Return the connection to the idle set on release, kept for idleFor.
        void MarkReusable(std::chrono::milliseconds idleFor);

        // Hands the connection back now (or closes it when not reusable).
        void Release();

    private:
        std::shared_ptr<ConnectionPool> pool;
        std::unique_ptr<UpstreamConnection> conn;
        std::optional<std::chrono::milliseconds> keepFor;
        bool reused{false};
    };

    ConnectionPool(boost::asio::any_io_executor ex, boost::asio::ssl::context& sslCtx,
                   TlsSessionCache& sessions, UrlParts origin, PoolOptions opts);
    ~ConnectionPool();

    //==========================================================================================================
    // Acquire
    // Purpose: Leases a connection, connecting when no idle one is usable.
    // Args:
    //   deadline: Overall request deadline. Bounds the wait for a free slot; connect is bounded by
    //             min(deadline, now + connectTimeout).
    // Throws:
    //   boost::system::system_error on resolve/connect/handshake failure (beast::error::timeout on expiry);
    //   std::logic_error when the pool has been closed.
    //==========================================================================================================
    boost::asio::awaitable<Lease> Acquire(std::chrono::steady_clock::time_point deadline);

    //==========================================================================================================
    // Close
    // Purpose: Graceful shutdown. Closes idle connections, fails pending acquirers, then waits until every
    //          leased connection is returned or the grace period ends.
    //==========================================================================================================
    boost::asio::awaitable<void> Close(std::chrono::milliseconds grace);

    PoolStats Stats() const;
    const std::string& Origin() const { return originKey; }
    const PoolOptions& Options() const { return opts; }
    bool Closed() const;

private:
    friend class Lease;

    boost::asio::awaitable<std::unique_ptr<UpstreamConnection>> connect(
        std::chrono::steady_clock::time_point deadline);
    void release(std::unique_ptr<UpstreamConnection> conn, std::optional<std::chrono::milliseconds> keepFor);
    std::unique_ptr<UpstreamConnection> takeIdle();

    boost::asio::any_io_executor ex;
    boost::asio::ssl::context& sslCtx;
    TlsSessionCache& sessions;
    UrlParts origin;
    std::string originKey;
    PoolOptions opts;

    async::AsyncSemaphore slots;
    mutable std::mutex mtx;
    std::deque<std::unique_ptr<UpstreamConnection>> idle;
    std::size_t leased{0};
    bool closed{false};
    std::shared_ptr<boost::asio::steady_timer> drained;
};

//==========================================================================================================
// ConnectionPoolManager
// Purpose: Owns every ConnectionPool (one per origin, created on first use) plus the client TLS context
//          and the shared TLS session cache.
//==========================================================================================================
class ConnectionPoolManager {
public:
    ConnectionPoolManager(boost::asio::any_io_executor ex, PoolOptions opts = PoolOptions());
    ~ConnectionPoolManager();

    //==========================================================================================================
    // GetPool
    // Purpose: Returns the pool for the origin of baseUrl, creating it on first request.
    // Throws:
    //   std::invalid_argument for an unparseable URL; std::logic_error after CloseAll().
    //==========================================================================================================
    std::shared_ptr<ConnectionPool> GetPool(const std::string& baseUrl);

    //==========================================================================================================
    // CloseAll
    // Purpose: Closes every pool (see ConnectionPool::Close) and clears the map. Idempotent.
    //==========================================================================================================
    boost::asio::awaitable<void> CloseAll(std::chrono::milliseconds grace = std::chrono::milliseconds(30000));

    std::size_t PoolCount() const;

    // Client TLS context; tests use it to trust a self-signed certificate.
    boost::asio::ssl::context& SslContext() { return sslCtx; }

private:
    boost::asio::any_io_executor ex;
    PoolOptions opts;
    boost::asio::ssl::context sslCtx;
    TlsSessionCache sessions;
    mutable std::mutex mtx;
    std::map<std::string, std::shared_ptr<ConnectionPool>> pools;
    bool shutDown{false};
};

} // namespace chatproxy
