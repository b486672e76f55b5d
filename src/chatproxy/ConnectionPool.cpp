//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/chatproxy/ConnectionPool.cpp
// Purpose: Keep-alive upstream connection pools using Boost.Beast (TLS via OpenSSL)
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <openssl/err.h>

#include "chatproxy/ConnectionPool.hpp"
#include "logging/Logger.h"

namespace chatproxy {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
using tcp = net::ip::tcp;

std::optional<std::chrono::milliseconds> ComputeKeepAlive(std::optional<std::string_view> keepAliveHeader,
                                                          const PoolOptions& opts) {
    if (!keepAliveHeader.has_value()) {
        return opts.keepAliveTimeout;
    }
    std::string lower;
    lower.reserve(keepAliveHeader->size());
    for (char c : *keepAliveHeader) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    auto pos = lower.find("timeout=");
    if (pos == std::string::npos) {
        return opts.keepAliveTimeout;
    }
    pos += 8;
    std::size_t end = pos;
    while (end < lower.size() && std::isdigit(static_cast<unsigned char>(lower[end]))) ++end;
    if (end == pos || end - pos > 9) {
        return opts.keepAliveTimeout;
    }
    const auto hinted = std::chrono::milliseconds(std::stoll(lower.substr(pos, end - pos)) * 1000);
    const auto usable = hinted - opts.keepAliveTimeoutThreshold;
    if (usable <= std::chrono::milliseconds(0)) {
        return std::nullopt;
    }
    return std::min(usable, opts.keepAliveMaxTimeout);
}

//----------------------------------------------------------------------------------------------------------
// TlsSessionCache
//----------------------------------------------------------------------------------------------------------
TlsSessionCache::~TlsSessionCache() {
    for (auto& e : lru) {
        ::SSL_SESSION_free(e.session);
    }
}

bool TlsSessionCache::Apply(const std::string& key, SSL* ssl) {
    std::lock_guard<std::mutex> lock(mtx);
    for (auto it = lru.begin(); it != lru.end(); ++it) {
        if (it->key == key) {
            lru.splice(lru.begin(), lru, it);
            return ::SSL_set_session(ssl, lru.front().session) == 1;
        }
    }
    return false;
}

void TlsSessionCache::Store(const std::string& key, SSL* ssl) {
    if (capacity == 0 || ssl == nullptr) {
        return;
    }
    SSL_SESSION* session = ::SSL_get1_session(ssl);
    if (session == nullptr) {
        return;
    }
    if (::SSL_SESSION_is_resumable(session) != 1) {
        ::SSL_SESSION_free(session);
        return;
    }
    std::lock_guard<std::mutex> lock(mtx);
    for (auto it = lru.begin(); it != lru.end(); ++it) {
        if (it->key == key) {
            ::SSL_SESSION_free(it->session);
            lru.erase(it);
            break;
        }
    }
    lru.push_front(Entry{key, session});
    while (lru.size() > capacity) {
        ::SSL_SESSION_free(lru.back().session);
        lru.pop_back();
    }
}

std::size_t TlsSessionCache::Size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return lru.size();
}

//----------------------------------------------------------------------------------------------------------
// UpstreamConnection
//----------------------------------------------------------------------------------------------------------
UpstreamConnection::UpstreamConnection(beast::tcp_stream p)
    : plain(std::move(p)) {}

UpstreamConnection::UpstreamConnection(std::unique_ptr<TlsStream> t)
    : plain(t->get_executor()), tls(std::move(t)) {}

beast::tcp_stream& UpstreamConnection::Tcp() {
    return tls ? tls->next_layer() : plain;
}

bool UpstreamConnection::IsOpen() {
    return Tcp().socket().is_open();
}

void UpstreamConnection::Close() {
    boost::system::error_code ec;
    auto& sock = Tcp().socket();
    if (sock.is_open()) {
        sock.shutdown(tcp::socket::shutdown_both, ec);
        sock.close(ec);
    }
}

//----------------------------------------------------------------------------------------------------------
// ConnectionPool::Lease
//----------------------------------------------------------------------------------------------------------
ConnectionPool::Lease::Lease(std::shared_ptr<ConnectionPool> p, std::unique_ptr<UpstreamConnection> c, bool r)
    : pool(std::move(p)), conn(std::move(c)), reused(r) {}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool(std::move(other.pool)), conn(std::move(other.conn)),
      keepFor(other.keepFor), reused(other.reused) {}

ConnectionPool::Lease& ConnectionPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        Release();
        pool = std::move(other.pool);
        conn = std::move(other.conn);
        keepFor = other.keepFor;
        reused = other.reused;
    }
    return *this;
}

ConnectionPool::Lease::~Lease() {
    Release();
}

void ConnectionPool::Lease::MarkReusable(std::chrono::milliseconds idleFor) {
    keepFor = idleFor;
}

void ConnectionPool::Lease::Release() {
    if (pool && conn) {
        pool->release(std::move(conn), keepFor);
    }
    pool.reset();
    conn.reset();
}

//----------------------------------------------------------------------------------------------------------
// ConnectionPool
//----------------------------------------------------------------------------------------------------------
ConnectionPool::ConnectionPool(net::any_io_executor e, ssl::context& ctx, TlsSessionCache& s,
                               UrlParts o, PoolOptions options)
    : ex(std::move(e)), sslCtx(ctx), sessions(s), origin(std::move(o)),
      originKey(origin.Origin()), opts(options), slots(options.maxConnections) {}

ConnectionPool::~ConnectionPool() {
    for (auto& c : idle) {
        c->Close();
    }
}

bool ConnectionPool::Closed() const {
    std::lock_guard<std::mutex> lock(mtx);
    return closed;
}

PoolStats ConnectionPool::Stats() const {
    std::lock_guard<std::mutex> lock(mtx);
    PoolStats s;
    s.idle = idle.size();
    s.leased = leased;
    s.open = s.idle + s.leased;
    return s;
}

std::unique_ptr<UpstreamConnection> ConnectionPool::takeIdle() {
    std::lock_guard<std::mutex> lock(mtx);
    const auto now = std::chrono::steady_clock::now();
    while (!idle.empty()) {
        // Most recently returned first
        auto c = std::move(idle.back());
        idle.pop_back();
        if (now < c->idleUntil && c->IsOpen()) {
            return c;
        }
        c->Close();
        LOG_DEBUG("Discarded expired idle connection to {}", originKey);
    }
    return nullptr;
}

net::awaitable<std::unique_ptr<UpstreamConnection>> ConnectionPool::connect(
    std::chrono::steady_clock::time_point deadline) {
    const auto connectDeadline = std::min(deadline, std::chrono::steady_clock::now() + opts.connectTimeout);

    tcp::resolver resolver(ex);
    auto results = co_await resolver.async_resolve(origin.host, origin.port, net::use_awaitable);

    if (!origin.IsTls()) {
        beast::tcp_stream stream(ex);
        stream.expires_at(connectDeadline);
        co_await stream.async_connect(results, net::use_awaitable);
        stream.expires_never();
        LOG_DEBUG("Connected to {}", originKey);
        co_return std::make_unique<UpstreamConnection>(std::move(stream));
    }

    auto tls = std::make_unique<UpstreamConnection::TlsStream>(ex, sslCtx);
    if (!::SSL_set_tlsext_host_name(tls->native_handle(), origin.serverName.c_str())) {
        throw boost::system::system_error(
            boost::system::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()),
            "failed to set SNI hostname");
    }
    (void)::SSL_set1_host(tls->native_handle(), origin.serverName.c_str());
    const std::string sessionKey = origin.serverName + ":" + origin.port;
    const bool resumed = sessions.Apply(sessionKey, tls->native_handle());

    tls->next_layer().expires_at(connectDeadline);
    co_await tls->next_layer().async_connect(results, net::use_awaitable);
    co_await tls->async_handshake(ssl::stream_base::client, net::use_awaitable);
    tls->next_layer().expires_never();
    LOG_DEBUG("TLS connected to {} (session {})", originKey,
              (resumed && ::SSL_session_reused(tls->native_handle()) == 1) ? "resumed" : "new");
    co_return std::make_unique<UpstreamConnection>(std::move(tls));
}

net::awaitable<ConnectionPool::Lease> ConnectionPool::Acquire(std::chrono::steady_clock::time_point deadline) {
    if (Closed()) {
        throw std::logic_error("Connection pool for " + originKey + " is closed");
    }
    co_await slots.Acquire(deadline);
    if (Closed()) {
        slots.Release();
        throw std::logic_error("Connection pool for " + originKey + " is closed");
    }

    bool reused = true;
    auto conn = takeIdle();
    if (!conn) {
        reused = false;
        try {
            conn = co_await connect(deadline);
        } catch (const std::exception&) {
            slots.Release();
            throw;
        }
    }
    conn->MarkUsed();
    {
        std::lock_guard<std::mutex> lock(mtx);
        ++leased;
    }
    co_return Lease(shared_from_this(), std::move(conn), reused);
}

void ConnectionPool::release(std::unique_ptr<UpstreamConnection> conn,
                             std::optional<std::chrono::milliseconds> keepFor) {
    // The session cache belongs to the manager and is not touched once the pool is closed.
    if (conn->IsTls() && conn->IsOpen() && !Closed()) {
        sessions.Store(origin.serverName + ":" + origin.port, conn->NativeSsl());
    }
    std::shared_ptr<net::steady_timer> notify;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (leased > 0) {
            --leased;
        }
        if (keepFor.has_value() && !closed && conn->IsOpen()) {
            conn->idleUntil = std::chrono::steady_clock::now() + keepFor.value();
            idle.push_back(std::move(conn));
        } else {
            conn->Close();
        }
        if (closed && leased == 0 && drained) {
            notify = drained;
        }
    }
    slots.Release();
    if (notify) {
        notify->cancel();
    }
}

net::awaitable<void> ConnectionPool::Close(std::chrono::milliseconds grace) {
    std::deque<std::unique_ptr<UpstreamConnection>> toClose;
    std::shared_ptr<net::steady_timer> waitTimer;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (closed) {
            co_return;
        }
        closed = true;
        toClose.swap(idle);
        if (leased > 0) {
            drained = std::make_shared<net::steady_timer>(ex, std::chrono::steady_clock::now() + grace);
            waitTimer = drained;
        }
    }
    for (auto& c : toClose) {
        c->Close();
    }
    slots.CancelAll();

    if (waitTimer) {
        boost::system::error_code ec;
        co_await waitTimer->async_wait(net::redirect_error(net::use_awaitable, ec));
        if (!ec) {
            LOG_WARN("Connection pool {} closed with {} connection(s) still leased", originKey, Stats().leased);
        }
    }
    LOG_INFO("Closed connection pool {}", originKey);
}

//----------------------------------------------------------------------------------------------------------
// ConnectionPoolManager
//----------------------------------------------------------------------------------------------------------
ConnectionPoolManager::ConnectionPoolManager(net::any_io_executor e, PoolOptions options)
    : ex(std::move(e)), opts(options), sslCtx(ssl::context::tls_client),
      sessions(options.maxCachedTlsSessions) {
    ::SSL_CTX_set_min_proto_version(sslCtx.native_handle(), TLS1_2_VERSION);
    ::SSL_CTX_set_session_cache_mode(sslCtx.native_handle(), SSL_SESS_CACHE_CLIENT);
    ::ERR_clear_error();
    try {
        sslCtx.set_default_verify_paths();
    } catch (const std::exception& e) {
        LOG_WARN("HTTPS: set_default_verify_paths failed: {}", e.what());
    }
    sslCtx.set_verify_mode(ssl::verify_peer);
}

ConnectionPoolManager::~ConnectionPoolManager() = default;

std::shared_ptr<ConnectionPool> ConnectionPoolManager::GetPool(const std::string& baseUrl) {
    UrlParts parts = ParseUrl(baseUrl);
    const std::string key = parts.Origin();

    std::lock_guard<std::mutex> lock(mtx);
    if (shutDown) {
        throw std::logic_error("ConnectionPoolManager used after CloseAll()");
    }
    auto it = pools.find(key);
    if (it != pools.end()) {
        return it->second;
    }
    auto pool = std::make_shared<ConnectionPool>(ex, sslCtx, sessions, std::move(parts), opts);
    pools.emplace(key, pool);
    LOG_INFO("Created connection pool for {} (max_connections={}, keep_alive={}ms)",
             key, opts.maxConnections, opts.keepAliveTimeout.count());
    return pool;
}

net::awaitable<void> ConnectionPoolManager::CloseAll(std::chrono::milliseconds grace) {
    std::map<std::string, std::shared_ptr<ConnectionPool>> toClose;
    {
        std::lock_guard<std::mutex> lock(mtx);
        shutDown = true;
        toClose.swap(pools);
    }
    const auto deadline = std::chrono::steady_clock::now() + grace;
    for (auto& [key, pool] : toClose) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        co_await pool->Close(std::max(remaining, std::chrono::milliseconds(0)));
    }
    if (!toClose.empty()) {
        LOG_INFO("Closed {} connection pool(s)", toClose.size());
    }
}

std::size_t ConnectionPoolManager::PoolCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return pools.size();
}

} // namespace chatproxy
