//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/chatproxy/ProxyServer.cpp
// Purpose: HTTP/HTTPS front end of the proxy using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include "chatproxy/ConcurrencyLimiter.hpp"
#include "chatproxy/ProxyServer.hpp"
#include "chatproxy/RequestHandler.hpp"
#include "chatproxy/ResponseSink.h"
#include "chatproxy/Router.hpp"
#include "chatproxy/StreamingRelay.hpp"
#include "chatproxy/UpstreamDispatcher.hpp"
#include "chatproxy/errors/Errors.h"
#include "chatproxy/version.h"
#include "logging/Logger.h"

#include <openssl/ssl.h>

namespace chatproxy {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

constexpr auto kIdleTimeout = std::chrono::seconds(120);
constexpr std::string_view kChatCompletionsPath = "/v1/chat/completions";
constexpr std::string_view kHealthzPath = "/healthz";

std::string targetPath(beast::string_view target) {
    std::string path(target.data(), target.size());
    auto q = path.find('?');
    if (q != std::string::npos) {
        path.resize(q);
    }
    return path;
}

//==========================================================================================================
// BeastSink
// Purpose: IResponseSink over a Beast stream. Event streams use chunked transfer encoding.
//==========================================================================================================
template <class Stream>
class BeastSink : public IResponseSink {
public:
    BeastSink(Stream& s, unsigned version, bool keepAlive) : stream(s), version(version), keepAlive(keepAlive) {}

    net::awaitable<void> SendJson(int status, std::string body) override {
        http::response<http::string_body> res;
        res.version(version);
        res.result(static_cast<unsigned>(status));
        res.set(http::field::server, "chatproxy/" + getVersionString());
        res.set(http::field::content_type, "application/json");
        res.keep_alive(keepAlive);
        res.body() = std::move(body);
        res.prepare_payload();
        committed = true;
        boost::system::error_code ec;
        co_await http::async_write(stream, res, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            throw ClientDisconnected("response write failed: " + ec.message());
        }
    }

    net::awaitable<void> BeginEventStream() override {
        http::response<http::empty_body> res{http::status::ok, version};
        res.set(http::field::server, "chatproxy/" + getVersionString());
        res.set(http::field::content_type, "text/event-stream");
        res.set(http::field::cache_control, "no-cache");
        res.set(http::field::connection, "keep-alive");
        res.chunked(true);
        http::response_serializer<http::empty_body> sr{res};
        committed = true;
        streamed = true;
        boost::system::error_code ec;
        co_await http::async_write_header(stream, sr, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            throw ClientDisconnected("event stream header write failed: " + ec.message());
        }
    }

    net::awaitable<void> WriteChunk(std::string_view data) override {
        // An empty chunk would terminate the chunked body.
        if (data.empty()) {
            co_return;
        }
        boost::system::error_code ec;
        co_await net::async_write(stream, http::make_chunk(net::const_buffer(data.data(), data.size())),
                                  net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            throw ClientDisconnected("event stream write failed: " + ec.message());
        }
    }

    net::awaitable<void> End() override {
        boost::system::error_code ec;
        co_await net::async_write(stream, http::make_chunk_last(), net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            throw ClientDisconnected("event stream end failed: " + ec.message());
        }
    }

    void Abort() override {
        aborted = true;
        boost::system::error_code ec;
        beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ec);
        beast::get_lowest_layer(stream).socket().close(ec);
    }

    bool Committed() const override { return committed; }

    void SetKeepAlive(bool v) { keepAlive = v; }

    // The connection cannot carry another request after an event stream or an abort.
    bool Reusable() const { return keepAlive && !streamed && !aborted; }

private:
    Stream& stream;
    unsigned version;
    bool keepAlive;
    bool committed{false};
    bool streamed{false};
    bool aborted{false};
};

} // namespace

class ProxyServer::Impl {
public:
    ProxyServer::Options opts;
    std::atomic<bool> running{false};

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::thread ioThread;

    Router router;
    CredentialStore credentials;
    ConnectionPoolManager pools;
    ConcurrencyLimiter limiter;
    UpstreamDispatcher dispatcher;
    StreamingRelay relay;
    RequestHandler handler;

    Impl(const ProxyServer::Options& o, RoutesConfig routes, ProvidersConfig providers, PoolOptions poolOptions,
         RetryPolicy retryPolicy)
        : opts(o),
          router(std::move(routes), std::move(providers)),
          credentials(router.Providers()),
          pools(ioc.get_executor(), poolOptions),
          dispatcher(pools, limiter, retryPolicy),
          relay(pools, limiter),
          handler(router, credentials, dispatcher, relay) {
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("ProxyServer: failed to load certificate/key: {}", e.what());
                throw;
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        }
    }

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    void bind() {
        // Validate port strictly: numeric and within [0, 65535]
        if (opts.port.empty() || opts.port.size() > 5 ||
            !std::all_of(opts.port.begin(), opts.port.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
            throw std::runtime_error("ProxyServer invalid port: '" + opts.port + "'");
        }
        if (std::stoul(opts.port) > 65535ul) {
            throw std::runtime_error("ProxyServer invalid port (out of range): " + opts.port);
        }
        if (opts.scheme != "http" && opts.scheme != "https") {
            throw std::runtime_error("ProxyServer unsupported scheme: " + opts.scheme);
        }
        tcp::resolver resolver(ioc);
        auto r = resolver.resolve(opts.address, opts.port);
        tcp::endpoint ep = *r.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
    }

    template <class Stream>
    net::awaitable<void> sendTooLarge(Stream& stream, unsigned version) {
        BeastSink<Stream> sink(stream, version, false);
        errors::RequestError err("Request body too large (max " + std::to_string(opts.maxBodyBytes) + " bytes)", 413);
        LOG_WARN("Rejected request: {}", err.what());
        co_await sink.SendJson(err.httpStatus, errors::MakeErrorBody(err));
    }

    // Discards what the client is still sending so that closing does not reset the connection before the
    // client has read the response. Ends at EOF, on error or after two seconds.
    template <class Stream>
    net::awaitable<void> drain(Stream& stream) {
        beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(2));
        char buf[8192];
        boost::system::error_code ec;
        while (!ec) {
            co_await stream.async_read_some(net::buffer(buf), net::redirect_error(net::use_awaitable, ec));
        }
    }

    //==========================================================================================================
    // serve
    // Purpose: Request loop for one client connection.
    // Notes:
    //   Headers are read first so the route and the body limit are known before any body byte is buffered.
    //==========================================================================================================
    template <class Stream>
    net::awaitable<void> serve(Stream& stream) {
        beast::flat_buffer buffer;
        bool rejected = false;
        for (;;) {
            beast::get_lowest_layer(stream).expires_after(kIdleTimeout);
            http::request_parser<http::empty_body> head;
            head.body_limit(opts.maxBodyBytes);
            boost::system::error_code ec;
            co_await http::async_read_header(stream, buffer, head, net::redirect_error(net::use_awaitable, ec));
            if (ec == http::error::end_of_stream) {
                break;
            }
            if (ec == http::error::body_limit) {
                co_await sendTooLarge(stream, 11);
                rejected = true;
                break;
            }
            if (ec) {
                throw boost::system::system_error(ec);
            }

            const std::string path = targetPath(head.get().target());
            const http::verb method = head.get().method();
            const unsigned version = head.get().version();
            BeastSink<Stream> sink(stream, version, head.get().keep_alive());

            if (path == kChatCompletionsPath && method == http::verb::post) {
                http::request_parser<http::string_body> parser{std::move(head)};
                co_await http::async_read(stream, buffer, parser, net::redirect_error(net::use_awaitable, ec));
                if (ec == http::error::body_limit) {
                    co_await sendTooLarge(stream, version);
                    rejected = true;
                    break;
                }
                if (ec) {
                    throw boost::system::system_error(ec);
                }
                beast::get_lowest_layer(stream).expires_never();
                co_await handler.HandleChatCompletion(parser.get().body(), sink);
            } else {
                // Any request body is left unread, so the connection cannot be reused.
                if (!head.is_done()) {
                    sink.SetKeepAlive(false);
                }
                if (path == kHealthzPath && method == http::verb::get) {
                    co_await sink.SendJson(200, RequestHandler::HealthzBody());
                } else {
                    LOG_DEBUG("No route for {} {}", std::string(http::to_string(method)), path);
                    co_await sink.SendJson(404, errors::MakeErrorBody("Not Found", errors::ErrorType::InvalidRequest));
                }
            }

            if (!sink.Reusable()) {
                break;
            }
        }

        if (rejected) {
            co_await drain(stream);
        }
        boost::system::error_code ec;
        if constexpr (std::is_same_v<Stream, beast::tcp_stream>) {
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } else {
            beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(5));
            co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
        }
        co_return;
    }

    net::awaitable<void> session_plain(tcp::socket socket) {
        try {
            beast::tcp_stream stream(std::move(socket));
            co_await serve(stream);
        } catch (const ClientDisconnected& e) {
            LOG_DEBUG("ProxyServer client disconnected: {}", e.what());
        } catch (const boost::system::system_error& e) {
            LOG_DEBUG("ProxyServer plain session ended: {}", e.what());
        } catch (const std::exception& e) {
            if (running.load()) {
                LOG_ERROR("ProxyServer plain session error: {}", e.what());
            }
        }
        co_return;
    }

    net::awaitable<void> session_tls(tcp::socket socket) {
        try {
            beast::ssl_stream<beast::tcp_stream> tls(std::move(socket), *sslCtx);
            beast::get_lowest_layer(tls).expires_after(kIdleTimeout);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await serve(tls);
        } catch (const ClientDisconnected& e) {
            LOG_DEBUG("ProxyServer client disconnected: {}", e.what());
        } catch (const boost::system::system_error& e) {
            LOG_DEBUG("ProxyServer TLS session ended: {}", e.what());
        } catch (const std::exception& e) {
            if (running.load()) {
                LOG_ERROR("ProxyServer TLS session error: {}", e.what());
            }
        }
        co_return;
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (opts.scheme == "https") {
                    net::co_spawn(ioc, session_tls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ioc, session_plain(std::move(socket)), net::detached);
                }
            }
        } catch (const boost::system::system_error& e) {
            if (running.load()) {
                LOG_ERROR("ProxyServer accept error: {}", e.what());
            } else {
                LOG_DEBUG("ProxyServer accept loop ended during shutdown: {}", e.what());
            }
        }
        co_return;
    }

    net::awaitable<void> shutdown() {
        boost::system::error_code ec;
        if (acceptor) {
            acceptor->close(ec);
        }
        co_await pools.CloseAll(opts.shutdownGrace);
    }
};

ProxyServer::ProxyServer(const Options& opts, RoutesConfig routes, ProvidersConfig providers,
                         PoolOptions poolOptions, RetryPolicy retryPolicy)
    : pImpl(std::make_unique<Impl>(opts, std::move(routes), std::move(providers), poolOptions, retryPolicy)) {}

ProxyServer::~ProxyServer() {
    Stop().wait();
}

std::future<void> ProxyServer::Start() {
    pImpl->bind();
    LOG_INFO("ProxyServer listening on {}://{}:{}", pImpl->opts.scheme, pImpl->opts.address, LocalPort());

    std::promise<void> ready;
    auto fut = ready.get_future();
    pImpl->running.store(true);
    pImpl->ioThread = std::thread([this, pr = std::move(ready)]() mutable {
        net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
        pr.set_value();
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("ProxyServer I/O thread terminated: {}", e.what());
        }
    });
    return fut;
}

std::future<void> ProxyServer::Stop() {
    std::promise<void> done;
    auto fut = done.get_future();
    if (!pImpl->running.exchange(false)) {
        done.set_value();
        return fut;
    }
    LOG_INFO("ProxyServer stopping");
    if (pImpl->ioThread.joinable()) {
        auto closed = net::co_spawn(pImpl->ioc, pImpl->shutdown(), net::use_future);
        try {
            closed.get();
        } catch (const std::exception& e) {
            LOG_WARN("ProxyServer: closing upstream pools failed: {}", e.what());
        }
        pImpl->ioc.stop();
        pImpl->ioThread.join();
    }
    LOG_INFO("ProxyServer stopped");
    done.set_value();
    return fut;
}

unsigned short ProxyServer::LocalPort() const {
    if (!pImpl->acceptor) {
        return 0;
    }
    boost::system::error_code ec;
    auto ep = pImpl->acceptor->local_endpoint(ec);
    return ec ? 0 : ep.port();
}

const CredentialStore& ProxyServer::Credentials() const {
    return pImpl->credentials;
}

ssl::context& ProxyServer::UpstreamSslContext() {
    return pImpl->pools.SslContext();
}

ProxyServer::Options ParseListenAddress(const std::string& config, ProxyServer::Options opts) {
    std::string cfg = config;
    auto trim = [](std::string& s) {
        auto notSpace = [](unsigned char c) { return !std::isspace(c); };
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
        s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    };
    trim(cfg);

    auto startsWith = [](const std::string& s, const char* pfx) { return s.rfind(pfx, 0) == 0; };
    if (startsWith(cfg, "http://")) {
        opts.scheme = "http";
        cfg = cfg.substr(7);
    } else if (startsWith(cfg, "https://")) {
        opts.scheme = "https";
        cfg = cfg.substr(8);
    }

    std::string hostPort = cfg;
    std::string query;
    auto qpos = cfg.find('?');
    if (qpos != std::string::npos) {
        hostPort = cfg.substr(0, qpos);
        query = cfg.substr(qpos + 1);
    }
    auto slash = hostPort.find('/');
    if (slash != std::string::npos) {
        hostPort.resize(slash);
    }
    trim(hostPort);

    // host[:port], IPv6 as [addr]:port
    if (!hostPort.empty()) {
        if (hostPort.front() == '[') {
            auto rb = hostPort.find(']');
            if (rb != std::string::npos) {
                opts.address = hostPort.substr(1, rb - 1);
                if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
                    opts.port = hostPort.substr(rb + 2);
                }
            }
        } else {
            auto colon = hostPort.rfind(':');
            if (colon != std::string::npos) {
                opts.address = hostPort.substr(0, colon);
                opts.port = hostPort.substr(colon + 1);
            } else {
                opts.address = hostPort;
            }
        }
        trim(opts.address);
        trim(opts.port);
    }

    if (!query.empty()) {
        std::stringstream ss(query);
        std::string kv;
        while (std::getline(ss, kv, '&')) {
            auto eq = kv.find('=');
            std::string key = (eq == std::string::npos) ? kv : kv.substr(0, eq);
            std::string val = (eq == std::string::npos) ? std::string() : kv.substr(eq + 1);
            if (key == "cert") opts.certFile = val;
            else if (key == "key") opts.keyFile = val;
        }
    }
    return opts;
}

} // namespace chatproxy
