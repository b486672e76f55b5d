//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/MiniUpstream.h
// Purpose: In-process Boost.Beast upstream and client helpers shared by the network tests
//==========================================================================================================

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace testutil {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

using Request = http::request<http::string_body>;

//==========================================================================================================
// MiniUpstream
// Purpose: Blocking HTTP/1.1 server on 127.0.0.1:0 with one thread per connection.
// Notes:
//   The handler writes the reply and returns true to keep the connection open for another request.
//   Every request is recorded; connections are counted so tests can observe pooling.
//==========================================================================================================
struct MiniUpstream {
    using Handler = std::function<bool(beast::tcp_stream&, const Request&)>;

    explicit MiniUpstream(Handler h) : handler(std::move(h)) {}
    ~MiniUpstream() { stop(); }

    MiniUpstream(const MiniUpstream&) = delete;
    MiniUpstream& operator=(const MiniUpstream&) = delete;

    net::io_context io;
    tcp::acceptor acceptor{io};
    std::thread thr;
    std::atomic<bool> running{false};
    unsigned short port{0};
    Handler handler;

    std::atomic<int> connections{0};
    std::atomic<int> requests{0};
    std::mutex mtx;
    std::vector<Request> received;
    std::vector<std::shared_ptr<beast::tcp_stream>> streams;
    std::vector<std::thread> workers;

    std::string baseUrl() const { return "http://127.0.0.1:" + std::to_string(port) + "/v1"; }

    Request lastRequest() {
        std::lock_guard<std::mutex> lock(mtx);
        return received.empty() ? Request() : received.back();
    }

    static void writeJson(beast::tcp_stream& stream, const Request& req, unsigned status, const std::string& body,
                          bool keepAlive = true) {
        http::response<http::string_body> res;
        res.version(req.version());
        res.result(status);
        res.set(http::field::server, "mini-upstream");
        res.set(http::field::content_type, "application/json");
        res.keep_alive(keepAlive);
        res.body() = body;
        res.prepare_payload();
        http::write(stream, res);
    }

    // Chunked text/event-stream reply; each element becomes one HTTP chunk.
    static void writeSse(beast::tcp_stream& stream, const Request& req, const std::vector<std::string>& chunks) {
        http::response<http::empty_body> res{http::status::ok, req.version()};
        res.set(http::field::server, "mini-upstream");
        res.set(http::field::content_type, "text/event-stream");
        res.keep_alive(false);
        res.chunked(true);
        http::response_serializer<http::empty_body> sr{res};
        http::write_header(stream, sr);
        for (const auto& c : chunks) {
            net::write(stream, http::make_chunk(net::buffer(c)));
        }
        net::write(stream, http::make_chunk_last());
    }

    void serveConnection(std::shared_ptr<beast::tcp_stream> stream) {
        try {
            beast::flat_buffer buffer;
            for (;;) {
                Request req;
                http::read(*stream, buffer, req);
                {
                    std::lock_guard<std::mutex> lock(mtx);
                    received.push_back(req);
                }
                ++requests;
                if (!handler(*stream, req) || !req.keep_alive()) {
                    break;
                }
            }
            boost::system::error_code ec;
            stream->socket().shutdown(tcp::socket::shutdown_both, ec);
        } catch (...) {
            // Peer closed or the test stopped the server
            (void)0;
        }
    }

    void start() {
        tcp::endpoint ep{net::ip::make_address("127.0.0.1"), 0};
        acceptor.open(ep.protocol());
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        acceptor.bind(ep);
        acceptor.listen();
        port = acceptor.local_endpoint().port();
        running.store(true);
        thr = std::thread([this]() {
            while (running.load()) {
                try {
                    tcp::socket socket{io};
                    acceptor.accept(socket);
                    if (!running.load()) {
                        break;
                    }
                    ++connections;
                    auto stream = std::make_shared<beast::tcp_stream>(std::move(socket));
                    std::lock_guard<std::mutex> lock(mtx);
                    streams.push_back(stream);
                    workers.emplace_back([this, stream]() { serveConnection(stream); });
                } catch (...) {
                    break;
                }
            }
        });
    }

    void stop() {
        if (!running.exchange(false)) {
            return;
        }
        boost::system::error_code ec;
        // Poke accept by connecting to ourselves before closing acceptor
        {
            tcp::socket poke{io};
            poke.connect(tcp::endpoint{net::ip::make_address("127.0.0.1"), port}, ec);
        }
        if (thr.joinable()) {
            thr.join();
        }
        acceptor.close(ec);
        std::vector<std::thread> toJoin;
        {
            std::lock_guard<std::mutex> lock(mtx);
            for (auto& s : streams) {
                s->socket().shutdown(tcp::socket::shutdown_both, ec);
            }
            toJoin.swap(workers);
        }
        for (auto& t : toJoin) {
            if (t.joinable()) {
                t.join();
            }
        }
    }
};

//==========================================================================================================
// RunAwaitable
// Purpose: Runs a coroutine to completion on ioc and returns its result (or rethrows its exception).
//==========================================================================================================
template <class T>
T RunAwaitable(net::io_context& ioc, net::awaitable<T> aw) {
    auto fut = net::co_spawn(ioc, std::move(aw), net::use_future);
    ioc.restart();
    ioc.run();
    return fut.get();
}

// Blocking POST to 127.0.0.1:port; reads the whole response (chunked bodies included).
// With chunked set the request body goes out with Transfer-Encoding: chunked instead of Content-Length.
inline http::response<http::string_body> Post(unsigned short port, const std::string& target,
                                              const std::string& body, bool chunked = false) {
    net::io_context ioc;
    beast::tcp_stream stream(ioc);
    stream.connect(tcp::endpoint{net::ip::make_address("127.0.0.1"), port});
    Request req{http::verb::post, target, 11};
    req.set(http::field::host, "127.0.0.1");
    req.set(http::field::content_type, "application/json");
    req.keep_alive(false);
    req.body() = body;
    boost::system::error_code ec;
    if (chunked) {
        req.chunked(true);
    } else {
        req.prepare_payload();
    }
    http::write(stream, req, ec);
    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
    http::read(stream, buffer, parser, ec);
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    return parser.release();
}

inline http::response<http::string_body> Get(unsigned short port, const std::string& target) {
    net::io_context ioc;
    beast::tcp_stream stream(ioc);
    stream.connect(tcp::endpoint{net::ip::make_address("127.0.0.1"), port});
    Request req{http::verb::get, target, 11};
    req.set(http::field::host, "127.0.0.1");
    req.keep_alive(false);
    http::write(stream, req);
    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    boost::system::error_code ec;
    http::read(stream, buffer, res, ec);
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    return res;
}

} // namespace testutil
