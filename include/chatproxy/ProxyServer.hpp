//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProxyServer.hpp
// Purpose: Coroutine-based HTTP/HTTPS front end of the proxy using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <string>

#include "chatproxy/Config.h"
#include "chatproxy/ConnectionPool.hpp"
#include "chatproxy/CredentialStore.hpp"
#include "chatproxy/RetryPolicy.h"

namespace chatproxy {

class ProxyServer {
public:
    //==========================================================================================================
    // Options
    // Purpose: Listener configuration.
    // Fields:
    //   address: Bind address (default: 127.0.0.1)
    //   port: Listen port; "0" picks an ephemeral port (see LocalPort())
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //   maxBodyBytes: Request body limit; larger bodies are answered with 413
    //   shutdownGrace: How long Stop() waits for in-flight upstream requests
    //==========================================================================================================
    struct Options {
        std::string address{"127.0.0.1"};
        std::string port{"8080"};
        std::string scheme{"http"};
        std::string certFile;
        std::string keyFile;
        std::size_t maxBodyBytes{10 * 1024 * 1024};
        std::chrono::milliseconds shutdownGrace{30000};
    };

    //==========================================================================================================
    // Constructor
    // Purpose: Builds the request pipeline (router, credentials, pools, limiter, dispatcher and relay).
    // Notes:
    //   Credentials are read from the environment here; see Credentials().Missing().
    // Throws:
    //   std::exception when the TLS certificate or key cannot be loaded.
    //==========================================================================================================
    ProxyServer(const Options& opts, RoutesConfig routes, ProvidersConfig providers,
                PoolOptions poolOptions = PoolOptions(), RetryPolicy retryPolicy = RetryPolicy());
    ~ProxyServer();

    ProxyServer(const ProxyServer&) = delete;
    ProxyServer& operator=(const ProxyServer&) = delete;

    //==========================================================================================================
    // Binds the listener and starts the accept loop on a background I/O thread.
    // Returns:
    //   Future that becomes ready once the I/O context is running.
    // Throws:
    //   std::runtime_error for an invalid port or when binding fails.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stops the server: closes the acceptor, closes upstream pools (waiting up to shutdownGrace for leased
    // connections), stops the I/O context and joins the background thread. Idempotent.
    //==========================================================================================================
    std::future<void> Stop();

    // Bound port after Start(); 0 before.
    unsigned short LocalPort() const;

    const CredentialStore& Credentials() const;

    // Client TLS context used for upstream connections; tests use it to trust a self-signed certificate.
    boost::asio::ssl::context& UpstreamSslContext();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// ParseListenAddress
// Purpose: Parses a listener URI into Options, starting from base.
//            - "<address>:<port>" or "http://<address>:<port>"
//            - "https://<address>:<port>?cert=<pem>&key=<pem>"
//          IPv6 addresses use the [addr]:port form. Unknown parameters are ignored.
//==========================================================================================================
ProxyServer::Options ParseListenAddress(const std::string& config, ProxyServer::Options base = ProxyServer::Options());

} // namespace chatproxy
