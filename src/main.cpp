//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: chatproxy server entry point
//==========================================================================================================

#include <csignal>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "chatproxy/ConfigLoader.hpp"
#include "chatproxy/ProxyServer.hpp"
#include "chatproxy/version.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

using namespace chatproxy;

//==========================================================================================================
// Parses simple key=value style command-line options.
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes (e.g., "--config-dir")
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    const std::size_t exported = LoadDotEnvFile(".env");

    LoadedConfig config;
    const std::string configDir = ConfigLoader::ResolveConfigDir(getArgValue(argc, argv, "--config-dir").value_or(""));
    try {
        config = ConfigLoader::LoadDirectory(configDir);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to load configuration from '{}': {}", configDir, e.what());
        return EXIT_FAILURE;
    }

    const auto& settings = config.providers.proxy;
    Logger::setLogLevelFromString(GetEnvOrDefault("CHATPROXY_LOG_LEVEL", settings.logLevel));
    if (!settings.logFile.empty()) {
        Logger::setLogFile(settings.logFile);
    }
    LOG_INFO("chatproxy {} starting (config: {}, {} variable(s) from .env)", getVersionString(), configDir, exported);

    ProxyServer::Options opts;
    opts.address = settings.listenAddress;
    opts.port = settings.listenPort;
    opts.maxBodyBytes = settings.maxBodyBytes;
    std::string listen = GetEnvOrDefault("CHATPROXY_LISTEN", "");
    if (auto v = getArgValue(argc, argv, "--listen"); v.has_value()) {
        listen = v.value();
    }
    if (!listen.empty()) {
        opts = ParseListenAddress(listen, opts);
    }

    try {
        ProxyServer server(opts, config.routes, config.providers);

        for (const auto& s : server.Credentials().Statuses()) {
            LOG_INFO("Provider '{}' base_url={} api_key_env={} [{}]", s.provider, s.baseUrl, s.apiKeyEnv,
                     s.configured ? "configured" : "missing");
        }
        const auto missing = server.Credentials().Missing();
        if (!missing.empty()) {
            for (const auto& name : missing) {
                LOG_ERROR("API key not found: Environment variable '{}' is not set", name);
            }
            return EXIT_FAILURE;
        }

        server.Start().get();

        boost::asio::io_context signals;
        boost::asio::signal_set stopOn(signals, SIGINT, SIGTERM);
        stopOn.async_wait([](const boost::system::error_code& ec, int signo) {
            if (!ec) {
                LOG_INFO("Received signal {}, shutting down", signo);
            }
        });
        signals.run();

        server.Stop().get();
    } catch (const std::exception& e) {
        LOG_ERROR("chatproxy failed: {}", e.what());
        Logger::closeLogFile();
        return EXIT_FAILURE;
    }

    LOG_INFO("chatproxy stopped");
    Logger::closeLogFile();
    return EXIT_SUCCESS;
}
