//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/env/DotEnv.cpp
// Purpose: .env file import for provider credentials.
//==========================================================================================================

#include <cctype>
#include <fstream>
#include <string>
#include <stdlib.h>

#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace {

std::string trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

} // namespace

std::size_t LoadDotEnvFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return 0;
    }
    std::size_t exported = 0;
    std::string line;
    std::size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        std::string t = trim(line);
        if (t.empty() || t.front() == '#') {
            continue;
        }
        if (t.rfind("export ", 0) == 0) {
            t = trim(t.substr(7));
        }
        auto eq = t.find('=');
        if (eq == std::string::npos || eq == 0) {
            LOG_WARN("{}:{}: ignoring malformed line", path, lineNo);
            continue;
        }
        std::string key = trim(t.substr(0, eq));
        std::string value = trim(t.substr(eq + 1));
        if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                                  (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }
        if (std::getenv(key.c_str()) != nullptr) {
            continue;
        }
        if (::setenv(key.c_str(), value.c_str(), 0) == 0) {
            ++exported;
        } else {
            LOG_WARN("{}:{}: setenv failed for {}", path, lineNo, key);
        }
    }
    LOG_DEBUG("Imported {} variable(s) from {}", exported, path);
    return exported;
}
