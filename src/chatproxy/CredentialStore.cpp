//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/chatproxy/CredentialStore.cpp
// Purpose: Provider credential lookup
//==========================================================================================================

#include "chatproxy/CredentialStore.hpp"
#include "chatproxy/errors/Errors.h"
#include "env/EnvVars.h"

namespace chatproxy {

CredentialStore::CredentialStore(const ProvidersConfig& providers) {
    for (const auto& [id, cfg] : providers.providers) {
        ProviderStatus s;
        s.provider = id;
        s.baseUrl = cfg.baseUrl;
        s.apiKeyEnv = cfg.apiKeyEnv;
        if (auto v = TryGetEnv(cfg.apiKeyEnv)) {
            credentials.emplace(id, std::move(v.value()));
            s.configured = true;
        }
        status.emplace(id, std::move(s));
    }
}

const std::string& CredentialStore::Resolve(const std::string& providerId) const {
    auto it = credentials.find(providerId);
    if (it != credentials.end()) {
        return it->second;
    }
    auto st = status.find(providerId);
    if (st == status.end()) {
        throw errors::ConfigurationError("No credentials configured for provider '" + providerId + "'");
    }
    throw errors::ConfigurationError("API key not found: Environment variable '" + st->second.apiKeyEnv +
                                     "' is not set");
}

std::vector<ProviderStatus> CredentialStore::Statuses() const {
    std::vector<ProviderStatus> out;
    out.reserve(status.size());
    for (const auto& [id, s] : status) {
        out.push_back(s);
    }
    return out;
}

std::vector<std::string> CredentialStore::Missing() const {
    std::vector<std::string> out;
    for (const auto& [id, s] : status) {
        if (!s.configured) {
            out.push_back(s.apiKeyEnv);
        }
    }
    return out;
}

} // namespace chatproxy
