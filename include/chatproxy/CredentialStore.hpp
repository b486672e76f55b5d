//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CredentialStore.hpp
// Purpose: Resolves provider API keys from the environment and exposes read-only provider status
//==========================================================================================================

#pragma once

#include <map>
#include <string>
#include <vector>

#include "chatproxy/Config.h"

namespace chatproxy {

struct ProviderStatus {
    std::string provider;
    std::string baseUrl;
    std::string apiKeyEnv;
    bool configured{false};
};

//==========================================================================================================
// CredentialStore
// Purpose: Snapshot of each provider's credential taken from its api_key_env variable at construction.
// Notes:
//   - Values are never logged; only variable names and configured/missing state are reported.
//   - Immutable after construction; safe to read from any thread.
//==========================================================================================================
class CredentialStore {
public:
    explicit CredentialStore(const ProvidersConfig& providers);

    //==========================================================================================================
    // Resolve
    // Purpose: Returns the credential for a provider.
    // Throws:
    //   errors::ConfigurationError when the provider is unknown or its variable was unset/empty.
    //==========================================================================================================
    const std::string& Resolve(const std::string& providerId) const;

    // Provider status sorted by id.
    std::vector<ProviderStatus> Statuses() const;

    // Environment variable names that were unset or empty.
    std::vector<std::string> Missing() const;

private:
    std::map<std::string, ProviderStatus> status;
    std::map<std::string, std::string> credentials;
};

} // namespace chatproxy
