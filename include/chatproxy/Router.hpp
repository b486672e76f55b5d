//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Router.hpp
// Purpose: Resolves a client model identifier to a provider/model route
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

#include "chatproxy/Config.h"

namespace chatproxy {

class Router {
public:
    Router(RoutesConfig routes, ProvidersConfig providers);

    //==========================================================================================================
    // ResolveRoute
    // Purpose: Maps a model identifier to a ResolvedRoute.
    // Notes:
    //   Resolution order:
    //     1) "<provider>:<model>" (provider has no colon) selects the provider directly, skipping slots.
    //     2) Exact slot name lookup.
    //     3) The "default" slot, when fallback_to_default is enabled (logged at WARN).
    // Throws:
    //   errors::RoutingError (invalid_request_error) for an unknown provider or alias;
    //   errors::RoutingError (api_error) when a slot names a provider missing from the provider table.
    //==========================================================================================================
    ResolvedRoute ResolveRoute(const std::string& model) const;

    std::vector<std::string> GetModelSlots() const;
    bool HasModelSlot(const std::string& slot) const;

    const ProvidersConfig& Providers() const { return providers; }

private:
    ResolvedRoute resolveSlot(const std::string& slotName, const ModelSlot& slot) const;

    RoutesConfig routes;
    ProvidersConfig providers;
};

} // namespace chatproxy
