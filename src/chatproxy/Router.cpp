//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/chatproxy/Router.cpp
// Purpose: Model alias routing
//==========================================================================================================

#include "chatproxy/Router.hpp"
#include "chatproxy/errors/Errors.h"
#include "logging/Logger.h"

namespace chatproxy {

using errors::ErrorType;
using errors::RoutingError;

Router::Router(RoutesConfig r, ProvidersConfig p)
    : routes(std::move(r)), providers(std::move(p)) {}

ResolvedRoute Router::ResolveRoute(const std::string& model) const {
    // provider:model-name
    const auto colon = model.find(':');
    if (colon != std::string::npos && colon > 0 && colon + 1 < model.size()) {
        const std::string provider = model.substr(0, colon);
        auto it = providers.providers.find(provider);
        if (it == providers.providers.end()) {
            throw RoutingError("Unknown provider '" + provider + "' in direct model reference",
                               ErrorType::InvalidRequest);
        }
        ResolvedRoute route;
        route.provider = provider;
        route.model = model.substr(colon + 1);
        route.providerConfig = it->second;
        return route;
    }

    auto slot = routes.modelSlots.find(model);
    if (slot != routes.modelSlots.end()) {
        return resolveSlot(model, slot->second);
    }

    if (routes.fallbackToDefault) {
        auto def = routes.modelSlots.find("default");
        if (def != routes.modelSlots.end()) {
            LOG_WARN("Unknown model alias '{}', falling back to 'default' slot", model);
            return resolveSlot("default", def->second);
        }
    }

    throw RoutingError("Unknown model alias: " + model +
                       ". Configure in routes.json or enable fallback_to_default.",
                       ErrorType::InvalidRequest);
}

ResolvedRoute Router::resolveSlot(const std::string& slotName, const ModelSlot& slot) const {
    auto it = providers.providers.find(slot.provider);
    if (it == providers.providers.end()) {
        throw RoutingError("Provider '" + slot.provider + "' configured for slot '" + slotName +
                           "' not found in providers.json",
                           ErrorType::Api);
    }
    ResolvedRoute route;
    route.provider = slot.provider;
    route.model = slot.model;
    route.providerConfig = it->second;
    route.enableReasoning = slot.enableReasoning;
    return route;
}

std::vector<std::string> Router::GetModelSlots() const {
    std::vector<std::string> out;
    out.reserve(routes.modelSlots.size());
    for (const auto& [name, slot] : routes.modelSlots) {
        out.push_back(name);
    }
    return out;
}

bool Router::HasModelSlot(const std::string& slot) const {
    return routes.modelSlots.find(slot) != routes.modelSlots.end();
}

} // namespace chatproxy
