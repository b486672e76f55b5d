//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_router.cpp
// Purpose: GoogleTests for model alias resolution
//==========================================================================================================

#include <gtest/gtest.h>

#include "chatproxy/Router.hpp"
#include "chatproxy/errors/Errors.h"

using namespace chatproxy;

namespace {

ProvidersConfig makeProviders() {
    ProvidersConfig p;
    ProviderConfig orr;
    orr.id = "openrouter";
    orr.baseUrl = "https://openrouter.ai/api/v1";
    orr.apiKeyEnv = "OPENROUTER_API_KEY";
    p.providers.emplace(orr.id, orr);
    ProviderConfig zai;
    zai.id = "zai";
    zai.baseUrl = "https://api.z.ai/api/paas/v4";
    zai.apiKeyEnv = "ZAI_API_KEY";
    p.providers.emplace(zai.id, zai);
    return p;
}

RoutesConfig makeRoutes(bool fallback) {
    RoutesConfig r;
    r.modelSlots["default"] = ModelSlot{"openrouter", "anthropic/claude-3.5-sonnet", std::nullopt};
    r.modelSlots["think"] = ModelSlot{"zai", "glm-4.6", true};
    r.modelSlots["broken"] = ModelSlot{"missing", "x", std::nullopt};
    r.fallbackToDefault = fallback;
    return r;
}

} // namespace

TEST(Router, ResolvesSlot) {
    Router router(makeRoutes(false), makeProviders());
    auto route = router.ResolveRoute("think");
    EXPECT_EQ(route.provider, "zai");
    EXPECT_EQ(route.model, "glm-4.6");
    EXPECT_EQ(route.providerConfig.baseUrl, "https://api.z.ai/api/paas/v4");
    EXPECT_EQ(route.enableReasoning, std::optional<bool>(true));
}

TEST(Router, DirectProviderReferenceSkipsSlots) {
    RoutesConfig routes = makeRoutes(false);
    // A slot with the same literal name must not be consulted
    routes.modelSlots["zai:glm-4.5"] = ModelSlot{"openrouter", "other", std::nullopt};
    Router router(routes, makeProviders());
    auto route = router.ResolveRoute("zai:glm-4.5");
    EXPECT_EQ(route.provider, "zai");
    EXPECT_EQ(route.model, "glm-4.5");
    EXPECT_FALSE(route.enableReasoning.has_value());
}

TEST(Router, DirectReferenceKeepsColonsInModelName) {
    Router router(makeRoutes(false), makeProviders());
    auto route = router.ResolveRoute("openrouter:meta/llama:free");
    EXPECT_EQ(route.provider, "openrouter");
    EXPECT_EQ(route.model, "meta/llama:free");
}

TEST(Router, UnknownDirectProviderIsInvalidRequest) {
    Router router(makeRoutes(true), makeProviders());
    try {
        (void)router.ResolveRoute("openai:gpt-4o");
        FAIL() << "expected RoutingError";
    } catch (const errors::RoutingError& e) {
        EXPECT_EQ(e.httpStatus, 400);
        EXPECT_EQ(e.type, errors::ErrorType::InvalidRequest);
        EXPECT_NE(std::string(e.what()).find("Unknown provider 'openai'"), std::string::npos);
    }
}

TEST(Router, UnknownAliasWithoutFallback) {
    Router router(makeRoutes(false), makeProviders());
    try {
        (void)router.ResolveRoute("gpt-5");
        FAIL() << "expected RoutingError";
    } catch (const errors::RoutingError& e) {
        EXPECT_EQ(e.httpStatus, 400);
        EXPECT_STREQ(e.what(), "Unknown model alias: gpt-5. Configure in routes.json or enable fallback_to_default.");
    }
}

TEST(Router, UnknownAliasFallsBackToDefault) {
    Router router(makeRoutes(true), makeProviders());
    auto route = router.ResolveRoute("gpt-5");
    EXPECT_EQ(route.provider, "openrouter");
    EXPECT_EQ(route.model, "anthropic/claude-3.5-sonnet");
}

TEST(Router, MalformedColonFormsAreTreatedAsAliases) {
    Router router(makeRoutes(true), makeProviders());
    EXPECT_EQ(router.ResolveRoute(":model").provider, "openrouter");
    EXPECT_EQ(router.ResolveRoute("zai:").provider, "openrouter");
}

TEST(Router, SlotWithMissingProviderIsApiError) {
    Router router(makeRoutes(false), makeProviders());
    try {
        (void)router.ResolveRoute("broken");
        FAIL() << "expected RoutingError";
    } catch (const errors::RoutingError& e) {
        EXPECT_EQ(e.httpStatus, 500);
        EXPECT_EQ(e.type, errors::ErrorType::Api);
        EXPECT_STREQ(e.what(), "Provider 'missing' configured for slot 'broken' not found in providers.json");
    }
}

TEST(Router, SlotAccessors) {
    Router router(makeRoutes(false), makeProviders());
    EXPECT_TRUE(router.HasModelSlot("default"));
    EXPECT_FALSE(router.HasModelSlot("nope"));
    EXPECT_EQ(router.GetModelSlots().size(), 3u);
    EXPECT_EQ(router.Providers().providers.size(), 2u);
}
