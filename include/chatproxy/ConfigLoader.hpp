//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConfigLoader.hpp
// Purpose: Loads and validates routes.json / providers.json into the immutable configuration tables
//==========================================================================================================

#pragma once

#include <string>

#include "chatproxy/Config.h"

namespace chatproxy {

struct LoadedConfig {
    RoutesConfig routes;
    ProvidersConfig providers;
};

//==========================================================================================================
// ConfigLoader
// Purpose: JSON configuration reader with validation. Every failure throws std::runtime_error naming the
//          source and the offending key.
//==========================================================================================================
class ConfigLoader {
public:
    //==========================================================================================================
    // ParseRoutes / ParseProviders
    // Purpose: Parse and validate configuration text.
    // Args:
    //   text: JSON document.
    //   source: Name used in error messages (usually the file path).
    //==========================================================================================================
    static RoutesConfig ParseRoutes(const std::string& text, const std::string& source);
    static ProvidersConfig ParseProviders(const std::string& text, const std::string& source);

    static RoutesConfig LoadRoutes(const std::string& path);
    static ProvidersConfig LoadProviders(const std::string& path);

    //==========================================================================================================
    // LoadDirectory
    // Purpose: Loads <dir>/routes.json and <dir>/providers.json.
    //==========================================================================================================
    static LoadedConfig LoadDirectory(const std::string& dir);

    //==========================================================================================================
    // ResolveConfigDir
    // Purpose: --config-dir value when given, else CHATPROXY_CONFIG_DIR, else "./config".
    //==========================================================================================================
    static std::string ResolveConfigDir(const std::string& cliValue);
};

} // namespace chatproxy
