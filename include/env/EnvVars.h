//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables and import a .env file.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <optional>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    return v ? std::string(v) : defaultValue;
}

//==========================================================================================================
// TryGetEnv
// Purpose: Returns the value of a set, non-empty environment variable; std::nullopt otherwise.
//==========================================================================================================
inline std::optional<std::string> TryGetEnv(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }
    const char* v = std::getenv(name.c_str());
    if (v == nullptr || *v == '\0') {
        return std::nullopt;
    }
    return std::string(v);
}

//==========================================================================================================
// LoadDotEnvFile
// Purpose: Exports KEY=VALUE pairs from a .env style file into the process environment.
// Notes:
//   - Blank lines and lines starting with '#' are skipped; an optional leading "export " is accepted.
//   - Values may be wrapped in single or double quotes, which are removed.
//   - Variables already present in the environment are never overwritten.
// Returns:
//   Number of variables exported; 0 when the file does not exist.
//==========================================================================================================
std::size_t LoadDotEnvFile(const std::string& path);
