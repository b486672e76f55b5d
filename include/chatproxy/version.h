//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Version of the chatproxy library and server (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace chatproxy {

//==========================================================================================================
// VersionInfo
// Fields:
//   major, minor, patch: Version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Returns:
//   std::string formatted as "MAJOR.MINOR.PATCH"; also sent upstream in the User-Agent header.
//==========================================================================================================
std::string getVersionString();

} // namespace chatproxy
