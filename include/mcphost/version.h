//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for the MCP host library (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace mcphost {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
// Fields:
//   major, minor, patch: Version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

//==========================================================================================================
// getVersion
// Purpose: Returns the library semantic version components.
//==========================================================================================================
VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Purpose: Returns the semantic version string.
// Returns:
//   std::string formatted as "MAJOR.MINOR.PATCH"; sent as clientInfo.version during the handshake.
//==========================================================================================================
std::string getVersionString();

} // namespace mcphost
