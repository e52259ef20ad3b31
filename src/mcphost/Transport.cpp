//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.cpp
// Purpose: Shared transport configuration helpers
//==========================================================================================================

#include "mcphost/Transport.h"
#include "env/EnvVars.h"

namespace mcphost {

uint64_t ResolveRequestTimeoutMs(const std::optional<uint64_t>& explicitMs) {
    if (explicitMs.has_value()) {
        return explicitMs.value();
    }
    return GetEnvUintOrDefault("MCPHOST_REQUEST_TIMEOUT_MS", DefaultRequestTimeoutMs);
}

} // namespace mcphost
