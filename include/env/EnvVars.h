//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables safely.
//==========================================================================================================
#pragma once
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset/empty.
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
    return std::getenv(name) ? std::string(std::getenv(name)) : defaultValue;
}

//==========================================================================================================
// GetEnvUintOrDefault
// Purpose: Reads an unsigned integer environment variable; malformed or missing values yield the default.
// Args:
//   name: Environment variable name.
//   defaultValue: Fallback value.
// Returns:
//   Parsed value or defaultValue.
//==========================================================================================================
inline uint64_t GetEnvUintOrDefault(const char* name, uint64_t defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return defaultValue;
    }
    try {
        return static_cast<uint64_t>(std::stoull(v));
    } catch (const std::invalid_argument&) {
        return defaultValue;
    } catch (const std::out_of_range&) {
        return defaultValue;
    }
}
