//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Cross-platform helpers to read environment variables safely.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <optional>
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
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') {
        return defaultValue;
    }
    return std::string(v);
}

//==========================================================================================================
// GetEnvFlag
// Purpose: Reads a boolean flag ("1", "true", "TRUE", "yes" enable; "0", "false", "FALSE", "no" disable).
// Returns:
//   defaultValue when unset or unrecognized.
//==========================================================================================================
inline bool GetEnvFlag(const char* name, bool defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v == "1" || v == "true" || v == "TRUE" || v == "yes") {
        return true;
    }
    if (v == "0" || v == "false" || v == "FALSE" || v == "no") {
        return false;
    }
    return defaultValue;
}

//==========================================================================================================
// GetEnvInt
// Purpose: Reads an integer environment variable.
// Returns:
//   std::nullopt when unset or not a valid integer.
//==========================================================================================================
inline std::optional<long long> GetEnvInt(const char* name) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t used = 0;
        long long n = std::stoll(v, &used);
        if (used != v.size()) {
            return std::nullopt;
        }
        return n;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}
