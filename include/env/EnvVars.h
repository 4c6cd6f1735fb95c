//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read string and numeric settings from environment variables.
//==========================================================================================================
#pragma once
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <stdexcept>
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
// GetEnvUnsigned
// Purpose: Reads a strictly positive decimal integer from the environment.
// Args:
//   name: Environment variable name.
// Returns:
//   std::nullopt when unset or empty; otherwise the parsed value.
// Throws:
//   std::invalid_argument when the variable is set but is not a positive decimal integer.
//==========================================================================================================
inline std::optional<std::uint64_t> GetEnvUnsigned(const char* name) {
    const std::string raw = GetEnvOrDefault(name, std::string());
    if (raw.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    for (char c : raw) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument(std::string(name) + " must be a positive integer");
        }
        const std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
        if (value > (UINT64_MAX - digit) / 10u) {
            throw std::invalid_argument(std::string(name) + " is out of range");
        }
        value = value * 10u + digit;
    }
    if (value == 0u) {
        throw std::invalid_argument(std::string(name) + " must be greater than zero");
    }
    return value;
}
