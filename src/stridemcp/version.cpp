//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Implements version helpers from the project version passed in by the build.
//==========================================================================================================
#include "stridemcp/version.h"

#include <fmt/format.h>

// Supplied by CMake from project(VERSION ...)
#ifndef STRIDEMCP_VERSION_MAJOR
#define STRIDEMCP_VERSION_MAJOR 0
#endif
#ifndef STRIDEMCP_VERSION_MINOR
#define STRIDEMCP_VERSION_MINOR 1
#endif
#ifndef STRIDEMCP_VERSION_PATCH
#define STRIDEMCP_VERSION_PATCH 0
#endif

namespace stridemcp {

VersionInfo getVersion() {
    return VersionInfo{STRIDEMCP_VERSION_MAJOR, STRIDEMCP_VERSION_MINOR, STRIDEMCP_VERSION_PATCH};
}

std::string getVersionString() {
    const auto v = getVersion();
    return fmt::format("{}.{}.{}", v.major, v.minor, v.patch);
}

} // namespace stridemcp
