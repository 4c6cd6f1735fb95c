//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Definitions for Logger static members.
//==========================================================================================================

#include "logging/Logger.h"

// Level comes from STRIDEMCP_LOG_LEVEL when set, INFO otherwise
LogLevel Logger::sLogLevel = Logger::levelFromString(GetEnvOrDefault("STRIDEMCP_LOG_LEVEL", "INFO"));
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
