//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Definitions for Logger static members.
//==========================================================================================================

#include "logging/Logger.h"

// Define static members; level and stdio routing start from the environment
LogLevel Logger::sLogLevel = Logger::levelFromString(GetEnvOrDefault("TOOLHOST_LOG_LEVEL", "INFO"));
std::atomic<bool> Logger::sStdioMode{GetEnvFlag("TOOLHOST_STDIO_MODE", false)};
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
