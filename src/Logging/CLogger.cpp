/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

/* printf-style shim forwarding to the C++ Logger */
#include "CLogger.h"

#include <cstdarg>
#include <cstdio>
#include <string>

#include "LogLevel.h"
#include "Logger.h"

using ::Scribe::Core::Logging::Logger;
using ::Scribe::Core::Logging::LogLevel;

static LogLevel map_level(ScribeLogLevelC lvl) noexcept {
    switch (lvl) {
        case SCRIBE_LOG_TRACE_C:
            return LogLevel::Trace;
        case SCRIBE_LOG_DEBUG_C:
            return LogLevel::Debug;
        case SCRIBE_LOG_INFO_C:
            return LogLevel::Info;
        case SCRIBE_LOG_WARN_C:
            return LogLevel::Warning;
        case SCRIBE_LOG_ERROR_C:
            return LogLevel::Error;
        case SCRIBE_LOG_FATAL_C:
            return LogLevel::Fatal;
        default:
            return LogLevel::Info;
    }
}

static void vwrite_internal(ScribeLogLevelC level, const char* category, const char* fmt, va_list args) {
    if (!fmt) return;

    auto& logger = Logger::global();
    const LogLevel mapped = map_level(level);
    // Skip formatting entirely for filtered levels
    if (!logger.isEnabled(mapped)) return;

    va_list args_copy;
    va_copy(args_copy, args);
    int needed = std::vsnprintf(nullptr, 0, fmt, args_copy);
    va_end(args_copy);
    if (needed < 0) return;

    std::string message;
    message.resize(static_cast<size_t>(needed));
    std::vsnprintf(message.data(), message.size() + 1, fmt, args);

    logger.log(mapped, (category && *category) ? category : "C", message);
}

extern "C" {

void scribe_log_vwrite(ScribeLogLevelC level, const char* fmt, va_list args) {
    vwrite_internal(level, "C", fmt, args);
}

void scribe_log_vwrite_cat(ScribeLogLevelC level, const char* category, const char* fmt, va_list args) {
    vwrite_internal(level, category, fmt, args);
}

void scribe_log_write(ScribeLogLevelC level, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite_internal(level, "C", fmt, args);
    va_end(args);
}

void scribe_log_write_cat(ScribeLogLevelC level, const char* category, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite_internal(level, category, fmt, args);
    va_end(args);
}

}  // extern "C"
