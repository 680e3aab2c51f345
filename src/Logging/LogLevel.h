/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace Scribe {
namespace Core {
namespace Logging {

    /**
     * @brief Severity of a log entry, ordered from most to least verbose
     *
     * Values are mirrored by ScribeLogLevelC in CLogger.h; keep them in sync.
     */
    enum class LogLevel : uint8_t {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warning = 3,
        Error = 4,
        Fatal = 5,
        Off = 6
    };

    constexpr const char* logLevelToString(LogLevel level) noexcept {
        switch (level) {
            case LogLevel::Trace:   return "TRACE";
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
            case LogLevel::Fatal:   return "FATAL";
            case LogLevel::Off:     return "OFF";
        }
        return "UNKNOWN";
    }

    /**
     * @brief Parses a level name as written in SCRIBE_LOG_LEVEL (case-insensitive)
     * @return The level, or nullopt for unrecognized names
     */
    std::optional<LogLevel> parseLogLevel(std::string_view name) noexcept;

} // namespace Logging
} // namespace Core
} // namespace Scribe
