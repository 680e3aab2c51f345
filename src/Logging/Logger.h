/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

/**
 * @file Logger.h
 * @brief Process-wide logger with pluggable sinks
 *
 * Logger::global() starts with a ConsoleSink attached and a minimum level of Info,
 * or the level named by the SCRIBE_LOG_LEVEL environment variable if it is set.
 * Use the SCRIBE_LOG_* macros rather than calling log() directly so that the
 * level check happens before the message string is built.
 *
 * @code
 * SCRIBE_LOG_INFO("Loaded " + std::to_string(count) + " lines");
 * SCRIBE_LOG_DEBUG_CAT("FileAccess", "copy complete: " + dst);
 * @endcode
 */

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>
#include "ILogSink.h"
#include "LogLevel.h"

namespace Scribe {
namespace Core {
namespace Logging {

    class Logger {
    public:
        Logger();
        ~Logger();

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        /**
         * @brief The shared logger used by the SCRIBE_LOG_* macros
         */
        static Logger& global();

        void log(LogLevel level, std::string_view category, std::string_view message);

        void addSink(std::shared_ptr<ILogSink> sink);
        void removeSink(const std::shared_ptr<ILogSink>& sink);
        void clearSinks();
        size_t sinkCount() const;

        void setMinLevel(LogLevel level) noexcept { _minLevel.store(level, std::memory_order_relaxed); }
        LogLevel minLevel() const noexcept { return _minLevel.load(std::memory_order_relaxed); }
        bool isEnabled(LogLevel level) const noexcept {
            return level != LogLevel::Off && level >= minLevel();
        }

        void flush();

    private:
        std::atomic<LogLevel> _minLevel{LogLevel::Info};
        mutable std::mutex _sinkMutex;
        std::vector<std::shared_ptr<ILogSink>> _sinks;
    };

} // namespace Logging
} // namespace Core
} // namespace Scribe

#define SCRIBE_LOG_AT(level, category, message) \
    do { \
        auto& scribeLogger_ = ::Scribe::Core::Logging::Logger::global(); \
        if (scribeLogger_.isEnabled(level)) { \
            scribeLogger_.log((level), (category), (message)); \
        } \
    } while (0)

#define SCRIBE_LOG_TRACE_CAT(cat, msg)   SCRIBE_LOG_AT(::Scribe::Core::Logging::LogLevel::Trace, cat, msg)
#define SCRIBE_LOG_DEBUG_CAT(cat, msg)   SCRIBE_LOG_AT(::Scribe::Core::Logging::LogLevel::Debug, cat, msg)
#define SCRIBE_LOG_INFO_CAT(cat, msg)    SCRIBE_LOG_AT(::Scribe::Core::Logging::LogLevel::Info, cat, msg)
#define SCRIBE_LOG_WARNING_CAT(cat, msg) SCRIBE_LOG_AT(::Scribe::Core::Logging::LogLevel::Warning, cat, msg)
#define SCRIBE_LOG_ERROR_CAT(cat, msg)   SCRIBE_LOG_AT(::Scribe::Core::Logging::LogLevel::Error, cat, msg)
#define SCRIBE_LOG_FATAL_CAT(cat, msg)   SCRIBE_LOG_AT(::Scribe::Core::Logging::LogLevel::Fatal, cat, msg)

#define SCRIBE_LOG_TRACE(msg)   SCRIBE_LOG_TRACE_CAT(__func__, msg)
#define SCRIBE_LOG_DEBUG(msg)   SCRIBE_LOG_DEBUG_CAT(__func__, msg)
#define SCRIBE_LOG_INFO(msg)    SCRIBE_LOG_INFO_CAT(__func__, msg)
#define SCRIBE_LOG_WARNING(msg) SCRIBE_LOG_WARNING_CAT(__func__, msg)
#define SCRIBE_LOG_ERROR(msg)   SCRIBE_LOG_ERROR_CAT(__func__, msg)
#define SCRIBE_LOG_FATAL(msg)   SCRIBE_LOG_FATAL_CAT(__func__, msg)
