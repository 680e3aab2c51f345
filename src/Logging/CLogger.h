/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

#pragma once

// C-compatible logging shim that forwards to ScribeCore's C++ logger backend.
// Provides printf-style logging macros that can be used from both C and C++.

#include <stdarg.h>
#ifdef __cplusplus
extern "C" {
#endif

// C-visible log levels (keep values in sync with Logging::LogLevel)
typedef enum ScribeLogLevelC
{
    SCRIBE_LOG_TRACE_C = 0,
    SCRIBE_LOG_DEBUG_C = 1,
    SCRIBE_LOG_INFO_C = 2,
    SCRIBE_LOG_WARN_C = 3,
    SCRIBE_LOG_ERROR_C = 4,
    SCRIBE_LOG_FATAL_C = 5
} ScribeLogLevelC;

// Core C APIs (printf-style)
void scribe_log_write(ScribeLogLevelC level, const char* fmt, ...);
void scribe_log_write_cat(ScribeLogLevelC level, const char* category, const char* fmt, ...);

// va_list variants
void scribe_log_vwrite(ScribeLogLevelC level, const char* fmt, va_list args);
void scribe_log_vwrite_cat(ScribeLogLevelC level, const char* category, const char* fmt, va_list args);

#ifdef __cplusplus
}  // extern "C"
#endif

// ------------------------------------------------------------
// Macros usable from BOTH C and C++ (printf-style)
// By default, non-category macros use __func__ as the category.
// ------------------------------------------------------------
#ifndef SCRIBE_LOG_CATEGORY_DEFAULT
#define SCRIBE_LOG_CATEGORY_DEFAULT __func__
#endif

#define SCRIBE_LOG_TRACE_F(fmt, ...) \
    scribe_log_write_cat(SCRIBE_LOG_TRACE_C, SCRIBE_LOG_CATEGORY_DEFAULT, (fmt), ##__VA_ARGS__)
#define SCRIBE_LOG_DEBUG_F(fmt, ...) \
    scribe_log_write_cat(SCRIBE_LOG_DEBUG_C, SCRIBE_LOG_CATEGORY_DEFAULT, (fmt), ##__VA_ARGS__)
#define SCRIBE_LOG_INFO_F(fmt, ...) \
    scribe_log_write_cat(SCRIBE_LOG_INFO_C, SCRIBE_LOG_CATEGORY_DEFAULT, (fmt), ##__VA_ARGS__)
#define SCRIBE_LOG_WARNING_F(fmt, ...) \
    scribe_log_write_cat(SCRIBE_LOG_WARN_C, SCRIBE_LOG_CATEGORY_DEFAULT, (fmt), ##__VA_ARGS__)
#define SCRIBE_LOG_ERROR_F(fmt, ...) \
    scribe_log_write_cat(SCRIBE_LOG_ERROR_C, SCRIBE_LOG_CATEGORY_DEFAULT, (fmt), ##__VA_ARGS__)
#define SCRIBE_LOG_FATAL_F(fmt, ...) \
    scribe_log_write_cat(SCRIBE_LOG_FATAL_C, SCRIBE_LOG_CATEGORY_DEFAULT, (fmt), ##__VA_ARGS__)

#define SCRIBE_LOG_TRACE_CAT_F(cat, fmt, ...) scribe_log_write_cat(SCRIBE_LOG_TRACE_C, (cat), (fmt), ##__VA_ARGS__)
#define SCRIBE_LOG_DEBUG_CAT_F(cat, fmt, ...) scribe_log_write_cat(SCRIBE_LOG_DEBUG_C, (cat), (fmt), ##__VA_ARGS__)
#define SCRIBE_LOG_INFO_CAT_F(cat, fmt, ...) scribe_log_write_cat(SCRIBE_LOG_INFO_C, (cat), (fmt), ##__VA_ARGS__)
#define SCRIBE_LOG_WARNING_CAT_F(cat, fmt, ...) scribe_log_write_cat(SCRIBE_LOG_WARN_C, (cat), (fmt), ##__VA_ARGS__)
#define SCRIBE_LOG_ERROR_CAT_F(cat, fmt, ...) scribe_log_write_cat(SCRIBE_LOG_ERROR_C, (cat), (fmt), ##__VA_ARGS__)
#define SCRIBE_LOG_FATAL_CAT_F(cat, fmt, ...) scribe_log_write_cat(SCRIBE_LOG_FATAL_C, (cat), (fmt), ##__VA_ARGS__)
