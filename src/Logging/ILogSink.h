/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

#pragma once

#include "LogEntry.h"

namespace Scribe {
namespace Core {
namespace Logging {

    /**
     * @brief Destination for log entries
     *
     * Sinks are invoked under the Logger's mutex, so implementations do not need
     * their own locking unless they are shared between loggers.
     */
    class ILogSink {
    public:
        virtual ~ILogSink() = default;

        virtual void write(const LogEntry& entry) = 0;
        virtual void flush() = 0;
    };

} // namespace Logging
} // namespace Core
} // namespace Scribe
