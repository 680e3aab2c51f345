/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

#pragma once

#include <iosfwd>
#include "ILogSink.h"

namespace Scribe {
namespace Core {
namespace Logging {

    /**
     * @brief Writes entries to stdout, with Warning and above going to stderr
     *
     * Line format: `[HH:MM:SS.mmm] [LEVEL] [category] message`
     */
    class ConsoleSink : public ILogSink {
    public:
        ConsoleSink() = default;

        void write(const LogEntry& entry) override;
        void flush() override;

    private:
        static void writeTo(std::ostream& out, const LogEntry& entry);
    };

} // namespace Logging
} // namespace Core
} // namespace Scribe
