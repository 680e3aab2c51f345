/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

#include "ConsoleSink.h"
#include <ctime>
#include <iomanip>
#include <iostream>

namespace Scribe {
namespace Core {
namespace Logging {

    void ConsoleSink::write(const LogEntry& entry) {
        if (entry.level >= LogLevel::Warning) {
            writeTo(std::cerr, entry);
        } else {
            writeTo(std::cout, entry);
        }
    }

    void ConsoleSink::flush() {
        std::cout.flush();
        std::cerr.flush();
    }

    void ConsoleSink::writeTo(std::ostream& out, const LogEntry& entry) {
        auto t = std::chrono::system_clock::to_time_t(entry.timestamp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            entry.timestamp.time_since_epoch()).count() % 1000;
        std::tm tm{};
#if defined(_WIN32)
        localtime_s(&tm, &t);
#else
        localtime_r(&t, &tm);
#endif
        out << '[' << std::put_time(&tm, "%H:%M:%S") << '.'
            << std::setw(3) << std::setfill('0') << ms << std::setfill(' ') << "] "
            << '[' << logLevelToString(entry.level) << "] ";
        if (!entry.category.empty()) {
            out << '[' << entry.category << "] ";
        }
        out << entry.message << '\n';
    }

} // namespace Logging
} // namespace Core
} // namespace Scribe
