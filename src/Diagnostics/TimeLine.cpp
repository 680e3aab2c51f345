/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

#include "TimeLine.h"
#include "../Logging/Logger.h"
#include <algorithm>
#include <sstream>

namespace Scribe::Core::Diagnostics {

const char* spanEventToString(SpanEvent event) noexcept {
    switch (event) {
        case SpanEvent::Start: return "start";
        case SpanEvent::End: return "end";
        case SpanEvent::Done: return "done";
    }
    return "unknown";
}

TimeLine::TimeLine(std::string category, size_t maxRecords)
    : _category(std::move(category))
    , _maxRecords(std::max<size_t>(maxRecords, 1)) {
}

void TimeLine::asyncStart(std::string_view id) { record(SpanEvent::Start, id); }
void TimeLine::asyncEnd(std::string_view id) { record(SpanEvent::End, id); }
void TimeLine::asyncDone(std::string_view id) { record(SpanEvent::Done, id); }

void TimeLine::record(SpanEvent event, std::string_view id) {
    const auto now = std::chrono::steady_clock::now();
    std::string key(id);
    std::optional<std::chrono::steady_clock::duration> elapsed;

    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto& st = _stats[key];
        switch (event) {
            case SpanEvent::Start:
                ++st.starts;
                _startTimes[key] = now;
                break;
            case SpanEvent::End:
                ++st.ends;
                break;
            case SpanEvent::Done:
                ++st.dones;
                break;
        }
        if (event != SpanEvent::Start) {
            auto it = _startTimes.find(key);
            if (it != _startTimes.end()) {
                elapsed = now - it->second;
                st.lastElapsed = elapsed;
                if (event == SpanEvent::Done) {
                    _startTimes.erase(it);
                }
            }
        }
        if (event == SpanEvent::Done) {
            retireSpanLocked(key);
        }
        _records.push_back(Record{event, key});
        while (_records.size() > _maxRecords) {
            _records.pop_front();
        }
    }

    if (Logging::Logger::global().isEnabled(Logging::LogLevel::Debug)) {
        std::ostringstream oss;
        oss << key << " " << spanEventToString(event);
        if (elapsed) {
            oss << " +" << std::chrono::duration_cast<std::chrono::microseconds>(*elapsed).count() << "us";
        }
        SCRIBE_LOG_DEBUG_CAT(_category, oss.str());
    }
}

void TimeLine::retireSpanLocked(const std::string& key) {
    auto it = std::find(_finished.begin(), _finished.end(), key);
    if (it != _finished.end()) {
        _finished.erase(it);
    }
    _finished.push_back(key);

    while (_finished.size() > _maxRecords) {
        const std::string oldest = std::move(_finished.front());
        _finished.pop_front();
        // A span restarted under the same id keeps its counters
        if (_startTimes.find(oldest) == _startTimes.end()) {
            _stats.erase(oldest);
        }
    }
}

TimeLine::SpanStats TimeLine::stats(std::string_view id) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _stats.find(std::string(id));
    return it != _stats.end() ? it->second : SpanStats{};
}

std::vector<TimeLine::Record> TimeLine::records() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return std::vector<Record>(_records.begin(), _records.end());
}

void TimeLine::clear() {
    std::lock_guard<std::mutex> lock(_mutex);
    _startTimes.clear();
    _stats.clear();
    _finished.clear();
    _records.clear();
}

} // namespace Scribe::Core::Diagnostics
