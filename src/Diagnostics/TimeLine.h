/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

/**
 * @file TimeLine.h
 * @brief Span hooks for asynchronous operations and a timing implementation
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Scribe::Core::Diagnostics {

/**
 * @brief Receives start/end/done notifications for named operation spans
 *
 * asyncStart marks the beginning of a span, asyncEnd the point where its main I/O
 * finished, and asyncDone the moment right before the caller is notified. Calls are
 * fire-and-forget; implementations must not throw.
 */
class ISpanObserver {
public:
    virtual ~ISpanObserver() = default;
    virtual void asyncStart(std::string_view id) = 0;
    virtual void asyncEnd(std::string_view id) = 0;
    virtual void asyncDone(std::string_view id) = 0;
};

enum class SpanEvent { Start, End, Done };

const char* spanEventToString(SpanEvent event) noexcept;

/**
 * @brief ISpanObserver that times spans and logs them at Debug
 *
 * Keeps an ordered event log and per-span counters so callers can inspect what happened.
 * Both are bounded by maxRecords: the oldest records are dropped first, and counters of
 * finished spans are evicted in the order the spans finished.
 */
class TimeLine : public ISpanObserver {
public:
    struct SpanStats {
        size_t starts = 0;
        size_t ends = 0;
        size_t dones = 0;
        std::optional<std::chrono::steady_clock::duration> lastElapsed;
    };

    struct Record {
        SpanEvent event;
        std::string id;
    };

    static constexpr size_t kDefaultMaxRecords = 1024;

    explicit TimeLine(std::string category = "TimeLine", size_t maxRecords = kDefaultMaxRecords);

    void asyncStart(std::string_view id) override;
    void asyncEnd(std::string_view id) override;
    void asyncDone(std::string_view id) override;

    SpanStats stats(std::string_view id) const;
    std::vector<Record> records() const;
    void clear();

    size_t maxRecords() const noexcept { return _maxRecords; }

private:
    void record(SpanEvent event, std::string_view id);
    // Caller holds _mutex
    void retireSpanLocked(const std::string& key);

    std::string _category;
    size_t _maxRecords;
    mutable std::mutex _mutex;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> _startTimes;
    std::unordered_map<std::string, SpanStats> _stats;
    std::deque<std::string> _finished;   // ids of spans that reached Done, oldest first
    std::deque<Record> _records;
};

} // namespace Scribe::Core::Diagnostics
