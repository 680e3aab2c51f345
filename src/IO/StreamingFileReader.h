/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

/**
 * @file StreamingFileReader.h
 * @brief Line-by-line delivery of a text file without monopolizing the thread
 */
#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include "FileOperationHandle.h"

namespace Scribe::Core::Concurrency {
class WorkContractGroup;
}

namespace Scribe::Core::Diagnostics {
class ISpanObserver;
}

namespace Scribe::Core::IO {

class FileHandle;
class IFileSystemBackend;

// Completion callback: nullopt on success, otherwise the first failure
using CompletionCallback = std::function<void(std::optional<FileErrorInfo>)>;

/**
 * @brief Receives the lines of a file, then nullopt as the end-of-stream sentinel
 *
 * The view passed to process() is only valid during the call.
 */
class ILineConsumer {
public:
    virtual ~ILineConsumer() = default;
    virtual void process(std::optional<std::string_view> line) = 0;
};

using LineCallback = std::function<void(std::optional<std::string_view>)>;

// Adapts a callable to ILineConsumer
class CallbackLineConsumer : public ILineConsumer {
public:
    explicit CallbackLineConsumer(LineCallback callback) : _callback(std::move(callback)) {}
    void process(std::optional<std::string_view> line) override {
        if (_callback) _callback(line);
    }

private:
    LineCallback _callback;
};

/**
 * @brief Reads a whole file and feeds its non-empty lines to a consumer
 *
 * The file is read with one backend call and decoded as UTF-8 (malformed bytes become
 * U+FFFD). Each line is delivered from its own contract on the group, so a long file
 * interleaves with other scheduled work. After the last line the consumer receives
 * nullopt, then onDone(nullopt). A read failure skips delivery entirely; an exception
 * thrown by the consumer stops delivery and is reported as FileError::Unknown.
 * onDone is always invoked exactly once, from a contract, never inline.
 *
 * @code
 * reader.readFromFile(handle,
 *     std::make_shared<CallbackLineConsumer>([](auto line) { if (line) print(*line); }),
 *     [](std::optional<FileErrorInfo> err) { if (err) report(*err); });
 * group.executeAllMainThreadWork();
 * @endcode
 */
class StreamingFileReader {
public:
    StreamingFileReader(std::shared_ptr<IFileSystemBackend> backend,
                        Concurrency::WorkContractGroup* group);

    void setSpanObserver(std::shared_ptr<Diagnostics::ISpanObserver> observer) { _observer = std::move(observer); }

    /**
     * @param spanId When set and an observer is configured, asyncStart fires before the read,
     *               asyncEnd after it succeeds, and asyncDone right before onDone.
     */
    void readFromFile(const FileHandle& file,
                      std::shared_ptr<ILineConsumer> consumer,
                      CompletionCallback onDone,
                      std::optional<std::string> spanId = std::nullopt);

private:
    struct ReadOperation;

    std::shared_ptr<IFileSystemBackend> _backend;
    Concurrency::WorkContractGroup* _group;
    std::shared_ptr<Diagnostics::ISpanObserver> _observer;
};

} // namespace Scribe::Core::IO
