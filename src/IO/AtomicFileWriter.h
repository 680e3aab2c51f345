/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

/**
 * @file AtomicFileWriter.h
 * @brief Crash-safe line writer: temp file, chunked writes, atomic rename
 */
#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "ChunkedEncoder.h"
#include "StreamingFileReader.h"

namespace Scribe::Core::IO {

// Pull-style line producer: returns the next line or nullopt when exhausted
using LineSource = std::function<std::optional<std::string>()>;

/**
 * @brief Writes lines to a file so the target is either untouched or fully replaced
 *
 * Sequence: open "<target><tempSuffix>" truncated, write buffered lines in chunks of at
 * least chunkThreshold UTF-16 units, write the remainder, flush when the stream supports it,
 * close, then rename the temp file over the target without a copy fallback. The first
 * failure aborts the remaining steps; the temp file may be left behind, the target never
 * sees partial content.
 */
class AtomicFileWriter {
public:
    struct Options {
        size_t chunkThreshold;    // UTF-16 units buffered before a chunk write
        std::string tempSuffix;   // appended to the target path for the temp file

        Options()
            : chunkThreshold(kDefaultChunkThreshold)
            , tempSuffix(".tmp") {}
    };

    AtomicFileWriter(std::shared_ptr<IFileSystemBackend> backend,
                     Concurrency::WorkContractGroup* group,
                     Options options = {});

    void setSpanObserver(std::shared_ptr<Diagnostics::ISpanObserver> observer) { _observer = std::move(observer); }
    const Options& options() const noexcept { return _options; }

    /**
     * @brief Writes every line produced by lines, each followed by the platform line break
     * @param onDone Invoked exactly once, from a contract: nullopt on success or the first error
     * @param spanId asyncStart before the open, asyncEnd after the rename, asyncDone before onDone
     */
    void writeToFile(const FileHandle& file,
                     LineSource lines,
                     CompletionCallback onDone,
                     std::optional<std::string> spanId = std::nullopt);

    void writeToFile(const FileHandle& file,
                     std::vector<std::string> lines,
                     CompletionCallback onDone,
                     std::optional<std::string> spanId = std::nullopt);

    // Single-pass LineSource over a vector
    static LineSource fromVector(std::vector<std::string> lines);

private:
    struct WriteOperation;

    std::shared_ptr<IFileSystemBackend> _backend;
    Concurrency::WorkContractGroup* _group;
    Options _options;
    std::shared_ptr<Diagnostics::ISpanObserver> _observer;
};

} // namespace Scribe::Core::IO
