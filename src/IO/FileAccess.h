/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

/**
 * @file FileAccess.h
 * @brief Entry point for line-oriented file I/O and basic file management
 *
 * FileAccess wires a backend (local filesystem by default) to a WorkContractGroup and exposes
 * streaming reads, atomic writes, and copy/rename/remove/stat with one completion contract:
 * every operation invokes its callback exactly once, with nullopt on success or a
 * FileErrorInfo describing the failure. Nothing is thrown across an asynchronous boundary.
 * See Examples/LineStreamingExample.cpp for end-to-end usage.
 */
#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "AtomicFileWriter.h"
#include "FileHandle.h"
#include "FileOperationHandle.h"
#include "IFileSystemBackend.h"
#include "StreamingFileReader.h"

namespace Scribe::Core::Concurrency {
class WorkContractGroup;
}

namespace Scribe::Core::IO {

using StatCallback = std::function<void(std::optional<FileErrorInfo>, FileStat)>;

class FileAccess {
public:
    struct Config {
        size_t chunkThreshold;                         // UTF-16 units buffered before a chunk write
        std::string tempSuffix;                        // appended to the target path for the temp file
        std::string appName;                           // subdirectory of the platform app-data directory
        std::optional<std::string> profileDirectory;   // base for relative paths; nullopt => app-data path

        Config()
            : chunkThreshold(kDefaultChunkThreshold)
            , tempSuffix(".tmp")
            , appName("ScribeCore") {}

        /**
         * @brief Defaults overridden by SCRIBE_PROFILE_DIR and SCRIBE_CHUNK_THRESHOLD
         *
         * Unparseable or zero thresholds are ignored with a warning.
         */
        static Config fromEnvironment();
    };

    /**
     * @brief Creates a facade over the local filesystem
     * @param group Group that runs every operation; must outlive this object and its operations
     */
    explicit FileAccess(Concurrency::WorkContractGroup* group, Config cfg = {});
    FileAccess(Concurrency::WorkContractGroup* group, std::shared_ptr<IFileSystemBackend> backend, Config cfg = {});

    FileHandle createFileHandle(std::string path) const;

    /**
     * @brief Maps a logical path to a handle
     *
     * Absolute paths are used as-is; other paths are '/'-separated segments under the
     * profile directory. Returns nullopt for empty input or when neither applies.
     */
    std::optional<FileHandle> resolveFilePath(const std::string& path) const;

    // The effective base directory for relative paths, if one can be determined
    std::optional<std::string> profileDirectory() const;

    static const std::string& lineBreak();

    void setSpanObserver(std::shared_ptr<Diagnostics::ISpanObserver> observer);

    // Streaming line I/O
    void readFromFile(const FileHandle& file, std::shared_ptr<ILineConsumer> consumer,
                      CompletionCallback onDone, std::optional<std::string> spanId = std::nullopt);
    void readFromFile(const FileHandle& file, LineCallback onLine,
                      CompletionCallback onDone, std::optional<std::string> spanId = std::nullopt);
    void writeToFile(const FileHandle& file, LineSource lines,
                     CompletionCallback onDone, std::optional<std::string> spanId = std::nullopt);
    void writeToFile(const FileHandle& file, std::vector<std::string> lines,
                     CompletionCallback onDone, std::optional<std::string> spanId = std::nullopt);

    // File management. A synchronous setup failure invokes the callback before returning.

    // Duplicates content; an existing destination is overwritten
    void copyFile(const FileHandle& from, const FileHandle& to, CompletionCallback callback);
    /**
     * @brief Moves the file to a sibling named newName
     *
     * Fails if the source is missing or the destination already exists.
     */
    void renameFile(const FileHandle& from, const std::string& newName, CompletionCallback callback);
    // Fails with FileError::FileNotFound if the file does not exist
    void removeFile(const FileHandle& file, CompletionCallback callback);
    /**
     * @brief Queries existence and type
     *
     * A missing file is not an error: the callback receives nullopt and a FileStat with
     * exists == false. Other failures are reported with a zeroed FileStat.
     */
    void statFile(const FileHandle& file, StatCallback callback);

    std::shared_ptr<IFileSystemBackend> backend() const { return _backend; }
    Concurrency::WorkContractGroup* group() const noexcept { return _group; }
    const Config& config() const noexcept { return _cfg; }

private:
    static AtomicFileWriter::Options writerOptions(const Config& cfg);

    // Runs a void-result primitive and reports through callback exactly once
    void runOperation(const char* opName, const std::string& path,
                      const std::function<FileOperationHandle()>& start,
                      CompletionCallback callback);

    Concurrency::WorkContractGroup* _group;
    Config _cfg;
    std::shared_ptr<IFileSystemBackend> _backend;
    StreamingFileReader _reader;
    AtomicFileWriter _writer;
};

} // namespace Scribe::Core::IO
