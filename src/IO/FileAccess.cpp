/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

#include "FileAccess.h"
#include "LocalFileSystemBackend.h"
#include "PlatformResourceUtils.h"
#include "../Concurrency/WorkContractGroup.h"
#include "../Diagnostics/TimeLine.h"
#include "../Logging/Logger.h"
#include "../CoreCommon.h"
#include <stdexcept>

namespace Scribe::Core::IO {

FileAccess::Config FileAccess::Config::fromEnvironment() {
    Config cfg;
    if (auto dir = safeGetEnv("SCRIBE_PROFILE_DIR"); dir && !dir->empty()) {
        cfg.profileDirectory = *dir;
    }
    if (auto threshold = safeGetEnv("SCRIBE_CHUNK_THRESHOLD"); threshold && !threshold->empty()) {
        try {
            size_t consumed = 0;
            const unsigned long long value = std::stoull(*threshold, &consumed);
            if (consumed != threshold->size() || value == 0) {
                throw std::invalid_argument("not a positive integer");
            }
            cfg.chunkThreshold = static_cast<size_t>(value);
        } catch (const std::invalid_argument&) {
            SCRIBE_LOG_WARNING_CAT("FileAccess", "Ignoring SCRIBE_CHUNK_THRESHOLD='" + *threshold + "'");
        } catch (const std::out_of_range&) {
            SCRIBE_LOG_WARNING_CAT("FileAccess", "Ignoring out-of-range SCRIBE_CHUNK_THRESHOLD='" + *threshold + "'");
        }
    }
    return cfg;
}

FileAccess::FileAccess(Concurrency::WorkContractGroup* group, Config cfg)
    : FileAccess(group, std::make_shared<LocalFileSystemBackend>(group), std::move(cfg)) {
}

FileAccess::FileAccess(Concurrency::WorkContractGroup* group, std::shared_ptr<IFileSystemBackend> backend, Config cfg)
    : _group(group)
    , _cfg(std::move(cfg))
    , _backend(std::move(backend))
    , _reader(_backend, group)
    , _writer(_backend, group, writerOptions(_cfg)) {
    SCRIBE_ASSERT(_group != nullptr, "FileAccess requires a WorkContractGroup");
    SCRIBE_ASSERT(_backend != nullptr, "FileAccess requires a backend");
    SCRIBE_LOG_DEBUG_CAT("FileAccess", "Using backend " + _backend->getBackendType() +
                         ", chunk threshold " + std::to_string(_cfg.chunkThreshold));
}

AtomicFileWriter::Options FileAccess::writerOptions(const Config& cfg) {
    AtomicFileWriter::Options opts;
    opts.chunkThreshold = cfg.chunkThreshold;
    opts.tempSuffix = cfg.tempSuffix;
    return opts;
}

FileHandle FileAccess::createFileHandle(std::string path) const {
    return FileHandle(std::move(path));
}

std::optional<std::string> FileAccess::profileDirectory() const {
    if (_cfg.profileDirectory) return _cfg.profileDirectory;
    return getAppDataPath(_cfg.appName);
}

std::optional<FileHandle> FileAccess::resolveFilePath(const std::string& path) const {
    auto resolved = IO::resolveFilePath(path, profileDirectory());
    if (!resolved) {
        SCRIBE_LOG_DEBUG_CAT("FileAccess", "Could not resolve path '" + path + "'");
        return std::nullopt;
    }
    return FileHandle(std::move(*resolved));
}

const std::string& FileAccess::lineBreak() {
    return IO::lineBreak();
}

void FileAccess::setSpanObserver(std::shared_ptr<Diagnostics::ISpanObserver> observer) {
    _reader.setSpanObserver(observer);
    _writer.setSpanObserver(std::move(observer));
}

void FileAccess::readFromFile(const FileHandle& file, std::shared_ptr<ILineConsumer> consumer,
                              CompletionCallback onDone, std::optional<std::string> spanId) {
    _reader.readFromFile(file, std::move(consumer), std::move(onDone), std::move(spanId));
}

void FileAccess::readFromFile(const FileHandle& file, LineCallback onLine,
                              CompletionCallback onDone, std::optional<std::string> spanId) {
    _reader.readFromFile(file, std::make_shared<CallbackLineConsumer>(std::move(onLine)),
                         std::move(onDone), std::move(spanId));
}

void FileAccess::writeToFile(const FileHandle& file, LineSource lines,
                             CompletionCallback onDone, std::optional<std::string> spanId) {
    _writer.writeToFile(file, std::move(lines), std::move(onDone), std::move(spanId));
}

void FileAccess::writeToFile(const FileHandle& file, std::vector<std::string> lines,
                             CompletionCallback onDone, std::optional<std::string> spanId) {
    _writer.writeToFile(file, std::move(lines), std::move(onDone), std::move(spanId));
}

void FileAccess::runOperation(const char* opName, const std::string& path,
                              const std::function<FileOperationHandle()>& start,
                              CompletionCallback callback) {
    FileOperationHandle handle;
    if (auto err = tryStartOperation(start, handle, path)) {
        SCRIBE_LOG_WARNING_CAT("FileAccess", std::string(opName) + " rejected: " + err->toString());
        if (callback) callback(std::move(*err));
        return;
    }

    std::string name(opName);
    handle.then([name, callback = std::move(callback)](const FileOperationHandle& h) {
        if (h.status() != FileOpStatus::Complete) {
            SCRIBE_LOG_WARNING_CAT("FileAccess", name + " failed: " + h.errorInfo().toString());
            if (callback) callback(h.errorInfo());
            return;
        }
        if (callback) callback(std::nullopt);
    });
}

void FileAccess::copyFile(const FileHandle& from, const FileHandle& to, CompletionCallback callback) {
    auto backend = _backend;
    runOperation("copyFile", from.path(),
                 [&] { return backend->copyFile(from.path(), to.path()); },
                 std::move(callback));
}

void FileAccess::renameFile(const FileHandle& from, const std::string& newName, CompletionCallback callback) {
    auto backend = _backend;
    runOperation("renameFile", from.path(),
                 [&] { return backend->moveFile(from.path(), from.withLeafName(newName).path()); },
                 std::move(callback));
}

void FileAccess::removeFile(const FileHandle& file, CompletionCallback callback) {
    auto backend = _backend;
    runOperation("removeFile", file.path(),
                 [&] { return backend->removeFile(file.path()); },
                 std::move(callback));
}

void FileAccess::statFile(const FileHandle& file, StatCallback callback) {
    FileOperationHandle handle;
    if (auto err = tryStartOperation([&] { return _backend->getMetadata(file.path()); }, handle, file.path())) {
        SCRIBE_LOG_WARNING_CAT("FileAccess", "statFile rejected: " + err->toString());
        if (callback) callback(std::move(*err), FileStat{});
        return;
    }

    handle.then([callback = std::move(callback)](const FileOperationHandle& h) {
        if (h.status() == FileOpStatus::Complete) {
            if (callback) callback(std::nullopt, h.stat().value_or(FileStat{}));
            return;
        }
        if (h.errorInfo().code == FileError::FileNotFound) {
            if (callback) callback(std::nullopt, FileStat{});
            return;
        }
        SCRIBE_LOG_WARNING_CAT("FileAccess", "statFile failed: " + h.errorInfo().toString());
        if (callback) callback(h.errorInfo(), FileStat{});
    });
}

} // namespace Scribe::Core::IO
