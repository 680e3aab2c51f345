/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

#pragma once
#include <memory>
#include <vector>
#include <string>
#include <span>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <functional>

namespace Scribe::Core::Concurrency {
class WorkContractGroup;
}

namespace Scribe::Core::IO {

class FileStream;

enum class FileOpStatus { Pending, Running, Complete, Failed };

/**
 * Public error taxonomy surfaced by file operations.
 * Mapping guidelines:
 * - FileNotFound: path does not exist when required (read/stat/copy/remove/move source)
 * - AccessDenied: open/create denied by OS/permissions, or move target exists without overwrite
 * - DiskFull: ENOSPC/EDQUOT or equivalent on write/flush
 * - InvalidPath: malformed path, name too long, parent missing, or directory where a file is required
 * - IOError: other local I/O failures (including fsync and rename failures)
 * - SetupFailure: the primitive rejected the call before any asynchronous work started
 * - Unknown: anything else, including exceptions thrown by caller-supplied consumers
 */
enum class FileError {
    None = 0,
    FileNotFound,
    AccessDenied,
    DiskFull,
    InvalidPath,
    IOError,
    SetupFailure,
    Unknown
};

const char* fileErrorToString(FileError error) noexcept;

struct FileErrorInfo {
    FileError code = FileError::None;
    std::string message;
    std::optional<std::error_code> systemError;
    std::string path;

    std::string toString() const;
};

/**
 * @brief Existence and type information for a path
 *
 * If exists is false the remaining fields are false/zero.
 * lastModified is milliseconds since the Unix epoch.
 */
struct FileStat {
    bool exists = false;
    bool isDirectory = false;
    bool isFile = false;
    int64_t lastModified = 0;
};

/**
 * @brief Thrown by a backend when a call is rejected before an operation handle exists
 *
 * This is the only exception the IO layer produces. Facade operations catch it and report
 * the carried FileErrorInfo through their completion callback.
 */
class FileOperationException : public std::runtime_error {
public:
    explicit FileOperationException(FileErrorInfo info);
    const FileErrorInfo& info() const noexcept { return _info; }

private:
    FileErrorInfo _info;
};

/**
 * @brief Shared result of one asynchronous file primitive
 *
 * A handle completes exactly once, either Complete or Failed. Continuations attached with
 * then() never run inline: they are posted to the owning WorkContractGroup, after the
 * operation completes, in attachment order.
 *
 * @code
 * auto h = backend->readFile("notes.txt");
 * h.then([](const FileOperationHandle& r) {
 *     if (r.status() == FileOpStatus::Complete) consume(r.contentsBytes());
 * });
 * group.executeAllMainThreadWork();
 * @endcode
 */
class FileOperationHandle {
public:
    using Continuation = std::function<void(const FileOperationHandle&)>;

    FileOperationHandle() = default;

    /**
     * @brief Pumps the owning group until this operation completes
     *
     * Returns early (still Pending) if the group runs out of work, since nothing
     * else on this thread could complete the operation.
     */
    void wait() const;
    FileOpStatus status() const noexcept;
    bool isComplete() const noexcept;

    // Read results - only valid after completion
    std::span<const std::byte> contentsBytes() const;
    std::string contentsText() const;

    // Write results - only valid after completion
    uint64_t bytesWritten() const;

    // Metadata results - only valid after completion
    const std::optional<FileStat>& stat() const;

    // Open results - only valid after completion
    std::shared_ptr<FileStream> stream() const;

    // Error information - only valid after completion and status is Failed
    const FileErrorInfo& errorInfo() const;

    /**
     * @brief Attaches a continuation to run once the operation completes
     */
    void then(Continuation continuation) const;

private:
    struct OpState {
        FileOpStatus st = FileOpStatus::Pending;
        bool isComplete = false;
        Concurrency::WorkContractGroup* group = nullptr;
        std::vector<Continuation> continuations;

        // Result data - only valid after completion
        std::vector<std::byte> bytes;      // for reads
        uint64_t wrote = 0;                // for writes
        FileErrorInfo error;               // error details if failed
        std::optional<FileStat> stat;      // for metadata queries
        std::shared_ptr<FileStream> stream; // for opens

        void complete(FileOpStatus final, const std::shared_ptr<OpState>& self);

        void setError(FileError code, const std::string& msg,
                      const std::string& path = "",
                      std::optional<std::error_code> ec = std::nullopt) {
            error.code = code;
            error.message = msg;
            error.path = path;
            error.systemError = ec;
        }
    };

    std::shared_ptr<OpState> _s;
    explicit FileOperationHandle(std::shared_ptr<OpState> s) : _s(std::move(s)) {}

    static std::shared_ptr<OpState> makeState(Concurrency::WorkContractGroup* group);
    static void postContinuation(const std::shared_ptr<OpState>& state, Continuation continuation);

    friend class OperationCompleter;
};

/**
 * @brief Producer side of a FileOperationHandle, for backends outside this library
 *
 * Backends create a completer, return handle() to their caller, and later call one of
 * the complete/fail methods exactly once. Extra completion calls are ignored.
 */
class OperationCompleter {
public:
    explicit OperationCompleter(Concurrency::WorkContractGroup* group);

    FileOperationHandle handle() const { return FileOperationHandle(_s); }

    void complete();
    void completeWithBytes(std::vector<std::byte> bytes);
    void completeWithWrite(uint64_t bytesWritten);
    void completeWithStat(FileStat stat);
    void completeWithStream(std::shared_ptr<FileStream> stream);
    void fail(FileErrorInfo error);

private:
    std::shared_ptr<FileOperationHandle::OpState> _s;
};

/**
 * @brief Starts a primitive call, converting a synchronous throw into an error value
 *
 * On success out holds the returned handle and nullopt is returned. A
 * FileOperationException yields its carried info; any other std::exception becomes
 * FileError::SetupFailure.
 */
template<typename Fn>
std::optional<FileErrorInfo> tryStartOperation(Fn&& fn, FileOperationHandle& out, const std::string& path) {
    try {
        out = fn();
    } catch (const FileOperationException& e) {
        return e.info();
    } catch (const std::exception& e) {
        return FileErrorInfo{FileError::SetupFailure, e.what(), std::nullopt, path};
    }
    return std::nullopt;
}

} // namespace Scribe::Core::IO
