/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

/**
 * @file IFileSystemBackend.h
 * @brief Asynchronous file-system primitive used by the IO layer
 *
 * Implementations provide concrete file operations (local filesystem, test doubles, etc.).
 * Every method returns a FileOperationHandle whose completion is driven by the
 * WorkContractGroup the backend was constructed with. A method may throw
 * FileOperationException before any handle exists when it rejects its arguments outright
 * (empty path, embedded NUL); callers treat that as a synchronous setup failure.
 */
#pragma once
#include <string>
#include <cstdint>
#include "FileOperationHandle.h"

namespace Scribe::Core::IO {

class FileStream;

/**
 * @brief Options for opening a writable stream
 * @param truncate Truncate the file to zero length when opening
 * @param createIfMissing Create the file if it does not exist
 */
struct OpenOptions {
    bool truncate = true;
    bool createIfMissing = true;
};

/**
 * @brief Options controlling move/rename
 * @param overwriteExisting Replace destination if it exists
 * @param noCopy Fail instead of falling back to copy+delete when a plain rename is impossible
 */
struct MoveOptions {
    bool overwriteExisting = false;
    bool noCopy = false;
};

/**
 * @brief Options controlling file copy behavior
 * @param overwriteExisting Replace destination if it exists
 */
struct CopyOptions {
    bool overwriteExisting = true;
};

/**
 * @brief Capabilities advertised by a backend
 */
struct BackendCapabilities {
    bool supportsFlush = false;
    bool supportsAtomicMove = false;
    bool isRemote = false;
};

class IFileSystemBackend {
public:
    virtual ~IFileSystemBackend() = default;

    /**
     * @brief Reads the whole file as bytes
     * @param path Path to read
     * @return Handle whose contentsBytes() are available after completion
     *
     * @note Missing files fail with FileError::FileNotFound, directories with FileError::InvalidPath.
     */
    virtual FileOperationHandle readFile(const std::string& path) = 0;

    /**
     * @brief Opens a file for writing
     * @return Handle whose stream() is available after successful completion
     */
    virtual FileOperationHandle openFile(const std::string& path, OpenOptions options = {}) = 0;

    /**
     * @brief Moves or renames a file
     *
     * Fails with FileError::AccessDenied when the destination exists and
     * overwriteExisting is false.
     */
    virtual FileOperationHandle moveFile(const std::string& source, const std::string& destination,
                                         MoveOptions options = {}) = 0;

    virtual FileOperationHandle copyFile(const std::string& source, const std::string& destination,
                                         CopyOptions options = {}) = 0;

    // Fails with FileError::FileNotFound if nothing exists at path
    virtual FileOperationHandle removeFile(const std::string& path) = 0;

    /**
     * @brief Queries existence, type and modification time
     *
     * Fails with FileError::FileNotFound for missing paths; callers that want an
     * exists=false result translate that themselves.
     */
    virtual FileOperationHandle getMetadata(const std::string& path) = 0;

    virtual BackendCapabilities getCapabilities() const = 0;
    virtual std::string getBackendType() const = 0;
};

} // namespace Scribe::Core::IO
