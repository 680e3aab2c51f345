/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

#pragma once
#include <span>
#include <cstddef>
#include <string>
#include "FileOperationHandle.h"

namespace Scribe::Core::IO {

/**
 * @brief Writable handle produced by IFileSystemBackend::openFile
 *
 * Every operation is asynchronous and reports through a FileOperationHandle.
 * Implementations release the underlying OS resource in their destructor if close()
 * was never called.
 */
class FileStream {
public:
    virtual ~FileStream() = default;

    // Appends data at the current position; the handle reports bytesWritten()
    virtual FileOperationHandle write(std::span<const std::byte> data) = 0;

    // Whether flush() reaches an OS-level durability primitive
    virtual bool supportsFlush() const { return false; }

    // Flush any OS-level buffering. Only meaningful when supportsFlush() is true.
    virtual FileOperationHandle flush() = 0;

    // Close the stream; subsequent writes fail with IOError
    virtual FileOperationHandle close() = 0;

    virtual bool isOpen() const = 0;

    // Get underlying file path if applicable
    virtual std::string path() const { return ""; }
};

} // namespace Scribe::Core::IO
