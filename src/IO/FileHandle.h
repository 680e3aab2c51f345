/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

/**
 * @file FileHandle.h
 * @brief Value-semantic reference to a concrete file path
 *
 * FileHandle is a dumb handle: it performs no filesystem probing and no I/O. The reader,
 * writer and FileAccess operations take it to name their target.
 */
#pragma once
#include <string>
#include <string_view>
#include <functional>

namespace Scribe::Core::IO {

class FileAccess; // fwd

/**
 * @brief Copyable handle to a file path
 *
 * Construct via FileAccess::createFileHandle() or FileAccess::resolveFilePath().
 *
 * @code
 * auto fh = access.createFileHandle("/tmp/notes.txt");
 * auto renamed = fh.withLeafName("notes.bak");   // "/tmp/notes.bak"
 * @endcode
 */
class FileHandle {
public:
    struct Metadata {
        std::string path;       // full path as provided
        std::string directory;  // parent directory (may be empty)
        std::string filename;   // file name with extension
        std::string extension;  // extension including leading dot if present
    };

private:
    explicit FileHandle(std::string path);

public:
    const std::string& path() const noexcept { return _meta.path; }
    const std::string& directory() const noexcept { return _meta.directory; }
    const std::string& filename() const noexcept { return _meta.filename; }
    const std::string& extension() const noexcept { return _meta.extension; }
    const Metadata& metadata() const noexcept { return _meta; }

    /**
     * @brief Clone of this handle with the final path component replaced
     * @param leafName New file name; must be non-empty and contain no separator
     * @throws FileOperationException (InvalidPath) for an unusable leaf name
     */
    FileHandle withLeafName(std::string_view leafName) const;

    /**
     * @brief Clone of this handle with suffix appended to the full path
     *
     * "/a/b.txt" with ".tmp" becomes "/a/b.txt.tmp".
     */
    FileHandle withSuffix(std::string_view suffix) const;

    friend bool operator==(const FileHandle& a, const FileHandle& b) noexcept {
        return a._meta.path == b._meta.path;
    }
    friend bool operator!=(const FileHandle& a, const FileHandle& b) noexcept { return !(a == b); }

private:
    Metadata _meta;

    friend class FileAccess;
};

} // namespace Scribe::Core::IO

// Hash support for FileHandle
namespace std {
    template<>
    struct hash<Scribe::Core::IO::FileHandle> {
        size_t operator()(const Scribe::Core::IO::FileHandle& h) const noexcept {
            return std::hash<std::string>{}(h.path());
        }
    };
}
