/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

#include "LocalFileSystemBackend.h"
#include "FileStream.h"
#include "../Concurrency/WorkContractGroup.h"
#include "../Logging/CLogger.h"
#include <filesystem>
#include <fstream>
#include <chrono>
#include <vector>
#include <cstring>
#include <cerrno>

#if defined(__unix__) || defined(__APPLE__)
#include <fcntl.h>     // open(), fcntl()
#include <unistd.h>    // write(), close(), fsync()
#include <sys/stat.h>
#endif

namespace Scribe::Core::IO {

namespace {
    // Map errno to FileError with platform-specific handling
    FileError mapErrnoToFileError(int err) {
        switch (err) {
            case ENOSPC:
#if defined(__unix__) || defined(__APPLE__)
            case EDQUOT:  // Disk quota exceeded (POSIX)
#endif
                return FileError::DiskFull;
            case EACCES:
            case EPERM:
                return FileError::AccessDenied;
            case ENOENT:
                return FileError::FileNotFound;
            case EINVAL:
            case ENAMETOOLONG:
            case EISDIR:
            case ENOTDIR:
                return FileError::InvalidPath;
            default:
                return FileError::IOError;
        }
    }

    FileError mapErrorCode(const std::error_code& ec) {
        if (ec.category() == std::generic_category() || ec.category() == std::system_category()) {
#if defined(_WIN32)
            // system_category carries Win32 codes; translate through the portable condition
            return mapErrnoToFileError(ec.default_error_condition().value());
#else
            return mapErrnoToFileError(ec.value());
#endif
        }
        return FileError::IOError;
    }

    FileErrorInfo makeError(FileError code, std::string msg, std::string path,
                            std::optional<std::error_code> ec = std::nullopt) {
        FileErrorInfo info;
        info.code = code;
        info.message = std::move(msg);
        info.path = std::move(path);
        info.systemError = ec;
        return info;
    }

    // Check if path points to a special file (FIFO, device, socket)
    bool isSpecialFile(const std::filesystem::path& p) {
        std::error_code ec;
        auto status = std::filesystem::status(p, ec);
        if (ec) return false;

        return std::filesystem::is_block_file(status) ||
               std::filesystem::is_character_file(status) ||
               std::filesystem::is_fifo(status) ||
               std::filesystem::is_socket(status);
    }

    int64_t toUnixMillis(std::filesystem::file_time_type lwt) {
        // Convert file_time_type to system_clock::time_point
        auto sctp = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            lwt - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now()
        );
        return std::chrono::duration_cast<std::chrono::milliseconds>(sctp.time_since_epoch()).count();
    }
}

// Concrete FileStream implementation for local files
class LocalFileStream : public FileStream, public std::enable_shared_from_this<LocalFileStream> {
private:
    Concurrency::WorkContractGroup* _group;
    std::string _path;
#if defined(__unix__) || defined(__APPLE__)
    int _fd;
#else
    std::fstream _stream;
#endif

    FileOperationHandle schedule(std::function<void(OperationCompleter&)> work) {
        OperationCompleter completer(_group);
        _group->post([completer, work = std::move(work)]() mutable {
            work(completer);
        });
        return completer.handle();
    }

public:
#if defined(__unix__) || defined(__APPLE__)
    LocalFileStream(Concurrency::WorkContractGroup* group, std::string path, int fd)
        : _group(group), _path(std::move(path)), _fd(fd) {}

    ~LocalFileStream() override {
        if (_fd >= 0) {
            ::close(_fd);
        }
    }

    bool isOpen() const override { return _fd >= 0; }
#else
    LocalFileStream(Concurrency::WorkContractGroup* group, std::string path, std::fstream stream)
        : _group(group), _path(std::move(path)), _stream(std::move(stream)) {}

    ~LocalFileStream() override {
        if (_stream.is_open()) {
            _stream.close();
        }
    }

    bool isOpen() const override { return _stream.is_open(); }
#endif

    bool supportsFlush() const override { return true; }
    std::string path() const override { return _path; }

    FileOperationHandle write(std::span<const std::byte> data) override {
        std::vector<std::byte> owned(data.begin(), data.end());
        auto self = shared_from_this();
        return schedule([self, owned = std::move(owned)](OperationCompleter& c) {
            if (!self->isOpen()) {
                c.fail(makeError(FileError::IOError, "Stream is closed", self->_path));
                return;
            }
#if defined(__unix__) || defined(__APPLE__)
            size_t total = 0;
            while (total < owned.size()) {
                ssize_t n = ::write(self->_fd, owned.data() + total, owned.size() - total);
                if (n < 0) {
                    const int saved_errno = errno;  // Capture errno immediately
                    if (saved_errno == EINTR) continue;
                    auto code = mapErrnoToFileError(saved_errno);
                    std::string msg = (code == FileError::DiskFull) ? "Disk full or quota exceeded" : "Write operation failed";
                    SCRIBE_LOG_DEBUG_CAT_F("LocalFileStream", "write(%s) failed: %s",
                                           self->_path.c_str(), std::strerror(saved_errno));
                    c.fail(makeError(code, msg, self->_path, std::error_code(saved_errno, std::generic_category())));
                    return;
                }
                total += static_cast<size_t>(n);
            }
            c.completeWithWrite(total);
#else
            self->_stream.write(reinterpret_cast<const char*>(owned.data()),
                                static_cast<std::streamsize>(owned.size()));
            if (!self->_stream.good()) {
                c.fail(makeError(FileError::IOError, "Write operation failed", self->_path));
                return;
            }
            c.completeWithWrite(owned.size());
#endif
        });
    }

    FileOperationHandle flush() override {
        auto self = shared_from_this();
        return schedule([self](OperationCompleter& c) {
            if (!self->isOpen()) {
                c.fail(makeError(FileError::IOError, "Stream is closed", self->_path));
                return;
            }
#if defined(__APPLE__)
            if (::fcntl(self->_fd, F_FULLFSYNC) != 0) {
                const int sync_errno = errno;
                c.fail(makeError(FileError::IOError, "F_FULLFSYNC failed", self->_path,
                                 std::error_code(sync_errno, std::generic_category())));
                return;
            }
#elif defined(__linux__)
            if (::fdatasync(self->_fd) != 0) {
                const int sync_errno = errno;
                c.fail(makeError(mapErrnoToFileError(sync_errno), "fdatasync failed", self->_path,
                                 std::error_code(sync_errno, std::generic_category())));
                return;
            }
#elif defined(__unix__)
            if (::fsync(self->_fd) != 0) {
                const int sync_errno = errno;
                c.fail(makeError(FileError::IOError, "fsync failed", self->_path,
                                 std::error_code(sync_errno, std::generic_category())));
                return;
            }
#else
            self->_stream.flush();
            if (!self->_stream.good()) {
                c.fail(makeError(FileError::IOError, "Flush failed", self->_path));
                return;
            }
#endif
            c.complete();
        });
    }

    FileOperationHandle close() override {
        auto self = shared_from_this();
        return schedule([self](OperationCompleter& c) {
            if (!self->isOpen()) {
                c.fail(makeError(FileError::IOError, "Stream is closed", self->_path));
                return;
            }
#if defined(__unix__) || defined(__APPLE__)
            const int fd = self->_fd;
            self->_fd = -1;
            if (::close(fd) != 0) {
                const int close_errno = errno;
                c.fail(makeError(mapErrnoToFileError(close_errno), "close failed", self->_path,
                                 std::error_code(close_errno, std::generic_category())));
                return;
            }
#else
            self->_stream.close();
            if (self->_stream.fail()) {
                c.fail(makeError(FileError::IOError, "close failed", self->_path));
                return;
            }
#endif
            c.complete();
        });
    }
};

// LocalFileSystemBackend implementation
LocalFileSystemBackend::LocalFileSystemBackend(Concurrency::WorkContractGroup* group)
    : _group(group) {
}

void LocalFileSystemBackend::validatePath(const std::string& path) {
    if (path.empty()) {
        throw FileOperationException(makeError(FileError::SetupFailure, "Empty path", path));
    }
    if (path.find('\0') != std::string::npos) {
        throw FileOperationException(makeError(FileError::SetupFailure, "Path contains an embedded NUL", path));
    }
}

FileOperationHandle LocalFileSystemBackend::submitWork(const std::string& path,
    std::function<void(OperationCompleter&, const std::string&)> work) {

    OperationCompleter completer(_group);
    if (!_group) {
        completer.fail(makeError(FileError::Unknown, "No WorkContractGroup set for backend", path));
        return completer.handle();
    }

    _group->post([completer, path, work = std::move(work)]() mutable {
        work(completer, path);
    });
    return completer.handle();
}

FileOperationHandle LocalFileSystemBackend::readFile(const std::string& path) {
    validatePath(path);
    return submitWork(path, [](OperationCompleter& c, const std::string& p) {
        // Check for special files (FIFO, device, socket)
        if (isSpecialFile(p)) {
            c.fail(makeError(FileError::InvalidPath, "Cannot perform file operations on special files (FIFO, device, socket)", p));
            return;
        }

        std::error_code dirEc;
        if (std::filesystem::is_directory(p, dirEc)) {
            c.fail(makeError(FileError::InvalidPath, "Path is a directory", p));
            return;
        }

        std::ifstream in(p, std::ios::in | std::ios::binary);
        if (!in) {
            const int saved_errno = errno;  // Capture errno immediately
            std::error_code ec1;
            bool ex = std::filesystem::exists(p, ec1);
            if (ec1 && ec1 != std::errc::no_such_file_or_directory) {
                c.fail(makeError(FileError::InvalidPath, "Invalid path or unsupported filename", p, ec1));
            } else if (!ex) {
                c.fail(makeError(FileError::FileNotFound, "File not found", p));
            } else {
                c.fail(makeError(FileError::AccessDenied, "Cannot open file for reading", p,
                                 std::error_code(saved_errno, std::generic_category())));
            }
            return;
        }

        in.seekg(0, std::ios::end);
        auto size = in.tellg();
        in.seekg(0, std::ios::beg);
        if (size < 0) {
            c.fail(makeError(FileError::IOError, "Cannot determine file size", p));
            return;
        }

        std::vector<std::byte> bytes(static_cast<size_t>(size));
        in.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (in.bad() || static_cast<size_t>(in.gcount()) != bytes.size()) {
            c.fail(makeError(FileError::IOError, "Read operation failed", p));
            return;
        }

        c.completeWithBytes(std::move(bytes));
    });
}

FileOperationHandle LocalFileSystemBackend::openFile(const std::string& path, OpenOptions options) {
    validatePath(path);
    auto* group = _group;
    return submitWork(path, [group, options](OperationCompleter& c, const std::string& p) {
        if (isSpecialFile(p)) {
            c.fail(makeError(FileError::InvalidPath, "Cannot perform file operations on special files (FIFO, device, socket)", p));
            return;
        }

#if defined(__unix__) || defined(__APPLE__)
        int flags = O_WRONLY | O_CLOEXEC;
        if (options.createIfMissing) flags |= O_CREAT;
        if (options.truncate) flags |= O_TRUNC;

        int fd = ::open(p.c_str(), flags, 0644);
        if (fd < 0) {
            const int saved_errno = errno;  // Capture errno immediately
            SCRIBE_LOG_DEBUG_CAT_F("LocalFileSystemBackend", "open(%s) failed: %s",
                                   p.c_str(), std::strerror(saved_errno));
            auto code = mapErrnoToFileError(saved_errno);
            std::string msg = "Cannot open file for writing";
            if (saved_errno == ENOENT && options.createIfMissing) {
                code = FileError::InvalidPath;
                msg = "Parent directory does not exist";
            }
            c.fail(makeError(code, msg, p, std::error_code(saved_errno, std::generic_category())));
            return;
        }
        c.completeWithStream(std::make_shared<LocalFileStream>(group, p, fd));
#else
        std::error_code exEc;
        const bool existed = std::filesystem::exists(p, exEc);
        if (!existed && !options.createIfMissing) {
            c.fail(makeError(FileError::FileNotFound, "File not found", p));
            return;
        }
        std::ios_base::openmode mode = std::ios::out | std::ios::binary;
        mode |= (options.truncate || !existed) ? std::ios::trunc : std::ios::in;
        std::fstream out(p, mode);
        if (!out.is_open()) {
            c.fail(makeError(FileError::AccessDenied, "Cannot open file for writing", p));
            return;
        }
        c.completeWithStream(std::make_shared<LocalFileStream>(group, p, std::move(out)));
#endif
    });
}

FileOperationHandle LocalFileSystemBackend::moveFile(const std::string& src, const std::string& dst, MoveOptions options) {
    validatePath(src);
    validatePath(dst);
    return submitWork(src, [src, dst, options](OperationCompleter& c, const std::string&) {
        std::error_code ec;

        // Check if source exists
        if (!std::filesystem::exists(src, ec) || ec) {
            c.fail(makeError(FileError::FileNotFound, "Source file not found", src, ec ? std::optional<std::error_code>(ec) : std::nullopt));
            return;
        }

        // Check if destination exists
        if (std::filesystem::exists(dst, ec) && !options.overwriteExisting) {
            c.fail(makeError(FileError::AccessDenied, "Destination already exists", dst));
            return;
        }
        ec.clear();

        // Rename replaces an existing destination atomically on the same filesystem
        std::filesystem::rename(src, dst, ec);
        if (!ec) {
            c.complete();
            return;
        }

        if (options.noCopy) {
            SCRIBE_LOG_DEBUG_CAT_F("LocalFileSystemBackend", "rename(%s -> %s) failed: %s",
                                   src.c_str(), dst.c_str(), ec.message().c_str());
            c.fail(makeError(mapErrorCode(ec), "Rename failed", src, ec));
            return;
        }

        // Rename failed (likely cross-filesystem) - do copy + delete
        ec.clear();
        if (!std::filesystem::copy_file(src, dst,
            options.overwriteExisting ? std::filesystem::copy_options::overwrite_existing :
                                        std::filesystem::copy_options::none, ec)) {
            c.fail(makeError(mapErrorCode(ec), "Copy failed during move", src, ec));
            return;
        }

        // Copy succeeded, now delete source
        std::filesystem::remove(src, ec);
        if (ec) {
            c.fail(makeError(FileError::IOError, "Source deletion failed after copy", src, ec));
            return;
        }

        c.complete();
    });
}

FileOperationHandle LocalFileSystemBackend::copyFile(const std::string& src, const std::string& dst, CopyOptions options) {
    validatePath(src);
    validatePath(dst);
    return submitWork(src, [src, dst, options](OperationCompleter& c, const std::string&) {
        std::error_code ec;

        // Check if source exists
        if (!std::filesystem::exists(src, ec) || ec) {
            c.fail(makeError(FileError::FileNotFound, "Source file not found", src, ec ? std::optional<std::error_code>(ec) : std::nullopt));
            return;
        }
        if (std::filesystem::is_directory(src, ec)) {
            c.fail(makeError(FileError::InvalidPath, "Source is a directory", src));
            return;
        }

        // Check if destination exists
        if (std::filesystem::exists(dst, ec) && !options.overwriteExisting) {
            c.fail(makeError(FileError::AccessDenied, "Destination already exists", dst));
            return;
        }
        ec.clear();

        uintmax_t fileSize = std::filesystem::file_size(src, ec);
        if (ec) fileSize = 0;
        ec.clear();

        std::filesystem::copy_options copyOpts = options.overwriteExisting ?
            std::filesystem::copy_options::overwrite_existing :
            std::filesystem::copy_options::none;

        if (!std::filesystem::copy_file(src, dst, copyOpts, ec) || ec) {
            SCRIBE_LOG_DEBUG_CAT_F("LocalFileSystemBackend", "copy(%s -> %s) failed: %s",
                                   src.c_str(), dst.c_str(), ec.message().c_str());
            c.fail(makeError(ec ? mapErrorCode(ec) : FileError::IOError, "Copy failed", src,
                             ec ? std::optional<std::error_code>(ec) : std::nullopt));
            return;
        }

        c.completeWithWrite(static_cast<uint64_t>(fileSize));
    });
}

FileOperationHandle LocalFileSystemBackend::removeFile(const std::string& path) {
    validatePath(path);
    return submitWork(path, [](OperationCompleter& c, const std::string& p) {
        std::error_code ec;
        // Do not follow symlinks: removing a link removes the link itself
        auto status = std::filesystem::symlink_status(p, ec);
        if (status.type() == std::filesystem::file_type::not_found) {
            c.fail(makeError(FileError::FileNotFound, "File not found", p));
            return;
        }
        if (ec) {
            c.fail(makeError(mapErrorCode(ec), "Cannot query file", p, ec));
            return;
        }
        if (std::filesystem::is_directory(status)) {
            c.fail(makeError(FileError::InvalidPath, "Path is a directory", p));
            return;
        }

        if (!std::filesystem::remove(p, ec) || ec) {
            c.fail(makeError(ec ? mapErrorCode(ec) : FileError::FileNotFound, "Remove failed", p,
                             ec ? std::optional<std::error_code>(ec) : std::nullopt));
            return;
        }
        c.complete();
    });
}

FileOperationHandle LocalFileSystemBackend::getMetadata(const std::string& path) {
    validatePath(path);
    return submitWork(path, [](OperationCompleter& c, const std::string& p) {
        std::error_code ec;
        auto status = std::filesystem::status(p, ec);

        if (status.type() == std::filesystem::file_type::not_found) {
            c.fail(makeError(FileError::FileNotFound, "File not found", p));
            return;
        }
        if (ec) {
            c.fail(makeError(mapErrorCode(ec), "Cannot query file", p, ec));
            return;
        }

        FileStat st;
        st.exists = true;
        st.isDirectory = std::filesystem::is_directory(status);
        st.isFile = !st.isDirectory;

        auto lwt = std::filesystem::last_write_time(p, ec);
        if (!ec) {
            st.lastModified = toUnixMillis(lwt);
        }

        c.completeWithStat(st);
    });
}

BackendCapabilities LocalFileSystemBackend::getCapabilities() const {
    BackendCapabilities caps;
    caps.supportsFlush = true;
    caps.supportsAtomicMove = true;  // via rename
    caps.isRemote = false;
    return caps;
}

} // namespace Scribe::Core::IO
