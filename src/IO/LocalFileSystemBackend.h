/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

#pragma once
#include "IFileSystemBackend.h"
#include <functional>

namespace Scribe::Core::Concurrency {
class WorkContractGroup;
}

namespace Scribe::Core::IO {

/**
 * @brief IFileSystemBackend over the local disk
 *
 * Each call schedules one contract on the supplied group; the blocking system calls run
 * when that contract executes, so a caller pumping the group observes completion in
 * scheduling order. The group must outlive the backend and every stream it opens.
 */
class LocalFileSystemBackend : public IFileSystemBackend {
public:
    explicit LocalFileSystemBackend(Concurrency::WorkContractGroup* group);
    ~LocalFileSystemBackend() override = default;

    FileOperationHandle readFile(const std::string& path) override;
    FileOperationHandle openFile(const std::string& path, OpenOptions options = {}) override;
    FileOperationHandle moveFile(const std::string& src, const std::string& dst, MoveOptions options = {}) override;
    FileOperationHandle copyFile(const std::string& src, const std::string& dst, CopyOptions options = {}) override;
    FileOperationHandle removeFile(const std::string& path) override;
    FileOperationHandle getMetadata(const std::string& path) override;

    BackendCapabilities getCapabilities() const override;
    std::string getBackendType() const override { return "LocalFileSystem"; }

    Concurrency::WorkContractGroup* workGroup() const noexcept { return _group; }

private:
    // Rejects paths no primitive could accept; throws FileOperationException
    static void validatePath(const std::string& path);

    // Submit work to the backend's group
    FileOperationHandle submitWork(const std::string& path,
                                   std::function<void(OperationCompleter&, const std::string&)> work);

    Concurrency::WorkContractGroup* _group;
};

} // namespace Scribe::Core::IO
