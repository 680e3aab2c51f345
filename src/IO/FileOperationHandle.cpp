/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

#include "FileOperationHandle.h"
#include "../Concurrency/WorkContractGroup.h"
#include "../Logging/Logger.h"
#include <sstream>

namespace Scribe::Core::IO {

const char* fileErrorToString(FileError error) noexcept {
    switch (error) {
        case FileError::None: return "None";
        case FileError::FileNotFound: return "FileNotFound";
        case FileError::AccessDenied: return "AccessDenied";
        case FileError::DiskFull: return "DiskFull";
        case FileError::InvalidPath: return "InvalidPath";
        case FileError::IOError: return "IOError";
        case FileError::SetupFailure: return "SetupFailure";
        case FileError::Unknown: return "Unknown";
    }
    return "Unknown";
}

std::string FileErrorInfo::toString() const {
    std::ostringstream oss;
    oss << fileErrorToString(code);
    if (!message.empty()) oss << ": " << message;
    if (!path.empty()) oss << " (" << path << ")";
    if (systemError) oss << " [" << systemError->message() << "]";
    return oss.str();
}

FileOperationException::FileOperationException(FileErrorInfo info)
    : std::runtime_error(info.toString())
    , _info(std::move(info)) {
}

void FileOperationHandle::OpState::complete(FileOpStatus final, const std::shared_ptr<OpState>& self) {
    if (isComplete) return;
    st = final;
    isComplete = true;

    auto pending = std::move(continuations);
    continuations.clear();
    for (auto& continuation : pending) {
        postContinuation(self, std::move(continuation));
    }
}

std::shared_ptr<FileOperationHandle::OpState> FileOperationHandle::makeState(Concurrency::WorkContractGroup* group) {
    auto state = std::make_shared<OpState>();
    state->group = group;
    return state;
}

void FileOperationHandle::postContinuation(const std::shared_ptr<OpState>& state, Continuation continuation) {
    if (!state->group) {
        // Detached state: nothing can pump it later
        continuation(FileOperationHandle(state));
        return;
    }
    state->group->post([state, continuation = std::move(continuation)]() {
        continuation(FileOperationHandle(state));
    });
}

void FileOperationHandle::wait() const {
    if (!_s || _s->isComplete) return;

    while (!_s->isComplete) {
        if (!_s->group || _s->group->executeMainThreadWork(1) == 0) {
            SCRIBE_LOG_WARNING_CAT("FileOperationHandle",
                "wait() ran out of scheduled work before the operation completed");
            return;
        }
    }
}

FileOpStatus FileOperationHandle::status() const noexcept {
    return _s ? _s->st : FileOpStatus::Pending;
}

bool FileOperationHandle::isComplete() const noexcept {
    return _s && _s->isComplete;
}

std::span<const std::byte> FileOperationHandle::contentsBytes() const {
    if (!_s) return {};
    if (!_s->isComplete) wait();
    return std::span<const std::byte>(_s->bytes.data(), _s->bytes.size());
}

std::string FileOperationHandle::contentsText() const {
    if (!_s) return {};
    if (!_s->isComplete) wait();
    return std::string(reinterpret_cast<const char*>(_s->bytes.data()), _s->bytes.size());
}

uint64_t FileOperationHandle::bytesWritten() const {
    if (!_s) return 0ULL;
    if (!_s->isComplete) wait();
    return _s->wrote;
}

const std::optional<FileStat>& FileOperationHandle::stat() const {
    static const std::optional<FileStat> empty;
    if (!_s) return empty;
    if (!_s->isComplete) wait();
    return _s->stat;
}

std::shared_ptr<FileStream> FileOperationHandle::stream() const {
    if (!_s) return nullptr;
    if (!_s->isComplete) wait();
    return _s->stream;
}

const FileErrorInfo& FileOperationHandle::errorInfo() const {
    static FileErrorInfo emptyError;
    if (!_s) return emptyError;
    if (!_s->isComplete) wait();
    return _s->error;
}

void FileOperationHandle::then(Continuation continuation) const {
    if (!_s || !continuation) return;
    if (_s->isComplete) {
        postContinuation(_s, std::move(continuation));
    } else {
        _s->continuations.push_back(std::move(continuation));
    }
}

OperationCompleter::OperationCompleter(Concurrency::WorkContractGroup* group)
    : _s(FileOperationHandle::makeState(group)) {
}

void OperationCompleter::complete() {
    _s->complete(FileOpStatus::Complete, _s);
}

void OperationCompleter::completeWithBytes(std::vector<std::byte> bytes) {
    if (_s->isComplete) return;
    _s->bytes = std::move(bytes);
    _s->complete(FileOpStatus::Complete, _s);
}

void OperationCompleter::completeWithWrite(uint64_t bytesWritten) {
    if (_s->isComplete) return;
    _s->wrote = bytesWritten;
    _s->complete(FileOpStatus::Complete, _s);
}

void OperationCompleter::completeWithStat(FileStat stat) {
    if (_s->isComplete) return;
    _s->stat = stat;
    _s->complete(FileOpStatus::Complete, _s);
}

void OperationCompleter::completeWithStream(std::shared_ptr<FileStream> stream) {
    if (_s->isComplete) return;
    _s->stream = std::move(stream);
    _s->complete(FileOpStatus::Complete, _s);
}

void OperationCompleter::fail(FileErrorInfo error) {
    if (_s->isComplete) return;
    _s->error = std::move(error);
    _s->complete(FileOpStatus::Failed, _s);
}

} // namespace Scribe::Core::IO
