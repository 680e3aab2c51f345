/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

#include "AtomicFileWriter.h"
#include "FileHandle.h"
#include "FileStream.h"
#include "IFileSystemBackend.h"
#include "PlatformResourceUtils.h"
#include "../Concurrency/WorkContractGroup.h"
#include "../Diagnostics/TimeLine.h"
#include "../Logging/Logger.h"
#include "../CoreCommon.h"

namespace Scribe::Core::IO {

struct AtomicFileWriter::WriteOperation : std::enable_shared_from_this<WriteOperation> {
    std::string target;
    std::string tempPath;
    LineSource lines;
    CompletionCallback onDone;
    std::optional<std::string> spanId;
    std::shared_ptr<Diagnostics::ISpanObserver> observer;
    std::shared_ptr<IFileSystemBackend> backend;
    Concurrency::WorkContractGroup* group = nullptr;

    ChunkedEncoder encoder;
    std::shared_ptr<FileStream> stream;
    size_t chunksWritten = 0;
    bool finished = false;

    explicit WriteOperation(size_t threshold)
        : encoder(lineBreak(), threshold) {}

    void span(Diagnostics::SpanEvent event) {
        if (!observer || !spanId) return;
        switch (event) {
            case Diagnostics::SpanEvent::Start: observer->asyncStart(*spanId); break;
            case Diagnostics::SpanEvent::End: observer->asyncEnd(*spanId); break;
            case Diagnostics::SpanEvent::Done: observer->asyncDone(*spanId); break;
        }
    }

    void start() {
        span(Diagnostics::SpanEvent::Start);

        FileOperationHandle open;
        OpenOptions opts;
        opts.truncate = true;
        if (auto err = tryStartOperation([&] { return backend->openFile(tempPath, opts); }, open, tempPath)) {
            postFinish(std::move(*err));
            return;
        }

        auto self = shared_from_this();
        open.then([self](const FileOperationHandle& h) {
            if (h.status() != FileOpStatus::Complete) {
                self->finish(h.errorInfo());
                return;
            }
            self->stream = h.stream();
            if (!self->stream) {
                self->finish(FileErrorInfo{FileError::IOError, "Backend returned no stream", std::nullopt, self->tempPath});
                return;
            }
            self->pump();
        });
    }

    // Pulls lines until a chunk is due or the source is exhausted
    void pump() {
        while (true) {
            std::optional<std::string> line;
            try {
                line = lines ? lines() : std::nullopt;
            } catch (const std::exception& e) {
                abort(FileErrorInfo{FileError::Unknown, e.what(), std::nullopt, target});
                return;
            } catch (...) {
                abort(FileErrorInfo{FileError::Unknown, "non-standard exception", std::nullopt, target});
                return;
            }

            if (!line) {
                finalize();
                return;
            }

            if (encoder.append(std::move(*line))) {
                auto self = shared_from_this();
                writeChunk([self]() { self->pump(); });
                return;
            }
        }
    }

    void writeChunk(std::function<void()> next) {
        auto bytes = encoder.takeChunk();
        SCRIBE_ASSERT(encoder.pendingLength() == 0, "line buffer must be empty after a flush");

        FileOperationHandle write;
        if (auto err = tryStartOperation([&] { return stream->write(bytes); }, write, tempPath)) {
            abort(std::move(*err));
            return;
        }

        auto self = shared_from_this();
        write.then([self, next = std::move(next)](const FileOperationHandle& h) {
            if (h.status() != FileOpStatus::Complete) {
                self->abort(h.errorInfo());
                return;
            }
            ++self->chunksWritten;
            next();
        });
    }

    void finalize() {
        if (encoder.hasPendingLines()) {
            auto self = shared_from_this();
            writeChunk([self]() { self->flushStream(); });
        } else {
            flushStream();
        }
    }

    void flushStream() {
        if (!stream->supportsFlush()) {
            closeStream();
            return;
        }

        FileOperationHandle flush;
        if (auto err = tryStartOperation([&] { return stream->flush(); }, flush, tempPath)) {
            abort(std::move(*err));
            return;
        }

        auto self = shared_from_this();
        flush.then([self](const FileOperationHandle& h) {
            if (h.status() != FileOpStatus::Complete) {
                self->abort(h.errorInfo());
                return;
            }
            self->closeStream();
        });
    }

    void closeStream() {
        FileOperationHandle close;
        if (auto err = tryStartOperation([&] { return stream->close(); }, close, tempPath)) {
            finish(std::move(*err));
            return;
        }

        auto self = shared_from_this();
        close.then([self](const FileOperationHandle& h) {
            self->stream.reset();
            if (h.status() != FileOpStatus::Complete) {
                self->finish(h.errorInfo());
                return;
            }
            self->commit();
        });
    }

    void commit() {
        MoveOptions opts;
        opts.overwriteExisting = true;
        opts.noCopy = true;

        FileOperationHandle move;
        if (auto err = tryStartOperation([&] { return backend->moveFile(tempPath, target, opts); }, move, tempPath)) {
            finish(std::move(*err));
            return;
        }

        auto self = shared_from_this();
        move.then([self](const FileOperationHandle& h) {
            if (h.status() != FileOpStatus::Complete) {
                self->finish(h.errorInfo());
                return;
            }
            self->span(Diagnostics::SpanEvent::End);
            self->finish(std::nullopt);
        });
    }

    // Releases the stream, then reports the error that caused the abort
    void abort(FileErrorInfo error) {
        if (!stream || !stream->isOpen()) {
            finish(std::move(error));
            return;
        }

        FileOperationHandle close;
        if (tryStartOperation([&] { return stream->close(); }, close, tempPath)) {
            stream.reset();
            finish(std::move(error));
            return;
        }

        auto self = shared_from_this();
        close.then([self, error = std::move(error)](const FileOperationHandle& h) {
            if (h.status() != FileOpStatus::Complete) {
                SCRIBE_LOG_DEBUG_CAT("FileAccess", "close after failed write also failed: " + h.errorInfo().toString());
            }
            self->stream.reset();
            self->finish(error);
        });
    }

    void postFinish(FileErrorInfo error) {
        auto self = shared_from_this();
        group->post([self, error = std::move(error)]() { self->finish(error); });
    }

    void finish(std::optional<FileErrorInfo> error) {
        if (finished) return;
        finished = true;

        span(Diagnostics::SpanEvent::Done);
        if (error) {
            SCRIBE_LOG_WARNING_CAT("FileAccess", "writeToFile failed after " + std::to_string(chunksWritten) +
                                   " chunks: " + error->toString());
        } else {
            SCRIBE_LOG_TRACE_CAT("FileAccess", "writeToFile committed " + std::to_string(chunksWritten) +
                                 " chunks to " + target);
        }
        if (onDone) onDone(std::move(error));
    }
};

AtomicFileWriter::AtomicFileWriter(std::shared_ptr<IFileSystemBackend> backend,
                                   Concurrency::WorkContractGroup* group,
                                   Options options)
    : _backend(std::move(backend))
    , _group(group)
    , _options(std::move(options)) {
}

void AtomicFileWriter::writeToFile(const FileHandle& file,
                                   LineSource lines,
                                   CompletionCallback onDone,
                                   std::optional<std::string> spanId) {
    SCRIBE_ASSERT(_group != nullptr, "AtomicFileWriter requires a WorkContractGroup");

    auto op = std::make_shared<WriteOperation>(_options.chunkThreshold);
    op->target = file.path();
    op->tempPath = file.withSuffix(_options.tempSuffix).path();
    op->lines = std::move(lines);
    op->onDone = std::move(onDone);
    op->spanId = std::move(spanId);
    op->observer = _observer;
    op->backend = _backend;
    op->group = _group;
    op->start();
}

void AtomicFileWriter::writeToFile(const FileHandle& file,
                                   std::vector<std::string> lines,
                                   CompletionCallback onDone,
                                   std::optional<std::string> spanId) {
    writeToFile(file, fromVector(std::move(lines)), std::move(onDone), std::move(spanId));
}

LineSource AtomicFileWriter::fromVector(std::vector<std::string> lines) {
    auto state = std::make_shared<std::vector<std::string>>(std::move(lines));
    auto index = std::make_shared<size_t>(0);
    return [state, index]() -> std::optional<std::string> {
        if (*index >= state->size()) return std::nullopt;
        return std::move((*state)[(*index)++]);
    };
}

} // namespace Scribe::Core::IO
