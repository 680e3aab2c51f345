/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

#include "StreamingFileReader.h"
#include "FileHandle.h"
#include "IFileSystemBackend.h"
#include "LineScanner.h"
#include "TextCodec.h"
#include "../Concurrency/WorkContractGroup.h"
#include "../Diagnostics/TimeLine.h"
#include "../Logging/Logger.h"
#include "../CoreCommon.h"

namespace Scribe::Core::IO {

struct StreamingFileReader::ReadOperation : std::enable_shared_from_this<ReadOperation> {
    std::string path;
    std::shared_ptr<ILineConsumer> consumer;
    CompletionCallback onDone;
    std::optional<std::string> spanId;
    std::shared_ptr<Diagnostics::ISpanObserver> observer;
    Concurrency::WorkContractGroup* group = nullptr;

    // text must not move once the scanner points into it
    std::string text;
    LineScanner scanner;
    size_t delivered = 0;
    bool finished = false;

    void span(Diagnostics::SpanEvent event) {
        if (!observer || !spanId) return;
        switch (event) {
            case Diagnostics::SpanEvent::Start: observer->asyncStart(*spanId); break;
            case Diagnostics::SpanEvent::End: observer->asyncEnd(*spanId); break;
            case Diagnostics::SpanEvent::Done: observer->asyncDone(*spanId); break;
        }
    }

    void start(IFileSystemBackend& backend) {
        span(Diagnostics::SpanEvent::Start);

        FileOperationHandle read;
        if (auto err = tryStartOperation([&] { return backend.readFile(path); }, read, path)) {
            postFinish(std::move(*err));
            return;
        }

        auto self = shared_from_this();
        read.then([self](const FileOperationHandle& h) {
            if (h.status() != FileOpStatus::Complete) {
                self->finish(h.errorInfo());
                return;
            }
            self->span(Diagnostics::SpanEvent::End);
            self->text = TextCodec::decodeUtf8Lossy(h.contentsBytes());
            self->scanner = LineScanner(self->text);
            self->deliverNext();
        });
    }

    // Delivers one line, then yields by scheduling the next delivery
    void deliverNext() {
        auto line = scanner.next();
        try {
            if (consumer) consumer->process(line);
        } catch (const std::exception& e) {
            finish(FileErrorInfo{FileError::Unknown, e.what(), std::nullopt, path});
            return;
        } catch (...) {
            finish(FileErrorInfo{FileError::Unknown, "non-standard exception", std::nullopt, path});
            return;
        }

        if (!line) {
            finish(std::nullopt);
            return;
        }

        ++delivered;
        auto self = shared_from_this();
        group->post([self]() { self->deliverNext(); });
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
            SCRIBE_LOG_WARNING_CAT("FileAccess", "readFromFile failed after " + std::to_string(delivered) +
                                   " lines: " + error->toString());
        } else {
            SCRIBE_LOG_TRACE_CAT("FileAccess", "readFromFile delivered " + std::to_string(delivered) +
                                 " lines from " + path);
        }
        if (onDone) onDone(std::move(error));
    }
};

StreamingFileReader::StreamingFileReader(std::shared_ptr<IFileSystemBackend> backend,
                                         Concurrency::WorkContractGroup* group)
    : _backend(std::move(backend))
    , _group(group) {
}

void StreamingFileReader::readFromFile(const FileHandle& file,
                                       std::shared_ptr<ILineConsumer> consumer,
                                       CompletionCallback onDone,
                                       std::optional<std::string> spanId) {
    SCRIBE_ASSERT(_group != nullptr, "StreamingFileReader requires a WorkContractGroup");
    SCRIBE_ASSERT(consumer != nullptr, "StreamingFileReader requires a consumer");

    auto op = std::make_shared<ReadOperation>();
    op->path = file.path();
    op->consumer = std::move(consumer);
    op->onDone = std::move(onDone);
    op->spanId = std::move(spanId);
    op->observer = _observer;
    op->group = _group;
    op->start(*_backend);
}

} // namespace Scribe::Core::IO
