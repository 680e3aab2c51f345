/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

/**
 * @file ChunkedEncoder.h
 * @brief Bounded line buffer that turns appended lines into encoded chunks
 */
#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace Scribe::Core::IO {

// Buffered source length (UTF-16 units) at which a chunk is emitted: 32 KiB
inline constexpr size_t kDefaultChunkThreshold = 0x8000;

/**
 * @brief Accumulates lines and emits them as join(lines, LB) + LB in UTF-8
 *
 * Buffer length is the sum of the UTF-16 lengths of the buffered lines; line breaks
 * are not counted. The caller appends, checks shouldFlush() after each append, and
 * calls takeChunk() to drain the buffer, which resets the length to zero.
 */
class ChunkedEncoder {
public:
    explicit ChunkedEncoder(std::string lineBreak, size_t threshold = kDefaultChunkThreshold);

    /**
     * @brief Buffers one line
     * @return true when the buffer length has reached the threshold
     */
    bool append(std::string line);

    bool shouldFlush() const noexcept { return _buffer.length >= _threshold; }
    bool hasPendingLines() const noexcept { return !_buffer.lines.empty(); }
    size_t pendingLength() const noexcept { return _buffer.length; }
    size_t pendingLineCount() const noexcept { return _buffer.lines.size(); }
    size_t threshold() const noexcept { return _threshold; }
    const std::string& lineBreak() const noexcept { return _lineBreak; }

    // Encodes every buffered line followed by the line break and empties the buffer
    std::vector<std::byte> takeChunk();

private:
    struct LineBuffer {
        std::vector<std::string> lines;
        size_t length = 0;

        void clear() {
            lines.clear();
            length = 0;
        }
    };

    std::string _lineBreak;
    size_t _threshold;
    LineBuffer _buffer;
};

} // namespace Scribe::Core::IO
