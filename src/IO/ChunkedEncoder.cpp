/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

#include "ChunkedEncoder.h"
#include "TextCodec.h"

namespace Scribe::Core::IO {

ChunkedEncoder::ChunkedEncoder(std::string lineBreak, size_t threshold)
    : _lineBreak(std::move(lineBreak))
    , _threshold(threshold == 0 ? 1 : threshold) {
}

bool ChunkedEncoder::append(std::string line) {
    _buffer.length += TextCodec::utf16Length(line);
    _buffer.lines.push_back(std::move(line));
    return shouldFlush();
}

std::vector<std::byte> ChunkedEncoder::takeChunk() {
    size_t total = 0;
    for (const auto& line : _buffer.lines) {
        total += line.size() + _lineBreak.size();
    }

    std::string joined;
    joined.reserve(total);
    for (const auto& line : _buffer.lines) {
        joined += line;
        joined += _lineBreak;
    }

    _buffer.clear();
    return TextCodec::encodeUtf8(joined);
}

} // namespace Scribe::Core::IO
