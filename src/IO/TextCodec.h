/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

/**
 * @file TextCodec.h
 * @brief UTF-8 helpers for line-oriented text I/O
 */
#pragma once
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <cstddef>

namespace Scribe::Core::IO::TextCodec {

/**
 * @brief Decodes bytes as UTF-8, replacing each malformed sequence with U+FFFD
 *
 * A leading byte-order mark is dropped. The result is always valid UTF-8.
 */
std::string decodeUtf8Lossy(std::span<const std::byte> bytes);

/**
 * @brief Length of valid UTF-8 text in UTF-16 code units
 *
 * Code points above U+FFFF count as two units. Used to measure buffered text against
 * the chunk threshold independently of its encoded byte length.
 */
size_t utf16Length(std::string_view utf8) noexcept;

// Copies the text into a byte buffer ready for a stream write
std::vector<std::byte> encodeUtf8(std::string_view text);

} // namespace Scribe::Core::IO::TextCodec
