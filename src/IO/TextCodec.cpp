/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

#include "TextCodec.h"
#include <cstdint>

namespace Scribe::Core::IO::TextCodec {

namespace {
    constexpr char kReplacement[] = "\xEF\xBF\xBD";

    // Length of the well-formed sequence starting at i, or 0 if malformed.
    // Follows the Unicode "maximal subpart" rules for ranges of the second byte.
    size_t validSequenceLength(const uint8_t* p, size_t remaining, size_t& maximalSubpart) {
        const uint8_t b0 = p[0];
        maximalSubpart = 1;
        if (b0 < 0x80) return 1;

        size_t need = 0;
        uint8_t lo = 0x80, hi = 0xBF;
        if (b0 >= 0xC2 && b0 <= 0xDF) {
            need = 1;
        } else if (b0 == 0xE0) {
            need = 2; lo = 0xA0;
        } else if ((b0 >= 0xE1 && b0 <= 0xEC) || b0 == 0xEE || b0 == 0xEF) {
            need = 2;
        } else if (b0 == 0xED) {
            need = 2; hi = 0x9F;  // excludes surrogates
        } else if (b0 == 0xF0) {
            need = 3; lo = 0x90;
        } else if (b0 >= 0xF1 && b0 <= 0xF3) {
            need = 3;
        } else if (b0 == 0xF4) {
            need = 3; hi = 0x8F;
        } else {
            return 0;
        }

        for (size_t k = 1; k <= need; ++k) {
            if (k >= remaining) return 0;
            const uint8_t b = p[k];
            const uint8_t min = (k == 1) ? lo : 0x80;
            const uint8_t max = (k == 1) ? hi : 0xBF;
            if (b < min || b > max) return 0;
            maximalSubpart = k + 1;
        }
        return need + 1;
    }
}

std::string decodeUtf8Lossy(std::span<const std::byte> bytes) {
    const auto* p = reinterpret_cast<const uint8_t*>(bytes.data());
    size_t n = bytes.size();
    size_t i = 0;

    if (n >= 3 && p[0] == 0xEF && p[1] == 0xBB && p[2] == 0xBF) {
        i = 3;
    }

    std::string out;
    out.reserve(n - i);
    while (i < n) {
        size_t subpart = 1;
        const size_t len = validSequenceLength(p + i, n - i, subpart);
        if (len == 0) {
            out.append(kReplacement);
            i += subpart;
            continue;
        }
        out.append(reinterpret_cast<const char*>(p + i), len);
        i += len;
    }
    return out;
}

size_t utf16Length(std::string_view utf8) noexcept {
    size_t units = 0;
    for (unsigned char c : utf8) {
        if ((c & 0xC0) == 0x80) continue;   // continuation byte
        units += (c >= 0xF0) ? 2 : 1;
    }
    return units;
}

std::vector<std::byte> encodeUtf8(std::string_view text) {
    std::vector<std::byte> out(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        out[i] = static_cast<std::byte>(text[i]);
    }
    return out;
}

} // namespace Scribe::Core::IO::TextCodec
