/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

#include "LineScanner.h"

namespace Scribe::Core::IO {

namespace {
    constexpr bool isBreak(char c) noexcept { return c == '\r' || c == '\n'; }
}

std::optional<std::string_view> LineScanner::next() noexcept {
    while (_pos < _text.size() && isBreak(_text[_pos])) {
        ++_pos;
    }
    if (_pos >= _text.size()) {
        return std::nullopt;
    }

    const size_t start = _pos;
    while (_pos < _text.size() && !isBreak(_text[_pos])) {
        ++_pos;
    }
    return _text.substr(start, _pos - start);
}

bool LineScanner::done() const noexcept {
    for (size_t i = _pos; i < _text.size(); ++i) {
        if (!isBreak(_text[i])) return false;
    }
    return true;
}

LineScanner::Iterator::Iterator(LineScanner* scanner)
    : _scanner(scanner)
    , _current(scanner->next()) {
}

LineScanner::Iterator& LineScanner::Iterator::operator++() {
    _current = _scanner ? _scanner->next() : std::nullopt;
    return *this;
}

LineScanner::Iterator LineScanner::Iterator::operator++(int) {
    Iterator previous = *this;
    ++*this;
    return previous;
}

} // namespace Scribe::Core::IO
