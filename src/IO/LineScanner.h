/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

/**
 * @file LineScanner.h
 * @brief Lazy cursor over the non-empty lines of a text blob
 */
#pragma once
#include <cstddef>
#include <iterator>
#include <optional>
#include <string_view>

namespace Scribe::Core::IO {

/**
 * @brief Produces the non-empty lines of a text, one at a time
 *
 * A line is a maximal run of characters containing neither '\r' nor '\n'. Blank lines
 * are skipped, so "\r\n", "\n" and a lone "\r" all act as terminators and no empty
 * token is ever produced. The scanner does not own the text; the returned views point
 * into it and stay valid as long as the text does.
 *
 * @code
 * LineScanner scanner("x\n\ny\n");
 * while (auto line = scanner.next()) {
 *     consume(*line);   // "x", then "y"
 * }
 * @endcode
 */
class LineScanner {
public:
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::string_view;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string_view*;
        using reference = const std::string_view&;

        Iterator() = default;

        reference operator*() const noexcept { return *_current; }
        pointer operator->() const noexcept { return &*_current; }
        Iterator& operator++();
        Iterator operator++(int);

        friend bool operator==(const Iterator& a, const Iterator& b) noexcept {
            // Only end-equality is meaningful for an input iterator
            return !a._current.has_value() && !b._current.has_value();
        }
        friend bool operator!=(const Iterator& a, const Iterator& b) noexcept { return !(a == b); }

    private:
        explicit Iterator(LineScanner* scanner);

        LineScanner* _scanner = nullptr;
        std::optional<std::string_view> _current;

        friend class LineScanner;
    };

    LineScanner() = default;
    explicit LineScanner(std::string_view text) noexcept : _text(text) {}

    // Next non-empty line, or nullopt once the text is exhausted
    std::optional<std::string_view> next() noexcept;

    // Restart from the beginning of the text
    void reset() noexcept { _pos = 0; }

    bool done() const noexcept;
    std::string_view text() const noexcept { return _text; }

    // Input range over the remaining lines; shares this scanner's cursor
    Iterator begin() { return Iterator(this); }
    Iterator end() { return Iterator(); }

private:
    std::string_view _text;
    size_t _pos = 0;
};

} // namespace Scribe::Core::IO
