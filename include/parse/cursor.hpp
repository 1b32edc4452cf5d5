//! # Input Cursor
//!
//! A `Cursor` is the position threaded through every parser. It pairs the full
//! input text with a byte offset, so the unconsumed slice is always
//! `input[offset..]` and the consumed prefix stays available for line/column
//! reporting.
//!
//! Cursors are plain values. Advancing returns a new cursor and leaves the
//! original untouched, which is what lets alternation retry from the same
//! position after a failed branch.
//!
//! ## Example
//!
//! ```cpp
//! Cursor c("[1, 2]");
//! Cursor next = c.advance(1);
//! assert(c.offset() == 0);
//! assert(next.remaining() == "1, 2]");
//! ```

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace knit::parse {

/// Immutable position over an input string.
///
/// The cursor does not own the input; the caller keeps the text alive for as
/// long as any cursor or parse error views into it.
class Cursor {
public:
    /// Creates a cursor at the start of `input`.
    explicit Cursor(std::string_view input) : input_(input) {}

    /// The whole input this cursor walks over.
    [[nodiscard]] auto input() const -> std::string_view {
        return input_;
    }

    /// Byte offset from the start of the input.
    [[nodiscard]] auto offset() const -> size_t {
        return offset_;
    }

    /// The unconsumed input.
    [[nodiscard]] auto remaining() const -> std::string_view {
        return input_.substr(offset_);
    }

    /// Returns `true` when no input remains.
    [[nodiscard]] auto at_end() const -> bool {
        return offset_ >= input_.size();
    }

    /// Current character, or `'\0'` at end of input.
    [[nodiscard]] auto peek() const -> char {
        return at_end() ? '\0' : input_[offset_];
    }

    /// Returns `true` if the remaining input begins with `prefix`.
    [[nodiscard]] auto starts_with(std::string_view prefix) const -> bool {
        return remaining().starts_with(prefix);
    }

    /// Returns a cursor moved forward by `count` bytes (clamped to the end).
    [[nodiscard]] auto advance(size_t count) const -> Cursor;

    /// 1-based line number of the current offset.
    [[nodiscard]] auto line() const -> size_t;

    /// 1-based column number of the current offset.
    [[nodiscard]] auto column() const -> size_t;

    /// Up to `max_len` bytes of remaining input, cut at the first newline,
    /// with `...` appended when truncated.
    [[nodiscard]] auto excerpt(size_t max_len = 32) const -> std::string;

    [[nodiscard]] auto operator==(const Cursor& other) const -> bool {
        return input_.data() == other.input_.data() && input_.size() == other.input_.size() &&
               offset_ == other.offset_;
    }

private:
    Cursor(std::string_view input, size_t offset) : input_(input), offset_(offset) {}

    std::string_view input_;
    size_t offset_ = 0;
};

} // namespace knit::parse
