//! # Parse Error Types
//!
//! Every parser in knit reports failure through a single `ParseError` value.
//! Errors carry the failure tier, the position of the failure, a short excerpt
//! of the unconsumed input and the stack of parser labels that were active.
//!
//! ## Failure Tiers
//!
//! | Kind         | Raised by                                   | Example                    |
//! |--------------|---------------------------------------------|----------------------------|
//! | `Token`      | Literal and character-class matchers        | expected `]`               |
//! | `Conversion` | Literal-to-enum conversions                 | unknown HTTP method        |
//! | `Format`     | Numeric and date decoding of matched tokens | octet 999 out of range     |
//!
//! All three tiers are fatal to the parse in progress; the tier only tells the
//! caller what kind of problem the input had.
//!
//! ## Example
//!
//! ```cpp
//! auto err = ParseError::token(cursor, "expected ']'");
//! err.to_string();        // "offset 6: expected ']' (near \"}\")"
//! err.locate(input);
//! err.to_string();        // "line 1, column 7: expected ']' (near \"}\")"
//! ```
//!
//! Errors are cheap to create: parsers build and discard many of them while
//! trying alternatives, so construction records only the offset and a bounded
//! excerpt. Line and column are filled in by `locate`, which the grammar entry
//! points call once before an error leaves them.

#pragma once

#include "parse/cursor.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace knit::parse {

/// Failure tier of a `ParseError`.
enum class ParseErrorKind : uint8_t {
    Token,      ///< Expected literal or character class not found
    Conversion, ///< Matched token is not a member of the expected literal set
    Format      ///< Matched token has an invalid or out-of-range value
};

/// Returns the lowercase name of an error kind ("token", "conversion", "format").
[[nodiscard]] auto kind_name(ParseErrorKind kind) -> const char*;

/// An error produced by a parser.
///
/// # Fields
///
/// - `kind`: failure tier
/// - `message`: what was expected or what was wrong
/// - `context`: labels of enclosing parsers, innermost first
/// - `offset`: failure position as a byte offset
/// - `line`, `column`: 1-based position, 0 until `locate` is called
/// - `near`: excerpt of the unconsumed input at the failure position
struct ParseError {
    ParseErrorKind kind = ParseErrorKind::Token;
    std::string message;
    std::vector<std::string> context;
    size_t offset = 0;
    size_t line = 0;
    size_t column = 0;
    std::string near;

    /// Creates an error of the given tier positioned at `at`.
    static auto make(ParseErrorKind kind, const Cursor& at, std::string msg) -> ParseError;

    /// Creates a `Token` error at `at`.
    static auto token(const Cursor& at, std::string msg) -> ParseError {
        return make(ParseErrorKind::Token, at, std::move(msg));
    }

    /// Creates a `Conversion` error at `at`.
    static auto conversion(const Cursor& at, std::string msg) -> ParseError {
        return make(ParseErrorKind::Conversion, at, std::move(msg));
    }

    /// Creates a `Format` error at `at`.
    static auto format(const Cursor& at, std::string msg) -> ParseError {
        return make(ParseErrorKind::Format, at, std::move(msg));
    }

    /// Appends an enclosing parser label. Returns `*this` for chaining.
    auto with_context(std::string label) -> ParseError& {
        context.push_back(std::move(label));
        return *this;
    }

    /// Fills in `line` and `column` from `offset`. `input` must be the text the
    /// failing parse ran over. Costs O(offset).
    auto locate(std::string_view input) -> ParseError&;

    /// Formats the error as a human-readable string.
    ///
    /// Format: `"line L, column C: message (near \"...\") [in a > b]"`, where the
    /// context list runs outermost to innermost. An error that has not been
    /// located starts with `"offset N: "` instead.
    [[nodiscard]] auto to_string() const -> std::string;
};

} // namespace knit::parse
