//! # JSON Parser
//!
//! Recursive-descent JSON grammar assembled from the combinators in
//! `parse/combinators.hpp`. Each grammar rule is a plain function with the
//! parser signature `(Cursor) -> ParseResult<T>`, so rules can be passed
//! directly to combinators and can refer to each other recursively.
//!
//! ## Grammar
//!
//! ```text
//! value  := null | bool | number | string | array | object    (tried in this order)
//! null   := "null"
//! bool   := "true" | "false"
//! number := "-"? digits ("." digits)?
//! string := '"' (any char except '"')* '"'
//! array  := ws "[" ws (value (ws "," ws value)*)? ws "]" ws
//! object := ws "{" ws pair (ws "," ws pair)* ws "}" ws
//! pair   := string ws ":" ws value
//! ```
//!
//! ## Scope Limits
//!
//! - String content is taken literally; backslash escapes are not decoded
//! - Numbers have no exponent form; a fractional part makes a `Float`
//! - `{}` is rejected because an object needs at least one pair, while `[]`
//!   is accepted
//!
//! ## Example
//!
//! ```cpp
//! auto result = parse_json(R"({"name": "Alice", "age": 30})");
//! if (is_ok(result)) {
//!     auto& json = unwrap(result);
//!     std::cout << json.get("age")->as_i64() << std::endl;
//! } else {
//!     std::cerr << unwrap_err(result).to_string() << std::endl;
//! }
//! ```

#pragma once

#include "common.hpp"
#include "json/json_value.hpp"
#include "parse/combinators.hpp"

#include <string>
#include <string_view>

namespace knit::json {

using parse::Cursor;
using parse::ParseError;
using parse::ParseResult;

// ============================================================================
// Grammar Rules
// ============================================================================

/// Matches the literal `null`.
[[nodiscard]] auto parse_null(Cursor in) -> ParseResult<parse::Unit>;

/// Matches `true` or `false`.
[[nodiscard]] auto parse_bool(Cursor in) -> ParseResult<bool>;

/// Parses an optionally negative integer or `int.frac` decimal.
///
/// The integer digit-run must fit in `int64_t` (`Format` error otherwise).
/// With a fractional part, the two digit-runs are joined with `.` and the
/// resulting text is converted to `double`; the sign is applied afterwards.
[[nodiscard]] auto parse_number(Cursor in) -> ParseResult<JsonNumber>;

/// Parses a double-quoted string. Content runs to the first `"` and is not
/// unescaped.
[[nodiscard]] auto parse_string(Cursor in) -> ParseResult<std::string>;

/// Parses `[ value, ... ]` with zero or more values.
[[nodiscard]] auto parse_array(Cursor in) -> ParseResult<JsonArray>;

/// Parses `{ "key": value, ... }` with one or more pairs. Repeated keys keep
/// the last value.
[[nodiscard]] auto parse_object(Cursor in) -> ParseResult<JsonObject>;

/// Parses any JSON value. Input starting with `[` or `{` is parsed only as
/// an array or object, so a malformed container reports the error inside it.
[[nodiscard]] auto parse_value(Cursor in) -> ParseResult<JsonValue>;

// ============================================================================
// Document Entry Point
// ============================================================================

/// Parses a complete JSON document.
///
/// Leading and trailing whitespace is allowed; anything else after the value
/// is an error. On failure the lowest-level error is returned with the
/// message prefixed by `"failed to parse JSON: "`.
[[nodiscard]] auto parse_json(std::string_view input) -> Result<JsonValue, ParseError>;

} // namespace knit::json
