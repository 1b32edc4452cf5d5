//! # NGINX Combined Log Parser
//!
//! Parses one line of the NGINX combined log format into an `NginxLogRecord`:
//!
//! ```text
//! 93.180.71.3 - - [17/May/2015:08:05:32 +0000] "GET /downloads/product_1 HTTP/1.1" 304 0 "-" "Debian APT-HTTP/1.3"
//! ^address    ^ident ^timestamp                 ^request line                          ^status ^size ^referer ^user agent
//! ```
//!
//! Fields are parsed strictly left to right. The field parsers below match
//! only their own token; `parse_nginx_log` consumes the run of spaces and tabs
//! after each field and requires the line to end after the user agent. The
//! first failing field aborts the whole line.

#pragma once

#include "common.hpp"
#include "nginx/nginx_log.hpp"
#include "parse/combinators.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace knit::nginx {

using parse::Cursor;
using parse::ParseError;
using parse::ParseResult;

/// Method, path and version from the quoted request line.
struct RequestLine {
    HttpMethod method = HttpMethod::Get;
    std::string path;
    HttpVersion version = HttpVersion::Http11;
};

// ============================================================================
// Field Parsers
// ============================================================================

/// Parses a dotted-quad address. Each of the four groups must be a decimal
/// number in 0-255 (`Format` error otherwise).
[[nodiscard]] auto parse_ipv4(Cursor in) -> ParseResult<Ipv4Address>;

/// Matches the two unused identity fields, the literal `"- - "`.
[[nodiscard]] auto parse_identity(Cursor in) -> ParseResult<std::string_view>;

/// Decodes `DD/Mon/YYYY:HH:MM:SS +ZZZZ` into a UTC instant.
///
/// The day has one or two digits, the month is an English three-letter
/// abbreviation (`Jan` ... `Dec`), the other numeric fields have fixed widths.
/// The zone offset is subtracted. Invalid dates and out-of-range times are
/// errors.
///
/// # Example
///
/// ```cpp
/// auto ts = timestamp_from_string("17/May/2015:10:05:32 +0200");
/// format_timestamp(unwrap(ts));  // "2015-05-17T08:05:32Z"
/// ```
[[nodiscard]] auto timestamp_from_string(std::string_view text) -> Result<Timestamp>;

/// Parses `[...]` and decodes the interior with `timestamp_from_string`.
[[nodiscard]] auto parse_timestamp(Cursor in) -> ParseResult<Timestamp>;

/// Parses `"METHOD path VERSION"`. Unknown methods and versions are
/// `Conversion` errors.
[[nodiscard]] auto parse_request_line(Cursor in) -> ParseResult<RequestLine>;

/// Parses a decimal status code into `uint16_t`.
[[nodiscard]] auto parse_status(Cursor in) -> ParseResult<uint16_t>;

/// Parses a decimal response size into `uint64_t`.
[[nodiscard]] auto parse_size(Cursor in) -> ParseResult<uint64_t>;

/// Parses a non-empty double-quoted string, taken literally.
[[nodiscard]] auto parse_quoted(Cursor in) -> ParseResult<std::string>;

// ============================================================================
// Line Entry Point
// ============================================================================

/// Parses one complete log line (without its line terminator).
[[nodiscard]] auto parse_nginx_log(std::string_view line) -> Result<NginxLogRecord, ParseError>;

} // namespace knit::nginx
