//! # NGINX Log Record
//!
//! Typed output of the combined-log-line grammar in `nginx/nginx_parser.hpp`.
//!
//! ## Fields
//!
//! | Field          | Type            | Source token                       |
//! |----------------|-----------------|------------------------------------|
//! | `address`      | `Ipv4Address`   | `93.180.71.3`                      |
//! | `timestamp`    | `Timestamp`     | `[17/May/2015:08:05:32 +0000]`     |
//! | `method`       | `HttpMethod`    | `GET`                              |
//! | `path`         | `std::string`   | `/downloads/product_1`             |
//! | `http_version` | `HttpVersion`   | `HTTP/1.1`                         |
//! | `status`       | `uint16_t`      | `304`                              |
//! | `size`         | `uint64_t`      | `0`                                |
//! | `referer`      | `std::string`   | `"-"`                              |
//! | `user_agent`   | `std::string`   | `"Debian APT-HTTP/1.3 (...)"`      |
//!
//! A record only exists fully populated; the parser never returns one with
//! missing or defaulted fields.

#pragma once

#include "common.hpp"
#include "json/json_value.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace knit::nginx {

// ============================================================================
// HTTP Enumerations
// ============================================================================

/// Request methods accepted in the request line.
enum class HttpMethod : uint8_t {
    Get,
    Post,
    Put,
    Delete,
    Head,
    Options,
    Connect,
    Trace,
    Patch,
};

/// Protocol versions accepted in the request line.
enum class HttpVersion : uint8_t {
    Http10, ///< `HTTP/1.0`
    Http11, ///< `HTTP/1.1`
    Http20, ///< `HTTP/2.0`
    Http30, ///< `HTTP/3.0`
};

/// Converts an upper-case method token (`"GET"`, `"POST"`, ...).
///
/// Matching is exact; any other token is an error naming it.
[[nodiscard]] auto http_method_from_string(std::string_view token) -> Result<HttpMethod>;

/// Converts a version token (`"HTTP/1.0"`, `"HTTP/1.1"`, `"HTTP/2.0"`, `"HTTP/3.0"`).
[[nodiscard]] auto http_version_from_string(std::string_view token) -> Result<HttpVersion>;

[[nodiscard]] auto to_string(HttpMethod method) -> std::string_view;

[[nodiscard]] auto to_string(HttpVersion version) -> std::string_view;

// ============================================================================
// Address and Time
// ============================================================================

/// An IPv4 address as four octets, most significant first.
struct Ipv4Address {
    std::array<uint8_t, 4> octets{};

    /// Dotted-quad form, e.g. `"93.180.71.3"`.
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto operator==(const Ipv4Address& other) const -> bool = default;
};

/// An absolute UTC instant with second resolution.
using Timestamp = std::chrono::sys_seconds;

/// Formats a timestamp as ISO-8601 UTC: `YYYY-MM-DDTHH:MM:SSZ`.
[[nodiscard]] auto format_timestamp(Timestamp ts) -> std::string;

// ============================================================================
// Log Record
// ============================================================================

/// One parsed line of the NGINX combined log format.
struct NginxLogRecord {
    Ipv4Address address;
    Timestamp timestamp;
    HttpMethod method = HttpMethod::Get;
    std::string path;
    HttpVersion http_version = HttpVersion::Http11;
    uint16_t status = 0;
    uint64_t size = 0;
    std::string referer;
    std::string user_agent;

    [[nodiscard]] auto operator==(const NginxLogRecord& other) const -> bool = default;
};

/// Converts a record to a JSON object.
///
/// Keys are the field names. The address, timestamp, method and version are
/// written with their `to_string` forms; status and size are integers. The
/// free-text fields (`path`, `referer`, `user_agent`) go through
/// `json::escape_string`, so a `"` or `\` in them yields valid JSON.
///
/// # Example
///
/// ```cpp
/// auto json = to_json(record);
/// std::cout << json.to_string() << std::endl;
/// // {"address":"93.180.71.3","http_version":"HTTP/1.1",...}
/// ```
[[nodiscard]] auto to_json(const NginxLogRecord& record) -> json::JsonValue;

} // namespace knit::nginx
