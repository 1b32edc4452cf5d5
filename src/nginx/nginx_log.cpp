//! # NGINX Log Record Implementation
//!
//! Enum conversions, display forms and JSON conversion for log records.

#include "nginx/nginx_log.hpp"

#include <iomanip>
#include <limits>
#include <sstream>

namespace knit::nginx {

// ============================================================================
// HTTP Enumerations
// ============================================================================

auto http_method_from_string(std::string_view token) -> Result<HttpMethod> {
    if (token == "GET")
        return HttpMethod::Get;
    if (token == "POST")
        return HttpMethod::Post;
    if (token == "PUT")
        return HttpMethod::Put;
    if (token == "DELETE")
        return HttpMethod::Delete;
    if (token == "HEAD")
        return HttpMethod::Head;
    if (token == "OPTIONS")
        return HttpMethod::Options;
    if (token == "CONNECT")
        return HttpMethod::Connect;
    if (token == "TRACE")
        return HttpMethod::Trace;
    if (token == "PATCH")
        return HttpMethod::Patch;
    return "unknown HTTP method '" + std::string(token) + "'";
}

auto http_version_from_string(std::string_view token) -> Result<HttpVersion> {
    if (token == "HTTP/1.0")
        return HttpVersion::Http10;
    if (token == "HTTP/1.1")
        return HttpVersion::Http11;
    if (token == "HTTP/2.0")
        return HttpVersion::Http20;
    if (token == "HTTP/3.0")
        return HttpVersion::Http30;
    return "unknown HTTP version '" + std::string(token) + "'";
}

auto to_string(HttpMethod method) -> std::string_view {
    switch (method) {
    case HttpMethod::Get:
        return "GET";
    case HttpMethod::Post:
        return "POST";
    case HttpMethod::Put:
        return "PUT";
    case HttpMethod::Delete:
        return "DELETE";
    case HttpMethod::Head:
        return "HEAD";
    case HttpMethod::Options:
        return "OPTIONS";
    case HttpMethod::Connect:
        return "CONNECT";
    case HttpMethod::Trace:
        return "TRACE";
    case HttpMethod::Patch:
        return "PATCH";
    }
    return "?";
}

auto to_string(HttpVersion version) -> std::string_view {
    switch (version) {
    case HttpVersion::Http10:
        return "HTTP/1.0";
    case HttpVersion::Http11:
        return "HTTP/1.1";
    case HttpVersion::Http20:
        return "HTTP/2.0";
    case HttpVersion::Http30:
        return "HTTP/3.0";
    }
    return "?";
}

// ============================================================================
// Address and Time
// ============================================================================

auto Ipv4Address::to_string() const -> std::string {
    std::string out;
    for (size_t i = 0; i < octets.size(); ++i) {
        if (i > 0) {
            out += '.';
        }
        out += std::to_string(octets[i]);
    }
    return out;
}

auto format_timestamp(Timestamp ts) -> std::string {
    using namespace std::chrono;

    auto day = floor<days>(ts);
    year_month_day ymd{day};
    hh_mm_ss<seconds> tod{ts - day};

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-' << std::setw(2)
        << static_cast<unsigned>(ymd.day()) << 'T' << std::setw(2) << tod.hours().count() << ':'
        << std::setw(2) << tod.minutes().count() << ':' << std::setw(2) << tod.seconds().count()
        << 'Z';
    return oss.str();
}

// ============================================================================
// JSON Conversion
// ============================================================================

auto to_json(const NginxLogRecord& record) -> json::JsonValue {
    json::JsonObject obj;
    obj["address"] = json::json_string(record.address.to_string());
    obj["timestamp"] = json::json_string(format_timestamp(record.timestamp));
    obj["method"] = json::json_string(std::string(to_string(record.method)));
    obj["path"] = json::json_string(json::escape_string(record.path));
    obj["http_version"] = json::json_string(std::string(to_string(record.http_version)));
    obj["status"] = json::json_int(record.status);

    // Sizes beyond the Int range fall back to Float
    if (record.size > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        obj["size"] = json::json_float(static_cast<double>(record.size));
    } else {
        obj["size"] = json::json_int(static_cast<int64_t>(record.size));
    }

    obj["referer"] = json::json_string(json::escape_string(record.referer));
    obj["user_agent"] = json::json_string(json::escape_string(record.user_agent));
    return json::JsonValue(std::move(obj));
}

} // namespace knit::nginx
