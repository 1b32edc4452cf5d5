//! # NGINX Combined Log Parser Implementation
//!
//! Field parsers are combinator values built once per process. Numeric
//! conversions go through `std::from_chars`, so out-of-range values are
//! reported instead of wrapping.

#include "nginx/nginx_parser.hpp"

#include "log/log.hpp"

#include <array>
#include <charconv>
#include <system_error>
#include <utility>
#include <vector>

namespace knit::nginx {

using parse::ParseErrorKind;

namespace {

constexpr std::array<std::string_view, 12> MONTH_NAMES = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

/// Method and version tokens stop at a space or the closing quote.
auto is_token_char(char c) -> bool {
    return c != ' ' && c != '"';
}

auto is_path_char(char c) -> bool {
    return c != ' ';
}

template <typename T> auto parse_unsigned(std::string_view text, const char* what) -> Result<T> {
    T value{};
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size()) {
        return std::string(what) + " '" + std::string(text) + "' is out of range";
    }
    return value;
}

/// Reads `min` to `max` leading digits of `text` into `out`.
auto take_number(std::string_view& text, size_t min, size_t max, int& out) -> bool {
    size_t n = 0;
    while (n < max && n < text.size() && parse::is_digit(text[n])) {
        ++n;
    }
    if (n < min) {
        return false;
    }
    out = 0;
    for (size_t i = 0; i < n; ++i) {
        out = out * 10 + (text[i] - '0');
    }
    text.remove_prefix(n);
    return true;
}

auto take_char(std::string_view& text, char c) -> bool {
    if (text.empty() || text.front() != c) {
        return false;
    }
    text.remove_prefix(1);
    return true;
}

auto take_month(std::string_view& text, unsigned& out) -> bool {
    for (size_t i = 0; i < MONTH_NAMES.size(); ++i) {
        if (text.starts_with(MONTH_NAMES[i])) {
            out = static_cast<unsigned>(i + 1);
            text.remove_prefix(MONTH_NAMES[i].size());
            return true;
        }
    }
    return false;
}

/// Consumes the spaces and tabs after a field.
template <typename P> auto field(P p) {
    return parse::terminated(std::move(p), parse::space0());
}

auto parse_octet(Cursor in) -> ParseResult<uint8_t> {
    static const auto octet = parse::convert(
        parse::digits(), [](std::string_view text) { return parse_unsigned<uint8_t>(text, "octet"); },
        ParseErrorKind::Format);
    return octet(in);
}

} // namespace

// ============================================================================
// Field Parsers
// ============================================================================

auto parse_ipv4(Cursor in) -> ParseResult<Ipv4Address> {
    static const auto address =
        parse::map(parse::separated(parse_octet, parse::character('.'), 4, 4),
                   [](std::vector<uint8_t>&& octets) {
                       Ipv4Address addr;
                       for (size_t i = 0; i < addr.octets.size(); ++i) {
                           addr.octets[i] = octets[i];
                       }
                       return addr;
                   });
    return address(in);
}

auto parse_identity(Cursor in) -> ParseResult<std::string_view> {
    static const auto identity = parse::literal("- - ");
    return identity(in);
}

auto timestamp_from_string(std::string_view text) -> Result<Timestamp> {
    using namespace std::chrono;

    auto fail = [&](const char* what) -> Result<Timestamp> {
        return "invalid " + std::string(what) + " in timestamp '" + std::string(text) + "'";
    };

    std::string_view rest = text;
    int day_num = 0;
    unsigned month_num = 0;
    int year_num = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int zone = 0;

    if (!take_number(rest, 1, 2, day_num) || !take_char(rest, '/'))
        return fail("day");
    if (!take_month(rest, month_num) || !take_char(rest, '/'))
        return fail("month");
    if (!take_number(rest, 4, 4, year_num) || !take_char(rest, ':'))
        return fail("year");
    if (!take_number(rest, 2, 2, hour) || !take_char(rest, ':') || hour > 23)
        return fail("hour");
    if (!take_number(rest, 2, 2, minute) || !take_char(rest, ':') || minute > 59)
        return fail("minute");
    if (!take_number(rest, 2, 2, second) || second > 59)
        return fail("second");
    if (!take_char(rest, ' '))
        return fail("zone separator");

    int zone_sign = 1;
    if (take_char(rest, '-')) {
        zone_sign = -1;
    } else if (!take_char(rest, '+')) {
        return fail("zone sign");
    }
    if (!take_number(rest, 4, 4, zone) || !rest.empty())
        return fail("zone offset");
    int zone_hours = zone / 100;
    int zone_minutes = zone % 100;
    if (zone_hours > 23 || zone_minutes > 59)
        return fail("zone offset");

    year_month_day ymd{year{year_num}, month{month_num}, std::chrono::day{static_cast<unsigned>(day_num)}};
    if (!ymd.ok())
        return fail("date");

    Timestamp local = sys_days{ymd} + hours{hour} + minutes{minute} + seconds{second};
    seconds offset = hours{zone_hours} + minutes{zone_minutes};
    return Timestamp{local - zone_sign * offset};
}

auto parse_timestamp(Cursor in) -> ParseResult<Timestamp> {
    static const auto timestamp = parse::delimited(
        parse::character('['),
        parse::convert(parse::take_till(']'), timestamp_from_string, ParseErrorKind::Format),
        parse::character(']'));
    return timestamp(in);
}

auto parse_request_line(Cursor in) -> ParseResult<RequestLine> {
    static const auto method = parse::convert(parse::take_while(is_token_char, 1, "HTTP method"),
                                              http_method_from_string);
    static const auto path = parse::map(parse::take_while(is_path_char, 1, "request path"),
                                        [](std::string_view p) { return std::string(p); });
    static const auto version = parse::convert(
        parse::take_while(is_token_char, 1, "HTTP version"), http_version_from_string);
    static const auto request = parse::map(
        parse::delimited(parse::character('"'),
                         parse::sequence(field(method), field(path), version),
                         parse::character('"')),
        [](auto&& parts) {
            RequestLine line;
            line.method = std::get<0>(parts);
            line.path = std::move(std::get<1>(parts));
            line.version = std::get<2>(parts);
            return line;
        });
    return request(in);
}

auto parse_status(Cursor in) -> ParseResult<uint16_t> {
    static const auto status = parse::convert(
        parse::digits(),
        [](std::string_view text) { return parse_unsigned<uint16_t>(text, "status code"); },
        ParseErrorKind::Format);
    return status(in);
}

auto parse_size(Cursor in) -> ParseResult<uint64_t> {
    static const auto size = parse::convert(
        parse::digits(),
        [](std::string_view text) { return parse_unsigned<uint64_t>(text, "response size"); },
        ParseErrorKind::Format);
    return size(in);
}

auto parse_quoted(Cursor in) -> ParseResult<std::string> {
    static const auto quoted = parse::map(
        parse::delimited(parse::character('"'), parse::take_till('"', 1), parse::character('"')),
        [](std::string_view text) { return std::string(text); });
    return quoted(in);
}

// ============================================================================
// Line Entry Point
// ============================================================================

auto parse_nginx_log(std::string_view line) -> Result<NginxLogRecord, ParseError> {
    using parse::label;

    static const auto record = parse::map(
        parse::sequence(field(label(parse_ipv4, "address")),
                        field(label(parse_identity, "identity")),
                        field(label(parse_timestamp, "timestamp")),
                        field(label(parse_request_line, "request line")),
                        field(label(parse_status, "status")), field(label(parse_size, "size")),
                        field(label(parse_quoted, "referer")),
                        field(label(parse_quoted, "user agent")), parse::end_of_input()),
        [](auto&& fields) {
            NginxLogRecord rec;
            rec.address = std::get<0>(fields);
            rec.timestamp = std::get<2>(fields);
            auto& request = std::get<3>(fields);
            rec.method = request.method;
            rec.path = std::move(request.path);
            rec.http_version = request.version;
            rec.status = std::get<4>(fields);
            rec.size = std::get<5>(fields);
            rec.referer = std::move(std::get<6>(fields));
            rec.user_agent = std::move(std::get<7>(fields));
            return rec;
        });

    KNIT_LOG_TRACE("nginx", "parsing line of " << line.size() << " bytes");

    auto result = record(Cursor(line));
    if (is_err(result)) {
        auto& err = unwrap_err(result);
        err.locate(line).with_context("nginx log line");
        KNIT_LOG_DEBUG("nginx", err.to_string());
        return std::move(err);
    }

    auto& parsed = unwrap(result);
    KNIT_LOG_TRACE("nginx", "parsed " << to_string(parsed.value.method) << " "
                                      << parsed.value.path << " -> " << parsed.value.status);
    return std::move(parsed.value);
}

} // namespace knit::nginx
