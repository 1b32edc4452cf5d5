//! # JSON Serialization
//!
//! Converts `JsonValue` trees back to text.
//!
//! ## Output Formats
//!
//! | Method               | Output                                   |
//! |----------------------|------------------------------------------|
//! | `to_string()`        | Compact, no whitespace                   |
//! | `to_string_pretty()` | One element per line, indented           |
//! | `write_to()`         | Compact, streamed to an `std::ostream`   |
//!
//! ## Number Formatting
//!
//! - `Int` is written as a plain decimal integer
//! - `Float` uses the shortest fixed-notation digits that round-trip and
//!   always contains a `.`. No exponent is ever written, since the grammar
//!   has none. The output re-parses as the same float when its integer part
//!   fits in 64 bits
//! - NaN and infinity have no JSON spelling and are written as `null`
//!
//! ## Strings
//!
//! String content is written verbatim. Values hold raw literal content (see
//! `json_value.hpp`), so escaping happens once, in `escape_string`, when plain
//! text enters the model.

#include "json/json_value.hpp"

#include <charconv>
#include <cmath>
#include <ostream>
#include <system_error>

namespace knit::json {

namespace {

auto format_number(const JsonNumber& num) -> std::string {
    switch (num.kind) {
    case JsonNumber::Kind::Int:
        return std::to_string(num.i64);
    case JsonNumber::Kind::Float: {
        if (std::isnan(num.f64) || std::isinf(num.f64)) {
            return "null";
        }

        // Fixed notation of the smallest subnormal needs about 330 bytes
        char buf[512];
        auto [end, ec] =
            std::to_chars(buf, buf + sizeof(buf), num.f64, std::chars_format::fixed);
        if (ec != std::errc()) {
            return "null";
        }
        std::string result(buf, end);

        // Keep the float/int distinction visible in the output
        if (result.find('.') == std::string::npos) {
            result += ".0";
        }
        return result;
    }
    }
    return "0";
}

void serialize_compact(const JsonValue& value, std::string& out) {
    if (value.is_null()) {
        out += "null";
        return;
    }

    if (value.is_bool()) {
        out += value.as_bool() ? "true" : "false";
        return;
    }

    if (value.is_number()) {
        out += format_number(value.as_number());
        return;
    }

    if (value.is_string()) {
        out += '"';
        out += value.as_string();
        out += '"';
        return;
    }

    if (value.is_array()) {
        out += '[';
        const auto& arr = value.as_array();
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) {
                out += ',';
            }
            serialize_compact(arr[i], out);
        }
        out += ']';
        return;
    }

    out += '{';
    bool first = true;
    for (const auto& [key, val] : value.as_object()) {
        if (!first) {
            out += ',';
        }
        first = false;
        out += '"';
        out += key;
        out += "\":";
        serialize_compact(val, out);
    }
    out += '}';
}

void serialize_pretty(const JsonValue& value, std::string& out, int indent, int depth) {
    auto newline = [&](int level) {
        out += '\n';
        out.append(static_cast<size_t>(indent * level), ' ');
    };

    if (value.is_array()) {
        const auto& arr = value.as_array();
        if (arr.empty()) {
            out += "[]";
            return;
        }
        out += '[';
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) {
                out += ',';
            }
            newline(depth + 1);
            serialize_pretty(arr[i], out, indent, depth + 1);
        }
        newline(depth);
        out += ']';
        return;
    }

    if (value.is_object()) {
        const auto& obj = value.as_object();
        if (obj.empty()) {
            out += "{}";
            return;
        }
        out += '{';
        bool first = true;
        for (const auto& [key, val] : obj) {
            if (!first) {
                out += ',';
            }
            first = false;
            newline(depth + 1);
            out += '"';
            out += key;
            out += "\": ";
            serialize_pretty(val, out, indent, depth + 1);
        }
        newline(depth);
        out += '}';
        return;
    }

    serialize_compact(value, out);
}

} // namespace

auto escape_string(std::string_view text) -> std::string {
    static constexpr char HEX[] = "0123456789abcdef";

    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default: {
            auto byte = static_cast<unsigned char>(c);
            if (byte < 0x20) {
                out += "\\u00";
                out += HEX[byte >> 4];
                out += HEX[byte & 0x0F];
            } else {
                out += c;
            }
        }
        }
    }
    return out;
}

auto JsonValue::to_string() const -> std::string {
    std::string out;
    serialize_compact(*this, out);
    return out;
}

auto JsonValue::to_string_pretty(int indent) const -> std::string {
    std::string out;
    serialize_pretty(*this, out, indent, 0);
    return out;
}

auto JsonValue::write_to(std::ostream& os) const -> std::ostream& {
    return os << to_string();
}

auto operator<<(std::ostream& os, const JsonValue& value) -> std::ostream& {
    return value.write_to(os);
}

} // namespace knit::json
