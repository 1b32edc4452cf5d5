//! # JSON Parser Implementation
//!
//! Each rule builds its combinator once (function-local static) and applies it
//! to the incoming cursor. Array and object rules recurse through
//! `parse_value`, so nesting depth is limited only by the call stack.

#include "json/json_parser.hpp"

#include "log/log.hpp"

#include <charconv>
#include <system_error>
#include <utility>
#include <vector>

namespace knit::json {

using parse::alternative;
using parse::character;
using parse::delimited;
using parse::digits;
using parse::label;
using parse::literal;
using parse::padded;
using parse::separated;
using parse::separated_pair;
using parse::succeed;
using parse::Unit;

auto parse_null(Cursor in) -> ParseResult<Unit> {
    static const auto null_literal = parse::value(literal("null"), Unit{});
    return null_literal(in);
}

auto parse_bool(Cursor in) -> ParseResult<bool> {
    static const auto boolean = alternative(parse::value(literal("true"), true),
                                            parse::value(literal("false"), false));
    return boolean(in);
}

auto parse_number(Cursor in) -> ParseResult<JsonNumber> {
    static const auto sign = parse::optional(character('-'));
    static const auto integer = label(digits(), "integer part");
    static const auto fraction = label(parse::preceded(character('.'), digits()), "fraction");

    auto sign_result = sign(in);
    if (is_err(sign_result)) {
        return std::move(unwrap_err(sign_result));
    }
    bool negative = unwrap(sign_result).value.has_value();
    Cursor int_start = unwrap(sign_result).rest;

    auto int_result = integer(int_start);
    if (is_err(int_result)) {
        return std::move(unwrap_err(int_result));
    }
    std::string_view int_digits = unwrap(int_result).value;
    Cursor after_int = unwrap(int_result).rest;

    int64_t int_value = 0;
    auto [int_end, int_ec] =
        std::from_chars(int_digits.data(), int_digits.data() + int_digits.size(), int_value);
    if (int_ec != std::errc() || int_end != int_digits.data() + int_digits.size()) {
        return ParseError::format(int_start, "integer '" + std::string(int_digits) +
                                                 "' does not fit in 64 bits");
    }

    if (after_int.peek() != '.') {
        return succeed(JsonNumber(negative ? -int_value : int_value), after_int);
    }

    auto frac_result = fraction(after_int);
    if (is_err(frac_result)) {
        return std::move(unwrap_err(frac_result));
    }
    std::string_view frac_digits = unwrap(frac_result).value;

    std::string text;
    text.reserve(int_digits.size() + 1 + frac_digits.size());
    text.append(int_digits).append(".").append(frac_digits);

    double float_value = 0.0;
    auto [float_end, float_ec] =
        std::from_chars(text.data(), text.data() + text.size(), float_value);
    if (float_ec != std::errc() || float_end != text.data() + text.size()) {
        return ParseError::format(int_start, "invalid float literal '" + text + "'");
    }

    return succeed(JsonNumber(negative ? -float_value : float_value), unwrap(frac_result).rest);
}

auto parse_string(Cursor in) -> ParseResult<std::string> {
    static const auto quoted = parse::map(
        delimited(character('"'), parse::take_till('"'), character('"')),
        [](std::string_view content) { return std::string(content); });
    return quoted(in);
}

auto parse_array(Cursor in) -> ParseResult<JsonArray> {
    static const auto array = label(delimited(padded(character('[')),
                                              separated(parse_value, padded(character(',')), 0),
                                              padded(character(']'))),
                                    "json array");
    return array(in);
}

auto parse_object(Cursor in) -> ParseResult<JsonObject> {
    static const auto pair = separated_pair(parse_string, padded(character(':')), parse_value);
    static const auto object = label(
        parse::map(delimited(padded(character('{')), separated(pair, padded(character(',')), 1),
                             padded(character('}'))),
                   [](std::vector<std::pair<std::string, JsonValue>>&& pairs) {
                       JsonObject obj;
                       for (auto& [key, val] : pairs) {
                           obj.insert_or_assign(std::move(key), std::move(val));
                       }
                       return obj;
                   }),
        "json object");
    return object(in);
}

auto parse_value(Cursor in) -> ParseResult<JsonValue> {
    static const auto scalar = label(
        alternative(parse::map(parse_null, [](Unit) { return JsonValue(); }),
                    parse::map(parse_bool, [](bool b) { return JsonValue(b); }),
                    parse::map(parse_number, [](JsonNumber n) { return JsonValue(n); }),
                    parse::map(parse_string,
                               [](std::string&& s) { return JsonValue(std::move(s)); })),
        "json value");
    static const auto array = label(
        parse::map(parse_array, [](JsonArray&& a) { return JsonValue(std::move(a)); }),
        "json value");
    static const auto object = label(
        parse::map(parse_object, [](JsonObject&& o) { return JsonValue(std::move(o)); }),
        "json value");

    // '[' and '{' open nothing but containers, so a failed container reports
    // its own error instead of a scalar alternative's.
    auto text = in.remaining();
    auto first = text.find_first_not_of(" \t\r\n");
    if (first != std::string_view::npos) {
        if (text[first] == '[') {
            return array(in);
        }
        if (text[first] == '{') {
            return object(in);
        }
    }
    return scalar(in);
}

auto parse_json(std::string_view input) -> Result<JsonValue, ParseError> {
    static const auto document = delimited(parse::multispace0(), parse_value,
                                            parse::preceded(parse::multispace0(),
                                                            parse::end_of_input()));

    KNIT_LOG_TRACE("json", "parsing document of " << input.size() << " bytes");

    auto result = document(Cursor(input));
    if (is_err(result)) {
        auto& err = unwrap_err(result);
        err.locate(input);
        err.message = "failed to parse JSON: " + err.message;
        KNIT_LOG_DEBUG("json", err.to_string());
        return std::move(err);
    }

    auto& parsed = unwrap(result);
    KNIT_LOG_TRACE("json", "parsed " << parsed.value.size() << "-element document");
    return std::move(parsed.value);
}

} // namespace knit::json
