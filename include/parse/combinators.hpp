//! # Parser Combinators
//!
//! A parser is any callable taking a `Cursor` and returning a
//! `ParseResult<T>`: either the parsed value together with the advanced cursor,
//! or a `ParseError`. Parsers never mutate shared state, so a failed parser
//! leaves the caller free to retry another one from the same cursor.
//!
//! This header provides the token-level primitives and the generic combinators
//! that grammars are assembled from.
//!
//! ## Primitives
//!
//! | Function             | Output             | Matches                                  |
//! |----------------------|--------------------|------------------------------------------|
//! | `literal(text)`      | `std::string_view` | `text` exactly                           |
//! | `character(c)`       | `char`             | `c` exactly                              |
//! | `take_while(p, min)` | `std::string_view` | run of chars satisfying `p`              |
//! | `take_till(c, min)`  | `std::string_view` | run of chars up to (not including) `c`   |
//! | `digits()`           | `std::string_view` | one or more ASCII digits                 |
//! | `multispace0()`      | `std::string_view` | spaces, tabs, CR and LF (zero or more)   |
//! | `space0()`           | `std::string_view` | spaces and tabs (zero or more)           |
//! | `end_of_input()`     | `Unit`             | nothing left to consume                  |
//!
//! ## Combinators
//!
//! | Function                     | Output                  |
//! |------------------------------|-------------------------|
//! | `sequence(p...)`             | `std::tuple<T...>`      |
//! | `alternative(p...)`          | `T` (shared by all)     |
//! | `delimited(open, p, close)`  | output of `p`           |
//! | `preceded(a, b)`             | output of `b`           |
//! | `terminated(a, b)`           | output of `a`           |
//! | `separated_pair(a, sep, b)`  | `std::pair<A, B>`       |
//! | `separated(p, sep, min, max)`| `std::vector<T>`        |
//! | `optional(p)`                | `std::optional<T>`      |
//! | `map(p, f)`                  | `f(T)`                  |
//! | `value(p, v)`                | type of `v`             |
//! | `convert(p, f, kind)`        | `U` from `Result<U>`    |
//! | `label(p, name)`             | `T`, error gets context |
//! | `padded(p)`                  | `T`, whitespace trimmed |
//!
//! ## Example
//!
//! ```cpp
//! auto pair = separated_pair(digits(), padded(character(',')), digits());
//! auto result = pair(Cursor("12 , 34"));
//! if (is_ok(result)) {
//!     auto& [a, b] = unwrap(result).value;  // "12", "34"
//! }
//! ```

#pragma once

#include "common.hpp"
#include "parse/cursor.hpp"
#include "parse/parse_error.hpp"

#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace knit::parse {

// ============================================================================
// Parse Results
// ============================================================================

/// A successfully parsed value and the cursor just past it.
template <typename T> struct Parsed {
    T value;
    Cursor rest;
};

/// Outcome of running a parser.
template <typename T> using ParseResult = Result<Parsed<T>, ParseError>;

/// Output of parsers that match something but produce no value.
struct Unit {
    [[nodiscard]] auto operator==(const Unit&) const -> bool = default;
};

/// Builds a successful result.
template <typename T> [[nodiscard]] auto succeed(T value, Cursor rest) -> ParseResult<T> {
    return Parsed<T>{std::move(value), rest};
}

namespace detail {

template <typename R> struct parse_result_traits;

template <typename T> struct parse_result_traits<std::variant<Parsed<T>, ParseError>> {
    using value_type = T;
};

} // namespace detail

/// The value type produced by parser `P`.
template <typename P>
using output_t = typename detail::parse_result_traits<
    std::decay_t<std::invoke_result_t<const P&, Cursor>>>::value_type;

// ============================================================================
// Character Classes
// ============================================================================

inline auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

/// Space or tab.
inline auto is_space(char c) -> bool {
    return c == ' ' || c == '\t';
}

/// Space, tab, carriage return or newline.
inline auto is_multispace(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

// ============================================================================
// Primitives
// ============================================================================

/// Matches an exact string. The text must outlive the parser.
struct Literal {
    std::string_view text;

    auto operator()(Cursor in) const -> ParseResult<std::string_view>;
};

/// Matches one exact character.
struct Character {
    char expected;

    auto operator()(Cursor in) const -> ParseResult<char>;
};

/// Matches the longest run of characters satisfying a predicate.
struct TakeWhile {
    bool (*pred)(char);
    size_t min;
    const char* description;

    auto operator()(Cursor in) const -> ParseResult<std::string_view>;
};

/// Matches everything up to the first occurrence of a terminator character.
struct TakeTill {
    char terminator;
    size_t min;

    auto operator()(Cursor in) const -> ParseResult<std::string_view>;
};

/// Succeeds only when the input is exhausted.
struct EndOfInput {
    auto operator()(Cursor in) const -> ParseResult<Unit>;
};

[[nodiscard]] inline auto literal(std::string_view text) -> Literal {
    return Literal{text};
}

[[nodiscard]] inline auto character(char c) -> Character {
    return Character{c};
}

[[nodiscard]] inline auto take_while(bool (*pred)(char), size_t min,
                                     const char* description = "matching character")
    -> TakeWhile {
    return TakeWhile{pred, min, description};
}

[[nodiscard]] inline auto take_till(char terminator, size_t min = 0) -> TakeTill {
    return TakeTill{terminator, min};
}

[[nodiscard]] inline auto digits() -> TakeWhile {
    return TakeWhile{is_digit, 1, "digit"};
}

[[nodiscard]] inline auto multispace0() -> TakeWhile {
    return TakeWhile{is_multispace, 0, "whitespace"};
}

[[nodiscard]] inline auto space0() -> TakeWhile {
    return TakeWhile{is_space, 0, "space"};
}

[[nodiscard]] inline auto end_of_input() -> EndOfInput {
    return EndOfInput{};
}

// ============================================================================
// Transforming Combinators
// ============================================================================

/// Applies `f` to the output of `p`.
template <typename P, typename F> [[nodiscard]] auto map(P p, F f) {
    using Out = std::decay_t<std::invoke_result_t<const F&, output_t<P>&&>>;
    return [p, f](Cursor in) -> ParseResult<Out> {
        auto r = p(in);
        if (is_err(r)) {
            return std::move(unwrap_err(r));
        }
        auto& parsed = unwrap(r);
        return succeed<Out>(f(std::move(parsed.value)), parsed.rest);
    };
}

/// Replaces the output of `p` with a copy of `v`.
template <typename P, typename V> [[nodiscard]] auto value(P p, V v) {
    return map(std::move(p), [v](auto&&) { return v; });
}

/// Runs a fallible conversion on the output of `p`.
///
/// `f` returns `Result<U>` (string error). A conversion error becomes a
/// `ParseError` of tier `kind`, positioned at the start of the converted token.
template <typename P, typename F>
[[nodiscard]] auto convert(P p, F f, ParseErrorKind kind = ParseErrorKind::Conversion) {
    using Converted = std::decay_t<std::invoke_result_t<const F&, output_t<P>&&>>;
    using Out = std::variant_alternative_t<0, Converted>;
    return [p, f, kind](Cursor in) -> ParseResult<Out> {
        auto r = p(in);
        if (is_err(r)) {
            return std::move(unwrap_err(r));
        }
        auto& parsed = unwrap(r);
        auto converted = f(std::move(parsed.value));
        if (is_err(converted)) {
            return ParseError::make(kind, in, std::move(unwrap_err(converted)));
        }
        return succeed<Out>(std::move(unwrap(converted)), parsed.rest);
    };
}

/// Attaches `name` to the context of any error raised by `p`.
template <typename P> [[nodiscard]] auto label(P p, std::string name) {
    return [p, name](Cursor in) -> ParseResult<output_t<P>> {
        auto r = p(in);
        if (is_err(r)) {
            unwrap_err(r).with_context(name);
        }
        return r;
    };
}

/// Makes `p` optional: on failure yields `std::nullopt` without consuming.
template <typename P> [[nodiscard]] auto optional(P p) {
    using Out = std::optional<output_t<P>>;
    return [p](Cursor in) -> ParseResult<Out> {
        auto r = p(in);
        if (is_err(r)) {
            return succeed<Out>(std::nullopt, in);
        }
        auto& parsed = unwrap(r);
        return succeed<Out>(Out(std::move(parsed.value)), parsed.rest);
    };
}

// ============================================================================
// Sequencing
// ============================================================================

/// Runs parsers in order; all must succeed. Output is a tuple of their outputs.
template <typename P> [[nodiscard]] auto sequence(P p) {
    return map(std::move(p), [](auto&& v) { return std::make_tuple(std::move(v)); });
}

template <typename P, typename Q, typename... Rest>
[[nodiscard]] auto sequence(P p, Q q, Rest... rest) {
    auto tail = sequence(std::move(q), std::move(rest)...);
    using Head = output_t<P>;
    using Tail = output_t<decltype(tail)>;
    using Out = decltype(std::tuple_cat(std::declval<std::tuple<Head>>(), std::declval<Tail>()));
    return [p, tail](Cursor in) -> ParseResult<Out> {
        auto head = p(in);
        if (is_err(head)) {
            return std::move(unwrap_err(head));
        }
        auto& h = unwrap(head);
        auto others = tail(h.rest);
        if (is_err(others)) {
            return std::move(unwrap_err(others));
        }
        auto& t = unwrap(others);
        return succeed<Out>(std::tuple_cat(std::tuple<Head>(std::move(h.value)), std::move(t.value)),
                            t.rest);
    };
}

/// Runs `a` then `b`, keeping the output of `b`.
template <typename A, typename B> [[nodiscard]] auto preceded(A a, B b) {
    return map(sequence(std::move(a), std::move(b)),
               [](auto&& t) { return std::move(std::get<1>(t)); });
}

/// Runs `a` then `b`, keeping the output of `a`.
template <typename A, typename B> [[nodiscard]] auto terminated(A a, B b) {
    return map(sequence(std::move(a), std::move(b)),
               [](auto&& t) { return std::move(std::get<0>(t)); });
}

/// Runs `open`, `inner`, `close` in order, keeping the output of `inner`.
template <typename Open, typename Inner, typename Close>
[[nodiscard]] auto delimited(Open open, Inner inner, Close close) {
    return map(sequence(std::move(open), std::move(inner), std::move(close)),
               [](auto&& t) { return std::move(std::get<1>(t)); });
}

/// Runs `a`, `sep`, `b`, keeping the outputs of `a` and `b`.
template <typename A, typename Sep, typename B>
[[nodiscard]] auto separated_pair(A a, Sep sep, B b) {
    return map(sequence(std::move(a), std::move(sep), std::move(b)), [](auto&& t) {
        return std::make_pair(std::move(std::get<0>(t)), std::move(std::get<2>(t)));
    });
}

/// Skips whitespace (space, tab, CR, LF) on both sides of `p`.
template <typename P> [[nodiscard]] auto padded(P p) {
    return delimited(multispace0(), std::move(p), multispace0());
}

// ============================================================================
// Choice
// ============================================================================

/// Tries each parser from the same cursor and returns the first success.
///
/// When every alternative fails the error of the first alternative is
/// returned. No longest-match search is performed.
template <typename P, typename... Rest> [[nodiscard]] auto alternative(P p, Rest... rest) {
    using Out = output_t<P>;
    static_assert((std::is_same_v<Out, output_t<Rest>> && ...),
                  "all alternatives must produce the same type");
    return [p, rest...](Cursor in) -> ParseResult<Out> {
        auto first = p(in);
        if (is_ok(first)) {
            return first;
        }
        std::optional<ParseResult<Out>> hit;
        auto attempt = [&](const auto& alt) {
            if (hit) {
                return;
            }
            auto r = alt(in);
            if (is_ok(r)) {
                hit.emplace(std::move(r));
            }
        };
        (attempt(rest), ...);
        if (hit) {
            return std::move(*hit);
        }
        return first;
    };
}

// ============================================================================
// Repetition
// ============================================================================

/// Repeats `inner` separated by `sep`, between `min` and `max` times.
///
/// Repetition stops at the first separator-then-item step that fails; that
/// step is not consumed, so a trailing separator is left in the input for the
/// enclosing parser to reject. Fewer than `min` items is a failure carrying the
/// error of the step that stopped the repetition. An item that succeeds
/// without consuming input also stops the repetition.
template <typename Inner, typename Sep>
[[nodiscard]] auto separated(Inner inner, Sep sep, size_t min,
                             size_t max = std::numeric_limits<size_t>::max()) {
    using T = output_t<Inner>;
    return [inner, sep, min, max](Cursor in) -> ParseResult<std::vector<T>> {
        std::vector<T> items;
        if (max == 0) {
            return succeed(std::move(items), in);
        }

        auto first = inner(in);
        if (is_err(first)) {
            if (min == 0) {
                return succeed(std::move(items), in);
            }
            return std::move(unwrap_err(first));
        }
        items.push_back(std::move(unwrap(first).value));
        Cursor pos = unwrap(first).rest;

        std::optional<ParseError> stopped_by;
        while (items.size() < max) {
            auto s = sep(pos);
            if (is_err(s)) {
                stopped_by = std::move(unwrap_err(s));
                break;
            }
            auto next = inner(unwrap(s).rest);
            if (is_err(next)) {
                stopped_by = std::move(unwrap_err(next));
                break;
            }
            if (unwrap(next).rest.offset() == pos.offset()) {
                break;
            }
            items.push_back(std::move(unwrap(next).value));
            pos = unwrap(next).rest;
        }

        if (items.size() < min) {
            if (stopped_by) {
                return std::move(*stopped_by);
            }
            return ParseError::token(pos, "expected at least " + std::to_string(min) +
                                              " items, found " + std::to_string(items.size()));
        }
        return succeed(std::move(items), pos);
    };
}

} // namespace knit::parse
