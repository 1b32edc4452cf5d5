//! # Primitive Parsers
//!
//! Token-level matchers. Each one either consumes a prefix of the remaining
//! input or fails with a `Token` error positioned at the cursor it was given.

#include "parse/combinators.hpp"

namespace knit::parse {

namespace {

auto quote(std::string_view text) -> std::string {
    return "'" + std::string(text) + "'";
}

} // namespace

auto Literal::operator()(Cursor in) const -> ParseResult<std::string_view> {
    if (!in.starts_with(text)) {
        return ParseError::token(in, "expected " + quote(text));
    }
    return succeed(in.remaining().substr(0, text.size()), in.advance(text.size()));
}

auto Character::operator()(Cursor in) const -> ParseResult<char> {
    if (in.at_end() || in.peek() != expected) {
        return ParseError::token(in, "expected " + quote(std::string_view(&expected, 1)));
    }
    return succeed(expected, in.advance(1));
}

auto TakeWhile::operator()(Cursor in) const -> ParseResult<std::string_view> {
    auto rest = in.remaining();
    size_t len = 0;
    while (len < rest.size() && pred(rest[len])) {
        ++len;
    }
    if (len < min) {
        std::string msg = "expected " + std::string(description);
        if (min > 1) {
            msg += " (at least " + std::to_string(min) + ")";
        }
        return ParseError::token(in.advance(len), std::move(msg));
    }
    return succeed(rest.substr(0, len), in.advance(len));
}

auto TakeTill::operator()(Cursor in) const -> ParseResult<std::string_view> {
    auto rest = in.remaining();
    auto end = rest.find(terminator);
    if (end == std::string_view::npos) {
        return ParseError::token(in.advance(rest.size()),
                                 "expected " + quote(std::string_view(&terminator, 1)));
    }
    if (end < min) {
        return ParseError::token(in, "expected at least " + std::to_string(min) +
                                         " character(s) before " +
                                         quote(std::string_view(&terminator, 1)));
    }
    return succeed(rest.substr(0, end), in.advance(end));
}

auto EndOfInput::operator()(Cursor in) const -> ParseResult<Unit> {
    if (!in.at_end()) {
        return ParseError::token(in, "expected end of input");
    }
    return succeed(Unit{}, in);
}

} // namespace knit::parse
