//! # Combinator Tests
//!
//! Primitive matchers and the generic combinators, independent of any
//! grammar.
//!
//! ## Test Coverage
//!
//! - Primitives: literal, character, take_while, take_till, digits, end of input
//! - Sequencing and delimiting
//! - Ordered alternation and backtracking
//! - Separated repetition (minimum counts, trailing separators, exact counts)
//! - Mapping, conversion and labels

#include "parse/combinators.hpp"

#include <gtest/gtest.h>
#include <string>
#include <string_view>
#include <vector>

using namespace knit;
using namespace knit::parse;

namespace {

auto to_int(std::string_view text) -> int {
    return std::stoi(std::string(text));
}

auto is_alpha(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

} // namespace

// ============================================================================
// Primitives
// ============================================================================

TEST(PrimitiveTest, LiteralMatches) {
    auto r = literal("null")(Cursor("null, 1"));
    ASSERT_TRUE(is_ok(r));
    EXPECT_EQ(unwrap(r).value, "null");
    EXPECT_EQ(unwrap(r).rest.remaining(), ", 1");
}

TEST(PrimitiveTest, LiteralFailsWithoutConsuming) {
    auto r = literal("true")(Cursor("tru"));
    ASSERT_TRUE(is_err(r));
    const auto& err = unwrap_err(r);
    EXPECT_EQ(err.kind, ParseErrorKind::Token);
    EXPECT_EQ(err.offset, 0u);
    EXPECT_EQ(err.message, "expected 'true'");
}

TEST(PrimitiveTest, CharacterMatches) {
    auto r = character('[')(Cursor("[]"));
    ASSERT_TRUE(is_ok(r));
    EXPECT_EQ(unwrap(r).value, '[');
    EXPECT_EQ(unwrap(r).rest.offset(), 1u);
}

TEST(PrimitiveTest, CharacterFailsAtEnd) {
    auto r = character(']')(Cursor(""));
    ASSERT_TRUE(is_err(r));
    EXPECT_EQ(unwrap_err(r).near, "");
}

TEST(PrimitiveTest, TakeWhileLongestRun) {
    auto r = take_while(is_alpha, 1, "letter")(Cursor("abc123"));
    ASSERT_TRUE(is_ok(r));
    EXPECT_EQ(unwrap(r).value, "abc");
    EXPECT_EQ(unwrap(r).rest.remaining(), "123");
}

TEST(PrimitiveTest, TakeWhileBelowMinimum) {
    auto r = take_while(is_alpha, 1, "letter")(Cursor("123"));
    ASSERT_TRUE(is_err(r));
    EXPECT_EQ(unwrap_err(r).message, "expected letter");
}

TEST(PrimitiveTest, TakeWhileZeroMinimumMatchesNothing) {
    auto r = multispace0()(Cursor("x"));
    ASSERT_TRUE(is_ok(r));
    EXPECT_EQ(unwrap(r).value, "");
    EXPECT_EQ(unwrap(r).rest.offset(), 0u);
}

TEST(PrimitiveTest, DigitsRequiresOne) {
    EXPECT_TRUE(is_ok(digits()(Cursor("0"))));
    EXPECT_TRUE(is_err(digits()(Cursor("-1"))));
    EXPECT_TRUE(is_err(digits()(Cursor(""))));
}

TEST(PrimitiveTest, TakeTillStopsBeforeTerminator) {
    auto r = take_till('"')(Cursor("abc\" rest"));
    ASSERT_TRUE(is_ok(r));
    EXPECT_EQ(unwrap(r).value, "abc");
    EXPECT_EQ(unwrap(r).rest.peek(), '"');
}

TEST(PrimitiveTest, TakeTillFailsWithoutTerminator) {
    auto r = take_till(']')(Cursor("no bracket"));
    ASSERT_TRUE(is_err(r));
    EXPECT_EQ(unwrap_err(r).message, "expected ']'");
}

TEST(PrimitiveTest, TakeTillMinimumLength) {
    EXPECT_TRUE(is_ok(take_till('"')(Cursor("\""))));
    EXPECT_TRUE(is_err(take_till('"', 1)(Cursor("\""))));
}

TEST(PrimitiveTest, SpaceZeroDoesNotCrossNewline) {
    auto r = space0()(Cursor(" \t\nx"));
    ASSERT_TRUE(is_ok(r));
    EXPECT_EQ(unwrap(r).value, " \t");
}

TEST(PrimitiveTest, EndOfInput) {
    EXPECT_TRUE(is_ok(end_of_input()(Cursor(""))));
    auto r = end_of_input()(Cursor("x"));
    ASSERT_TRUE(is_err(r));
    EXPECT_EQ(unwrap_err(r).message, "expected end of input");
}

// ============================================================================
// Sequencing
// ============================================================================

TEST(SequenceTest, CollectsAllOutputs) {
    auto p = sequence(character('a'), digits(), literal("zz"));
    auto r = p(Cursor("a42zz!"));
    ASSERT_TRUE(is_ok(r));
    auto& [a, n, z] = unwrap(r).value;
    EXPECT_EQ(a, 'a');
    EXPECT_EQ(n, "42");
    EXPECT_EQ(z, "zz");
    EXPECT_EQ(unwrap(r).rest.remaining(), "!");
}

TEST(SequenceTest, FailsAtFirstFailingStep) {
    auto p = sequence(character('a'), digits(), literal("zz"));
    auto r = p(Cursor("a42z"));
    ASSERT_TRUE(is_err(r));
    EXPECT_EQ(unwrap_err(r).offset, 3u);
}

TEST(SequenceTest, DelimitedKeepsInner) {
    auto p = delimited(character('('), digits(), character(')'));
    auto r = p(Cursor("(123)"));
    ASSERT_TRUE(is_ok(r));
    EXPECT_EQ(unwrap(r).value, "123");
    EXPECT_TRUE(unwrap(r).rest.at_end());
}

TEST(SequenceTest, DelimitedMissingClose) {
    auto p = delimited(character('('), digits(), character(')'));
    auto r = p(Cursor("(123"));
    ASSERT_TRUE(is_err(r));
    EXPECT_EQ(unwrap_err(r).message, "expected ')'");
}

TEST(SequenceTest, PrecededAndTerminated) {
    auto pre = preceded(character('-'), digits());
    auto post = terminated(digits(), character(';'));

    auto r1 = pre(Cursor("-5"));
    ASSERT_TRUE(is_ok(r1));
    EXPECT_EQ(unwrap(r1).value, "5");

    auto r2 = post(Cursor("7;"));
    ASSERT_TRUE(is_ok(r2));
    EXPECT_EQ(unwrap(r2).value, "7");
    EXPECT_TRUE(unwrap(r2).rest.at_end());
}

TEST(SequenceTest, SeparatedPair) {
    auto p = separated_pair(digits(), padded(character(',')), digits());
    auto r = p(Cursor("12 , 34"));
    ASSERT_TRUE(is_ok(r));
    EXPECT_EQ(unwrap(r).value.first, "12");
    EXPECT_EQ(unwrap(r).value.second, "34");
}

TEST(SequenceTest, PaddedSkipsAllWhitespaceKinds) {
    auto p = padded(character(':'));
    auto r = p(Cursor(" \t\r\n:\n x"));
    ASSERT_TRUE(is_ok(r));
    EXPECT_EQ(unwrap(r).rest.remaining(), "x");
}

// ============================================================================
// Alternation
// ============================================================================

TEST(AlternativeTest, FirstSuccessWins) {
    auto p = alternative(literal("ab"), literal("abc"));
    auto r = p(Cursor("abc"));
    ASSERT_TRUE(is_ok(r));
    EXPECT_EQ(unwrap(r).value, "ab");
}

TEST(AlternativeTest, BacktracksAfterPartialMatch) {
    // First branch consumes "a" before failing; the second starts over
    auto p = alternative(map(sequence(character('a'), character('x')), [](auto&&) { return 1; }),
                         map(sequence(character('a'), character('b')), [](auto&&) { return 2; }));
    auto r = p(Cursor("ab"));
    ASSERT_TRUE(is_ok(r));
    EXPECT_EQ(unwrap(r).value, 2);
    EXPECT_TRUE(unwrap(r).rest.at_end());
}

TEST(AlternativeTest, AllFailReportsFirstAlternative) {
    auto p = alternative(literal("true"), literal("false"));
    auto r = p(Cursor("maybe"));
    ASSERT_TRUE(is_err(r));
    EXPECT_EQ(unwrap_err(r).message, "expected 'true'");
    EXPECT_EQ(unwrap_err(r).offset, 0u);
}

// ============================================================================
// Repetition
// ============================================================================

TEST(SeparatedTest, ZeroItemsAllowed) {
    auto p = separated(digits(), character(','), 0);
    auto r = p(Cursor("]"));
    ASSERT_TRUE(is_ok(r));
    EXPECT_TRUE(unwrap(r).value.empty());
    EXPECT_EQ(unwrap(r).rest.offset(), 0u);
}

TEST(SeparatedTest, CollectsItems) {
    auto p = separated(digits(), character(','), 0);
    auto r = p(Cursor("1,22,333]"));
    ASSERT_TRUE(is_ok(r));
    const auto& items = unwrap(r).value;
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0], "1");
    EXPECT_EQ(items[2], "333");
    EXPECT_EQ(unwrap(r).rest.remaining(), "]");
}

TEST(SeparatedTest, MinimumOneRejectsEmpty) {
    auto p = separated(digits(), character(','), 1);
    auto r = p(Cursor("}"));
    ASSERT_TRUE(is_err(r));
    EXPECT_EQ(unwrap_err(r).message, "expected digit");
}

TEST(SeparatedTest, TrailingSeparatorLeftUnconsumed) {
    auto p = separated(digits(), character(','), 0);
    auto r = p(Cursor("1,2,]"));
    ASSERT_TRUE(is_ok(r));
    EXPECT_EQ(unwrap(r).value.size(), 2u);
    EXPECT_EQ(unwrap(r).rest.remaining(), ",]");
}

TEST(SeparatedTest, TrailingSeparatorFailsEnclosingDelimiter) {
    auto p = delimited(character('['), separated(digits(), character(','), 0), character(']'));
    auto r = p(Cursor("[1,2,]"));
    ASSERT_TRUE(is_err(r));
    EXPECT_EQ(unwrap_err(r).message, "expected ']'");
    EXPECT_EQ(unwrap_err(r).offset, 4u);
}

TEST(SeparatedTest, ExactCount) {
    auto p = separated(digits(), character('.'), 4, 4);

    auto ok = p(Cursor("1.2.3.4.5"));
    ASSERT_TRUE(is_ok(ok));
    EXPECT_EQ(unwrap(ok).value.size(), 4u);
    EXPECT_EQ(unwrap(ok).rest.remaining(), ".5");

    auto short_input = p(Cursor("1.2.3"));
    ASSERT_TRUE(is_err(short_input));
    EXPECT_EQ(unwrap_err(short_input).message, "expected '.'");
}

TEST(SeparatedTest, SeparatorsCountAsProgress) {
    auto p = separated(multispace0(), character(','), 0);
    auto r = p(Cursor(",,,x"));
    ASSERT_TRUE(is_ok(r));
    EXPECT_EQ(unwrap(r).value.size(), 4u);
    EXPECT_EQ(unwrap(r).rest.remaining(), "x");
}

TEST(SeparatedTest, TerminatesWhenNothingIsConsumed) {
    auto p = separated(multispace0(), multispace0(), 0);
    auto r = p(Cursor("abc"));
    ASSERT_TRUE(is_ok(r));
    EXPECT_EQ(unwrap(r).value.size(), 1u);
    EXPECT_EQ(unwrap(r).rest.offset(), 0u);
}

// ============================================================================
// Transformation
// ============================================================================

TEST(TransformTest, MapAppliesFunction) {
    auto p = map(digits(), to_int);
    auto r = p(Cursor("42"));
    ASSERT_TRUE(is_ok(r));
    EXPECT_EQ(unwrap(r).value, 42);
}

TEST(TransformTest, ValueReplacesOutput) {
    auto p = value(literal("yes"), true);
    auto r = p(Cursor("yes"));
    ASSERT_TRUE(is_ok(r));
    EXPECT_TRUE(unwrap(r).value);
}

TEST(TransformTest, OptionalNeverFails) {
    auto p = optional(character('-'));

    auto with = p(Cursor("-1"));
    ASSERT_TRUE(is_ok(with));
    EXPECT_TRUE(unwrap(with).value.has_value());
    EXPECT_EQ(unwrap(with).rest.offset(), 1u);

    auto without = p(Cursor("1"));
    ASSERT_TRUE(is_ok(without));
    EXPECT_FALSE(unwrap(without).value.has_value());
    EXPECT_EQ(unwrap(without).rest.offset(), 0u);
}

TEST(TransformTest, ConvertSuccess) {
    auto p = convert(digits(), [](std::string_view text) -> Result<int> {
        return to_int(text);
    });
    auto r = p(Cursor("17 rest"));
    ASSERT_TRUE(is_ok(r));
    EXPECT_EQ(unwrap(r).value, 17);
    EXPECT_EQ(unwrap(r).rest.remaining(), " rest");
}

TEST(TransformTest, ConvertFailureIsPositionedAtToken) {
    auto p = preceded(literal("x="), convert(digits(), [](std::string_view) -> Result<int> {
                          return std::string("not allowed");
                      }));
    auto r = p(Cursor("x=99"));
    ASSERT_TRUE(is_err(r));
    const auto& err = unwrap_err(r);
    EXPECT_EQ(err.kind, ParseErrorKind::Conversion);
    EXPECT_EQ(err.message, "not allowed");
    EXPECT_EQ(err.offset, 2u);
}

TEST(TransformTest, ConvertWithFormatKind) {
    auto p = convert(
        digits(), [](std::string_view) -> Result<int> { return std::string("too big"); },
        ParseErrorKind::Format);
    auto r = p(Cursor("1"));
    ASSERT_TRUE(is_err(r));
    EXPECT_EQ(unwrap_err(r).kind, ParseErrorKind::Format);
}

TEST(TransformTest, LabelsStackInnermostFirst) {
    auto inner = label(character(']'), "close bracket");
    auto outer = label(preceded(character('['), inner), "list");
    auto r = outer(Cursor("[x"));
    ASSERT_TRUE(is_err(r));
    const auto& err = unwrap_err(r);
    ASSERT_EQ(err.context.size(), 2u);
    EXPECT_EQ(err.context[0], "close bracket");
    EXPECT_EQ(err.context[1], "list");
}

// ============================================================================
// Error Formatting
// ============================================================================

TEST(ParseErrorTest, ToStringIncludesPositionAndContext) {
    auto p = label(preceded(character('['), character(']')), "list");
    auto r = p(Cursor("[x"));
    ASSERT_TRUE(is_err(r));
    EXPECT_EQ(unwrap_err(r).to_string(), "offset 1: expected ']' (near \"x\") [in list]");
}

TEST(ParseErrorTest, ErrorsAreUnlocatedUntilAsked) {
    std::string_view input = "[\n\n x";
    auto p = preceded(padded(character('[')), character(']'));
    auto r = p(Cursor(input));
    ASSERT_TRUE(is_err(r));
    auto& err = unwrap_err(r);
    EXPECT_EQ(err.offset, 4u);
    EXPECT_EQ(err.line, 0u);
    EXPECT_EQ(err.column, 0u);

    err.locate(input);
    EXPECT_EQ(err.line, 3u);
    EXPECT_EQ(err.column, 2u);
    EXPECT_EQ(err.to_string(), "line 3, column 2: expected ']' (near \"x\")");
}

TEST(ParseErrorTest, ToStringAtEndOfInput) {
    auto err = ParseError::token(Cursor("ab").advance(2), "expected more");
    EXPECT_EQ(err.to_string(), "offset 2: expected more (at end of input)");
    err.locate("ab");
    EXPECT_EQ(err.to_string(), "line 1, column 3: expected more (at end of input)");
}

TEST(ParseErrorTest, ContextRendersOutermostFirst) {
    auto err = ParseError::format(Cursor("x"), "bad");
    err.with_context("inner").with_context("outer").locate("x");
    EXPECT_EQ(err.to_string(), "line 1, column 1: bad (near \"x\") [in outer > inner]");
}

TEST(ParseErrorTest, ExcerptIsBoundedOnLongLines) {
    std::string input(100000, 'a');
    auto err = ParseError::token(Cursor(input), "expected 'b'");
    EXPECT_EQ(err.near, std::string(32, 'a') + "...");
}

TEST(ParseErrorTest, KindNames) {
    EXPECT_STREQ(kind_name(ParseErrorKind::Token), "token");
    EXPECT_STREQ(kind_name(ParseErrorKind::Conversion), "conversion");
    EXPECT_STREQ(kind_name(ParseErrorKind::Format), "format");
}
