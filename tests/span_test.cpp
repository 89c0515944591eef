#include <lilscript-cpp/tex.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace lilscript_cpp;

// -- Span value type ----------------------------------------------------------

TEST(Span, factories_set_kind) {
    EXPECT_EQ(Span::normal("a").kind, SpanKind::normal);
    EXPECT_EQ(Span::emphasis("a").kind, SpanKind::emphasis);
    EXPECT_EQ(Span::inline_direction("a").kind, SpanKind::inline_direction);
}

TEST(Span, default_is_empty_normal) {
    const auto s = Span{};
    EXPECT_EQ(s.kind, SpanKind::normal);
    EXPECT_TRUE(s.contents.empty());
}

TEST(Span, as_kind_keeps_contents) {
    const auto s = Span::normal("loud").as_kind(SpanKind::emphasis);
    EXPECT_EQ(s, Span::emphasis("loud"));
}

TEST(Span, equality_compares_kind_and_contents) {
    EXPECT_EQ(Span::normal("x"), Span::normal("x"));
    EXPECT_NE(Span::normal("x"), Span::emphasis("x"));
    EXPECT_NE(Span::normal("x"), Span::normal("y"));
}

TEST(SpanKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(SpanKind::normal), "Normal");
    EXPECT_EQ(to_string_view(SpanKind::emphasis), "Emphasis");
    EXPECT_EQ(to_string_view(SpanKind::inline_direction), "InlineDirection");
}

// -- parse_span ---------------------------------------------------------------

TEST(ParseSpan, prose_is_normal) {
    EXPECT_EQ(parse_span("This is some text"), Span::normal("This is some text"));
}

TEST(ParseSpan, prose_is_trimmed_and_normalized) {
    EXPECT_EQ(parse_span("  Well\\ldots{}   sure.  "), Span::normal("Well... sure."));
}

TEST(ParseSpan, direct_is_an_inline_direction) {
    EXPECT_EQ(parse_span(R"(\direct{an inline!})"), Span::inline_direction("an inline!"));
}

TEST(ParseSpan, ul_is_emphasis) {
    EXPECT_EQ(parse_span(R"(\ul{EMPHASIS})"), Span::emphasis("EMPHASIS"));
}

TEST(ParseSpan, argument_is_trimmed) {
    EXPECT_EQ(parse_span(R"(\direct{  softly  })"), Span::inline_direction("softly"));
}

TEST(ParseSpan, argument_is_normalized) {
    EXPECT_EQ(parse_span(R"(\ul{rock \& roll})"), Span::emphasis("rock & roll"));
}

TEST(ParseSpan, unknown_command_throws) {
    try {
        (void)parse_span(R"(\whisper{psst})");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::unknown_inline_command);
        EXPECT_NE(std::string{e.what()}.find(R"(\whisper)"), std::string::npos);
    }
}

TEST(ParseSpan, whitespace_only_fragment_is_an_empty_normal_span) {
    EXPECT_EQ(parse_span("   "), Span::normal(""));
}
