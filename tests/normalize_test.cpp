#include <lilscript-cpp/tex.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace lilscript_cpp;

// -- Ellipses -----------------------------------------------------------------

TEST(Normalize, ellipsis_forms) {
    const auto s = R"(This is some text\textellipsis{} and some\ldots{} more text\textellipsis?)";
    EXPECT_EQ(normalize(s), "This is some text... and some... more text...?");
}

TEST(Normalize, ellipsis_without_braces_adds_no_space) {
    EXPECT_EQ(normalize(R"(wait\ldots what)"), "wait... what");
    EXPECT_EQ(normalize(R"(wait\ldots{}what)"), "wait... what");
}

// -- Quotes and escapes -------------------------------------------------------

TEST(Normalize, tex_quotes_become_ascii_quotes) {
    EXPECT_EQ(normalize("She said ``hello'' and ``bye''."), R"(She said "hello" and "bye".)");
}

TEST(Normalize, escaped_symbols) {
    const auto s = R"(This is some text\$ with \& a few \%symbols thrown in.)";
    EXPECT_EQ(normalize(s), "This is some text$ with & a few %symbols thrown in.");
}

// -- Custom commands ----------------------------------------------------------

TEST(Normalize, custom_commands) {
    const auto s = R"(This is some text, with some curious stuff\Tilde \Tilde{} \kaosmile{})";
    EXPECT_EQ(normalize(s), "This is some text, with some curious stuff∼ ∼ ^_^");
}

TEST(Normalize, kaosmile_adds_a_trailing_space) {
    EXPECT_EQ(normalize(R"(\kaosmile{}hi)"), "^_^ hi");
}

TEST(Normalize, href_becomes_markdown_link) {
    const auto s = R"(This is some text with a \href{https://google.com}{link} in it.)";
    EXPECT_EQ(normalize(s), "This is some text with a [link](https://google.com) in it.");
}

TEST(Normalize, unknown_commands_pass_through) {
    const auto s = R"(This is\anotherCommand{3} some text\textellipsis{} and some more text.)";
    EXPECT_EQ(normalize(s), R"(This is\anotherCommand{3} some text... and some more text.)");
}

// -- Whitespace ---------------------------------------------------------------

TEST(Normalize, duplicated_spaces_collapse) {
    const auto s = "This is some      normal text, except there is additional space in the middle";
    EXPECT_EQ(normalize(s),
              "This is some normal text, except there is additional space in the middle");
}

TEST(Normalize, tabs_and_newlines_collapse_and_ends_are_trimmed) {
    EXPECT_EQ(normalize("  \tone\n\ntwo \r\n"), "one two");
}

TEST(Normalize, empty_and_blank_input) {
    EXPECT_EQ(normalize(""), "");
    EXPECT_EQ(normalize(" \t\n "), "");
}

TEST(Normalize, is_idempotent_on_plain_text) {
    const auto once = normalize(R"(Well\ldots{} ``fine'' \& done\kaosmile)");
    EXPECT_EQ(normalize(once), once);
}
