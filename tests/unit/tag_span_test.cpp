#include <tagtext/markup/tag_span.h>
#include <tagtext/markup/tag_utils.h>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace tagtext::markup;

namespace {

size_t count_markers(const std::string& text) {
    size_t count = 0;
    for (char c : text) {
        if (c == '\\') ++count;
    }
    return count;
}

} // namespace

// ============================================================================
// Span matching
// ============================================================================

// 1. Spans are found left to right with their bodies
TEST(TagSpan, FindsSimpleSpans) {
    const std::string text = "a<red>b</red>c";
    auto spans = find_tag_spans(text);
    ASSERT_EQ(spans.size(), 2u);
    EXPECT_EQ(spans[0].begin, 1u);
    EXPECT_EQ(spans[0].end, 6u);
    EXPECT_EQ(spans[0].body(text), "red");
    EXPECT_EQ(spans[1].text(text), "</red>");
    EXPECT_EQ(spans[1].body(text), "/red");
    EXPECT_FALSE(spans[0].has_inner);
}

// 2. Text without brackets has no spans
TEST(TagSpan, NoSpansInPlainText) {
    EXPECT_TRUE(find_tag_spans("no tags here").empty());
    EXPECT_TRUE(find_tag_spans("1 < 2").empty());
    EXPECT_TRUE(find_tag_spans("<>").empty());
}

// 3. A span never contains an unrelated '<'
TEST(TagSpan, SkipsUnclosedBracket) {
    const std::string text = "<a<b>";
    auto spans = find_tag_spans(text);
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].begin, 2u);
    EXPECT_EQ(spans[0].text(text), "<b>");
}

// 4. The shortest span wins
TEST(TagSpan, ShortestSpan) {
    const std::string text = "<a>b>";
    auto span = find_tag_span(text);
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(span->end, 3u);
}

// 5. Search starts at the given offset
TEST(TagSpan, SearchFromOffset) {
    auto span = find_tag_span("<a>b<c>", 1);
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(span->begin, 4u);
    EXPECT_FALSE(find_tag_span("<a>", 1).has_value());
}

// 6. Arguments without brackets stay part of a plain body
TEST(TagSpan, ArgumentsInBody) {
    const std::string text = "<click:run_command:/x>";
    auto span = find_tag_span(text);
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(span->text(text), text);
    EXPECT_FALSE(span->has_inner);
}

// 7. A quoted argument may carry brackets and is reported as inner
TEST(TagSpan, QuotedInnerSegment) {
    const std::string text = "<hover:show_text:'<red>hi'>";
    auto span = find_tag_span(text);
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(span->begin, 0u);
    EXPECT_EQ(span->end, text.size());
    ASSERT_TRUE(span->has_inner);
    EXPECT_EQ(span->inner(text), "'<red>hi'");
}

// ============================================================================
// Escape
// ============================================================================

// 8. Every span gets one escape marker
TEST(EscapeTags, SimpleTags) {
    EXPECT_EQ(escape_tags("<red>hi</red>"), "\\<red>hi\\</red>");
}

// 9. Text without spans is unchanged
TEST(EscapeTags, PlainTextUnchanged) {
    EXPECT_EQ(escape_tags("Hello world"), "Hello world");
    EXPECT_EQ(escape_tags("1 < 2"), "1 < 2");
    EXPECT_EQ(escape_tags(""), "");
}

// 10. Tags inside a quoted argument are escaped as well
TEST(EscapeTags, NestedInQuotedArgument) {
    EXPECT_EQ(escape_tags("<hover:show_text:'<red>hi'>x"),
              "\\<hover:show_text:'\\<red>hi'>x");
}

// 11. Existing backslashes are kept exactly once
TEST(EscapeTags, KeepsOtherBackslashes) {
    EXPECT_EQ(escape_tags("a\\b <red>"), "a\\b \\<red>");
}

// 12. Removing escape markers restores the input
TEST(EscapeTags, UnescapeRestoresInput) {
    const std::vector<std::string> inputs = {
        "<red>hi</red>",
        "plain text",
        "<hover:show_text:'<red>hi'>x",
        "a <b>c</b> <click:open_url:https://example.com>link",
        "\\<red>already",
        "<a<b>",
        "a \\< b",
        "C:\\<dir",
    };
    for (const auto& input : inputs) {
        EXPECT_EQ(unescape_tags(escape_tags(input)), input) << input;
    }
}

// 13. unescape only drops a marker in front of a tag span
TEST(EscapeTags, UnescapeOnlyBeforeBracket) {
    EXPECT_EQ(unescape_tags("\\<a> \\b"), "<a> \\b");
    EXPECT_EQ(unescape_tags("a \\< b"), "a \\< b");
    EXPECT_EQ(unescape_tags("C:\\<dir"), "C:\\<dir");
}

// 14. Re-escaping keeps existing markers and adds one per span
TEST(EscapeTags, ReEscape) {
    EXPECT_EQ(escape_tags("\\<red>x"), "\\\\<red>x");
    EXPECT_EQ(escape_tags(escape_tags("<red>a</red>")), "\\\\<red>a\\\\</red>");

    const std::vector<std::string> inputs = {
        "\\<red>hi",
        "a\\b <red>x</red>",
        "\\\\<b>",
        "path C:\\dir <i> \\< 2",
    };
    for (const auto& input : inputs) {
        const std::string once = escape_tags(input);
        const std::string twice = escape_tags(once);
        EXPECT_EQ(count_markers(twice), count_markers(once) + find_tag_spans(once).size()) << input;
        EXPECT_EQ(unescape_tags(twice), once) << input;
    }
}

// ============================================================================
// Strip
// ============================================================================

// 15. Spans are removed, surrounding text kept in order
TEST(StripTags, RemovesSpans) {
    EXPECT_EQ(strip_tags("a<red>b</red>c"), "abc");
    EXPECT_EQ(strip_tags("x <a b> y"), "x  y");
}

// 16. A quoted argument is removed together with its tag
TEST(StripTags, RemovesQuotedArgument) {
    EXPECT_EQ(strip_tags("<hover:show_text:'<red>hi'>x"), "x");
}

// 17. Unmatched brackets survive
TEST(StripTags, KeepsUnmatchedBrackets) {
    EXPECT_EQ(strip_tags("1 < 2"), "1 < 2");
    EXPECT_EQ(strip_tags("<a<b>"), "<a");
}
