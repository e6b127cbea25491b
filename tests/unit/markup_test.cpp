#include <tagtext/core/diagnostics.h>
#include <tagtext/markup/errors.h>
#include <tagtext/markup/markup.h>
#include <tagtext/markup/tag_utils.h>
#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace tagtext::markup;
using tagtext::core::DiagnosticEvent;
using tagtext::core::Severity;
using tagtext::text::ClickEvent;
using tagtext::text::Component;
using tagtext::text::Decoration;
using tagtext::text::TextColor;
using tagtext::text::TriState;

// ============================================================================
// Plain text
// ============================================================================

// 1. Text without tags passes through escape, strip and parse unchanged
TEST(Markup, PlainTextUnchanged) {
    Markup markup;
    const std::vector<std::string> inputs = {"Hello world", "1 < 2", "a: b", "x\\y", "",
                                             "a \\< b", "C:\\<dir"};
    for (const auto& input : inputs) {
        EXPECT_EQ(markup.escape_tags(input), input);
        EXPECT_EQ(markup.strip_tags(input), input);
        EXPECT_EQ(markup.parse(input), Component::text(input)) << input;
    }
}

// 2. Escaping then unescaping restores the input
TEST(Markup, EscapeIsReversible) {
    Markup markup;
    const std::string input = "<red>Hi <hover:show_text:'<b>tip'>there</hover>";
    EXPECT_EQ(unescape_tags(markup.escape_tags(input)), input);
}

// 3. Escaped text parses back to the unescaped characters
TEST(Markup, EscapedTextParsesLiterally) {
    Markup markup;
    const std::string input = "<red>Hi</red> <b>there";
    Component parsed = markup.parse(markup.escape_tags(input));
    EXPECT_EQ(parsed.plain_text(), input);
}

// 4. Stripping removes markup but keeps the text
TEST(Markup, StripTags) {
    Markup markup;
    EXPECT_EQ(markup.strip_tags("<red>Hello</red> <b>world"), "Hello world");
}

// ============================================================================
// Tags
// ============================================================================

// 5. Unknown tags are literal when lenient
TEST(Markup, UnknownTagLenient) {
    Markup markup;
    ParseResult result = markup.parse_with_diagnostics("<frobnicate>hi</frobnicate>");
    EXPECT_EQ(result.component.plain_text(), "<frobnicate>hi</frobnicate>");
    EXPECT_EQ(result.diagnostics.size(), 2u);
    for (const auto& event : result.diagnostics) {
        EXPECT_EQ(event.severity, Severity::Warning);
        EXPECT_EQ(event.stage, "parse");
    }
}

// 6. Unknown tags fail when strict
TEST(Markup, UnknownTagStrict) {
    Markup markup = Markup::builder().strict(true).build();
    EXPECT_TRUE(markup.strict());
    EXPECT_THROW(markup.parse("<frobnicate>hi</frobnicate>"), ParsingError);
    EXPECT_NO_THROW(markup.parse("<red>hi</red>"));
}

// 7. Colors, decorations and negation
TEST(Markup, StyledText) {
    Markup markup;
    Component parsed = markup.parse("<#00ff00><b>go<!b>now");
    ASSERT_EQ(parsed.children().size(), 2u);
    EXPECT_EQ(parsed.children()[0].style().color, TextColor::from_rgb(0x00ff00));
    EXPECT_EQ(parsed.children()[0].style().decoration(Decoration::Bold), TriState::True);
    EXPECT_EQ(parsed.children()[1].style().decoration(Decoration::Bold), TriState::False);
}

// 8. Click events keep separators in their value
TEST(Markup, ClickEvent) {
    Markup markup;
    Component parsed = markup.parse("<click:open_url:https://example.com>link");
    ASSERT_TRUE(parsed.style().click.has_value());
    EXPECT_EQ(parsed.style().click->action, ClickEvent::OpenUrl);
    EXPECT_EQ(parsed.style().click->value, "https://example.com");
    EXPECT_EQ(parsed.content(), "link");
}

// 9. Hover text is parsed with the same settings
TEST(Markup, HoverTextIsMarkup) {
    Markup markup;
    Component parsed = markup.parse("<hover:show_text:'<red>tip'>x");
    ASSERT_NE(parsed.style().hover_text, nullptr);
    const Component& hover = *parsed.style().hover_text;
    EXPECT_EQ(hover.content(), "tip");
    EXPECT_EQ(hover.style().color, TextColor::from_rgb(0xff5555));
}

// 10. Pre keeps its content literal and closes cleanly
TEST(Markup, PreIsLiteral) {
    Markup markup;
    ParseResult result = markup.parse_with_diagnostics("<pre><red>literal</red></pre>");
    EXPECT_EQ(result.component.content(), "<red>literal</red>");
    EXPECT_TRUE(result.component.children().empty());
    EXPECT_FALSE(result.component.style().color.has_value());
    EXPECT_TRUE(result.diagnostics.empty());
}

// 11. Two same-named tags closed once only close the inner one
TEST(Markup, NestedSameNameTags) {
    Markup markup;
    Component parsed = markup.parse("<b>a<b>b</b>c");
    ASSERT_EQ(parsed.children().size(), 3u);
    EXPECT_EQ(parsed.children()[2].style().decoration(Decoration::Bold), TriState::True);
}

// 12. A one-shot touches exactly the next content node
TEST(Markup, OneShotNextNodeOnly) {
    Markup markup;
    Component parsed = markup.parse("<capitalize>hello <i>world");
    ASSERT_EQ(parsed.children().size(), 2u);
    EXPECT_EQ(parsed.children()[0].content(), "Hello ");
    EXPECT_EQ(parsed.children()[1].content(), "world");
}

// ============================================================================
// Placeholders and templates
// ============================================================================

// 13. A string placeholder parses like the substituted text
TEST(Markup, StringPlaceholder) {
    Markup markup;
    std::vector<std::string> placeholders = {"name", "Steve"};
    EXPECT_EQ(markup.parse("Hello <name>!", placeholders), markup.parse("Hello Steve!"));
}

// 14. Placeholder values may carry markup
TEST(Markup, PlaceholderWithMarkup) {
    Markup markup;
    std::map<std::string, std::string> placeholders = {{"name", "<red>Steve</red>"}};
    Component parsed = markup.parse("Hi <name>", placeholders);
    ASSERT_EQ(parsed.children().size(), 2u);
    EXPECT_EQ(parsed.children()[1].style().color, TextColor::from_rgb(0xff5555));
}

// 15. An odd placeholder list fails in every mode
TEST(Markup, OddPlaceholderList) {
    std::vector<std::string> placeholders = {"name"};
    EXPECT_THROW(Markup().parse("<name>", placeholders), PlaceholderError);
    EXPECT_THROW(Markup::builder().strict(true).build().parse("<name>", placeholders), PlaceholderError);
}

// 16. Typed templates mix strings and components
TEST(Markup, TypedTemplates) {
    Markup markup;
    Component icon = Component::text("*");
    icon.style().color = TextColor::from_rgb(0xffaa00);
    std::vector<Template> templates = {
        Template::of("name", "Steve"),
        Template::of("icon", icon),
    };
    Component parsed = markup.parse("<icon> <name>", templates);
    ASSERT_EQ(parsed.children().size(), 2u);
    EXPECT_EQ(parsed.children()[0], icon);
    EXPECT_EQ(parsed.children()[1].content(), " Steve");
}

// 17. The placeholder resolver supplies subtrees for unknown names
TEST(Markup, PlaceholderResolver) {
    Markup markup = Markup::builder()
        .placeholder_resolver([](const std::string& name) -> std::optional<Component> {
            if (name == "player") return Component::text("Alex");
            return std::nullopt;
        })
        .build();
    Component parsed = markup.parse("<player> joined");
    EXPECT_EQ(parsed.plain_text(), "Alex joined");
    EXPECT_EQ(markup.parse("<stranger> joined").plain_text(), "<stranger> joined");
}

// ============================================================================
// Configuration and diagnostics
// ============================================================================

// 18. Substitution is recorded as an info diagnostic
TEST(Markup, SubstitutionDiagnostic) {
    Markup markup;
    std::vector<std::string> placeholders = {"name", "Steve"};
    ParseResult result = markup.parse_with_diagnostics("Hi <name>", placeholders);
    EXPECT_EQ(result.substituted_text, "Hi Steve");
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].severity, Severity::Info);
    EXPECT_EQ(result.diagnostics[0].stage, "substitute");
}

// 19. Observers and severity filter come from the builder
TEST(Markup, ObserversAndMinSeverity) {
    std::vector<DiagnosticEvent> seen;
    Markup markup = Markup::builder()
        .min_severity(Severity::Warning)
        .add_observer([&seen](const DiagnosticEvent& event) { seen.push_back(event); })
        .build();

    std::vector<std::string> placeholders = {"x", "y"};
    ParseResult result = markup.parse_with_diagnostics("<x><nope>", placeholders);
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].severity, Severity::Warning);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].message, result.diagnostics[0].message);
}

// 20. Each parse has its own diagnostics
TEST(Markup, DiagnosticsPerParse) {
    Markup markup;
    EXPECT_EQ(markup.parse_with_diagnostics("<nope>").diagnostics.size(), 1u);
    EXPECT_TRUE(markup.parse_with_diagnostics("fine").diagnostics.empty());
}

// 21. The token trace shows collapsed runs
TEST(Markup, TokenTrace) {
    Markup markup;
    ParseResult result = markup.parse_with_diagnostics("<nope>x");
    ASSERT_EQ(result.tokens.size(), 2u);
    EXPECT_EQ(result.tokens[0].type, TokenType::String);
    EXPECT_EQ(result.tokens[0].text, "<nope>");
}

// 22. A custom registry replaces the standard tags
TEST(Markup, CustomRegistry) {
    auto registry = std::make_shared<TagRegistry>();
    Markup markup = Markup::builder().registry(registry).build();
    EXPECT_EQ(markup.parse("<red>x").plain_text(), "<red>x");
    EXPECT_FALSE(markup.registry().exists("red"));
}

// 23. Lenient parses never throw on malformed markup
TEST(Markup, LenientNeverThrows) {
    Markup markup;
    const std::vector<std::string> inputs = {
        "<", "</", "<red", "<red:", "<red:'x", "</>", "\\<", "\\</", "<<<>>>",
        "<hover:show_text:'<hover:show_text:\"<b>x\">y'>z", "<click:>", "<pre>", "</pre>",
    };
    for (const auto& input : inputs) {
        EXPECT_NO_THROW(markup.parse(input)) << input;
    }
}

// 24. A shared instance serves concurrent parses
TEST(Markup, ConcurrentParses) {
    const Markup markup;
    std::vector<std::thread> threads;
    std::vector<std::string> results(4);
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&markup, &results, i] {
            for (int n = 0; n < 50; ++n) {
                results[i] = markup.parse("<red>a<b>b</b><nope>").plain_text();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (const auto& result : results) {
        EXPECT_EQ(result, "ab<nope>");
    }
}
