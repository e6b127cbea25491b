#include <tagtext/markup/errors.h>
#include <tagtext/markup/template.h>
#include <gtest/gtest.h>
#include <map>
#include <string>
#include <vector>

using namespace tagtext::markup;
using tagtext::text::Component;

// ============================================================================
// String substitution
// ============================================================================

// 1. Every occurrence is replaced
TEST(Placeholders, ReplacesEveryOccurrence) {
    std::vector<Replacement> replacements = {{"name", "Steve"}};
    EXPECT_EQ(replace_placeholders("Hi <name>, bye <name>", replacements), "Hi Steve, bye Steve");
}

// 2. Substituted values are not rescanned
TEST(Placeholders, NotRecursive) {
    std::vector<Replacement> replacements = {{"a", "<b>"}, {"b", "B"}};
    EXPECT_EQ(replace_placeholders("<a><b>", replacements), "<b>B");
}

// 3. The first listed key wins at the same offset
TEST(Placeholders, FirstKeyWins) {
    std::vector<Replacement> replacements = {{"x", "first"}, {"x", "second"}};
    EXPECT_EQ(replace_placeholders("<x>", replacements), "first");
}

// 4. Unknown placeholders and other tags are left alone
TEST(Placeholders, LeavesOtherTags) {
    std::vector<Replacement> replacements = {{"name", "Steve"}};
    EXPECT_EQ(replace_placeholders("<red><other> <name>", replacements), "<red><other> Steve");
}

// 5. Flat key/value list
TEST(Placeholders, FlatList) {
    std::vector<std::string> flat = {"name", "Steve", "place", "home"};
    EXPECT_EQ(replace_placeholders_flat("<name> is <place>", flat), "Steve is home");
}

// 6. An odd flat list fails before substitution
TEST(Placeholders, OddFlatListThrows) {
    std::vector<std::string> flat = {"name", "Steve", "dangling"};
    EXPECT_THROW(replace_placeholders_flat("<name>", flat), PlaceholderError);
}

// 7. PlaceholderError is an invalid_argument
TEST(Placeholders, ErrorType) {
    std::vector<std::string> flat = {"only"};
    EXPECT_THROW(replace_placeholders_flat("x", flat), std::invalid_argument);
}

// 8. Map form
TEST(Placeholders, MapForm) {
    std::map<std::string, std::string> values = {{"a", "1"}, {"b", "2"}};
    EXPECT_EQ(replace_placeholders("<a>+<b>=<c>", values), "1+2=<c>");
}

// 9. Empty values remove the placeholder
TEST(Placeholders, EmptyValue) {
    std::vector<Replacement> replacements = {{"gone", ""}};
    EXPECT_EQ(replace_placeholders("a<gone>b", replacements), "ab");
}

// ============================================================================
// Typed templates
// ============================================================================

// 10. Template kinds
TEST(Templates, Kinds) {
    Template text = Template::of("name", "Steve");
    Template tree = Template::of("icon", Component::text("*"));
    EXPECT_TRUE(text.is_string());
    EXPECT_FALSE(text.is_component());
    EXPECT_EQ(text.string_value(), "Steve");
    EXPECT_TRUE(tree.is_component());
    EXPECT_EQ(tree.component_value().content(), "*");
    EXPECT_EQ(tree.key(), "icon");
}

// 11. String templates substitute, component templates are collected
TEST(Templates, ApplySplitsKinds) {
    std::vector<Template> templates = {
        Template::of("name", "Steve"),
        Template::of("icon", Component::text("*")),
    };
    TemplateSubstitution result = apply_templates("<icon> <name>", templates);
    EXPECT_EQ(result.text, "<icon> Steve");
    ASSERT_EQ(result.components.size(), 1u);
    EXPECT_EQ(result.components.at("icon").content(), "*");
}

// 12. A later component template replaces an earlier one
TEST(Templates, LaterComponentWins) {
    std::vector<Template> templates = {
        Template::of("icon", Component::text("old")),
        Template::of("icon", Component::text("new")),
    };
    TemplateSubstitution result = apply_templates("<icon>", templates);
    EXPECT_EQ(result.components.at("icon").content(), "new");
}
