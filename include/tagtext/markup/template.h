#pragma once
#include <tagtext/text/component.h>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tagtext::markup {

// Prebuilt subtrees that a tag of the same name splices into the output.
using ComponentTemplateMap = std::map<std::string, text::Component, std::less<>>;

// Looks up a subtree for a tag name that is neither a template nor a registered
// tag. Must be safe to call from concurrent parses.
using PlaceholderResolver = std::function<std::optional<text::Component>(const std::string& name)>;

// A named value supplied with the markup: either text substituted before
// scanning, or a component inserted where the `<key>` tag appears.
class Template {
public:
    static Template of(std::string key, std::string value);
    static Template of(std::string key, const char* value);
    static Template of(std::string key, text::Component value);

    const std::string& key() const { return key_; }
    bool is_string() const { return std::holds_alternative<std::string>(value_); }
    bool is_component() const { return std::holds_alternative<text::Component>(value_); }

    const std::string& string_value() const { return std::get<std::string>(value_); }
    const text::Component& component_value() const { return std::get<text::Component>(value_); }

private:
    Template(std::string key, std::variant<std::string, text::Component> value)
        : key_(std::move(key)), value_(std::move(value)) {}

    std::string key_;
    std::variant<std::string, text::Component> value_;
};

using Replacement = std::pair<std::string, std::string>;

// Replaces every `<key>` with its value in one left-to-right pass. Substituted
// values are never rescanned; when several keys match at one offset the first
// listed pair wins.
std::string replace_placeholders(std::string_view text, const std::vector<Replacement>& replacements);

// Alternating key, value, key, value... Throws PlaceholderError on an odd count
// before touching the text.
std::string replace_placeholders_flat(std::string_view text, const std::vector<std::string>& key_values);

std::string replace_placeholders(std::string_view text, const std::map<std::string, std::string>& values);

struct TemplateSubstitution {
    std::string text;
    ComponentTemplateMap components;
};

// String templates are substituted into the text; component templates are
// collected for tag resolution. A later component template replaces an earlier
// one with the same key.
TemplateSubstitution apply_templates(std::string_view text, const std::vector<Template>& templates);

} // namespace tagtext::markup
