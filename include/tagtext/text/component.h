#pragma once
#include <tagtext/text/style.h>
#include <ostream>
#include <string>
#include <vector>

namespace tagtext::text {

// A node of the styled-text tree: literal content, a style, and owned children
// rendered after the content. Copyable value type.
class Component {
public:
    Component() = default;
    explicit Component(std::string content);
    Component(std::string content, Style style);

    static Component text(std::string content) { return Component(std::move(content)); }
    static Component empty() { return Component(); }

    const std::string& content() const { return content_; }
    void set_content(std::string content) { content_ = std::move(content); }

    const Style& style() const { return style_; }
    Style& style() { return style_; }

    const std::vector<Component>& children() const { return children_; }
    Component& append(Component child);

    // Content of this node and all descendants, depth first.
    std::string plain_text() const;

    // Compact single-line rendering of the whole tree, used by diagnostics and tests:
    // text("hi")[color=#ff5555,bold]{text("!")}
    std::string to_debug_string() const;

    bool operator==(const Component& other) const;
    bool operator!=(const Component& other) const { return !(*this == other); }

private:
    std::string content_;
    Style style_;
    std::vector<Component> children_;
};

std::ostream& operator<<(std::ostream& os, const Component& component);

// Mutable root used while a tree is assembled.
class ComponentBuilder {
public:
    ComponentBuilder() = default;
    explicit ComponentBuilder(std::string content) : content_(std::move(content)) {}

    ComponentBuilder& content(std::string content);
    const std::string& content() const { return content_; }

    Style& style() { return style_; }
    const Style& style() const { return style_; }

    ComponentBuilder& append(Component child);
    const std::vector<Component>& children() const { return children_; }

    Component build() const;

private:
    std::string content_;
    Style style_;
    std::vector<Component> children_;
};

} // namespace tagtext::text
