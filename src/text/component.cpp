#include <tagtext/text/component.h>

namespace tagtext::text {

namespace {

void append_escaped(std::string& out, const std::string& text) {
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            default:   out += c; break;
        }
    }
}

std::string describe_style(const Style& style) {
    std::string out;
    auto add = [&out](const std::string& part) {
        if (!out.empty()) out += ',';
        out += part;
    };

    if (style.color) {
        const char* name = color_name(*style.color);
        add(std::string("color=") + (name ? name : style.color->as_hex_string()));
    }
    for (size_t i = 0; i < kDecorationCount; ++i) {
        TriState state = style.decorations[i];
        if (state == TriState::NotSet) continue;
        std::string name = decoration_name(static_cast<Decoration>(i));
        add(state == TriState::True ? name : "!" + name);
    }
    if (style.click) {
        add(std::string("click=") + ClickEvent::action_name(style.click->action) + ":" + style.click->value);
    }
    if (style.hover_text) {
        add("hover=" + style.hover_text->to_debug_string());
    }
    if (style.insertion) {
        add("insert=" + *style.insertion);
    }
    if (style.font) {
        add("font=" + *style.font);
    }
    return out;
}

} // namespace

Component::Component(std::string content) : content_(std::move(content)) {}

Component::Component(std::string content, Style style)
    : content_(std::move(content)), style_(std::move(style)) {}

Component& Component::append(Component child) {
    children_.push_back(std::move(child));
    return *this;
}

std::string Component::plain_text() const {
    std::string result = content_;
    for (const auto& child : children_) {
        result += child.plain_text();
    }
    return result;
}

std::string Component::to_debug_string() const {
    std::string out = "text(\"";
    append_escaped(out, content_);
    out += "\")";
    if (!style_.empty()) {
        out += '[';
        out += describe_style(style_);
        out += ']';
    }
    if (!children_.empty()) {
        out += '{';
        for (size_t i = 0; i < children_.size(); ++i) {
            if (i > 0) out += ", ";
            out += children_[i].to_debug_string();
        }
        out += '}';
    }
    return out;
}

bool Component::operator==(const Component& other) const {
    return content_ == other.content_ && style_ == other.style_ && children_ == other.children_;
}

std::ostream& operator<<(std::ostream& os, const Component& component) {
    return os << component.to_debug_string();
}

ComponentBuilder& ComponentBuilder::content(std::string content) {
    content_ = std::move(content);
    return *this;
}

ComponentBuilder& ComponentBuilder::append(Component child) {
    children_.push_back(std::move(child));
    return *this;
}

Component ComponentBuilder::build() const {
    Component result(content_, style_);
    for (const auto& child : children_) {
        result.append(child);
    }
    return result;
}

} // namespace tagtext::text
