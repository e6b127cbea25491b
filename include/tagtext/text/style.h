#pragma once
#include <tagtext/text/color.h>
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace tagtext::text {

class Component;

enum class Decoration : uint8_t {
    Bold,
    Italic,
    Underlined,
    Strikethrough,
    Obfuscated,
};

inline constexpr size_t kDecorationCount = 5;

enum class TriState : uint8_t { NotSet, True, False };

const char* decoration_name(Decoration decoration);

struct ClickEvent {
    enum Action { OpenUrl, OpenFile, RunCommand, SuggestCommand, ChangePage, CopyToClipboard };
    Action action = OpenUrl;
    std::string value;

    static std::optional<Action> action_from_name(std::string_view name);
    static const char* action_name(Action action);

    bool operator==(const ClickEvent& other) const {
        return action == other.action && value == other.value;
    }
    bool operator!=(const ClickEvent& other) const { return !(*this == other); }
};

// Visual and interactive attributes of one node. Unset fields are inherited
// from the parent by whatever renders the tree.
struct Style {
    std::optional<TextColor> color;
    std::array<TriState, kDecorationCount> decorations{};
    std::optional<ClickEvent> click;
    std::shared_ptr<const Component> hover_text;
    std::optional<std::string> insertion;
    std::optional<std::string> font;

    TriState decoration(Decoration d) const {
        return decorations[static_cast<size_t>(d)];
    }
    void set_decoration(Decoration d, TriState state) {
        decorations[static_cast<size_t>(d)] = state;
    }

    bool empty() const;

    bool operator==(const Style& other) const;
    bool operator!=(const Style& other) const { return !(*this == other); }
};

} // namespace tagtext::text
