#include <tagtext/text/style.h>
#include <tagtext/text/component.h>

namespace tagtext::text {

const char* decoration_name(Decoration decoration) {
    switch (decoration) {
        case Decoration::Bold:          return "bold";
        case Decoration::Italic:        return "italic";
        case Decoration::Underlined:    return "underlined";
        case Decoration::Strikethrough: return "strikethrough";
        case Decoration::Obfuscated:    return "obfuscated";
    }
    return "unknown";
}

std::optional<ClickEvent::Action> ClickEvent::action_from_name(std::string_view name) {
    if (name == "open_url") return OpenUrl;
    if (name == "open_file") return OpenFile;
    if (name == "run_command") return RunCommand;
    if (name == "suggest_command") return SuggestCommand;
    if (name == "change_page") return ChangePage;
    if (name == "copy_to_clipboard") return CopyToClipboard;
    return std::nullopt;
}

const char* ClickEvent::action_name(Action action) {
    switch (action) {
        case OpenUrl:         return "open_url";
        case OpenFile:        return "open_file";
        case RunCommand:      return "run_command";
        case SuggestCommand:  return "suggest_command";
        case ChangePage:      return "change_page";
        case CopyToClipboard: return "copy_to_clipboard";
    }
    return "unknown";
}

bool Style::empty() const {
    for (TriState state : decorations) {
        if (state != TriState::NotSet) return false;
    }
    return !color && !click && !hover_text && !insertion && !font;
}

bool Style::operator==(const Style& other) const {
    if (color != other.color) return false;
    if (decorations != other.decorations) return false;
    if (click != other.click) return false;
    if (insertion != other.insertion) return false;
    if (font != other.font) return false;
    if (hover_text == other.hover_text) return true;
    if (!hover_text || !other.hover_text) return false;
    return *hover_text == *other.hover_text;
}

} // namespace tagtext::text
