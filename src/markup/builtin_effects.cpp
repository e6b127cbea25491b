#include <tagtext/markup/builtin_effects.h>
#include <cctype>

namespace tagtext::markup {

ColorEffect::ColorEffect(std::string name, text::TextColor color)
    : Effect(std::move(name), Capability::Persistent), color_(color) {}

std::optional<text::Component> ColorEffect::apply(text::Component current, text::ComponentBuilder&) {
    current.style().color = color_;
    return current;
}

std::string ColorEffect::signature() const {
    return "color(" + color_.as_hex_string() + ")";
}

DecorationEffect::DecorationEffect(std::string name, text::Decoration decoration, bool enabled)
    : Effect(std::move(name), Capability::Persistent), decoration_(decoration), enabled_(enabled) {}

std::optional<text::Component> DecorationEffect::apply(text::Component current, text::ComponentBuilder&) {
    current.style().set_decoration(decoration_, enabled_ ? text::TriState::True : text::TriState::False);
    return current;
}

std::string DecorationEffect::signature() const {
    return std::string("decoration(") + (enabled_ ? "" : "!") + text::decoration_name(decoration_) + ")";
}

ClickEffect::ClickEffect(std::string name, text::ClickEvent event)
    : Effect(std::move(name), Capability::Persistent), event_(std::move(event)) {}

std::optional<text::Component> ClickEffect::apply(text::Component current, text::ComponentBuilder&) {
    current.style().click = event_;
    return current;
}

std::string ClickEffect::signature() const {
    return std::string("click(") + text::ClickEvent::action_name(event_.action) + ":" + event_.value + ")";
}

HoverEffect::HoverEffect(std::string name, text::Component hover_text)
    : Effect(std::move(name), Capability::Persistent),
      hover_text_(std::make_shared<const text::Component>(std::move(hover_text))) {}

std::optional<text::Component> HoverEffect::apply(text::Component current, text::ComponentBuilder&) {
    current.style().hover_text = hover_text_;
    return current;
}

std::string HoverEffect::signature() const {
    return "hover(" + hover_text_->to_debug_string() + ")";
}

InsertionEffect::InsertionEffect(std::string name, std::string insertion)
    : Effect(std::move(name), Capability::Persistent), insertion_(std::move(insertion)) {}

std::optional<text::Component> InsertionEffect::apply(text::Component current, text::ComponentBuilder&) {
    current.style().insertion = insertion_;
    return current;
}

std::string InsertionEffect::signature() const {
    return "insert(" + insertion_ + ")";
}

FontEffect::FontEffect(std::string name, std::string font)
    : Effect(std::move(name), Capability::Persistent), font_(std::move(font)) {}

std::optional<text::Component> FontEffect::apply(text::Component current, text::ComponentBuilder&) {
    current.style().font = font_;
    return current;
}

std::string FontEffect::signature() const {
    return "font(" + font_ + ")";
}

ResetEffect::ResetEffect(std::string name)
    : Effect(std::move(name), Capability::InstantApply) {}

void ResetEffect::apply_instant(text::ComponentBuilder&, EffectScope& scope) {
    scope.clear();
}

NewlineEffect::NewlineEffect(std::string name)
    : Effect(std::move(name), Capability::InstantApply) {}

void NewlineEffect::apply_instant(text::ComponentBuilder& parent, EffectScope&) {
    parent.append(text::Component::text("\n"));
}

CapitalizeEffect::CapitalizeEffect(std::string name)
    : Effect(std::move(name), Capability::OneShot) {}

std::optional<text::Component> CapitalizeEffect::apply_once(text::Component current,
                                                            text::ComponentBuilder&,
                                                            EffectScope&) {
    std::string content = current.content();
    for (char& c : content) {
        if (std::isalpha(static_cast<unsigned char>(c))) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            break;
        }
    }
    current.set_content(std::move(content));
    return current;
}

PreEffect::PreEffect(std::string name)
    : Effect(std::move(name), Capability::Persistent | Capability::RawModeMarker) {}

TemplateEffect::TemplateEffect(std::string name, text::Component value)
    : Effect(std::move(name), Capability::Persistent | Capability::Inserting), value_(std::move(value)) {}

std::optional<text::Component> TemplateEffect::apply(text::Component current, text::ComponentBuilder& parent) {
    if (!inserted_) {
        parent.append(value_);
        inserted_ = true;
    }
    return current;
}

std::string TemplateEffect::signature() const {
    return "template(" + name() + ")";
}

} // namespace tagtext::markup
