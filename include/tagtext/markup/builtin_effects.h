#pragma once
#include <tagtext/markup/effect.h>
#include <tagtext/text/color.h>
#include <tagtext/text/style.h>
#include <memory>
#include <string>

namespace tagtext::markup {

class ColorEffect : public Effect {
public:
    ColorEffect(std::string name, text::TextColor color);
    std::optional<text::Component> apply(text::Component current, text::ComponentBuilder& parent) override;
    std::string signature() const override;
    const text::TextColor& color() const { return color_; }

private:
    text::TextColor color_;
};

class DecorationEffect : public Effect {
public:
    DecorationEffect(std::string name, text::Decoration decoration, bool enabled);
    std::optional<text::Component> apply(text::Component current, text::ComponentBuilder& parent) override;
    std::string signature() const override;

private:
    text::Decoration decoration_;
    bool enabled_;
};

class ClickEffect : public Effect {
public:
    ClickEffect(std::string name, text::ClickEvent event);
    std::optional<text::Component> apply(text::Component current, text::ComponentBuilder& parent) override;
    std::string signature() const override;

private:
    text::ClickEvent event_;
};

class HoverEffect : public Effect {
public:
    HoverEffect(std::string name, text::Component hover_text);
    std::optional<text::Component> apply(text::Component current, text::ComponentBuilder& parent) override;
    std::string signature() const override;

private:
    std::shared_ptr<const text::Component> hover_text_;
};

class InsertionEffect : public Effect {
public:
    InsertionEffect(std::string name, std::string insertion);
    std::optional<text::Component> apply(text::Component current, text::ComponentBuilder& parent) override;
    std::string signature() const override;

private:
    std::string insertion_;
};

class FontEffect : public Effect {
public:
    FontEffect(std::string name, std::string font);
    std::optional<text::Component> apply(text::Component current, text::ComponentBuilder& parent) override;
    std::string signature() const override;

private:
    std::string font_;
};

// <reset>: closes every open scope entry.
class ResetEffect : public Effect {
public:
    explicit ResetEffect(std::string name);
    void apply_instant(text::ComponentBuilder& parent, EffectScope& scope) override;
};

// <newline>: appends a line break node to the root.
class NewlineEffect : public Effect {
public:
    explicit NewlineEffect(std::string name);
    void apply_instant(text::ComponentBuilder& parent, EffectScope& scope) override;
};

// <capitalize>: upper-cases the first letter of the next content node.
class CapitalizeEffect : public Effect {
public:
    explicit CapitalizeEffect(std::string name);
    std::optional<text::Component> apply_once(text::Component current,
                                              text::ComponentBuilder& parent,
                                              EffectScope& scope) override;
};

// <pre>: everything up to </pre> is literal text.
class PreEffect : public Effect {
public:
    explicit PreEffect(std::string name);
};

// Component template or placeholder-resolver hit. Appends its subtree to the
// root the first time it is applied, ahead of the node being styled.
class TemplateEffect : public Effect {
public:
    TemplateEffect(std::string name, text::Component value);
    std::optional<text::Component> apply(text::Component current, text::ComponentBuilder& parent) override;
    std::string signature() const override;
    bool inserted() const { return inserted_; }

private:
    text::Component value_;
    bool inserted_ = false;
};

} // namespace tagtext::markup
