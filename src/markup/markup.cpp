#include <tagtext/markup/markup.h>
#include <tagtext/markup/interpreter.h>
#include <tagtext/markup/scanner.h>
#include <tagtext/markup/tag_utils.h>

namespace tagtext::markup {

Markup::Builder& Markup::Builder::strict(bool enabled) {
    strict_ = enabled;
    return *this;
}

Markup::Builder& Markup::Builder::registry(std::shared_ptr<const TagRegistry> registry) {
    registry_ = std::move(registry);
    return *this;
}

Markup::Builder& Markup::Builder::placeholder_resolver(PlaceholderResolver resolver) {
    resolver_ = std::move(resolver);
    return *this;
}

Markup::Builder& Markup::Builder::add_observer(core::DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
    return *this;
}

Markup::Builder& Markup::Builder::min_severity(core::Severity severity) {
    min_severity_ = severity;
    return *this;
}

Markup Markup::Builder::build() const {
    return Markup(strict_, registry_ ? registry_ : TagRegistry::shared_standard(),
                  resolver_, observers_, min_severity_);
}

Markup::Markup() : registry_(TagRegistry::shared_standard()) {}

Markup::Markup(bool strict, std::shared_ptr<const TagRegistry> registry, PlaceholderResolver resolver,
               std::vector<core::DiagnosticObserver> observers, core::Severity min_severity)
    : strict_(strict),
      registry_(std::move(registry)),
      resolver_(std::move(resolver)),
      observers_(std::move(observers)),
      min_severity_(min_severity) {}

core::DiagnosticEmitter Markup::make_emitter() const {
    core::DiagnosticEmitter emitter;
    emitter.set_min_severity(min_severity_);
    for (const auto& observer : observers_) {
        emitter.add_observer(observer);
    }
    return emitter;
}

text::Component Markup::interpret(std::string_view text, const ComponentTemplateMap& components,
                                  core::DiagnosticEmitter& diagnostics, TokenList* trace) const {
    ResolveContext context;
    context.templates = &components;
    context.placeholder_resolver = &resolver_;
    context.parse_nested = [this, &components, &diagnostics](const std::string& nested) {
        return interpret(nested, components, diagnostics, nullptr);
    };

    TokenList tokens = scan(text, strict_, &diagnostics);
    Interpreter interpreter(*registry_, std::move(context), diagnostics, strict_);
    text::Component result = interpreter.run(std::move(tokens));
    if (trace) {
        *trace = interpreter.tokens();
    }
    return result;
}

ParseResult Markup::run(std::string text, ComponentTemplateMap components, bool substituted) const {
    core::DiagnosticEmitter diagnostics = make_emitter();
    if (substituted) {
        diagnostics.emit(core::Severity::Info, "substitute", "Substituted message: " + text);
    }

    ParseResult result;
    result.component = interpret(text, components, diagnostics, &result.tokens);
    result.diagnostics = diagnostics.events();
    result.substituted_text = std::move(text);
    return result;
}

text::Component Markup::parse(std::string_view text) const {
    return parse_with_diagnostics(text).component;
}

text::Component Markup::parse(std::string_view text, const std::vector<std::string>& placeholders) const {
    return parse_with_diagnostics(text, placeholders).component;
}

text::Component Markup::parse(std::string_view text,
                              const std::map<std::string, std::string>& placeholders) const {
    return parse_with_diagnostics(text, placeholders).component;
}

text::Component Markup::parse(std::string_view text, const std::vector<Template>& templates) const {
    return parse_with_diagnostics(text, templates).component;
}

ParseResult Markup::parse_with_diagnostics(std::string_view text) const {
    return run(std::string(text), {}, false);
}

ParseResult Markup::parse_with_diagnostics(std::string_view text,
                                           const std::vector<std::string>& placeholders) const {
    return run(replace_placeholders_flat(text, placeholders), {}, true);
}

ParseResult Markup::parse_with_diagnostics(std::string_view text,
                                           const std::map<std::string, std::string>& placeholders) const {
    return run(replace_placeholders(text, placeholders), {}, true);
}

ParseResult Markup::parse_with_diagnostics(std::string_view text, const std::vector<Template>& templates) const {
    TemplateSubstitution substitution = apply_templates(text, templates);
    return run(std::move(substitution.text), std::move(substitution.components), true);
}

std::string Markup::escape_tags(std::string_view text) const {
    return markup::escape_tags(text);
}

std::string Markup::strip_tags(std::string_view text) const {
    return markup::strip_tags(text);
}

} // namespace tagtext::markup
