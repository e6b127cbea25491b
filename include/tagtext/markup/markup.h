#pragma once
#include <tagtext/core/diagnostics.h>
#include <tagtext/markup/tag_registry.h>
#include <tagtext/markup/template.h>
#include <tagtext/markup/token.h>
#include <tagtext/text/component.h>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tagtext::markup {

// Everything one parse produced, for debugging and tracing.
struct ParseResult {
    text::Component component;
    std::vector<core::DiagnosticEvent> diagnostics;
    std::string substituted_text;
    // Token buffer after recovery, collapsed runs included.
    TokenList tokens;
};

// Entry point for the markup language. Immutable once built, so one instance may
// serve concurrent parses; every call gets its own scanner, interpreter and
// diagnostic emitter.
class Markup {
public:
    class Builder {
    public:
        Builder& strict(bool enabled);
        Builder& registry(std::shared_ptr<const TagRegistry> registry);
        Builder& placeholder_resolver(PlaceholderResolver resolver);
        // Observers see every diagnostic of every parse, in emission order.
        Builder& add_observer(core::DiagnosticObserver observer);
        Builder& min_severity(core::Severity severity);

        Markup build() const;

    private:
        bool strict_ = false;
        std::shared_ptr<const TagRegistry> registry_;
        PlaceholderResolver resolver_;
        std::vector<core::DiagnosticObserver> observers_;
        core::Severity min_severity_ = core::Severity::Info;
    };

    // Lenient, standard tags, no placeholder resolver.
    Markup();

    static Builder builder() { return Builder(); }

    text::Component parse(std::string_view text) const;
    // Alternating key, value pairs; throws PlaceholderError on an odd count.
    text::Component parse(std::string_view text, const std::vector<std::string>& placeholders) const;
    text::Component parse(std::string_view text, const std::map<std::string, std::string>& placeholders) const;
    text::Component parse(std::string_view text, const std::vector<Template>& templates) const;

    ParseResult parse_with_diagnostics(std::string_view text) const;
    ParseResult parse_with_diagnostics(std::string_view text, const std::vector<std::string>& placeholders) const;
    ParseResult parse_with_diagnostics(std::string_view text,
                                       const std::map<std::string, std::string>& placeholders) const;
    ParseResult parse_with_diagnostics(std::string_view text, const std::vector<Template>& templates) const;

    std::string escape_tags(std::string_view text) const;
    std::string strip_tags(std::string_view text) const;

    bool strict() const { return strict_; }
    const TagRegistry& registry() const { return *registry_; }

private:
    Markup(bool strict, std::shared_ptr<const TagRegistry> registry, PlaceholderResolver resolver,
           std::vector<core::DiagnosticObserver> observers, core::Severity min_severity);

    bool strict_ = false;
    std::shared_ptr<const TagRegistry> registry_;
    PlaceholderResolver resolver_;
    std::vector<core::DiagnosticObserver> observers_;
    core::Severity min_severity_ = core::Severity::Info;

    core::DiagnosticEmitter make_emitter() const;
    ParseResult run(std::string text, ComponentTemplateMap components, bool substituted) const;
    text::Component interpret(std::string_view text, const ComponentTemplateMap& components,
                              core::DiagnosticEmitter& diagnostics, TokenList* trace) const;
};

} // namespace tagtext::markup
