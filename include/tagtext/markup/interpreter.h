#pragma once
#include <tagtext/core/diagnostics.h>
#include <tagtext/markup/effect.h>
#include <tagtext/markup/tag_registry.h>
#include <tagtext/markup/token.h>
#include <tagtext/text/component.h>
#include <string>

namespace tagtext::markup {

enum class InterpreterState {
    Scanning,
    OpenTagName,
    OpenTagAfterName,
    OpenTagParams,
    CloseTagName,
    CloseTagAfterName,
    CloseTagParams
};

const char* interpreter_state_name(InterpreterState state);

// Turns a token stream into a component tree. Malformed or unresolvable tags are
// folded back into literal text (lenient) or raise ParsingError (strict). One
// instance per parse; the registry and context must outlive run().
class Interpreter {
public:
    Interpreter(const TagRegistry& registry, ResolveContext context,
                core::DiagnosticEmitter& diagnostics, bool strict);

    text::Component run(TokenList tokens);

    // Token buffer after recovery: every collapsed run appears as one STRING.
    const TokenList& tokens() const { return tokens_; }
    InterpreterState state() const { return state_; }
    bool raw_mode() const { return raw_mode_; }
    const EffectScope& scope() const { return scope_; }

private:
    // A complete `<name[:params]>` run starting at `start`; `end` is the TAG_END index.
    struct TagRun {
        size_t start = 0;
        size_t end = 0;
        std::string name;
        TokenList params;
    };

    const TagRegistry& registry_;
    ResolveContext context_;
    core::DiagnosticEmitter& diagnostics_;
    bool strict_;

    TokenList tokens_;
    text::ComponentBuilder root_;
    EffectScope scope_;
    InterpreterState state_ = InterpreterState::Scanning;
    bool raw_mode_ = false;
    std::string raw_tag_name_;
    // Literal text read since the last interpreted tag; styled as one node.
    std::string pending_content_;

    // Each handler returns the index to continue from.
    size_t handle_open_tag(size_t index);
    size_t handle_close_tag(size_t index);
    // Styles the pending literal text, drains one-shots and appends the node.
    void flush_content();

    // Reads name, params and TAG_END. Returns false after collapsing a malformed run.
    bool read_tag(size_t index, bool closing, TagRun& run);
    size_t dispatch(EffectPtr effect, size_t next);
    void collapse_raw_region(size_t from);

    // Replaces tokens [first, last) with one STRING holding their concatenated text.
    void collapse(size_t first, size_t last);
    // Same as collapse, dropping the escape marker of a complete escaped tag.
    void collapse_escaped(size_t first, size_t last);
    // Throws in strict mode; otherwise records a warning.
    void report(const std::string& message, int position);
    void warn(const std::string& message, int position);

    void flush_end_of_stream();
    text::Component finish();
};

} // namespace tagtext::markup
