#include <tagtext/markup/interpreter.h>
#include <tagtext/markup/errors.h>
#include <tagtext/core/config.h>
#include <cctype>
#include <cstddef>

namespace tagtext::markup {

namespace cfg = tagtext::core::config;

namespace {

constexpr const char* kStage = "parse";

std::string to_lower_ascii(const std::string& text) {
    std::string lowered = text;
    for (char& c : lowered) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lowered;
}

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

const char* interpreter_state_name(InterpreterState state) {
    switch (state) {
        case InterpreterState::Scanning:          return "Scanning";
        case InterpreterState::OpenTagName:       return "OpenTagName";
        case InterpreterState::OpenTagAfterName:  return "OpenTagAfterName";
        case InterpreterState::OpenTagParams:     return "OpenTagParams";
        case InterpreterState::CloseTagName:      return "CloseTagName";
        case InterpreterState::CloseTagAfterName: return "CloseTagAfterName";
        case InterpreterState::CloseTagParams:    return "CloseTagParams";
    }
    return "Unknown";
}

Interpreter::Interpreter(const TagRegistry& registry, ResolveContext context,
                         core::DiagnosticEmitter& diagnostics, bool strict)
    : registry_(registry), context_(std::move(context)), diagnostics_(diagnostics), strict_(strict) {}

text::Component Interpreter::run(TokenList tokens) {
    tokens_ = std::move(tokens);
    state_ = InterpreterState::Scanning;

    size_t i = 0;
    while (i < tokens_.size()) {
        switch (tokens_[i].type) {
            case TokenType::OpenTagStart:
            case TokenType::EscapedOpenTagStart:
                i = handle_open_tag(i);
                break;
            case TokenType::CloseTagStart:
            case TokenType::EscapedCloseTagStart:
                i = handle_close_tag(i);
                break;
            default:
                // STRING, or a stray tag piece left over from recovery
                pending_content_ += tokens_[i].text;
                ++i;
                break;
        }
    }

    flush_end_of_stream();
    return finish();
}

bool Interpreter::read_tag(size_t index, bool closing, TagRun& run) {
    const bool quiet = tokens_[index].is_escaped() || raw_mode_;
    const std::string opener = closing ? "</" : "<";
    const int position = static_cast<int>(index);
    state_ = closing ? InterpreterState::CloseTagName : InterpreterState::OpenTagName;

    if (index + 1 >= tokens_.size()) {
        if (!quiet) report("Expected a tag name after '" + opener + "' but reached the end of input", position);
        collapse(index, index + 1);
        return false;
    }

    const Token& next = tokens_[index + 1];
    if (tokens_[index].is_escaped() && next.is_tag_start()) {
        // \<<red>: only the escaped bracket is literal, the tag after it is real
        collapse(index, index + 1);
        return false;
    }
    if (next.type != TokenType::Name) {
        if (!quiet) report("Expected NAME after '" + opener + "', found " + next.describe(), position + 1);
        collapse(index, index + 1);
        return false;
    }

    run.start = index;
    run.name = next.text;
    state_ = closing ? InterpreterState::CloseTagAfterName : InterpreterState::OpenTagAfterName;

    size_t after = index + 2;
    if (after >= tokens_.size()) {
        if (!quiet) {
            report("Expected '>' or ':' after tag name '" + run.name + "' but reached the end of input",
                   static_cast<int>(after));
        }
        collapse(index, after);
        return false;
    }
    if (tokens_[after].type == TokenType::TagEnd) {
        run.end = after;
        return true;
    }
    if (tokens_[after].type != TokenType::ParamSeparator) {
        if (!quiet) {
            report("Expected '>' or ':' after tag name '" + run.name + "', found " +
                   tokens_[after].describe(), static_cast<int>(after));
        }
        collapse(index, after);
        return false;
    }

    state_ = closing ? InterpreterState::CloseTagParams : InterpreterState::OpenTagParams;
    size_t j = after + 1;
    while (j < tokens_.size() && tokens_[j].type != TokenType::TagEnd && !tokens_[j].is_tag_start()) {
        run.params.push_back(tokens_[j]);
        ++j;
    }
    if (j >= tokens_.size() || tokens_[j].type != TokenType::TagEnd) {
        if (!quiet) report("Expected '>' to end tag '" + run.name + "'", static_cast<int>(j));
        collapse(index, j);
        return false;
    }

    run.end = j;
    return true;
}

size_t Interpreter::handle_open_tag(size_t index) {
    TagRun run;
    const bool ok = read_tag(index, false, run);
    state_ = InterpreterState::Scanning;
    if (!ok) return index;

    if (raw_mode_) {
        collapse(run.start, run.end + 1);
        return index;
    }
    if (tokens_[index].is_escaped()) {
        collapse_escaped(run.start, run.end + 1);
        return index;
    }

    EffectPtr effect = registry_.resolve(run.name, run.params, context_);
    if (!effect) {
        if (registry_.exists(run.name)) {
            report("Invalid arguments for tag '" + run.name + "'", static_cast<int>(index));
        } else {
            report("Unknown tag '" + run.name + "'", static_cast<int>(index));
        }
        collapse(run.start, run.end + 1);
        return index;
    }

    flush_content();
    return dispatch(std::move(effect), run.end + 1);
}

size_t Interpreter::handle_close_tag(size_t index) {
    TagRun run;
    const bool ok = read_tag(index, true, run);
    state_ = InterpreterState::Scanning;
    if (!ok) return index;

    if (raw_mode_ && !iequals(run.name, raw_tag_name_)) {
        collapse(run.start, run.end + 1);
        return index;
    }
    if (tokens_[index].is_escaped()) {
        collapse_escaped(run.start, run.end + 1);
        return index;
    }

    if (!registry_.exists(run.name)) {
        report("Unknown closing tag '" + run.name + "'", static_cast<int>(index));
        collapse(run.start, run.end + 1);
        return index;
    }

    EffectPtr removed;
    if (run.params.empty()) {
        flush_content();
        removed = scope_.remove_last_named(to_lower_ascii(run.name));
    } else {
        EffectPtr effect = registry_.resolve(run.name, run.params, context_);
        if (!effect) {
            report("Invalid arguments for closing tag '" + run.name + "'", static_cast<int>(index));
            collapse(run.start, run.end + 1);
            return index;
        }
        flush_content();
        removed = scope_.remove_first_equal(*effect);
    }

    if (!removed) {
        warn("Closing tag '" + run.name + "' does not match an open tag", static_cast<int>(index));
    } else if (removed->has(Capability::RawModeMarker)) {
        raw_mode_ = false;
        raw_tag_name_.clear();
    }
    return run.end + 1;
}

size_t Interpreter::dispatch(EffectPtr effect, size_t next) {
    if (effect->has(Capability::InstantApply)) {
        effect->apply_instant(root_, scope_);
        return next;
    }
    if (effect->has(Capability::OneShot)) {
        scope_.enqueue_once(std::move(effect));
        return next;
    }

    const bool raw = effect->has(Capability::RawModeMarker);
    if (raw) {
        raw_mode_ = true;
        raw_tag_name_ = effect->name();
    }
    scope_.open(std::move(effect));
    if (raw) {
        collapse_raw_region(next);
    }
    return next;
}

void Interpreter::collapse_raw_region(size_t from) {
    size_t k = from;
    for (; k < tokens_.size(); ++k) {
        if (tokens_[k].type == TokenType::CloseTagStart && k + 2 < tokens_.size() &&
            tokens_[k + 1].type == TokenType::Name && iequals(tokens_[k + 1].text, raw_tag_name_) &&
            tokens_[k + 2].type == TokenType::TagEnd) {
            break;
        }
    }
    if (k > from) {
        collapse(from, k);
    }
}

void Interpreter::flush_content() {
    if (pending_content_.empty()) return;
    std::optional<text::Component> current = text::Component::text(std::move(pending_content_));
    pending_content_.clear();

    for (const auto& effect : scope_.active()) {
        current = effect->apply(std::move(*current), root_);
        if (!current) break;
    }

    // The queue belongs to this node even when it was dropped. One-shots may
    // queue further one-shots; those run before the node is appended.
    while (scope_.has_pending_once()) {
        EffectPtr once = scope_.take_newest_once();
        if (current) {
            current = once->apply_once(std::move(*current), root_, scope_);
        }
    }

    if (current) {
        root_.append(std::move(*current));
    }
}

void Interpreter::flush_end_of_stream() {
    flush_content();

    text::Component last = root_.children().empty() ? text::Component::empty()
                                                    : root_.children().back();

    scope_.for_each_active([this, &last](Effect& effect) {
        if (!effect.has(Capability::Inserting)) return;
        if (auto result = effect.apply(last, root_)) {
            last = std::move(*result);
        }
    });

    while (scope_.has_pending_once()) {
        EffectPtr once = scope_.take_oldest_once();
        if (auto result = once->apply_once(last, root_, scope_)) {
            last = std::move(*result);
        }
    }
}

text::Component Interpreter::finish() {
    text::Component result = root_.build();
    if (result.content().empty() && result.children().size() == 1) {
        return result.children().front();
    }
    return result;
}

void Interpreter::collapse(size_t first, size_t last) {
    if (last > tokens_.size()) last = tokens_.size();
    if (first >= last) return;

    std::string text;
    for (size_t k = first; k < last; ++k) {
        text += tokens_[k].text;
    }
    tokens_.erase(tokens_.begin() + static_cast<std::ptrdiff_t>(first) + 1,
                  tokens_.begin() + static_cast<std::ptrdiff_t>(last));
    tokens_[first] = Token{TokenType::String, std::move(text)};
}

void Interpreter::collapse_escaped(size_t first, size_t last) {
    std::string& marker = tokens_[first].text;
    if (!marker.empty() && marker.front() == cfg::kEscapeMarker) {
        marker.erase(0, 1);
    }
    collapse(first, last);
}

void Interpreter::report(const std::string& message, int position) {
    if (strict_) {
        throw ParsingError(message, position);
    }
    warn(message, position);
}

void Interpreter::warn(const std::string& message, int position) {
    diagnostics_.emit(core::Severity::Warning, kStage, message, position);
}

} // namespace tagtext::markup
