#include <tagtext/markup/scanner.h>
#include <tagtext/markup/errors.h>
#include <tagtext/core/config.h>
#include <cctype>

namespace tagtext::markup {

namespace cfg = tagtext::core::config;

bool is_name_char(char c) {
    if (std::isalnum(static_cast<unsigned char>(c))) return true;
    switch (c) {
        case '_': case '-': case '#': case '!': case '?': case '.': case '+':
            return true;
        default:
            return false;
    }
}

Scanner::Scanner(std::string_view input, bool strict, core::DiagnosticEmitter* diagnostics)
    : input_(input), strict_(strict), diagnostics_(diagnostics) {}

char Scanner::peek(size_t ahead) const {
    if (pos_ + ahead < input_.size()) {
        return input_[pos_ + ahead];
    }
    return '\0';
}

bool Scanner::at_end() const {
    return pos_ >= input_.size();
}

bool Scanner::tag_follows(size_t offset) const {
    if (pos_ + offset >= input_.size()) return false;
    char c = peek(offset);
    if (is_name_char(c)) return true;
    return c == cfg::kCloseMarker && pos_ + offset + 1 < input_.size() && is_name_char(peek(offset + 1));
}

void Scanner::emit(TokenType type, std::string text) {
    tokens_.push_back(Token{type, std::move(text)});
}

void Scanner::flush_pending() {
    if (!pending_.empty()) {
        emit(TokenType::String, std::move(pending_));
        pending_.clear();
    }
}

TokenList Scanner::scan() {
    tokens_.clear();
    pending_.clear();
    pos_ = 0;
    state_ = ScannerState::Data;

    while (!at_end()) {
        switch (state_) {
            case ScannerState::Data:        scan_data(); break;
            case ScannerState::Tag:         scan_tag(); break;
            case ScannerState::Param:       scan_param(); break;
            case ScannerState::QuotedParam: scan_quoted_param(); break;
        }
    }
    flush_pending();

    TokenList result = std::move(tokens_);
    tokens_.clear();
    merge_strings(result);
    return result;
}

void Scanner::scan_data() {
    char c = peek();

    if (c == cfg::kEscapeMarker && peek(1) == cfg::kTagStart) {
        flush_pending();
        if (peek(2) == cfg::kCloseMarker) {
            emit(TokenType::EscapedCloseTagStart, "\\</");
            pos_ += 3;
        } else {
            emit(TokenType::EscapedOpenTagStart, "\\<");
            pos_ += 2;
        }
        state_ = ScannerState::Tag;
        return;
    }

    if (c == cfg::kTagStart && tag_follows(1)) {
        flush_pending();
        if (peek(1) == cfg::kCloseMarker) {
            emit(TokenType::CloseTagStart, "</");
            pos_ += 2;
        } else {
            emit(TokenType::OpenTagStart, "<");
            pos_ += 1;
        }
        state_ = ScannerState::Tag;
        return;
    }

    pending_ += c;
    ++pos_;
}

void Scanner::scan_tag() {
    char c = peek();

    if (is_name_char(c)) {
        size_t start = pos_;
        while (!at_end() && is_name_char(peek())) {
            ++pos_;
        }
        emit(TokenType::Name, std::string(input_.substr(start, pos_ - start)));
        return;
    }
    if (c == cfg::kParamSeparator) {
        emit(TokenType::ParamSeparator, std::string(1, c));
        ++pos_;
        state_ = ScannerState::Param;
        return;
    }
    if (c == cfg::kTagEnd) {
        emit(TokenType::TagEnd, std::string(1, c));
        ++pos_;
        state_ = ScannerState::Data;
        return;
    }

    // Not part of a tag; reprocess as text.
    state_ = ScannerState::Data;
}

void Scanner::scan_param() {
    char c = peek();

    if (c == cfg::kParamSeparator) {
        emit(TokenType::ParamSeparator, std::string(1, c));
        ++pos_;
        return;
    }
    if (c == cfg::kTagEnd) {
        emit(TokenType::TagEnd, std::string(1, c));
        ++pos_;
        state_ = ScannerState::Data;
        return;
    }
    if (c == cfg::kTagStart) {
        state_ = ScannerState::Data;
        return;
    }

    bool argument_start = !tokens_.empty() && tokens_.back().type == TokenType::ParamSeparator;
    if ((c == '\'' || c == '"') && argument_start) {
        state_ = ScannerState::QuotedParam;
        return;
    }

    size_t start = pos_;
    while (!at_end()) {
        char ch = peek();
        if (ch == cfg::kParamSeparator || ch == cfg::kTagEnd || ch == cfg::kTagStart) break;
        ++pos_;
    }
    emit(TokenType::String, std::string(input_.substr(start, pos_ - start)));
}

void Scanner::scan_quoted_param() {
    size_t start = pos_;
    char quote = peek();
    ++pos_;

    while (!at_end()) {
        char ch = peek();
        if (ch == cfg::kEscapeMarker && peek(1) == quote) {
            pos_ += 2;
            continue;
        }
        ++pos_;
        if (ch == quote) {
            emit(TokenType::String, std::string(input_.substr(start, pos_ - start)));
            state_ = ScannerState::Param;
            return;
        }
    }

    std::string message = "Unterminated quoted argument starting at offset " + std::to_string(start);
    if (strict_) {
        throw ParsingError(message, static_cast<int>(start));
    }
    if (diagnostics_) {
        diagnostics_->emit(core::Severity::Warning, "scan", message, static_cast<int>(start));
    }
    emit(TokenType::String, std::string(input_.substr(start)));
    state_ = ScannerState::Param;
}

void merge_strings(TokenList& tokens) {
    if (tokens.empty()) return;

    TokenList merged;
    merged.reserve(tokens.size());
    for (auto& token : tokens) {
        if (!merged.empty() && token.type == TokenType::String &&
            merged.back().type == TokenType::String) {
            merged.back().text += token.text;
        } else {
            merged.push_back(std::move(token));
        }
    }
    tokens = std::move(merged);
}

TokenList scan(std::string_view input, bool strict, core::DiagnosticEmitter* diagnostics) {
    Scanner scanner(input, strict, diagnostics);
    return scanner.scan();
}

} // namespace tagtext::markup
