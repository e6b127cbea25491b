#pragma once
#include <tagtext/core/diagnostics.h>
#include <tagtext/markup/token.h>
#include <string>
#include <string_view>

namespace tagtext::markup {

enum class ScannerState {
    Data, Tag, Param, QuotedParam
};

bool is_name_char(char c);

// Splits placeholder-substituted markup into tokens. A `<` only opens a tag when
// a name (or `/` and a name) follows it; any other `<` is literal text.
class Scanner {
public:
    explicit Scanner(std::string_view input, bool strict = false,
                     core::DiagnosticEmitter* diagnostics = nullptr);

    // Throws ParsingError on an unterminated quoted argument in strict mode;
    // otherwise reports it at the "scan" stage and keeps the rest as the argument.
    TokenList scan();

    ScannerState state() const { return state_; }

private:
    std::string_view input_;
    size_t pos_ = 0;
    bool strict_;
    core::DiagnosticEmitter* diagnostics_;
    ScannerState state_ = ScannerState::Data;
    TokenList tokens_;
    std::string pending_;  // literal text waiting to become a STRING token

    char peek(size_t ahead = 0) const;
    bool at_end() const;
    bool tag_follows(size_t offset) const;
    void emit(TokenType type, std::string text);
    void flush_pending();

    void scan_data();
    void scan_tag();
    void scan_param();
    void scan_quoted_param();
};

// Joins runs of adjacent STRING tokens in place.
void merge_strings(TokenList& tokens);

TokenList scan(std::string_view input, bool strict = false,
               core::DiagnosticEmitter* diagnostics = nullptr);

} // namespace tagtext::markup
