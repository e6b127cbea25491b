#pragma once
#include <string>
#include <vector>

namespace tagtext::markup {

enum class TokenType {
    String,
    OpenTagStart,
    EscapedOpenTagStart,
    CloseTagStart,
    EscapedCloseTagStart,
    Name,
    ParamSeparator,
    TagEnd,
};

const char* token_type_name(TokenType type);

struct Token {
    TokenType type = TokenType::String;
    // Exact source text, including the escape marker of escaped tag starts.
    std::string text;

    bool is_tag_start() const;
    bool is_escaped() const {
        return type == TokenType::EscapedOpenTagStart || type == TokenType::EscapedCloseTagStart;
    }

    // NAME("red"), used in diagnostics
    std::string describe() const;

    bool operator==(const Token& other) const { return type == other.type && text == other.text; }
    bool operator!=(const Token& other) const { return !(*this == other); }
};

using TokenList = std::vector<Token>;

} // namespace tagtext::markup
