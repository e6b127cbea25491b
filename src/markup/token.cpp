#include <tagtext/markup/token.h>

namespace tagtext::markup {

const char* token_type_name(TokenType type) {
    switch (type) {
        case TokenType::String:               return "STRING";
        case TokenType::OpenTagStart:         return "OPEN_TAG_START";
        case TokenType::EscapedOpenTagStart:  return "ESCAPED_OPEN_TAG_START";
        case TokenType::CloseTagStart:        return "CLOSE_TAG_START";
        case TokenType::EscapedCloseTagStart: return "ESCAPED_CLOSE_TAG_START";
        case TokenType::Name:                 return "NAME";
        case TokenType::ParamSeparator:       return "PARAM_SEPARATOR";
        case TokenType::TagEnd:               return "TAG_END";
    }
    return "UNKNOWN";
}

bool Token::is_tag_start() const {
    switch (type) {
        case TokenType::OpenTagStart:
        case TokenType::EscapedOpenTagStart:
        case TokenType::CloseTagStart:
        case TokenType::EscapedCloseTagStart:
            return true;
        default:
            return false;
    }
}

std::string Token::describe() const {
    return std::string(token_type_name(type)) + "(\"" + text + "\")";
}

} // namespace tagtext::markup
