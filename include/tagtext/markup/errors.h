#pragma once
#include <stdexcept>
#include <string>

namespace tagtext::markup {

// Malformed markup in strict mode, or an unterminated quoted argument.
class ParsingError : public std::runtime_error {
public:
    explicit ParsingError(const std::string& message, int position = -1)
        : std::runtime_error(message), position_(position) {}

    // Token index (interpreter) or character offset (scanner); -1 when unknown.
    int position() const { return position_; }

private:
    int position_;
};

// Caller contract violation in the placeholder arguments, raised in every mode.
class PlaceholderError : public std::invalid_argument {
public:
    explicit PlaceholderError(const std::string& message)
        : std::invalid_argument(message) {}
};

} // namespace tagtext::markup
