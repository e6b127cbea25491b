#pragma once
#include <string>
#include <string_view>

namespace tagtext::markup {

// Puts an escape marker in front of every tag span, including spans nested in
// a quoted argument, so the text parses back to itself as literal content.
std::string escape_tags(std::string_view text);

// Removes every tag span, keeping the text around them in order.
std::string strip_tags(std::string_view text);

// Inverse of escape_tags: drops one escape marker in front of each tag span.
// A marker before text that is not tag-shaped is kept.
std::string unescape_tags(std::string_view text);

} // namespace tagtext::markup
