#pragma once
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace tagtext::markup {

// A tag-shaped region of raw text: '<' body '>'. Offsets index the searched text.
struct TagSpan {
    size_t begin = 0;        // the '<'
    size_t end = 0;          // one past the '>'
    size_t body_begin = 0;
    size_t body_end = 0;
    // Last ':'-prefixed argument segment, only reported when the body needed it
    // to reach the closing bracket (quoted text holding '<' or '>').
    bool has_inner = false;
    size_t inner_begin = 0;
    size_t inner_end = 0;

    std::string_view text(std::string_view source) const {
        return source.substr(begin, end - begin);
    }
    std::string_view body(std::string_view source) const {
        return source.substr(body_begin, body_end - body_begin);
    }
    std::string_view inner(std::string_view source) const {
        return has_inner ? source.substr(inner_begin, inner_end - inner_begin) : std::string_view();
    }
};

// Leftmost span starting at or after `from`. Among spans starting at the same
// bracket the shortest plain body wins; a quoted argument is only allowed to
// carry brackets when no plain body closes.
std::optional<TagSpan> find_tag_span(std::string_view text, size_t from = 0);

// All non-overlapping spans, left to right.
std::vector<TagSpan> find_tag_spans(std::string_view text);

} // namespace tagtext::markup
