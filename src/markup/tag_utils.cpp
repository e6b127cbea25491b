#include <tagtext/markup/tag_utils.h>
#include <tagtext/markup/tag_span.h>
#include <tagtext/core/config.h>

namespace tagtext::markup {

namespace cfg = tagtext::core::config;

namespace {

void replace_all(std::string& text, std::string_view from, const std::string& to) {
    if (from.empty()) return;
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

std::string escape_tags(std::string_view text) {
    std::string result;
    result.reserve(text.size());

    size_t last_end = 0;
    for (const auto& span : find_tag_spans(text)) {
        result.append(text.substr(last_end, span.begin - last_end));
        last_end = span.end;

        std::string body(span.body(text));
        if (span.has_inner) {
            std::string_view inner = span.inner(text);
            replace_all(body, inner, escape_tags(inner));
        }

        result += cfg::kEscapeMarker;
        result += cfg::kTagStart;
        result += body;
        result += cfg::kTagEnd;
    }
    result.append(text.substr(last_end));
    return result;
}

std::string strip_tags(std::string_view text) {
    std::string result;
    result.reserve(text.size());

    size_t last_end = 0;
    for (const auto& span : find_tag_spans(text)) {
        result.append(text.substr(last_end, span.begin - last_end));
        last_end = span.end;
    }
    result.append(text.substr(last_end));
    return result;
}

std::string unescape_tags(std::string_view text) {
    std::string result;
    result.reserve(text.size());

    size_t last_end = 0;
    for (const auto& span : find_tag_spans(text)) {
        size_t copy_end = span.begin;
        if (span.begin > last_end && text[span.begin - 1] == cfg::kEscapeMarker) {
            --copy_end;
        }
        result.append(text.substr(last_end, copy_end - last_end));
        last_end = span.end;

        std::string body(span.body(text));
        if (span.has_inner) {
            std::string_view inner = span.inner(text);
            replace_all(body, inner, unescape_tags(inner));
        }

        result += cfg::kTagStart;
        result += body;
        result += cfg::kTagEnd;
    }
    result.append(text.substr(last_end));
    return result;
}

} // namespace tagtext::markup
