#include <tagtext/markup/tag_span.h>
#include <tagtext/core/config.h>

namespace tagtext::markup {

namespace cfg = tagtext::core::config;

namespace {

bool is_quote(char c) {
    return c == '\'' || c == '"';
}

// Backtracking matcher for
//   '<' [^<>]+ (':' QUOTE? ([^'"] ('\' QUOTE)?)+ QUOTE?)* '>'
// trying alternatives in leftmost-first order. Results of the trailing
// "(':' segment)* '>'" part only depend on the start offset, so they are
// memoized for the lifetime of the matcher.
class SpanMatcher {
public:
    explicit SpanMatcher(std::string_view text)
        : text_(text), memo_(text.size() + 1, Unknown), cache_(text.size() + 1) {}

    std::optional<TagSpan> match_at(size_t open) {
        if (open >= text_.size() || text_[open] != cfg::kTagStart) return std::nullopt;

        size_t head = 0;
        while (open + 1 + head < text_.size()) {
            char c = text_[open + 1 + head];
            if (c == cfg::kTagStart || c == cfg::kTagEnd) break;
            ++head;
        }

        for (size_t len = head; len >= 1; --len) {
            size_t pos = open + 1 + len;
            if (const Tail* tail = match_tail(pos)) {
                TagSpan span;
                span.begin = open;
                span.end = tail->end;
                span.body_begin = open + 1;
                span.body_end = tail->end - 1;
                span.has_inner = tail->has_inner;
                span.inner_begin = tail->inner_begin;
                span.inner_end = tail->inner_end;
                return span;
            }
        }
        return std::nullopt;
    }

private:
    struct Tail {
        size_t end = 0;
        bool has_inner = false;
        size_t inner_begin = 0;
        size_t inner_end = 0;
    };

    enum MemoState : char { Unknown, Failed, Matched };

    std::string_view text_;
    std::vector<MemoState> memo_;
    std::vector<Tail> cache_;

    const Tail* match_tail(size_t pos) {
        if (pos > text_.size()) return nullptr;
        if (memo_[pos] == Failed) return nullptr;
        if (memo_[pos] == Matched) return &cache_[pos];

        std::optional<Tail> found;
        if (pos < text_.size() && text_[pos] == cfg::kParamSeparator) {
            for (size_t seg_end : segment_ends(pos + 1)) {
                if (const Tail* rest = match_tail(seg_end)) {
                    Tail tail = *rest;
                    if (!tail.has_inner) {
                        tail.has_inner = true;
                        tail.inner_begin = pos + 1;
                        tail.inner_end = seg_end;
                    }
                    found = tail;
                    break;
                }
            }
        }
        if (!found && pos < text_.size() && text_[pos] == cfg::kTagEnd) {
            Tail tail;
            tail.end = pos + 1;
            found = tail;
        }

        if (!found) {
            memo_[pos] = Failed;
            return nullptr;
        }
        memo_[pos] = Matched;
        cache_[pos] = *found;
        return &cache_[pos];
    }

    // Candidate end offsets of one argument segment starting at `start`, in the
    // order the greedy quantifiers would try them.
    std::vector<size_t> segment_ends(size_t start) const {
        std::vector<size_t> ends;
        size_t n = text_.size();
        size_t q = start;
        if (q < n && is_quote(text_[q])) ++q;
        if (q >= n || is_quote(text_[q])) return ends;

        size_t m = q + 1;
        bool after_char = true;
        while (m < n) {
            if (after_char && m + 1 < n && text_[m] == cfg::kEscapeMarker && is_quote(text_[m + 1])) {
                m += 2;
                after_char = false;
            } else if (!is_quote(text_[m])) {
                ++m;
                after_char = true;
            } else {
                break;
            }
        }

        for (size_t e = m; e > q; --e) {
            if (e < n && is_quote(text_[e])) {
                ends.push_back(e + 1);
            }
            ends.push_back(e);
        }
        return ends;
    }
};

} // namespace

std::optional<TagSpan> find_tag_span(std::string_view text, size_t from) {
    SpanMatcher matcher(text);
    for (size_t i = from; i < text.size(); ++i) {
        if (text[i] != cfg::kTagStart) continue;
        if (auto span = matcher.match_at(i)) {
            return span;
        }
    }
    return std::nullopt;
}

std::vector<TagSpan> find_tag_spans(std::string_view text) {
    std::vector<TagSpan> spans;
    SpanMatcher matcher(text);
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == cfg::kTagStart) {
            if (auto span = matcher.match_at(i)) {
                spans.push_back(*span);
                i = span->end;
                continue;
            }
        }
        ++i;
    }
    return spans;
}

} // namespace tagtext::markup
