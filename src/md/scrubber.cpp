#include <nocomment/md/scrubber.hpp>
#include <nocomment/log.hpp>

namespace nocomment {

namespace {

constexpr const char* COMMENT_START = "<!--";
constexpr const char* COMMENT_END = "-->";

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_comment(const std::string& s) {
    size_t end = s.find_last_not_of(" \t\r\n\f\v");
    if (end == std::string::npos) return false;
    static const std::string marker = COMMENT_END;
    return end + 1 >= marker.size() &&
           s.compare(end + 1 - marker.size(), marker.size(), marker) == 0;
}

// Outcome of probing for a comment at one position. A span that is not
// closed consumes nothing.
struct CommentSpan {
    bool closed = false;
    size_t length = 0;
    std::string text;
};

// Read-only cursor over the materialized stream. `pos` is the first token
// of the candidate span; lookahead never moves the caller's position.
struct Cursor {
    const TokenList& tokens;
    size_t pos;

    bool has(size_t offset) const { return pos + offset < tokens.size(); }

    const Token* peek(size_t offset) const {
        return has(offset) ? &tokens[pos + offset] : nullptr;
    }
};

// "<" followed by "!--..."; the tokenizer emits this shape when the comment
// is not valid raw HTML (for example one containing "--").
CommentSpan match_split_comment(const Cursor& cur) {
    CommentSpan span;
    const Token* next = cur.peek(1);
    if (!next || !next->is_text() || !starts_with(next->text, "!--")) {
        return span;
    }

    span.text = cur.peek(0)->text + next->text;
    if (ends_comment(next->text)) {
        span.closed = true;
        span.length = 2;
        return span;
    }

    for (size_t offset = 2; cur.has(offset); ++offset) {
        const Token& t = *cur.peek(offset);
        if (!t.is_text()) {
            // Paragraph breaks and other structure inside the comment
            continue;
        }
        span.text += t.text;
        if (ends_comment(t.text)) {
            span.closed = true;
            span.length = offset + 1;
            return span;
        }
    }

    span.text.clear();
    return span;
}

// An Html token starting with "<!--", optionally continued by further Html
// tokens (one per line of an HTML block).
CommentSpan match_markup_comment(const Cursor& cur) {
    CommentSpan span;
    span.text = cur.peek(0)->text;
    if (ends_comment(span.text)) {
        span.closed = true;
        span.length = 1;
        return span;
    }

    for (size_t offset = 1; cur.has(offset); ++offset) {
        const Token& t = *cur.peek(offset);
        if (!t.is_html()) break;
        span.text += t.text;
        if (ends_comment(t.text)) {
            span.closed = true;
            span.length = offset + 1;
            return span;
        }
    }

    span.text.clear();
    return span;
}

CommentSpan match_comment(const Cursor& cur) {
    const Token& current = *cur.peek(0);
    if (current.is_text() && current.text == "<") {
        return match_split_comment(cur);
    }
    if (current.is_html() && starts_with(current.text, COMMENT_START)) {
        return match_markup_comment(cur);
    }
    return {};
}

} // anonymous namespace

ScrubResult scrub_comments(const TokenList& tokens) {
    ScrubResult result;
    result.tokens.reserve(tokens.size());

    size_t pos = 0;
    while (pos < tokens.size()) {
        CommentSpan span = match_comment(Cursor{tokens, pos});
        if (span.closed) {
            log::debug("Comment: %s", span.text.c_str());
            result.comments.push_back(std::move(span.text));
            pos += span.length;
            continue;
        }
        result.tokens.push_back(tokens[pos]);
        ++pos;
    }

    return result;
}

TokenList scrub(const TokenList& tokens) {
    return scrub_comments(tokens).tokens;
}

} // namespace nocomment
