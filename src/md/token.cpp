#include <nocomment/md/token.hpp>

namespace nocomment {

bool BlockDetail::operator==(const BlockDetail& o) const {
    return level == o.level && tight == o.tight && mark == o.mark &&
           start == o.start && task == o.task && task_mark == o.task_mark &&
           fence == o.fence && info == o.info && align == o.align;
}

bool SpanDetail::operator==(const SpanDetail& o) const {
    return href == o.href && title == o.title && autolink == o.autolink;
}

bool Token::operator==(const Token& o) const {
    if (kind != o.kind || text != o.text) return false;
    switch (kind) {
    case TokenKind::BlockStart:
    case TokenKind::BlockEnd:
        return block == o.block && block_detail == o.block_detail;
    case TokenKind::SpanStart:
    case TokenKind::SpanEnd:
        return span == o.span && span_detail == o.span_detail;
    default:
        return true;
    }
}

// ---------------------------------------------------------------------------
// Factories
// ---------------------------------------------------------------------------

static Token make(TokenKind kind, std::string text) {
    Token t;
    t.kind = kind;
    t.text = std::move(text);
    return t;
}

Token text_token(std::string text) { return make(TokenKind::Text, std::move(text)); }
Token html_token(std::string text) { return make(TokenKind::Html, std::move(text)); }
Token code_token(std::string text) { return make(TokenKind::Code, std::move(text)); }
Token entity_token(std::string text) { return make(TokenKind::Entity, std::move(text)); }
Token math_token(std::string text) { return make(TokenKind::Math, std::move(text)); }
Token soft_break() { return make(TokenKind::SoftBreak, "\n"); }
Token hard_break() { return make(TokenKind::HardBreak, "\n"); }

Token block_start(BlockType type, BlockDetail detail) {
    Token t = make(TokenKind::BlockStart, "");
    t.block = type;
    t.block_detail = std::move(detail);
    return t;
}

Token block_end(BlockType type, BlockDetail detail) {
    Token t = make(TokenKind::BlockEnd, "");
    t.block = type;
    t.block_detail = std::move(detail);
    return t;
}

Token span_start(SpanType type, SpanDetail detail) {
    Token t = make(TokenKind::SpanStart, "");
    t.span = type;
    t.span_detail = std::move(detail);
    return t;
}

Token span_end(SpanType type, SpanDetail detail) {
    Token t = make(TokenKind::SpanEnd, "");
    t.span = type;
    t.span_detail = std::move(detail);
    return t;
}

// ---------------------------------------------------------------------------
// Names
// ---------------------------------------------------------------------------

const char* token_kind_name(TokenKind k) {
    switch (k) {
    case TokenKind::BlockStart: return "BlockStart";
    case TokenKind::BlockEnd:   return "BlockEnd";
    case TokenKind::SpanStart:  return "SpanStart";
    case TokenKind::SpanEnd:    return "SpanEnd";
    case TokenKind::Text:       return "Text";
    case TokenKind::Html:       return "Html";
    case TokenKind::Code:       return "Code";
    case TokenKind::Entity:     return "Entity";
    case TokenKind::NullChar:   return "NullChar";
    case TokenKind::SoftBreak:  return "SoftBreak";
    case TokenKind::HardBreak:  return "HardBreak";
    case TokenKind::Math:       return "Math";
    }
    return "Unknown";
}

const char* block_type_name(BlockType t) {
    switch (t) {
    case BlockType::Document:        return "Document";
    case BlockType::Quote:           return "Quote";
    case BlockType::BulletList:      return "BulletList";
    case BlockType::OrderedList:     return "OrderedList";
    case BlockType::ListItem:        return "ListItem";
    case BlockType::Rule:            return "Rule";
    case BlockType::Heading:         return "Heading";
    case BlockType::CodeBlock:       return "CodeBlock";
    case BlockType::HtmlBlock:       return "HtmlBlock";
    case BlockType::Paragraph:       return "Paragraph";
    case BlockType::Table:           return "Table";
    case BlockType::TableHead:       return "TableHead";
    case BlockType::TableBody:       return "TableBody";
    case BlockType::TableRow:        return "TableRow";
    case BlockType::TableHeaderCell: return "TableHeaderCell";
    case BlockType::TableCell:       return "TableCell";
    }
    return "Unknown";
}

const char* span_type_name(SpanType t) {
    switch (t) {
    case SpanType::Emphasis:      return "Emphasis";
    case SpanType::Strong:        return "Strong";
    case SpanType::Link:          return "Link";
    case SpanType::Image:         return "Image";
    case SpanType::Code:          return "Code";
    case SpanType::Strikethrough: return "Strikethrough";
    case SpanType::Math:          return "Math";
    case SpanType::MathDisplay:   return "MathDisplay";
    case SpanType::WikiLink:      return "WikiLink";
    case SpanType::Underline:     return "Underline";
    }
    return "Unknown";
}

static std::string quoted(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        default:   out += c; break;
        }
    }
    out += "\"";
    return out;
}

std::string describe(const Token& t) {
    std::string out = token_kind_name(t.kind);
    switch (t.kind) {
    case TokenKind::BlockStart:
    case TokenKind::BlockEnd:
        out += "(";
        out += block_type_name(t.block);
        out += ")";
        break;
    case TokenKind::SpanStart:
    case TokenKind::SpanEnd:
        out += "(";
        out += span_type_name(t.span);
        out += ")";
        break;
    case TokenKind::SoftBreak:
    case TokenKind::HardBreak:
        break;
    default:
        out += " ";
        out += quoted(t.text);
        break;
    }
    return out;
}

} // namespace nocomment
