#pragma once

#include <string>
#include <vector>

namespace nocomment {

enum class TokenKind {
    BlockStart,
    BlockEnd,
    SpanStart,
    SpanEnd,
    Text,       // plain inline text; a lone "<" is always its own token
    Html,       // raw markup: HTML block lines and inline raw HTML
    Code,       // code span or code block contents
    Entity,     // entity reference, kept verbatim ("&amp;")
    NullChar,
    SoftBreak,
    HardBreak,
    Math        // LaTeX math contents
};

enum class BlockType {
    Document,
    Quote,
    BulletList,
    OrderedList,
    ListItem,
    Rule,
    Heading,
    CodeBlock,
    HtmlBlock,
    Paragraph,
    Table,
    TableHead,
    TableBody,
    TableRow,
    TableHeaderCell,
    TableCell
};

enum class SpanType {
    Emphasis,
    Strong,
    Link,
    Image,
    Code,
    Strikethrough,
    Math,
    MathDisplay,
    WikiLink,
    Underline
};

enum class Align { Default, Left, Center, Right };

// Rendering detail for BlockStart/BlockEnd. Only the fields relevant to the
// block type are meaningful.
struct BlockDetail {
    int level = 0;            // Heading: 1..6
    bool tight = false;       // lists
    char mark = '*';          // BulletList: '*', '-', '+'; OrderedList: '.' or ')'
    unsigned start = 1;       // OrderedList
    bool task = false;        // ListItem
    char task_mark = ' ';     // ListItem: ' ', 'x', 'X'
    char fence = 0;           // CodeBlock: '`', '~', or 0 for indented code
    std::string info;         // CodeBlock info string
    Align align = Align::Default;  // table cells

    bool operator==(const BlockDetail& o) const;
    bool operator!=(const BlockDetail& o) const { return !(*this == o); }
};

// Rendering detail for SpanStart/SpanEnd (links, images, wiki links).
struct SpanDetail {
    std::string href;         // Link href, Image src, WikiLink target
    std::string title;
    bool autolink = false;

    bool operator==(const SpanDetail& o) const;
    bool operator!=(const SpanDetail& o) const { return !(*this == o); }
};

struct Token {
    TokenKind kind = TokenKind::Text;
    std::string text;
    BlockType block = BlockType::Document;  // BlockStart / BlockEnd
    SpanType span = SpanType::Emphasis;     // SpanStart / SpanEnd
    BlockDetail block_detail;
    SpanDetail span_detail;

    bool is_text() const { return kind == TokenKind::Text; }
    bool is_html() const { return kind == TokenKind::Html; }

    bool operator==(const Token& o) const;
    bool operator!=(const Token& o) const { return !(*this == o); }
};

using TokenList = std::vector<Token>;

Token text_token(std::string text);
Token html_token(std::string text);
Token code_token(std::string text);
Token entity_token(std::string text);
Token math_token(std::string text);
Token soft_break();
Token hard_break();
Token block_start(BlockType type, BlockDetail detail = {});
Token block_end(BlockType type, BlockDetail detail = {});
Token span_start(SpanType type, SpanDetail detail = {});
Token span_end(SpanType type, SpanDetail detail = {});

const char* token_kind_name(TokenKind k);
const char* block_type_name(BlockType t);
const char* span_type_name(SpanType t);

// One-line description used by the token dump: `Text "foo"`, `BlockStart(Heading)`
std::string describe(const Token& t);

} // namespace nocomment
