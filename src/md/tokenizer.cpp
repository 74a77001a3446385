#include <nocomment/md/tokenizer.hpp>
#include <nocomment/log.hpp>
#include <md4c.h>

namespace nocomment {

const char* dialect_name(Dialect d) {
    switch (d) {
    case Dialect::CommonMark: return "commonmark";
    case Dialect::GitHub:     return "github";
    case Dialect::Extended:   return "extended";
    }
    return "unknown";
}

bool parse_dialect(const std::string& name, Dialect& out) {
    if (name == "commonmark") {
        out = Dialect::CommonMark;
        return true;
    }
    if (name == "github" || name == "gfm") {
        out = Dialect::GitHub;
        return true;
    }
    if (name == "extended") {
        out = Dialect::Extended;
        return true;
    }
    return false;
}

namespace {

unsigned parser_flags(Dialect d) {
    switch (d) {
    case Dialect::CommonMark: return MD_DIALECT_COMMONMARK;
    case Dialect::GitHub:     return MD_DIALECT_GITHUB;
    case Dialect::Extended:
        return MD_DIALECT_GITHUB | MD_FLAG_LATEXMATHSPANS | MD_FLAG_WIKILINKS |
               MD_FLAG_UNDERLINE;
    }
    return MD_DIALECT_COMMONMARK;
}

std::string attribute_to_string(const MD_ATTRIBUTE& attr) {
    if (attr.text == nullptr || attr.size == 0) {
        return "";
    }
    return std::string(attr.text, attr.size);
}

Align convert_align(MD_ALIGN align) {
    switch (align) {
    case MD_ALIGN_LEFT:   return Align::Left;
    case MD_ALIGN_CENTER: return Align::Center;
    case MD_ALIGN_RIGHT:  return Align::Right;
    default:              return Align::Default;
    }
}

struct Tokenizer {
    TokenList tokens;
    // md4c may deliver one run of plain text in several callbacks
    std::string pending_text;

    static int enter_block_cb(MD_BLOCKTYPE type, void* detail, void* userdata) {
        return static_cast<Tokenizer*>(userdata)->on_block(TokenKind::BlockStart, type, detail);
    }

    static int leave_block_cb(MD_BLOCKTYPE type, void* detail, void* userdata) {
        return static_cast<Tokenizer*>(userdata)->on_block(TokenKind::BlockEnd, type, detail);
    }

    static int enter_span_cb(MD_SPANTYPE type, void* detail, void* userdata) {
        return static_cast<Tokenizer*>(userdata)->on_span(TokenKind::SpanStart, type, detail);
    }

    static int leave_span_cb(MD_SPANTYPE type, void* detail, void* userdata) {
        return static_cast<Tokenizer*>(userdata)->on_span(TokenKind::SpanEnd, type, detail);
    }

    static int text_cb(MD_TEXTTYPE type, const MD_CHAR* text, MD_SIZE size, void* userdata) {
        return static_cast<Tokenizer*>(userdata)->on_text(type, text, size);
    }

    static void debug_log_cb(const char* msg, void*) {
        log::trace("md4c: %s", msg);
    }

    int on_block(TokenKind kind, MD_BLOCKTYPE type, void* detail) {
        flush_text();
        Token t;
        t.kind = kind;
        BlockDetail& d = t.block_detail;

        switch (type) {
        case MD_BLOCK_DOC:   t.block = BlockType::Document; break;
        case MD_BLOCK_QUOTE: t.block = BlockType::Quote; break;
        case MD_BLOCK_UL: {
            auto* ul = static_cast<MD_BLOCK_UL_DETAIL*>(detail);
            t.block = BlockType::BulletList;
            d.tight = ul->is_tight != 0;
            d.mark = ul->mark;
            break;
        }
        case MD_BLOCK_OL: {
            auto* ol = static_cast<MD_BLOCK_OL_DETAIL*>(detail);
            t.block = BlockType::OrderedList;
            d.tight = ol->is_tight != 0;
            d.mark = ol->mark_delimiter;
            d.start = ol->start;
            break;
        }
        case MD_BLOCK_LI: {
            auto* li = static_cast<MD_BLOCK_LI_DETAIL*>(detail);
            t.block = BlockType::ListItem;
            d.task = li->is_task != 0;
            d.task_mark = li->is_task ? li->task_mark : ' ';
            break;
        }
        case MD_BLOCK_HR:    t.block = BlockType::Rule; break;
        case MD_BLOCK_H: {
            auto* h = static_cast<MD_BLOCK_H_DETAIL*>(detail);
            t.block = BlockType::Heading;
            d.level = static_cast<int>(h->level);
            break;
        }
        case MD_BLOCK_CODE: {
            auto* code = static_cast<MD_BLOCK_CODE_DETAIL*>(detail);
            t.block = BlockType::CodeBlock;
            d.fence = code->fence_char;
            d.info = attribute_to_string(code->info);
            break;
        }
        case MD_BLOCK_HTML:  t.block = BlockType::HtmlBlock; break;
        case MD_BLOCK_P:     t.block = BlockType::Paragraph; break;
        case MD_BLOCK_TABLE: t.block = BlockType::Table; break;
        case MD_BLOCK_THEAD: t.block = BlockType::TableHead; break;
        case MD_BLOCK_TBODY: t.block = BlockType::TableBody; break;
        case MD_BLOCK_TR:    t.block = BlockType::TableRow; break;
        case MD_BLOCK_TH:
        case MD_BLOCK_TD: {
            auto* cell = static_cast<MD_BLOCK_TD_DETAIL*>(detail);
            t.block = type == MD_BLOCK_TH ? BlockType::TableHeaderCell : BlockType::TableCell;
            d.align = convert_align(cell->align);
            break;
        }
        default:
            log::trace("ignoring md4c block type %d", static_cast<int>(type));
            return 0;
        }

        tokens.push_back(std::move(t));
        return 0;
    }

    int on_span(TokenKind kind, MD_SPANTYPE type, void* detail) {
        flush_text();
        Token t;
        t.kind = kind;
        SpanDetail& d = t.span_detail;

        switch (type) {
        case MD_SPAN_EM:     t.span = SpanType::Emphasis; break;
        case MD_SPAN_STRONG: t.span = SpanType::Strong; break;
        case MD_SPAN_A: {
            auto* a = static_cast<MD_SPAN_A_DETAIL*>(detail);
            t.span = SpanType::Link;
            d.href = attribute_to_string(a->href);
            d.title = attribute_to_string(a->title);
            d.autolink = a->is_autolink != 0;
            break;
        }
        case MD_SPAN_IMG: {
            auto* img = static_cast<MD_SPAN_IMG_DETAIL*>(detail);
            t.span = SpanType::Image;
            d.href = attribute_to_string(img->src);
            d.title = attribute_to_string(img->title);
            break;
        }
        case MD_SPAN_CODE:   t.span = SpanType::Code; break;
        case MD_SPAN_DEL:    t.span = SpanType::Strikethrough; break;
        case MD_SPAN_LATEXMATH:         t.span = SpanType::Math; break;
        case MD_SPAN_LATEXMATH_DISPLAY: t.span = SpanType::MathDisplay; break;
        case MD_SPAN_WIKILINK: {
            auto* wiki = static_cast<MD_SPAN_WIKILINK_DETAIL*>(detail);
            t.span = SpanType::WikiLink;
            d.href = attribute_to_string(wiki->target);
            break;
        }
        case MD_SPAN_U:      t.span = SpanType::Underline; break;
        default:
            log::trace("ignoring md4c span type %d", static_cast<int>(type));
            return 0;
        }

        tokens.push_back(std::move(t));
        return 0;
    }

    int on_text(MD_TEXTTYPE type, const MD_CHAR* text, MD_SIZE size) {
        if (type == MD_TEXT_NORMAL) {
            pending_text.append(text, size);
            return 0;
        }
        flush_text();
        std::string content(text, size);

        switch (type) {
        case MD_TEXT_HTML:
            tokens.push_back(html_token(std::move(content)));
            break;
        case MD_TEXT_CODE:
            tokens.push_back(code_token(std::move(content)));
            break;
        case MD_TEXT_ENTITY:
            tokens.push_back(entity_token(std::move(content)));
            break;
        case MD_TEXT_NULLCHAR: {
            Token t;
            t.kind = TokenKind::NullChar;
            t.text = "\xEF\xBF\xBD";  // U+FFFD
            tokens.push_back(std::move(t));
            break;
        }
        case MD_TEXT_BR:
            tokens.push_back(hard_break());
            break;
        case MD_TEXT_SOFTBR:
            tokens.push_back(soft_break());
            break;
        case MD_TEXT_LATEXMATH:
            tokens.push_back(math_token(std::move(content)));
            break;
        default:
            tokens.push_back(text_token(std::move(content)));
            break;
        }
        return 0;
    }

    void flush_text() {
        if (pending_text.empty()) return;
        push_split_text(pending_text);
        pending_text.clear();
    }

    // "a <!-- b" -> "a ", "<", "!-- b"
    void push_split_text(const std::string& content) {
        size_t begin = 0;
        while (begin < content.size()) {
            size_t lt = content.find('<', begin);
            if (lt == std::string::npos) {
                tokens.push_back(text_token(content.substr(begin)));
                return;
            }
            if (lt > begin) {
                tokens.push_back(text_token(content.substr(begin, lt - begin)));
            }
            tokens.push_back(text_token("<"));
            begin = lt + 1;
        }
    }
};

} // anonymous namespace

Result<TokenList> tokenize(const std::string& source, Dialect dialect) {
    Tokenizer tokenizer;

    MD_PARSER parser = {};
    parser.abi_version = 0;
    parser.flags = parser_flags(dialect);
    parser.enter_block = &Tokenizer::enter_block_cb;
    parser.leave_block = &Tokenizer::leave_block_cb;
    parser.enter_span = &Tokenizer::enter_span_cb;
    parser.leave_span = &Tokenizer::leave_span_cb;
    parser.text = &Tokenizer::text_cb;
    parser.debug_log = &Tokenizer::debug_log_cb;
    parser.syntax = nullptr;

    int rc = md_parse(source.data(), static_cast<MD_SIZE>(source.size()), &parser, &tokenizer);
    if (rc != 0) {
        return NocommentError{NocommentError::Markdown,
            "markdown parser failed with code " + std::to_string(rc),
            "the document may be too large or the parser ran out of memory"};
    }
    tokenizer.flush_text();

    return Result<TokenList>::ok(std::move(tokenizer.tokens));
}

} // namespace nocomment
