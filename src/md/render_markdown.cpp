#include <nocomment/md/render.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace nocomment {

namespace {

// Splits on '\n'; a trailing newline does not produce an extra empty line.
std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> lines;
    std::istringstream stream(s);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += "\n";
        out += lines[i];
    }
    return out;
}

std::string trim_trailing_newlines(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
    return s;
}

size_t longest_run(const std::string& s, char c) {
    size_t best = 0;
    size_t run = 0;
    for (char ch : s) {
        run = ch == c ? run + 1 : 0;
        best = std::max(best, run);
    }
    return best;
}

bool at_line_start(const std::string& out) {
    return out.empty() || out.back() == '\n';
}

// Index of the delimiter of an ordered-list marker ("12." / "3)") starting
// at `begin`, or npos if there is none.
size_t list_marker_end(const std::string& text, size_t begin) {
    size_t i = begin;
    while (i < text.size() && i - begin < 9 && std::isdigit(static_cast<unsigned char>(text[i]))) {
        ++i;
    }
    if (i == begin || i >= text.size() || (text[i] != '.' && text[i] != ')')) {
        return std::string::npos;
    }
    if (i + 1 < text.size() && text[i + 1] != ' ' && text[i + 1] != '\t') {
        return std::string::npos;
    }
    return i;
}

// `before_link`: the text is directly followed by a link, so a trailing '!'
// would turn it into an image.
std::string escape_text(const std::string& text, bool line_start, bool in_table,
                        bool before_link) {
    std::string out;
    out.reserve(text.size());
    size_t marker = std::string::npos;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        char next = i + 1 < text.size() ? text[i + 1] : '\0';
        bool first = i == 0 ? line_start : text[i - 1] == '\n';
        if (first && std::isdigit(static_cast<unsigned char>(c))) {
            marker = list_marker_end(text, i);
        }
        if (i == marker) {
            out += '\\';
            out += c;
            continue;
        }
        switch (c) {
        case '\\': case '`': case '*': case '_':
        case '[': case ']': case '<': case '$':
            out += '\\';
            break;
        case '&':
            if (std::isalpha(static_cast<unsigned char>(next)) || next == '#') out += '\\';
            break;
        case '#': case '>': case '=':
            if (first) out += '\\';
            break;
        case '-':
            // list item, thematic break or setext underline
            if (first && (next == ' ' || next == '\0' || next == '-')) out += '\\';
            break;
        case '+':
            if (first && (next == ' ' || next == '\0')) out += '\\';
            break;
        case '~':
            if (first && next == '~') out += '\\';
            break;
        case '!':
            if (before_link && i + 1 == text.size()) out += '\\';
            break;
        case '|':
            if (in_table) out += '\\';
            break;
        default:
            break;
        }
        out += c;
    }
    return out;
}

std::string link_destination(const std::string& href) {
    if (href.empty()) return "<>";
    bool needs_brackets = href.find_first_of(" ()<>") != std::string::npos;
    return needs_brackets ? "<" + href + ">" : href;
}

std::string link_title(const std::string& title) {
    if (title.empty()) return "";
    std::string out = " \"";
    for (char c : title) {
        if (c == '"') out += '\\';
        out += c;
    }
    out += "\"";
    return out;
}

std::string align_marker(Align align) {
    switch (align) {
    case Align::Left:   return ":---";
    case Align::Center: return ":---:";
    case Align::Right:  return "---:";
    default:            return "---";
    }
}

struct Frame {
    bool is_span = false;
    BlockType block = BlockType::Document;
    SpanType span = SpanType::Emphasis;
    BlockDetail block_detail;
    SpanDetail span_detail;
    std::string out;

    bool tight = false;                // ListItem: parent list is tight
    unsigned next_number = 1;          // OrderedList
    std::vector<std::string> cells;    // TableRow
    std::vector<Align> aligns;         // Table
};

struct MarkdownWriter {
    std::vector<Frame> stack;

    MarkdownWriter() {
        stack.emplace_back();
    }

    Frame& top() { return stack.back(); }

    Frame* nearest_block(BlockType type) {
        for (auto it = stack.rbegin(); it != stack.rend(); ++it) {
            if (!it->is_span && it->block == type) return &*it;
        }
        return nullptr;
    }

    bool in_table() {
        return nearest_block(BlockType::TableRow) != nullptr;
    }

    void append_inline(const std::string& s) {
        top().out += s;
    }

    void append_block(const std::string& s) {
        Frame& parent = top();
        if (!parent.out.empty()) {
            bool tight_item = !parent.is_span && parent.block == BlockType::ListItem && parent.tight;
            parent.out += tight_item ? "\n" : "\n\n";
        }
        parent.out += s;
    }

    void open_block(const Token& t) {
        if (t.block == BlockType::Document) return;
        Frame f;
        f.block = t.block;
        f.block_detail = t.block_detail;
        if (t.block == BlockType::OrderedList) {
            f.next_number = t.block_detail.start;
        }
        if (t.block == BlockType::ListItem) {
            Frame& list = top();
            f.tight = !list.is_span &&
                      (list.block == BlockType::BulletList || list.block == BlockType::OrderedList) &&
                      list.block_detail.tight;
        }
        stack.push_back(std::move(f));
    }

    void open_span(const Token& t) {
        Frame f;
        f.is_span = true;
        f.span = t.span;
        f.span_detail = t.span_detail;
        stack.push_back(std::move(f));
    }

    void close_block(const Token& t) {
        if (t.block == BlockType::Document) return;
        bool has_block = std::any_of(stack.begin() + 1, stack.end(),
                                     [](const Frame& f) { return !f.is_span; });
        if (!has_block) return;
        while (top().is_span) pop();
        pop();
    }

    void close_span() {
        if (stack.size() > 1 && top().is_span) pop();
    }

    void finish() {
        while (stack.size() > 1) pop();
    }

    void pop() {
        Frame f = std::move(stack.back());
        stack.pop_back();
        if (f.is_span) {
            append_inline(render_span(f));
        } else {
            deliver_block(f);
        }
    }

    std::string render_span(const Frame& f) {
        const SpanDetail& d = f.span_detail;
        switch (f.span) {
        case SpanType::Emphasis:      return "*" + f.out + "*";
        case SpanType::Underline:     return "_" + f.out + "_";
        case SpanType::Strong:        return "**" + f.out + "**";
        case SpanType::Strikethrough: return "~~" + f.out + "~~";
        case SpanType::Math:          return "$" + f.out + "$";
        case SpanType::MathDisplay:   return "$$" + f.out + "$$";
        case SpanType::Code: {
            std::string ticks(longest_run(f.out, '`') + 1, '`');
            bool pad = !f.out.empty() &&
                       (f.out.front() == '`' || f.out.back() == '`' ||
                        (f.out.front() == ' ' && f.out.back() == ' ' &&
                         f.out.find_first_not_of(' ') != std::string::npos));
            std::string body = pad ? " " + f.out + " " : f.out;
            return ticks + body + ticks;
        }
        case SpanType::Link:
            if (d.autolink && d.href.find(':') != std::string::npos) {
                return "<" + d.href + ">";
            }
            if (d.autolink) return f.out;
            return "[" + f.out + "](" + link_destination(d.href) + link_title(d.title) + ")";
        case SpanType::Image:
            return "![" + f.out + "](" + link_destination(d.href) + link_title(d.title) + ")";
        case SpanType::WikiLink:
            if (f.out.empty() || f.out == d.href) return "[[" + d.href + "]]";
            return "[[" + d.href + "|" + f.out + "]]";
        }
        return f.out;
    }

    void deliver_block(Frame& f) {
        const BlockDetail& d = f.block_detail;
        switch (f.block) {
        case BlockType::Document:
            append_block(f.out);
            return;

        case BlockType::Paragraph:
            if (!f.out.empty()) append_block(f.out);
            return;

        case BlockType::Heading:
            append_block(std::string(static_cast<size_t>(std::clamp(d.level, 1, 6)), '#') +
                         " " + f.out);
            return;

        case BlockType::Rule:
            append_block("---");
            return;

        // A block emptied by comment removal leaves no blank lines behind
        case BlockType::HtmlBlock: {
            std::string html = trim_trailing_newlines(f.out);
            if (!html.empty()) append_block(html);
            return;
        }

        case BlockType::CodeBlock: {
            char fence_char = d.fence == '~' ? '~' : '`';
            std::string fence(std::max<size_t>(3, longest_run(f.out, fence_char) + 1), fence_char);
            std::string body = f.out;
            if (!body.empty() && body.back() != '\n') body += "\n";
            append_block(fence + d.info + "\n" + body + fence);
            return;
        }

        case BlockType::Quote: {
            std::vector<std::string> lines = split_lines(f.out);
            for (auto& line : lines) {
                line = line.empty() ? ">" : "> " + line;
            }
            append_block(lines.empty() ? ">" : join_lines(lines));
            return;
        }

        case BlockType::BulletList:
        case BlockType::OrderedList:
            append_block(f.out);
            return;

        case BlockType::ListItem: {
            std::string marker = "- ";
            Frame& list = top();
            if (!list.is_span && list.block == BlockType::OrderedList) {
                marker = std::to_string(list.next_number++) + list.block_detail.mark + " ";
            } else if (!list.is_span && list.block == BlockType::BulletList) {
                marker = std::string(1, list.block_detail.mark) + " ";
            }
            std::string body = f.out;
            if (d.task) {
                body = std::string("[") + d.task_mark + "] " + body;
            }
            std::vector<std::string> lines = split_lines(body);
            std::string indent(marker.size(), ' ');
            for (size_t i = 0; i < lines.size(); ++i) {
                if (i == 0) {
                    lines[i] = marker + lines[i];
                } else if (!lines[i].empty()) {
                    lines[i] = indent + lines[i];
                }
            }
            std::string item = lines.empty() ? trim_trailing_space(marker) : join_lines(lines);
            if (!list.out.empty()) {
                bool tight = !list.is_span && list.block_detail.tight;
                list.out += tight ? "\n" : "\n\n";
            }
            list.out += item;
            return;
        }

        case BlockType::Table: {
            append_block(f.out);
            return;
        }

        case BlockType::TableHead: {
            Frame* table = nearest_block(BlockType::Table);
            std::string row = f.out;
            std::string sep = "|";
            if (table) {
                for (Align a : table->aligns) sep += " " + align_marker(a) + " |";
            }
            append_line(row + (sep.size() > 1 ? "\n" + sep : ""));
            return;
        }

        case BlockType::TableBody:
            append_line(f.out);
            return;

        case BlockType::TableRow: {
            std::string row = "|";
            for (const auto& cell : f.cells) row += " " + cell + " |";
            append_line(row);
            return;
        }

        case BlockType::TableHeaderCell:
        case BlockType::TableCell: {
            if (f.block == BlockType::TableHeaderCell) {
                if (Frame* table = nearest_block(BlockType::Table)) {
                    table->aligns.push_back(d.align);
                }
            }
            Frame& row = top();
            if (!row.is_span && row.block == BlockType::TableRow) {
                row.cells.push_back(f.out);
            } else {
                append_inline(f.out);
            }
            return;
        }
        }
    }

    void append_line(const std::string& s) {
        if (s.empty()) return;
        Frame& parent = top();
        if (!parent.out.empty()) parent.out += "\n";
        parent.out += s;
    }

    static std::string trim_trailing_space(std::string s) {
        while (!s.empty() && s.back() == ' ') s.pop_back();
        return s;
    }

    void write(const Token& t, const Token* next) {
        switch (t.kind) {
        case TokenKind::BlockStart: open_block(t); break;
        case TokenKind::BlockEnd:   close_block(t); break;
        case TokenKind::SpanStart:  open_span(t); break;
        case TokenKind::SpanEnd:    close_span(); break;
        case TokenKind::Text:
            append_inline(escape_text(t.text, at_line_start(top().out), in_table(),
                                      next && next->kind == TokenKind::SpanStart &&
                                      next->span == SpanType::Link));
            break;
        case TokenKind::SoftBreak:
            append_inline("\n");
            break;
        case TokenKind::HardBreak:
            append_inline("\\\n");
            break;
        case TokenKind::Html:
        case TokenKind::Code:
        case TokenKind::Entity:
        case TokenKind::NullChar:
        case TokenKind::Math:
            append_inline(t.text);
            break;
        }
    }
};

} // anonymous namespace

std::string render_markdown(const TokenList& tokens) {
    MarkdownWriter writer;
    for (size_t i = 0; i < tokens.size(); ++i) {
        writer.write(tokens[i], i + 1 < tokens.size() ? &tokens[i + 1] : nullptr);
    }
    writer.finish();

    std::string out = writer.stack.front().out;
    if (!out.empty()) out += "\n";
    return out;
}

} // namespace nocomment
