#include <nocomment/md/render.hpp>
#include <vector>

namespace nocomment {

namespace {

std::string escape_html(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        default:  out += c; break;
        }
    }
    return out;
}

const char* align_attr(Align align) {
    switch (align) {
    case Align::Left:   return " align=\"left\"";
    case Align::Center: return " align=\"center\"";
    case Align::Right:  return " align=\"right\"";
    default:            return "";
    }
}

struct HtmlWriter {
    std::string out;
    // Open images collect their text as alt; nested images flatten into the outer alt
    std::vector<std::string> image_alt;

    void text(const std::string& s) {
        if (!image_alt.empty()) {
            image_alt.back() += s;
        } else {
            out += s;
        }
    }

    void open_block(const Token& t) {
        const BlockDetail& d = t.block_detail;
        switch (t.block) {
        case BlockType::Document:    break;
        case BlockType::Quote:       out += "<blockquote>\n"; break;
        case BlockType::BulletList:  out += "<ul>\n"; break;
        case BlockType::OrderedList:
            if (d.start != 1) {
                out += "<ol start=\"" + std::to_string(d.start) + "\">\n";
            } else {
                out += "<ol>\n";
            }
            break;
        case BlockType::ListItem:
            if (d.task) {
                out += "<li class=\"task-list-item\"><input type=\"checkbox\" disabled";
                out += (d.task_mark == 'x' || d.task_mark == 'X') ? " checked>" : ">";
            } else {
                out += "<li>";
            }
            break;
        case BlockType::Rule:        out += "<hr />\n"; break;
        case BlockType::Heading:
            out += "<h" + std::to_string(d.level) + ">";
            break;
        case BlockType::CodeBlock: {
            std::string lang = d.info.substr(0, d.info.find(' '));
            if (lang.empty()) {
                out += "<pre><code>";
            } else {
                out += "<pre><code class=\"language-" + escape_html(lang) + "\">";
            }
            break;
        }
        case BlockType::HtmlBlock:   break;
        case BlockType::Paragraph:   out += "<p>"; break;
        case BlockType::Table:       out += "<table>\n"; break;
        case BlockType::TableHead:   out += "<thead>\n"; break;
        case BlockType::TableBody:   out += "<tbody>\n"; break;
        case BlockType::TableRow:    out += "<tr>\n"; break;
        case BlockType::TableHeaderCell:
            out += std::string("<th") + align_attr(d.align) + ">";
            break;
        case BlockType::TableCell:
            out += std::string("<td") + align_attr(d.align) + ">";
            break;
        }
    }

    void close_block(const Token& t) {
        switch (t.block) {
        case BlockType::Document:        break;
        case BlockType::Quote:           out += "</blockquote>\n"; break;
        case BlockType::BulletList:      out += "</ul>\n"; break;
        case BlockType::OrderedList:     out += "</ol>\n"; break;
        case BlockType::ListItem:        out += "</li>\n"; break;
        case BlockType::Rule:            break;
        case BlockType::Heading:
            out += "</h" + std::to_string(t.block_detail.level) + ">\n";
            break;
        case BlockType::CodeBlock:       out += "</code></pre>\n"; break;
        case BlockType::HtmlBlock:       break;
        case BlockType::Paragraph:       out += "</p>\n"; break;
        case BlockType::Table:           out += "</table>\n"; break;
        case BlockType::TableHead:       out += "</thead>\n"; break;
        case BlockType::TableBody:       out += "</tbody>\n"; break;
        case BlockType::TableRow:        out += "</tr>\n"; break;
        case BlockType::TableHeaderCell: out += "</th>\n"; break;
        case BlockType::TableCell:       out += "</td>\n"; break;
        }
    }

    void open_span(const Token& t) {
        const SpanDetail& d = t.span_detail;
        if (!image_alt.empty()) {
            if (t.span == SpanType::Image) image_alt.emplace_back();
            return;
        }
        switch (t.span) {
        case SpanType::Emphasis:      out += "<em>"; break;
        case SpanType::Strong:        out += "<strong>"; break;
        case SpanType::Underline:     out += "<u>"; break;
        case SpanType::Strikethrough: out += "<del>"; break;
        case SpanType::Code:          out += "<code>"; break;
        case SpanType::Math:          out += "<x-equation>"; break;
        case SpanType::MathDisplay:   out += "<x-equation type=\"display\">"; break;
        case SpanType::Link:
        case SpanType::WikiLink:
            out += "<a href=\"" + escape_html(d.href) + "\"";
            if (!d.title.empty()) out += " title=\"" + escape_html(d.title) + "\"";
            out += ">";
            break;
        case SpanType::Image:
            image_alt.emplace_back();
            break;
        }
    }

    void close_span(const Token& t) {
        const SpanDetail& d = t.span_detail;
        if (!image_alt.empty()) {
            if (t.span != SpanType::Image) return;
            std::string alt = std::move(image_alt.back());
            image_alt.pop_back();
            if (!image_alt.empty()) {
                image_alt.back() += alt;
                return;
            }
            out += "<img src=\"" + escape_html(d.href) + "\" alt=\"" + alt + "\"";
            if (!d.title.empty()) out += " title=\"" + escape_html(d.title) + "\"";
            out += " />";
            return;
        }
        switch (t.span) {
        case SpanType::Emphasis:      out += "</em>"; break;
        case SpanType::Strong:        out += "</strong>"; break;
        case SpanType::Underline:     out += "</u>"; break;
        case SpanType::Strikethrough: out += "</del>"; break;
        case SpanType::Code:          out += "</code>"; break;
        case SpanType::Math:
        case SpanType::MathDisplay:   out += "</x-equation>"; break;
        case SpanType::Link:
        case SpanType::WikiLink:      out += "</a>"; break;
        case SpanType::Image:         break;
        }
    }

    void write(const Token& t) {
        switch (t.kind) {
        case TokenKind::BlockStart: open_block(t); break;
        case TokenKind::BlockEnd:   close_block(t); break;
        case TokenKind::SpanStart:  open_span(t); break;
        case TokenKind::SpanEnd:    close_span(t); break;
        case TokenKind::Text:
        case TokenKind::Code:
        case TokenKind::Math:
        case TokenKind::NullChar:
            text(escape_html(t.text));
            break;
        case TokenKind::Html:
        case TokenKind::Entity:
            text(t.text);
            break;
        case TokenKind::SoftBreak:
            text("\n");
            break;
        case TokenKind::HardBreak:
            text(image_alt.empty() ? "<br />\n" : " ");
            break;
        }
    }

    // Images left open by an unbalanced stream still contribute their alt text
    void finish() {
        while (!image_alt.empty()) {
            std::string alt = std::move(image_alt.back());
            image_alt.pop_back();
            text(alt);
        }
    }
};

} // anonymous namespace

std::string render_html(const TokenList& tokens) {
    HtmlWriter writer;
    for (const auto& t : tokens) {
        writer.write(t);
    }
    writer.finish();
    return writer.out;
}

} // namespace nocomment
