#include <nocomment/book.hpp>
#include <istream>
#include <iterator>
#include <ostream>

namespace nocomment {

using nlohmann::json;

namespace {

NocommentError json_error(std::string msg) {
    return NocommentError{NocommentError::Json, std::move(msg),
        "run this program as an mdBook preprocessor, or pipe `[context, book]` JSON to stdin"};
}

Result<std::string> string_field(const json& obj, const char* key, const char* where) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return json_error(std::string(where) + " has no string field '" + key + "'");
    }
    return Result<std::string>::ok(it->get<std::string>());
}

Status walk(json& items, std::vector<std::string>& parents, const Book::Visitor& visit) {
    if (!items.is_array()) {
        return json_error("book items must be an array");
    }
    for (auto& item : items) {
        // "Separator" is a bare string; {"PartTitle": "..."} has no content
        if (!item.is_object()) continue;
        auto it = item.find("Chapter");
        if (it == item.end()) continue;

        json& node = *it;
        if (!node.is_object()) {
            return json_error("chapter entry must be an object");
        }

        Chapter ch;
        auto name = string_field(node, "name", "chapter");
        if (name.is_err()) return std::move(name).error();
        ch.name = std::move(name).value();

        auto content = string_field(node, "content", ("chapter '" + ch.name + "'").c_str());
        if (content.is_err()) return std::move(content).error();
        ch.content = std::move(content).value();

        auto path = node.find("path");
        if (path != node.end() && path->is_string()) {
            ch.path = path->get<std::string>();
        }
        ch.parent_names = parents;

        NOCOMMENT_TRY(visit(ch));
        node["content"] = std::move(ch.content);

        auto sub = node.find("sub_items");
        if (sub != node.end()) {
            parents.push_back(ch.name);
            NOCOMMENT_TRY(walk(*sub, parents, visit));
            parents.pop_back();
        }
    }
    return ok_status();
}

size_t count(const json& items) {
    if (!items.is_array()) return 0;
    size_t n = 0;
    for (const auto& item : items) {
        if (!item.is_object()) continue;
        auto it = item.find("Chapter");
        if (it == item.end() || !it->is_object()) continue;
        ++n;
        auto sub = it->find("sub_items");
        if (sub != it->end()) n += count(*sub);
    }
    return n;
}

Result<PreprocessorContext> parse_context(const json& j) {
    if (!j.is_object()) {
        return json_error("preprocessor context must be an object");
    }

    PreprocessorContext ctx;
    auto version = string_field(j, "mdbook_version", "context");
    if (version.is_err()) return std::move(version).error();
    ctx.mdbook_version = std::move(version).value();

    auto renderer = string_field(j, "renderer", "context");
    if (renderer.is_err()) return std::move(renderer).error();
    ctx.renderer = std::move(renderer).value();

    auto root = j.find("root");
    if (root != j.end() && root->is_string()) {
        ctx.root = root->get<std::string>();
    }

    auto config = j.find("config");
    ctx.config = config != j.end() ? *config : json::object();

    return Result<PreprocessorContext>::ok(std::move(ctx));
}

} // anonymous namespace

Result<Book> Book::from_json(json data) {
    if (!data.is_object()) {
        return json_error("book must be an object");
    }
    auto sections = data.find("sections");
    if (sections == data.end()) {
        // Newer mdBook releases name the list "items"
        sections = data.find("items");
    }
    if (sections == data.end() || !sections->is_array()) {
        return json_error("book has no 'sections' array");
    }
    return Result<Book>::ok(Book(std::move(data)));
}

Status Book::for_each_chapter(const Visitor& visit) {
    auto sections = data_.find("sections");
    if (sections == data_.end()) sections = data_.find("items");
    std::vector<std::string> parents;
    return walk(*sections, parents, visit);
}

size_t Book::chapter_count() const {
    auto sections = data_.find("sections");
    if (sections == data_.end()) sections = data_.find("items");
    return count(*sections);
}

Result<PreprocessorInput> parse_input(std::istream& in) {
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return NocommentError{NocommentError::IO, "failed to read preprocessor input"};
    }
    return parse_input(text);
}

Result<PreprocessorInput> parse_input(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        return json_error(std::string("invalid preprocessor input: ") + e.what());
    }

    if (!doc.is_array() || doc.size() != 2) {
        return json_error("preprocessor input must be a [context, book] array");
    }

    auto ctx = parse_context(doc[0]);
    if (ctx.is_err()) return std::move(ctx).error();

    auto book = Book::from_json(std::move(doc[1]));
    if (book.is_err()) return std::move(book).error();

    return Result<PreprocessorInput>::ok(
        PreprocessorInput{std::move(ctx).value(), std::move(book).value()});
}

Status write_book(std::ostream& out, const Book& book) {
    std::string text;
    try {
        text = book.to_json().dump();
    } catch (const json::type_error& e) {
        // dump() throws on invalid UTF-8 in strings
        return NocommentError{NocommentError::Json,
            std::string("cannot serialize book: ") + e.what()};
    }
    out << text << '\n';
    out.flush();
    if (!out) {
        return NocommentError{NocommentError::IO, "failed to write book to stdout"};
    }
    return ok_status();
}

} // namespace nocomment
