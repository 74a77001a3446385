#pragma once

#include <nocomment/result.hpp>
#include <nlohmann/json.hpp>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

namespace nocomment {

// Context mdBook sends alongside the book
struct PreprocessorContext {
    std::string root;
    std::string renderer;
    std::string mdbook_version;
    nlohmann::json config;  // parsed book.toml
};

// Editable view of one chapter. Only content is written back.
struct Chapter {
    std::string name;
    std::string content;
    std::string path;                       // empty for draft chapters
    std::vector<std::string> parent_names;
};

// mdBook's book tree. The JSON is kept as received so fields this tool does
// not know about survive the round trip.
class Book {
public:
    using Visitor = std::function<Status(Chapter&)>;

    static Result<Book> from_json(nlohmann::json data);
    const nlohmann::json& to_json() const { return data_; }

    // Depth-first over sections and sub_items. Separators and part titles are
    // skipped. Stops at the first visitor error.
    Status for_each_chapter(const Visitor& visit);

    size_t chapter_count() const;

private:
    explicit Book(nlohmann::json data) : data_(std::move(data)) {}

    nlohmann::json data_;
};

struct PreprocessorInput {
    PreprocessorContext context;
    Book book;
};

// Read the `[context, book]` array mdBook writes to a preprocessor's stdin.
Result<PreprocessorInput> parse_input(std::istream& in);
Result<PreprocessorInput> parse_input(const std::string& text);

// Write the book back in the form mdBook reads from stdout.
Status write_book(std::ostream& out, const Book& book);

} // namespace nocomment
