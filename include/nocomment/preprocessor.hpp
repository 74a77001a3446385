#pragma once

#include <nocomment/book.hpp>
#include <nocomment/config.hpp>
#include <nocomment/result.hpp>
#include <string>

namespace nocomment {

// Version of this tool
constexpr const char* NOCOMMENT_VERSION = "0.1.0";

// mdBook release the JSON protocol handling was written against. A caret
// requirement: any 0.4.x host from 0.4.21 on is compatible.
constexpr const char* MDBOOK_VERSION = "0.4.21";

// Renderer name reserved for exercising the "unsupported" path
constexpr const char* UNSUPPORTED_RENDERER = "not-supported";

class Preprocessor {
public:
    explicit Preprocessor(Config config = {}) : config_(std::move(config)) {}

    static const char* name() { return "nocomment-preprocessor"; }

    // Strip HTML comments from every chapter
    Result<Book> run(const PreprocessorContext& ctx, Book book) const;

    // Markdown in, markdown out
    Result<std::string> process_chapter(const std::string& content) const;
    // Same, also reporting how many comments were removed
    Result<std::string> process_chapter(const std::string& content, size_t& removed) const;

    static bool supports_renderer(const std::string& renderer);

    const Config& config() const { return config_; }

private:
    Config config_;
};

// Whether the calling mdBook satisfies MDBOOK_VERSION. A mismatch is only
// worth a warning; unparseable versions are errors.
Result<bool> check_mdbook_version(const std::string& mdbook_version);

} // namespace nocomment
