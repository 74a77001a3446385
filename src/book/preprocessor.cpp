#include <nocomment/preprocessor.hpp>
#include <nocomment/log.hpp>
#include <nocomment/md/render.hpp>
#include <nocomment/md/scrubber.hpp>
#include <nocomment/md/tokenizer.hpp>
#include <nocomment/version.hpp>

namespace nocomment {

Result<std::string> Preprocessor::process_chapter(const std::string& content) const {
    size_t removed = 0;
    return process_chapter(content, removed);
}

Result<std::string> Preprocessor::process_chapter(const std::string& content,
                                                  size_t& removed) const {
    removed = 0;
    auto tokens = tokenize(content, config_.dialect);
    if (tokens.is_err()) return std::move(tokens).error();

    ScrubResult scrubbed = scrub_comments(tokens.value());
    removed = scrubbed.comments.size();
    if (scrubbed.comments.empty()) {
        // Nothing removed: keep the author's formatting untouched
        return Result<std::string>::ok(content);
    }
    return Result<std::string>::ok(render_markdown(scrubbed.tokens));
}

Result<Book> Preprocessor::run(const PreprocessorContext& ctx, Book book) const {
    log::debug("running %s for renderer '%s'", name(), ctx.renderer.c_str());

    size_t chapters = 0;
    auto status = book.for_each_chapter([&](Chapter& ch) -> Status {
        size_t removed = 0;
        auto processed = process_chapter(ch.content, removed);
        if (processed.is_err()) {
            auto err = std::move(processed).error();
            err.file = ch.path.empty() ? ch.name : ch.path;
            return err;
        }
        if (removed > 0) {
            log::debug("chapter '%s': removed %zu comment(s)", ch.name.c_str(), removed);
        }
        ch.content = std::move(processed).value();
        ++chapters;
        return ok_status();
    });
    if (status.is_err()) return std::move(status).error();

    log::debug("processed %zu chapters", chapters);
    return Result<Book>::ok(std::move(book));
}

bool Preprocessor::supports_renderer(const std::string& renderer) {
    return renderer != UNSUPPORTED_RENDERER;
}

Result<bool> check_mdbook_version(const std::string& mdbook_version) {
    auto book_version = Version::parse(mdbook_version);
    if (book_version.is_err()) return std::move(book_version).error();

    auto req = VersionReq::parse(MDBOOK_VERSION);
    if (req.is_err()) return std::move(req).error();

    return Result<bool>::ok(req.value().matches(book_version.value()));
}

} // namespace nocomment
