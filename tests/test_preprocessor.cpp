#include <catch2/catch.hpp>
#include <nocomment/preprocessor.hpp>
#include <nocomment/md/render.hpp>
#include <nocomment/md/tokenizer.hpp>
#include "stderr_capture.hpp"

using namespace nocomment;

static std::string scrub_to_html(const std::string& markdown) {
    Preprocessor pre;
    auto processed = pre.process_chapter(markdown);
    REQUIRE(processed.is_ok());
    auto tokens = tokenize(processed.value());
    REQUIRE(tokens.is_ok());
    return render_html(tokens.value());
}

// ===== Chapter processing =====

TEST_CASE("inline comment with double hyphen is removed", "[preprocessor]") {
    auto html = scrub_to_html("text <!-- double-hyphen -->");
    REQUIRE(html.find("text") != std::string::npos);
    REQUIRE(html.find("double-hyphen") == std::string::npos);
    REQUIRE(html.find("--") == std::string::npos);
}

TEST_CASE("inline comment with inner dashes is removed", "[preprocessor]") {
    auto html = scrub_to_html("text <!-- --double-hyphen -->");
    REQUIRE(html.find("text") != std::string::npos);
    REQUIRE(html.find("double-hyphen") == std::string::npos);
}

TEST_CASE("block comment over several lines is removed", "[preprocessor]") {
    auto html = scrub_to_html("intro\n\n<!--\nhidden\nnotes\n-->\n\noutro\n");
    REQUIRE(html.find("intro") != std::string::npos);
    REQUIRE(html.find("outro") != std::string::npos);
    REQUIRE(html.find("hidden") == std::string::npos);
    REQUIRE(html.find("<!--") == std::string::npos);
}

TEST_CASE("comment split over lines of one paragraph is removed", "[preprocessor]") {
    Preprocessor pre;
    auto r = pre.process_chapter("text <!-- \n--double-hyphen \n\n-->");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().find("text") != std::string::npos);
    REQUIRE(r.value().find("double-hyphen") == std::string::npos);
    REQUIRE(r.value().find("--") == std::string::npos);
}

TEST_CASE("comment spanning paragraph breaks is removed", "[preprocessor]") {
    Preprocessor pre;
    auto r = pre.process_chapter("text <!-- \n\n--double-hyphen \n\n\n-->");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().find("text") != std::string::npos);
    REQUIRE(r.value().find("double-hyphen") == std::string::npos);
    REQUIRE(r.value().find("--") == std::string::npos);

    auto html = scrub_to_html("text <!-- \n\n--double-hyphen \n\n\n-->");
    REQUIRE(html.find("text") != std::string::npos);
    REQUIRE(html.find("--") == std::string::npos);
}

TEST_CASE("html block comment with inner dashes is removed", "[preprocessor]") {
    Preprocessor pre;
    auto r = pre.process_chapter("<!-- \n--double-hyphen \n-->\n");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().find("double-hyphen") == std::string::npos);
    REQUIRE(r.value().find("--") == std::string::npos);
}

TEST_CASE("chapter without comments is returned unchanged", "[preprocessor]") {
    Preprocessor pre;
    std::string content = "Title\n=====\n\n* loose   spacing\n\n    indented code\n";
    auto r = pre.process_chapter(content);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == content);
}

TEST_CASE("comments inside code are kept", "[preprocessor]") {
    Preprocessor pre;
    std::string content = "```html\n<!-- keep me -->\n```\n\nand `<!-- me too -->`\n";
    auto r = pre.process_chapter(content);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == content);
}

TEST_CASE("unclosed comment opener is kept", "[preprocessor]") {
    auto html = scrub_to_html("before <!-- never closed\n");
    REQUIRE(html.find("before") != std::string::npos);
    REQUIRE(html.find("never closed") != std::string::npos);
}

TEST_CASE("empty chapter", "[preprocessor]") {
    Preprocessor pre;
    auto r = pre.process_chapter("");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().empty());
}

TEST_CASE("processing is idempotent", "[preprocessor]") {
    Preprocessor pre;
    std::string content = "# Doc\n\nSome text <!-- a --> more.\n\n<!-- block -->\n\n- item\n";
    auto once = pre.process_chapter(content).value();
    auto twice = pre.process_chapter(once).value();
    REQUIRE(once == twice);
    REQUIRE(once.find("<!--") == std::string::npos);
}

TEST_CASE("exposed opener is removed on the next run", "[preprocessor]") {
    Preprocessor pre;
    auto once = pre.process_chapter("<<!--x-->!--y-->\n").value();
    REQUIRE(once.find("x") == std::string::npos);
    REQUIRE(once.find("!--y-->") != std::string::npos);

    auto twice = pre.process_chapter(once).value();
    REQUIRE(twice.find("y") == std::string::npos);
}

// ===== Whole book =====

TEST_CASE("run strips comments from every chapter", "[preprocessor]") {
    auto input = parse_input(std::string(R"([
      {"root": "/b", "config": {}, "renderer": "html", "mdbook_version": "0.4.21"},
      {"sections": [
        {"Chapter": {"name": "One", "content": "one <!-- a -->\n", "path": "one.md",
                     "sub_items": [
          {"Chapter": {"name": "Two", "content": "<!-- b -->\n\ntwo\n", "path": "two.md",
                       "sub_items": []}}]}}
      ]}
    ])")).value();

    Preprocessor pre;
    auto book = pre.run(input.context, std::move(input.book));
    REQUIRE(book.is_ok());

    const auto& j = book.value().to_json();
    auto one = j["sections"][0]["Chapter"]["content"].get<std::string>();
    auto two = j["sections"][0]["Chapter"]["sub_items"][0]["Chapter"]["content"].get<std::string>();
    REQUIRE(one.find("one") != std::string::npos);
    REQUIRE(one.find("<!--") == std::string::npos);
    REQUIRE(two == "two\n");
}

TEST_CASE("process_chapter reports the number of removed comments", "[preprocessor]") {
    Preprocessor pre;
    size_t removed = 99;
    auto r = pre.process_chapter("a <!-- one --> b\n\n<!-- two -->\n", removed);
    REQUIRE(r.is_ok());
    REQUIRE(removed == 2);

    auto clean = pre.process_chapter("no comments here\n", removed);
    REQUIRE(clean.is_ok());
    REQUIRE(removed == 0);
}

TEST_CASE("run logs the comment count per chapter", "[preprocessor]") {
    auto input = parse_input(std::string(R"([
      {"root": "/b", "config": {}, "renderer": "html", "mdbook_version": "0.4.21"},
      {"sections": [
        {"Chapter": {"name": "Notes", "content": "x <!-- a --> y <!-- b -->\n",
                     "path": "notes.md", "sub_items": []}},
        {"Chapter": {"name": "Plain", "content": "plain\n", "path": "plain.md",
                     "sub_items": []}}
      ]}
    ])")).value();

    log::set_level(log::Debug);
    log::set_color_enabled(false);
    Preprocessor pre;
    std::string output = capture_stderr([&] {
        REQUIRE(pre.run(input.context, std::move(input.book)).is_ok());
    });
    log::set_level(log::Info);

    REQUIRE(output.find("chapter 'Notes': removed 2 comment(s)") != std::string::npos);
    REQUIRE(output.find("chapter 'Plain'") == std::string::npos);
}

TEST_CASE("dialect from config is used", "[preprocessor]") {
    Config cfg;
    cfg.dialect = Dialect::GitHub;
    cfg.dialect_set = true;
    Preprocessor pre(cfg);
    REQUIRE(pre.config().dialect == Dialect::GitHub);

    auto r = pre.process_chapter("| a | b |\n|---|---|\n| 1 | 2 <!-- c --> |\n");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().find("| a | b |") != std::string::npos);
    REQUIRE(r.value().find("<!--") == std::string::npos);
}

TEST_CASE("comments inside extended spans are removed", "[preprocessor]") {
    Config cfg;
    cfg.dialect = Dialect::Extended;
    cfg.dialect_set = true;
    Preprocessor pre(cfg);

    auto r = pre.process_chapter("_a <!-- c --> b_ [[Page]] $x$\n");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().find("<!--") == std::string::npos);

    auto tokens = tokenize(r.value(), Dialect::Extended).value();
    std::string html = render_html(tokens);
    REQUIRE(html.find("<u>a  b</u>") != std::string::npos);
    REQUIRE(html.find("<a href=\"Page\">") != std::string::npos);
    REQUIRE(html.find("<x-equation>x</x-equation>") != std::string::npos);
}

// ===== Renderers and versions =====

TEST_CASE("every renderer but the reserved one is supported", "[preprocessor]") {
    REQUIRE(Preprocessor::supports_renderer("html"));
    REQUIRE(Preprocessor::supports_renderer("markdown"));
    REQUIRE(Preprocessor::supports_renderer(""));
    REQUIRE_FALSE(Preprocessor::supports_renderer("not-supported"));
    REQUIRE(std::string(Preprocessor::name()) == "nocomment-preprocessor");
}

TEST_CASE("mdbook version check", "[preprocessor][version]") {
    REQUIRE(check_mdbook_version("0.4.21").value());
    REQUIRE(check_mdbook_version("0.4.40").value());
    REQUIRE_FALSE(check_mdbook_version("0.4.20").value());
    REQUIRE_FALSE(check_mdbook_version("0.5.0").value());
    REQUIRE_FALSE(check_mdbook_version("0.5.0-alpha.1").value());

    auto bad = check_mdbook_version("latest");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == NocommentError::Version);
}
