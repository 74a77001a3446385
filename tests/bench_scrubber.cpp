#include <catch2/catch.hpp>
#include <nocomment/md/render.hpp>
#include <nocomment/md/scrubber.hpp>
#include <nocomment/md/tokenizer.hpp>
#include <chrono>
#include <sstream>

using namespace nocomment;

// Generate a synthetic chapter with N sections, ~12 lines each
static std::string generate_chapter(int num_sections) {
    std::ostringstream out;
    for (int s = 0; s < num_sections; ++s) {
        out << "## Section " << s << "\n\n";
        out << "Some *emphasis* and a [link](https://example.com/" << s << ").\n";
        out << "Inline <!-- note " << s << " --> comment and `<!-- code -->`.\n\n";
        out << "<!--\n";
        out << "TODO(" << s << "): block comment\n";
        out << "-->\n\n";
        out << "- item one\n";
        out << "- item two <!-- --odd-- -->\n\n";
        out << "```\nplain code\n```\n\n";
    }
    return out.str();
}

TEST_CASE("scrubber perf: 10K-line chapter under 1s", "[scrubber][bench]") {
    auto source = generate_chapter(700);

    int line_count = 0;
    for (char c : source) {
        if (c == '\n') ++line_count;
    }
    REQUIRE(line_count >= 10000);

    auto tokens = tokenize(source);
    REQUIRE(tokens.is_ok());

    auto start = std::chrono::high_resolution_clock::now();
    auto r = scrub_comments(tokens.value());
    auto end = std::chrono::high_resolution_clock::now();

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();

    INFO("Lines: " << line_count);
    INFO("Tokens: " << tokens.value().size());
    INFO("Comments: " << r.comments.size());
    INFO("Time: " << ms << " ms");

    REQUIRE(r.comments.size() == 700 * 3);
    REQUIRE(ms < 1000);
}

TEST_CASE("scrubber perf: full pipeline on a 10K-line chapter under 2s", "[scrubber][bench]") {
    auto source = generate_chapter(700);

    auto start = std::chrono::high_resolution_clock::now();
    auto tokens = tokenize(source);
    REQUIRE(tokens.is_ok());
    auto out = render_markdown(scrub(tokens.value()));
    auto end = std::chrono::high_resolution_clock::now();

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    INFO("Output bytes: " << out.size());
    INFO("Time: " << ms << " ms");

    REQUIRE(out.find("<!-- note") == std::string::npos);
    REQUIRE(out.find("block comment") == std::string::npos);
    REQUIRE(out.find("`<!-- code -->`") != std::string::npos);
    REQUIRE(ms < 2000);
}
