// mdbook-nocomment: mdBook preprocessor that strips HTML comments.
//
//     mdbook-nocomment                     # preprocess: [context, book] JSON on stdin
//     mdbook-nocomment supports html       # exit 0 if the renderer is supported
//     mdbook-nocomment scrub chapter.md    # scrub one file, print markdown
//
// Exit codes: 0 success, 1 failure or unsupported renderer, 2 usage error.

#include <nocomment/book.hpp>
#include <nocomment/config.hpp>
#include <nocomment/log.hpp>
#include <nocomment/md/render.hpp>
#include <nocomment/md/scrubber.hpp>
#include <nocomment/md/tokenizer.hpp>
#include <nocomment/preprocessor.hpp>
#include <nocomment/result.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace nocomment;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_USAGE = 2;

const char* USAGE =
    "mdbook-nocomment: strip HTML comments from mdBook chapters\n"
    "\n"
    "Usage:\n"
    "  mdbook-nocomment [options]                       preprocess a book (JSON on stdin)\n"
    "  mdbook-nocomment [options] supports <renderer>   check renderer support\n"
    "  mdbook-nocomment [options] scrub <file.md> [--html] [--tokens] [--list]\n"
    "\n"
    "Options:\n"
    "  --config <path>   read settings from a TOML file (book.toml works)\n"
    "  -v, --verbose     debug logging\n"
    "  -q, --quiet       only log errors\n"
    "  --version         print version\n"
    "  -h, --help        print this help\n";

struct Options {
    std::string command;               // "", "supports", "scrub"
    std::vector<std::string> args;
    std::optional<std::string> config_path;
    std::optional<log::Level> level;   // from -v / -q
    bool html = false;
    bool tokens = false;
    bool list = false;
    bool help = false;
    bool version = false;
};

Result<Options> parse_args(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "--version") {
            opts.version = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.level = log::Debug;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.level = log::Error;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                return NocommentError{NocommentError::InvalidArg,
                    "--config requires a path", "usage: --config <path>"};
            }
            opts.config_path = argv[++i];
        } else if (arg == "--html") {
            opts.html = true;
        } else if (arg == "--tokens") {
            opts.tokens = true;
        } else if (arg == "--list") {
            opts.list = true;
        } else if (!arg.empty() && arg[0] == '-') {
            return NocommentError{NocommentError::InvalidArg,
                "unknown option '" + arg + "'", "see --help"};
        } else if (opts.command.empty()) {
            if (arg != "supports" && arg != "scrub") {
                return NocommentError{NocommentError::InvalidArg,
                    "unknown command '" + arg + "'",
                    "expected 'supports' or 'scrub'"};
            }
            opts.command = arg;
        } else {
            opts.args.push_back(arg);
        }
    }

    if ((opts.html || opts.tokens || opts.list) && opts.command != "scrub") {
        return NocommentError{NocommentError::InvalidArg,
            "--html, --tokens and --list only apply to 'scrub'"};
    }
    if (opts.command == "supports" && opts.args.size() != 1) {
        return NocommentError{NocommentError::InvalidArg,
            "'supports' takes exactly one renderer name",
            "usage: mdbook-nocomment supports <renderer>"};
    }
    if (opts.command == "scrub" && opts.args.size() != 1) {
        return NocommentError{NocommentError::InvalidArg,
            "'scrub' takes exactly one markdown file",
            "usage: mdbook-nocomment scrub <file.md>"};
    }

    return Result<Options>::ok(std::move(opts));
}

// Global file and --config file. The book layer is added once the input is read.
Result<Config> load_file_config(const Options& opts) {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    std::error_code ec;
    if (!global_path.empty() && fs::exists(global_path, ec)) {
        auto r = Config::load(global_path);
        if (r.is_err()) return std::move(r).error();
        global = std::move(r).value();
    }

    std::optional<Config> file;
    if (opts.config_path) {
        auto r = Config::load(*opts.config_path);
        if (r.is_err()) return std::move(r).error();
        file = std::move(r).value();
    }

    return Result<Config>::ok(Config::effective(global, file, std::nullopt));
}

// Command-line flags win over every config layer
void apply_config(Config cfg, const Options& opts) {
    if (opts.level) {
        cfg.log_level = *opts.level;
        cfg.log_level_set = true;
    }
    cfg.apply();
}

Result<std::string> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return NocommentError{NocommentError::IO,
            "could not open file: " + path,
            "check the path and file permissions"};
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return Result<std::string>::ok(buf.str());
}

void dump_tokens(const char* title, const TokenList& tokens) {
    std::cout << "-- " << title << " (" << tokens.size() << ") --\n";
    for (const auto& t : tokens) {
        std::cout << "  " << describe(t) << "\n";
    }
}

Status run_preprocess(const Options& opts) {
    auto file_cfg = load_file_config(opts);
    if (file_cfg.is_err()) return std::move(file_cfg).error();
    apply_config(file_cfg.value(), opts);

    auto input = parse_input(std::cin);
    if (input.is_err()) return std::move(input).error();
    auto& ctx = input.value().context;

    auto book_cfg = Config::from_json(ctx.config);
    if (book_cfg.is_err()) return std::move(book_cfg).error();
    Config cfg = Config::effective(std::nullopt, file_cfg.value(), book_cfg.value());
    apply_config(cfg, opts);

    auto matches = check_mdbook_version(ctx.mdbook_version);
    if (matches.is_err()) return std::move(matches).error();
    if (!matches.value()) {
        log::warn("The %s plugin was built against version %s of mdbook, "
                  "but we're being called from version %s",
                  Preprocessor::name(), MDBOOK_VERSION, ctx.mdbook_version.c_str());
    }

    Preprocessor preprocessor(cfg);
    auto book = preprocessor.run(ctx, std::move(input.value().book));
    if (book.is_err()) return std::move(book).error();

    return write_book(std::cout, book.value());
}

Status run_scrub(const Options& opts) {
    auto cfg = load_file_config(opts);
    if (cfg.is_err()) return std::move(cfg).error();
    apply_config(cfg.value(), opts);

    const std::string& path = opts.args[0];
    auto source = read_file(path);
    if (source.is_err()) return std::move(source).error();

    auto tokens = tokenize(source.value(), cfg.value().dialect);
    if (tokens.is_err()) {
        auto err = std::move(tokens).error();
        err.file = path;
        return err;
    }

    ScrubResult scrubbed = scrub_comments(tokens.value());
    log::info("%s: removed %zu comment(s)", path.c_str(), scrubbed.comments.size());

    if (opts.tokens) {
        dump_tokens("input tokens", tokens.value());
        dump_tokens("scrubbed tokens", scrubbed.tokens);
        return ok_status();
    }
    if (opts.list) {
        for (const auto& comment : scrubbed.comments) {
            std::cout << comment << "\n";
        }
        return ok_status();
    }

    std::cout << (opts.html ? render_html(scrubbed.tokens) : render_markdown(scrubbed.tokens));
    std::cout.flush();
    if (!std::cout) {
        return NocommentError{NocommentError::IO, "failed to write output"};
    }
    return ok_status();
}

} // anonymous namespace

int main(int argc, char** argv) {
    auto parsed = parse_args(argc, argv);
    if (parsed.is_err()) {
        std::cerr << parsed.error().format() << "\n";
        return EXIT_USAGE;
    }
    const Options& opts = parsed.value();

    if (opts.help) {
        std::cout << USAGE;
        return EXIT_OK;
    }
    if (opts.version) {
        std::cout << "mdbook-nocomment " << NOCOMMENT_VERSION << "\n";
        return EXIT_OK;
    }

    if (opts.command == "supports") {
        bool supported = Preprocessor::supports_renderer(opts.args[0]);
        log::debug("renderer '%s' %s", opts.args[0].c_str(),
                   supported ? "is supported" : "is not supported");
        return supported ? EXIT_OK : EXIT_ERROR;
    }

    Status status = opts.command == "scrub" ? run_scrub(opts) : run_preprocess(opts);
    if (status.is_err()) {
        std::cerr << status.error().format() << "\n";
        return EXIT_ERROR;
    }
    return EXIT_OK;
}
