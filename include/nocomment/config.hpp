#pragma once

#include <nocomment/result.hpp>
#include <nocomment/log.hpp>
#include <nocomment/md/tokenizer.hpp>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>

namespace nocomment {

// Layered configuration: global file > --config file > mdBook book config.
// Later layers override earlier ones, field by field.
//
// Recognised keys (TOML top level, a [preprocessor.nocomment] table, or the
// "preprocessor.nocomment" object of the book config mdBook passes in):
//   log-level = "trace" | "debug" | "info" | "warn" | "error"
//   color     = true | false
//   dialect   = "commonmark" | "github" | "extended"
struct Config {
    log::Level log_level = log::Info;
    bool color = false;
    Dialect dialect = Dialect::CommonMark;

    // Track which fields were explicitly set (for merge)
    bool log_level_set = false;
    bool color_set = false;
    bool dialect_set = false;

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Load from a TOML file (global config or a book.toml)
    static Result<Config> load(const std::string& path);

    // Read the preprocessor table out of mdBook's book config
    static Result<Config> from_json(const nlohmann::json& book_config);

    // Merge another config on top (other's explicitly-set values override this)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& file,
                            const std::optional<Config>& book);

    // Push log level and color into the log module
    void apply() const;
};

// Table name under [preprocessor] in book.toml
constexpr const char* CONFIG_TABLE = "nocomment";

// Discover the global config file path: ~/.nocomment/config.toml
std::string global_config_path();

} // namespace nocomment
