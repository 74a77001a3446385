#include <nocomment/config.hpp>
#include <toml++/toml.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace nocomment {

namespace {

// Keys mdBook itself reads from a [preprocessor.<name>] table
bool is_mdbook_key(const std::string& key) {
    return key == "command" || key == "renderers" || key == "before" ||
           key == "after" || key == "optional";
}

Status set_log_level(Config& cfg, const std::string& value) {
    if (!log::parse_level(value, cfg.log_level)) {
        return NocommentError{NocommentError::Config,
            "invalid log-level '" + value + "'",
            "expected one of: trace, debug, info, warn, error"};
    }
    cfg.log_level_set = true;
    return ok_status();
}

Status set_dialect(Config& cfg, const std::string& value) {
    if (!parse_dialect(value, cfg.dialect)) {
        return NocommentError{NocommentError::Config,
            "invalid dialect '" + value + "'",
            "expected one of: commonmark, github, extended"};
    }
    cfg.dialect_set = true;
    return ok_status();
}

Status read_table(Config& cfg, const toml::table& tbl) {
    for (const auto& [key, val] : tbl) {
        std::string k(key);
        if (k == "log-level") {
            auto s = val.value<std::string>();
            if (!s) {
                return NocommentError{NocommentError::Config, "log-level must be a string"};
            }
            NOCOMMENT_TRY(set_log_level(cfg, *s));
        } else if (k == "color") {
            auto b = val.value<bool>();
            if (!b) {
                return NocommentError{NocommentError::Config, "color must be a boolean"};
            }
            cfg.color = *b;
            cfg.color_set = true;
        } else if (k == "dialect") {
            auto s = val.value<std::string>();
            if (!s) {
                return NocommentError{NocommentError::Config, "dialect must be a string"};
            }
            NOCOMMENT_TRY(set_dialect(cfg, *s));
        } else if (!val.is_table() && !is_mdbook_key(k)) {
            log::warn("ignoring unknown config key '%s'", k.c_str());
        }
    }
    return ok_status();
}

} // anonymous namespace

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return NocommentError{NocommentError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description())};
    }

    Config cfg;

    // Top-level keys (global config file)
    NOCOMMENT_TRY(read_table(cfg, doc));

    // [preprocessor.nocomment] (book.toml)
    if (auto pre = doc["preprocessor"][CONFIG_TABLE].as_table()) {
        NOCOMMENT_TRY(read_table(cfg, *pre));
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return NocommentError{NocommentError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto r = Config::parse(ss.str());
    if (r.is_err()) {
        auto err = std::move(r).error();
        err.file = path;
        return err;
    }
    return r;
}

Result<Config> Config::from_json(const nlohmann::json& book_config) {
    Config cfg;
    if (!book_config.is_object()) return Result<Config>::ok(cfg);

    auto pre = book_config.find("preprocessor");
    if (pre == book_config.end() || !pre->is_object()) return Result<Config>::ok(cfg);
    auto table = pre->find(CONFIG_TABLE);
    if (table == pre->end() || !table->is_object()) return Result<Config>::ok(cfg);

    for (const auto& [key, val] : table->items()) {
        if (key == "log-level") {
            if (!val.is_string()) {
                return NocommentError{NocommentError::Config, "log-level must be a string"};
            }
            NOCOMMENT_TRY(set_log_level(cfg, val.get<std::string>()));
        } else if (key == "color") {
            if (!val.is_boolean()) {
                return NocommentError{NocommentError::Config, "color must be a boolean"};
            }
            cfg.color = val.get<bool>();
            cfg.color_set = true;
        } else if (key == "dialect") {
            if (!val.is_string()) {
                return NocommentError{NocommentError::Config, "dialect must be a string"};
            }
            NOCOMMENT_TRY(set_dialect(cfg, val.get<std::string>()));
        } else if (!is_mdbook_key(key)) {
            log::warn("ignoring unknown config key 'preprocessor.%s.%s'",
                      CONFIG_TABLE, key.c_str());
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.color_set) {
        color = other.color;
        color_set = true;
    }
    if (other.dialect_set) {
        dialect = other.dialect;
        dialect_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& file,
                         const std::optional<Config>& book) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (file.has_value()) result.merge(file.value());
    if (book.has_value()) result.merge(book.value());
    return result;
}

void Config::apply() const {
    if (log_level_set) log::set_level(log_level);
    if (color_set) log::set_color_enabled(color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.nocomment/config.toml";
}

} // namespace nocomment
