#include <catch2/catch.hpp>
#include <nocomment/config.hpp>
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>

using namespace nocomment;

// ===== Parsing =====

TEST_CASE("parse top-level keys", "[config]") {
    auto r = Config::parse(R"(
log-level = "debug"
color = true
dialect = "github"
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().log_level == log::Debug);
    REQUIRE(r.value().log_level_set);
    REQUIRE(r.value().color);
    REQUIRE(r.value().color_set);
    REQUIRE(r.value().dialect == Dialect::GitHub);
    REQUIRE(r.value().dialect_set);
}

TEST_CASE("parse preprocessor table from book.toml", "[config]") {
    auto r = Config::parse(R"(
[book]
title = "Example"

[preprocessor.nocomment]
command = "mdbook-nocomment"
before = ["links"]
dialect = "gfm"
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().dialect == Dialect::GitHub);
    REQUIRE_FALSE(r.value().log_level_set);
}

TEST_CASE("parse extended dialect", "[config]") {
    auto r = Config::parse("dialect = \"extended\"");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().dialect == Dialect::Extended);
    REQUIRE(r.value().dialect_set);

    auto bad = Config::parse("dialect = \"wiki\"");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().hint.find("extended") != std::string::npos);
}

TEST_CASE("parse empty config", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().log_level_set);
    REQUIRE_FALSE(r.value().color_set);
    REQUIRE_FALSE(r.value().dialect_set);
    REQUIRE(r.value().dialect == Dialect::CommonMark);
}

TEST_CASE("parse invalid TOML config", "[config]") {
    auto r = Config::parse("not valid [toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == NocommentError::Parse);
}

TEST_CASE("invalid values are config errors", "[config]") {
    auto level = Config::parse("log-level = \"loud\"");
    REQUIRE(level.is_err());
    REQUIRE(level.error().code == NocommentError::Config);

    auto color = Config::parse("color = \"yes\"");
    REQUIRE(color.is_err());
    REQUIRE(color.error().code == NocommentError::Config);

    auto dialect = Config::parse("[preprocessor.nocomment]\ndialect = \"asciidoc\"");
    REQUIRE(dialect.is_err());
    REQUIRE(dialect.error().message.find("asciidoc") != std::string::npos);
}

// ===== Book config JSON =====

TEST_CASE("from_json reads the preprocessor object", "[config][json]") {
    auto book = nlohmann::json::parse(R"({
        "book": {"title": "Example"},
        "preprocessor": {"nocomment": {"log-level": "warn", "color": false}}
    })");
    auto r = Config::from_json(book);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().log_level == log::Warn);
    REQUIRE(r.value().color_set);
    REQUIRE_FALSE(r.value().color);
    REQUIRE_FALSE(r.value().dialect_set);
}

TEST_CASE("from_json tolerates missing tables", "[config][json]") {
    REQUIRE(Config::from_json(nlohmann::json::object()).is_ok());
    REQUIRE(Config::from_json(nlohmann::json(nullptr)).is_ok());
    auto r = Config::from_json(nlohmann::json::parse(R"({"preprocessor": {"links": {}}})"));
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().log_level_set);
}

TEST_CASE("from_json rejects wrong types", "[config][json]") {
    auto r = Config::from_json(nlohmann::json::parse(
        R"({"preprocessor": {"nocomment": {"log-level": 3}}})"));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == NocommentError::Config);
}

// ===== Merge =====

TEST_CASE("merge only overrides explicitly set fields", "[config]") {
    auto base = Config::parse("log-level = \"debug\"\ncolor = true").value();
    auto overlay = Config::parse("log-level = \"error\"").value();

    base.merge(overlay);
    REQUIRE(base.log_level == log::Error);
    REQUIRE(base.color);
    REQUIRE_FALSE(base.dialect_set);
}

TEST_CASE("effective layers global, file then book", "[config]") {
    auto global = Config::parse("log-level = \"debug\"\ndialect = \"github\"").value();
    auto file = Config::parse("log-level = \"warn\"").value();
    auto book = Config::from_json(nlohmann::json::parse(
        R"({"preprocessor": {"nocomment": {"dialect": "commonmark"}}})")).value();

    auto cfg = Config::effective(global, file, book);
    REQUIRE(cfg.log_level == log::Warn);
    REQUIRE(cfg.dialect == Dialect::CommonMark);

    auto defaults = Config::effective(std::nullopt, std::nullopt, std::nullopt);
    REQUIRE(defaults.log_level == log::Info);
    REQUIRE_FALSE(defaults.log_level_set);
}

TEST_CASE("apply pushes settings into the log module", "[config]") {
    auto cfg = Config::parse("log-level = \"error\"\ncolor = false").value();
    cfg.apply();
    REQUIRE(log::get_level() == log::Error);
    REQUIRE_FALSE(log::is_color_enabled());
    log::set_level(log::Info);
}

// ===== Files =====

TEST_CASE("load reads a file and reports its path on error", "[config]") {
    std::string path = "nocomment_test_config.toml";
    {
        std::ofstream out(path);
        out << "[preprocessor.nocomment]\nlog-level = \"trace\"\n";
    }
    auto r = Config::load(path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().log_level == log::Trace);

    {
        std::ofstream out(path);
        out << "log-level = \n";
    }
    auto bad = Config::load(path);
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().file == path);
    std::remove(path.c_str());
}

TEST_CASE("load missing file is an IO error", "[config]") {
    auto r = Config::load("/nonexistent/nocomment/config.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == NocommentError::IO);
}

TEST_CASE("global config path lives under the home directory", "[config]") {
    auto path = global_config_path();
    if (!path.empty()) {
        REQUIRE(path.find(".nocomment/config.toml") != std::string::npos);
    }
}
