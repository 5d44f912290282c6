/// @file test_settings.cpp
/// @brief Tests for the JSON filter settings

#include <catch2/catch_test_macros.hpp>

#include "utils/settings.h"

#include <filesystem>

using namespace rbxmd;

TEST_CASE("Filter settings from JSON", "[settings]") {
    SECTION("Defaults for an empty object") {
        const auto cfg = settings::filter_config_from_json(nlohmann::json::object());
        REQUIRE_FALSE(cfg.use_path_whitelist);
        REQUIRE_FALSE(cfg.use_class_blacklist);
        REQUIRE_FALSE(cfg.exclude_no_id_items);
        REQUIRE(cfg.root_prefix == "game.");
    }

    SECTION("Direct keys") {
        const auto j = nlohmann::json::parse(R"({
            "path_whitelist": ["game.Workspace"],
            "use_path_whitelist": true,
            "class_whitelist": ["Part", "Model"],
            "use_class_whitelist": true,
            "exclude_no_id_items": true
        })");
        const auto cfg = settings::filter_config_from_json(j);
        REQUIRE(cfg.path_whitelist == std::vector<std::string>{"game.Workspace"});
        REQUIRE(cfg.use_path_whitelist);
        REQUIRE(cfg.class_whitelist.count("Model") == 1);
        REQUIRE(cfg.use_class_whitelist);
        REQUIRE(cfg.exclude_no_id_items);
    }

    SECTION("Ignore shorthand fills the blacklists") {
        const auto j = nlohmann::json::parse(R"({
            "Ignore": {"ClassName": ["Script", "LocalScript"], "Path": ["game.Workspace.Camera"]}
        })");
        const auto cfg = settings::filter_config_from_json(j);
        REQUIRE(cfg.use_class_blacklist);
        REQUIRE(cfg.class_blacklist.size() == 2);
        REQUIRE(cfg.use_path_blacklist);
        REQUIRE(cfg.path_blacklist == std::vector<std::string>{"game.Workspace.Camera"});
        REQUIRE_FALSE(md::include_class("Script", cfg));
        REQUIRE_FALSE(md::include_path("Workspace.Camera", cfg));
    }

    SECTION("Direct keys override the shorthand") {
        const auto j = nlohmann::json::parse(R"({
            "Ignore": {"ClassName": ["Script"]},
            "use_class_blacklist": false
        })");
        const auto cfg = settings::filter_config_from_json(j);
        REQUIRE_FALSE(cfg.use_class_blacklist);
        REQUIRE(md::include_class("Script", cfg));
    }

    SECTION("Wrongly typed values are ignored") {
        const auto j = nlohmann::json::parse(R"({"use_path_blacklist": "yes", "path_blacklist": "Workspace"})");
        const auto cfg = settings::filter_config_from_json(j);
        REQUIRE_FALSE(cfg.use_path_blacklist);
        REQUIRE(cfg.path_blacklist.empty());
    }
}

TEST_CASE("Missing settings file", "[settings]") {
    const auto cfg = settings::load_filter_config(std::filesystem::path("does_not_exist_rbxmd.json"));
    REQUIRE_FALSE(cfg.use_class_blacklist);
    REQUIRE(cfg.path_whitelist.empty());
}
