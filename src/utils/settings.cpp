/**
 * Copyright (c) 2026 Cr4nkSt4r
 */
#include "settings.h"

#include "fs_utils.h"
#include "log.h"

#include <stdexcept>

namespace rbxmd::settings {
namespace {
template <class Out>
void read_string_list(const nlohmann::json& j, const char* key, Out& out) {
    const auto it = j.find(key);
    if (it == j.end() || !it->is_array()) {
        return;
    }
    out.clear();
    for (const auto& el : *it) {
        if (el.is_string()) {
            out.insert(out.end(), el.get<std::string>());
        }
    }
}

void read_bool(const nlohmann::json& j, const char* key, bool& out) {
    const auto it = j.find(key);
    if (it != j.end() && it->is_boolean()) {
        out = it->get<bool>();
    }
}
}  // namespace

md::FilterConfig filter_config_from_json(const nlohmann::json& j) {
    md::FilterConfig cfg;
    if (!j.is_object()) {
        return cfg;
    }

    // {"Ignore": {"ClassName": [...], "Path": [...]}}
    const auto ignore = j.find("Ignore");
    if (ignore != j.end() && ignore->is_object()) {
        if (ignore->contains("ClassName")) {
            read_string_list(*ignore, "ClassName", cfg.class_blacklist);
            cfg.use_class_blacklist = true;
        }
        if (ignore->contains("Path")) {
            read_string_list(*ignore, "Path", cfg.path_blacklist);
            cfg.use_path_blacklist = true;
        }
    }

    read_string_list(j, "path_whitelist", cfg.path_whitelist);
    read_string_list(j, "path_blacklist", cfg.path_blacklist);
    read_string_list(j, "class_whitelist", cfg.class_whitelist);
    read_string_list(j, "class_blacklist", cfg.class_blacklist);
    read_bool(j, "use_path_whitelist", cfg.use_path_whitelist);
    read_bool(j, "use_path_blacklist", cfg.use_path_blacklist);
    read_bool(j, "use_class_whitelist", cfg.use_class_whitelist);
    read_bool(j, "use_class_blacklist", cfg.use_class_blacklist);
    read_bool(j, "exclude_no_id_items", cfg.exclude_no_id_items);
    if (const auto it = j.find("root_prefix"); it != j.end() && it->is_string()) {
        cfg.root_prefix = it->get<std::string>();
    }
    return cfg;
}

md::FilterConfig load_filter_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        RBXMD_LOG_INFO("Settings file not found: %s (using defaults)", path.string().c_str());
        return {};
    }
    try {
        const auto text = fs_utils::read_text_file(path);
        return filter_config_from_json(nlohmann::json::parse(text));
    } catch (const std::exception& e) {
        RBXMD_LOG_ERROR("Failed to load settings: %s (%s)", path.string().c_str(), e.what());
        return {};
    }
}
}  // namespace rbxmd::settings
