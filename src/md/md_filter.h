/**
 * Copyright (c) 2026 Cr4nkSt4r
 */
#pragma once

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace rbxmd::md {

struct FilterConfig {
    std::vector<std::string> path_whitelist;
    std::vector<std::string> path_blacklist;
    std::unordered_set<std::string> class_whitelist;
    std::unordered_set<std::string> class_blacklist;
    bool use_path_whitelist = false;
    bool use_path_blacklist = false;
    bool use_class_whitelist = false;
    bool use_class_blacklist = false;
    bool exclude_no_id_items = false;
    // Patterns may be written from the document root ("game.Workspace"); the
    // prefix is removed before comparing against paths.
    std::string root_prefix = "game.";
};

bool is_path_under(std::string_view path, std::string_view pattern);
bool include_class(std::string_view class_name, const FilterConfig& cfg);
bool include_path(std::string_view path, const FilterConfig& cfg);

}  // namespace rbxmd::md
