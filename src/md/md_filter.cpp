/**
 * Copyright (c) 2026 Cr4nkSt4r
 */
#include "md/md_filter.h"

#include <regex>

namespace rbxmd::md {
namespace {
std::string_view strip_root_prefix(std::string_view pattern, std::string_view prefix) {
    if (!prefix.empty() && pattern.substr(0, prefix.size()) == prefix) {
        pattern.remove_prefix(prefix.size());
    }
    return pattern;
}

std::string wildcard_to_regex(std::string_view pattern) {
    static const std::string_view kSpecial = ".^$|()[]{}+?\\";
    std::string out;
    out.reserve(pattern.size() * 2);
    for (char c : pattern) {
        if (c == '*') {
            out.append(".*");
            continue;
        }
        if (kSpecial.find(c) != std::string_view::npos) {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

bool matches_any(std::string_view path, const std::vector<std::string>& patterns, std::string_view prefix) {
    for (const auto& pattern : patterns) {
        if (is_path_under(path, strip_root_prefix(pattern, prefix))) {
            return true;
        }
    }
    return false;
}
}  // namespace

bool is_path_under(std::string_view path, std::string_view pattern) {
    if (pattern.find('*') != std::string_view::npos) {
        const std::regex re(wildcard_to_regex(pattern));
        return std::regex_match(path.begin(), path.end(), re);
    }
    if (path.size() < pattern.size() || path.substr(0, pattern.size()) != pattern) {
        return false;
    }
    if (path.size() == pattern.size()) {
        return true;
    }
    // Descendants follow either a '.' or a bracketed segment.
    const auto rest = path.substr(pattern.size());
    return rest.front() == '.' || rest.substr(0, 2) == "[\"";
}

bool include_class(std::string_view class_name, const FilterConfig& cfg) {
    const std::string key(class_name);
    if (cfg.use_class_whitelist && !cfg.class_whitelist.empty()
        && cfg.class_whitelist.find(key) == cfg.class_whitelist.end()) {
        return false;
    }
    if (cfg.use_class_blacklist && !cfg.class_blacklist.empty()
        && cfg.class_blacklist.find(key) != cfg.class_blacklist.end()) {
        return false;
    }
    return true;
}

bool include_path(std::string_view path, const FilterConfig& cfg) {
    if (cfg.use_path_whitelist && !cfg.path_whitelist.empty()
        && !matches_any(path, cfg.path_whitelist, cfg.root_prefix)) {
        return false;
    }
    if (cfg.use_path_blacklist && !cfg.path_blacklist.empty()
        && matches_any(path, cfg.path_blacklist, cfg.root_prefix)) {
        return false;
    }
    return true;
}

}  // namespace rbxmd::md
