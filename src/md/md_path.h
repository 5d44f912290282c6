/**
 * Copyright (c) 2026 Cr4nkSt4r
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace rbxmd::md {

// Dotted hierarchy paths. Plain names are joined with '.', names that would
// break the grammar are written as ["name"] and self-delimit:
//   Workspace.Baseplate
//   Workspace["Spawn Point"].Decal

bool needs_quoting(std::string_view name);
std::string encode_segment(std::string_view name);
std::string join(std::string_view parent_path, std::string_view segment_text, std::string_view raw_name);
std::vector<std::string> split(std::string_view path);

// Convenience fold of join/encode_segment over raw names.
std::string make_path(const std::vector<std::string>& names);
std::string leaf_name(std::string_view path);
std::string first_segment(std::string_view path);

}  // namespace rbxmd::md
