/**
 * Copyright (c) 2026 Cr4nkSt4r
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace rbxmd::fs_utils {
bool has_extension(const std::filesystem::path& path, std::string_view ext);
std::vector<std::filesystem::path>
collect_inputs(const std::filesystem::path& root, std::string_view ext);
std::string read_text_file(const std::filesystem::path& path);
void write_text_file(const std::filesystem::path& path, const std::string& text);
void ensure_dir(const std::filesystem::path& dir);
std::size_t count_lines(std::string_view text);
std::string sanitize_file_stem(std::string_view stem);
}  // namespace rbxmd::fs_utils
