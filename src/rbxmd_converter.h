/**
 * Copyright (c) 2026 Cr4nkSt4r
 */
#pragma once

#include "md/md_document.h"
#include "md/md_filter.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rbxmd {

struct MarkdownOptions {
    md::FilterConfig filter;
    md::FormatOptions format;
    bool single_file = false;
    std::string single_file_name = "output.md";
    bool debug = false;
};

struct MarkdownResult {
    // Output file name -> contents.
    std::map<std::string, std::string> files;
    std::size_t record_count = 0;
    std::size_t visited_nodes = 0;
    std::size_t input_lines = 0;
    std::size_t output_lines = 0;
    std::vector<std::string> warnings;

    double reduction_percent() const;
};

struct RbxlxOptions {
    // Fixed seed for placeholder ids; a random one is used otherwise.
    std::optional<std::uint64_t> seed;
    bool debug = false;
};

struct RbxlxResult {
    std::string xml;
    std::size_t record_count = 0;
    std::size_t item_count = 0;
    std::size_t placeholder_count = 0;
    std::vector<std::string> warnings;
};

class MdConverter {
   public:
    static MarkdownResult ConvertRbxlxText(std::string_view xml_text, const MarkdownOptions& opt = {});
    static MarkdownResult
    ConvertRbxlxFile(const std::filesystem::path& path, const MarkdownOptions& opt = {});

    static RbxlxResult
    ConvertMarkdownTexts(std::span<const std::string> texts, const RbxlxOptions& opt = {});
    static RbxlxResult
    ConvertMarkdownDir(const std::filesystem::path& dir, const RbxlxOptions& opt = {});
};

}  // namespace rbxmd
