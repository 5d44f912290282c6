/**
 * Copyright (c) 2026 Cr4nkSt4r
 */
#include "rbxmd_converter.h"

#include "md/md_tree_builder.h"
#include "md/md_tree_walker.h"
#include "rbxlx/rbxlx_reader.h"
#include "rbxlx/rbxlx_writer.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <chrono>
#include <stdexcept>

namespace rbxmd {

static long long elapsed_ms(std::chrono::steady_clock::time_point a, std::chrono::steady_clock::time_point b) {
    return static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(b - a).count());
}

double MarkdownResult::reduction_percent() const {
    if (input_lines == 0) {
        return 0.0;
    }
    const double in = static_cast<double>(input_lines);
    const double out = static_cast<double>(output_lines);
    return (in - out) / in * 100.0;
}

MarkdownResult MdConverter::ConvertRbxlxText(std::string_view xml_text, const MarkdownOptions& opt) {
    MarkdownResult res;
    res.input_lines = fs_utils::count_lines(xml_text);

    const auto t0 = std::chrono::steady_clock::now();
    const auto roots = rbxlx::read_document(xml_text);
    const auto t1 = std::chrono::steady_clock::now();
    auto walk = md::walk_tree(roots, opt.filter);
    const auto t2 = std::chrono::steady_clock::now();

    res.record_count = walk.records.size();
    res.visited_nodes = walk.visited_nodes;
    res.warnings = std::move(walk.warnings);

    if (opt.single_file) {
        res.files[opt.single_file_name] = md::format_records(std::move(walk.records), opt.format);
    } else {
        for (auto& [segment, records] : md::group_by_top_level(std::move(walk.records))) {
            auto& text = res.files[fs_utils::sanitize_file_stem(segment) + ".md"];
            // Two top-level names may sanitize to the same file.
            text += md::format_records(std::move(records), opt.format);
        }
    }
    for (const auto& [name, text] : res.files) {
        res.output_lines += fs_utils::count_lines(text);
    }
    const auto t3 = std::chrono::steady_clock::now();

    if (opt.debug) {
        RBXMD_LOG_INFO(
            "rbxlx -> md: items=%zu records=%zu parse=%lldms walk=%lldms format=%lldms",
            res.visited_nodes, res.record_count,
            elapsed_ms(t0, t1), elapsed_ms(t1, t2), elapsed_ms(t2, t3)
        );
    }
    return res;
}

MarkdownResult MdConverter::ConvertRbxlxFile(const std::filesystem::path& path, const MarkdownOptions& opt) {
    const auto t0 = std::chrono::steady_clock::now();
    const auto text = fs_utils::read_text_file(path);
    const auto t1 = std::chrono::steady_clock::now();
    if (opt.debug) {
        RBXMD_LOG_INFO("Read %s: bytes=%zu read=%lldms", path.string().c_str(), text.size(), elapsed_ms(t0, t1));
    }
    return ConvertRbxlxText(text, opt);
}

RbxlxResult MdConverter::ConvertMarkdownTexts(std::span<const std::string> texts, const RbxlxOptions& opt) {
    RbxlxResult res;
    const auto t0 = std::chrono::steady_clock::now();

    md::TreeBuilder builder = opt.seed ? md::TreeBuilder(*opt.seed) : md::TreeBuilder();
    for (const auto& text : texts) {
        for (const auto& record : md::parse_markdown(text)) {
            builder.insert(record);
            res.record_count++;
        }
    }
    const auto t1 = std::chrono::steady_clock::now();

    res.item_count = builder.node_count();
    res.placeholder_count = builder.placeholder_count();
    res.warnings = builder.warnings();
    const auto roots = builder.build();
    res.xml = rbxlx::write_document(roots);
    const auto t2 = std::chrono::steady_clock::now();

    if (opt.debug) {
        RBXMD_LOG_INFO(
            "md -> rbxlx: records=%zu items=%zu placeholders=%zu build=%lldms write=%lldms",
            res.record_count, res.item_count, res.placeholder_count,
            elapsed_ms(t0, t1), elapsed_ms(t1, t2)
        );
    }
    return res;
}

RbxlxResult MdConverter::ConvertMarkdownDir(const std::filesystem::path& dir, const RbxlxOptions& opt) {
    if (!std::filesystem::is_directory(dir)) {
        throw std::runtime_error("Not a directory: " + dir.string());
    }
    std::vector<std::string> texts;
    for (const auto& p : fs_utils::collect_inputs(dir, ".md")) {
        texts.push_back(fs_utils::read_text_file(p));
    }
    if (texts.empty()) {
        RBXMD_LOG_WARN("No .md files found in %s", dir.string().c_str());
    }
    return ConvertMarkdownTexts(texts, opt);
}

}  // namespace rbxmd
