/**
 * Copyright (c) 2026 Cr4nkSt4r
 */
#include "rbxmd_converter.h"
#include "utils/fs_utils.h"
#include "utils/log.h"
#include "utils/settings.h"

#include <filesystem>
#include <optional>
#include <string_view>
#include <string>
#include <vector>

namespace fs = std::filesystem;

struct Settings {
    std::optional<fs::path> output;
    fs::path settings_path = "settings.json";
    bool show_class = false;
    bool single_file = false;
    bool show_properties = true;
    bool debug = false;
};

static void print_usage() {
    RBXMD_LOG_INFO(
        "Usage:\n" \
        "    rbxmd <file-or-dir> [--output <path>] [--settings <path>] [--show-class] [--single-file] [--no-properties] [--debug]\n\n" \
        "Options:\n" \
        "    First argument must be a .rbxlx file (converted to .md) or a directory of .md files (converted to .rbxlx)\n" \
        "    --output        output directory for .md files, or output file for .rbxlx\n" \
        "    --settings      filter settings .json (default: settings.json)\n" \
        "    --show-class    writes [ClassName] after each record header\n" \
        "    --single-file   writes every record into one .md file\n" \
        "    --no-properties writes record headers only\n" \
        "    --debug         enables extra logging\n"
    );
}

static void log_warnings(const std::vector<std::string>& warnings) {
    for (const auto& w : warnings) {
        RBXMD_LOG_WARN("%s", w.c_str());
    }
}

static bool convert_rbxlx(const fs::path& input, const Settings& settings) {
    const std::string base = input.stem().string();
    try {
        rbxmd::MarkdownOptions opt{};
        opt.filter = rbxmd::settings::load_filter_config(settings.settings_path);
        opt.format.show_class = settings.show_class;
        opt.format.show_properties = settings.show_properties;
        opt.single_file = settings.single_file;
        opt.single_file_name = base + ".md";
        opt.debug = settings.debug;

        const auto res = rbxmd::MdConverter::ConvertRbxlxFile(input, opt);
        log_warnings(res.warnings);

        const fs::path out_dir = settings.output.value_or(input.parent_path() / base);
        rbxmd::fs_utils::ensure_dir(out_dir);
        for (const auto& [name, text] : res.files) {
            const fs::path out_path = out_dir / name;
            rbxmd::fs_utils::write_text_file(out_path, text);
            RBXMD_LOG_INFO("Wrote: %s", out_path.string().c_str());
        }
        RBXMD_LOG_INFO(
            "Records: %zu, files: %zu, lines: %zu -> %zu (%.1f%% reduction)",
            res.record_count, res.files.size(), res.input_lines, res.output_lines,
            res.reduction_percent()
        );
    } catch (const std::exception& e) {
        RBXMD_LOG_ERROR("Failed: %s (%s)", input.string().c_str(), e.what());
        return false;
    }
    return true;
}

static bool convert_markdown_dir(const fs::path& input, const Settings& settings) {
    try {
        rbxmd::RbxlxOptions opt{};
        opt.debug = settings.debug;
        const auto res = rbxmd::MdConverter::ConvertMarkdownDir(input, opt);
        log_warnings(res.warnings);

        const fs::path out_path = settings.output.value_or(fs::path("output.rbxlx"));
        rbxmd::fs_utils::write_text_file(out_path, res.xml);
        RBXMD_LOG_INFO("Wrote: %s", out_path.string().c_str());
        RBXMD_LOG_INFO(
            "Records: %zu, items: %zu (%zu placeholders)",
            res.record_count, res.item_count, res.placeholder_count
        );
    } catch (const std::exception& e) {
        RBXMD_LOG_ERROR("Failed: %s (%s)", input.string().c_str(), e.what());
        return false;
    }
    return true;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string_view first_arg = argv[1];
    if (!first_arg.empty() && first_arg[0] == '-') {
        RBXMD_LOG_ERROR("First argument must be a file or folder.");
        print_usage();
        return 2;
    }
    const fs::path input = fs::path(std::string(first_arg));
    Settings settings;
    for (int i = 2; i < argc; i++) {
        const std::string_view arg = argv[i];
        if (arg == "--show-class") {
            settings.show_class = true;
            continue;
        }
        if (arg == "--single-file") {
            settings.single_file = true;
            continue;
        }
        if (arg == "--no-properties") {
            settings.show_properties = false;
            continue;
        }
        if (arg == "--debug") {
            settings.debug = true;
            continue;
        }
        if (arg == "--output" || arg == "--settings") {
            if (i + 1 >= argc) {
                RBXMD_LOG_ERROR("Missing value for %s", std::string(arg).c_str());
                return 2;
            }
            if (arg == "--output") {
                settings.output = fs::path(argv[++i]);
            } else {
                settings.settings_path = fs::path(argv[++i]);
            }
            continue;
        }
        RBXMD_LOG_ERROR("Unknown option: %s", std::string(arg).c_str());
        return 2;
    }

    if (!fs::exists(input)) {
        RBXMD_LOG_ERROR("Input does not exist: %s", input.string().c_str());
        return 2;
    }

    if (fs::is_directory(input)) {
        return convert_markdown_dir(input, settings) ? 0 : 1;
    }
    if (!rbxmd::fs_utils::has_extension(input, ".rbxlx")) {
        RBXMD_LOG_ERROR("Unsupported input: %s", input.string().c_str());
        return 2;
    }
    return convert_rbxlx(input, settings) ? 0 : 1;
}
