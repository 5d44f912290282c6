/**
 * Copyright (c) 2026 Cr4nkSt4r
 */
#include "fs_utils.h"

#include "log.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

static std::string lower_ascii(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

namespace rbxmd::fs_utils {
bool has_extension(const fs::path& path, std::string_view ext) {
    return lower_ascii(path.extension().string()) == lower_ascii(ext);
}

std::vector<fs::path> collect_inputs(const fs::path& root, std::string_view ext) {
    std::vector<fs::path> out;
    for (const auto& it : fs::recursive_directory_iterator(root)) {
        if (!it.is_regular_file()) {
            continue;
        }
        if (!has_extension(it.path(), ext)) {
            continue;
        }
        out.push_back(it.path());
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::string read_text_file(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        throw std::runtime_error(std::string("Failed to open file for reading: ") + path.string());
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

void write_text_file(const fs::path& path, const std::string& text) {
    ensure_dir(path.parent_path());
    std::ofstream f(path, std::ios::binary);
    if (!f) {
        throw std::runtime_error(std::string("Failed to open file for writing: ") + path.string());
    }
    f.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!f) {
        throw std::runtime_error(std::string("Failed to write file: ") + path.string());
    }
}

void ensure_dir(const fs::path& dir) {
    if (dir.empty()) {
        return;
    }
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        RBXMD_LOG_ERROR(
            "Failed to create directory: %s (%s)", dir.string().c_str(), ec.message().c_str()
        );
    }
}

std::size_t count_lines(std::string_view text) {
    if (text.empty()) {
        return 0;
    }
    std::size_t n = static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n'));
    if (text.back() != '\n') {
        n++;
    }
    return n;
}

// Path separators and reserved characters cannot appear in a group file name.
std::string sanitize_file_stem(std::string_view stem) {
    std::string out;
    out.reserve(stem.size());
    for (char c : stem) {
        switch (c) {
            case '/':
            case '\\':
            case ':':
            case '*':
            case '?':
            case '"':
            case '<':
            case '>':
            case '|':
                out.push_back('_');
                break;
            default:
                out.push_back(c);
                break;
        }
    }
    if (out.empty()) {
        out = "Root";
    }
    return out;
}
}  // namespace rbxmd::fs_utils
