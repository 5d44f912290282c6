/**
 * Copyright (c) 2026 Cr4nkSt4r
 */
#include "md/md_document.h"

#include "md/md_path.h"

#include <algorithm>
#include <optional>
#include <regex>

namespace rbxmd::md {
namespace {
std::string_view rtrim(std::string_view s) {
    while (!s.empty() && (s.back() == '\r' || s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

bool is_property_line(std::string_view line) {
    const auto first = line.find_first_not_of(' ');
    return first != std::string_view::npos && line.substr(first, 2) == "- ";
}
}  // namespace

std::string format_record(const Record& record, const FormatOptions& opt) {
    std::string out = record.path + " (" + record.id + ")";
    if (opt.show_class) {
        out += " [" + record.class_name + "]";
    }
    out.push_back('\n');
    if (opt.show_properties) {
        for (const auto& line : record.properties) {
            out += line;
            out.push_back('\n');
        }
    }
    return out;
}

std::string format_records(std::vector<Record> records, const FormatOptions& opt) {
    std::stable_sort(records.begin(), records.end(), [](const Record& a, const Record& b) {
        return a.path < b.path;
    });
    std::string out;
    for (const auto& record : records) {
        out += format_record(record, opt);
        out.push_back('\n');
    }
    return out;
}

std::map<std::string, std::vector<Record>> group_by_top_level(std::vector<Record> records) {
    std::map<std::string, std::vector<Record>> groups;
    for (auto& record : records) {
        auto top = first_segment(record.path);
        if (top.empty()) {
            top = "Root";
        }
        groups[top].push_back(std::move(record));
    }
    return groups;
}

bool parse_header(std::string_view line, ParsedHeader& out) {
    // The id is the last parenthesised group, so names containing "(1)" stay
    // part of the path.
    static const std::regex re(R"(^(.*\S)\s*\(([^()]+)\)(?:\s*\[([^\]]+)\])?\s*$)");
    std::match_results<std::string_view::const_iterator> m;
    if (!std::regex_match(line.begin(), line.end(), m, re)) {
        return false;
    }
    out.path = m[1].str();
    out.id = m[2].str();
    out.class_name = m[3].matched ? m[3].str() : std::string(kDefaultClass);
    return true;
}

std::vector<Record> parse_markdown(std::string_view text) {
    std::vector<Record> records;
    std::optional<Record> current;

    auto flush = [&]() {
        if (current) {
            records.push_back(std::move(*current));
            current.reset();
        }
    };

    std::size_t pos = 0;
    while (pos <= text.size()) {
        const std::size_t eol = text.find('\n', pos);
        const auto raw = text.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
        pos = eol == std::string_view::npos ? text.size() + 1 : eol + 1;

        const auto line = rtrim(raw);
        if (line.empty()) {
            flush();
            continue;
        }
        // Property lines are checked first: values such as "(1, 2, 3)" would
        // otherwise read as a header.
        if (is_property_line(line)) {
            if (current) {
                current->properties.emplace_back(line);
            }
            continue;
        }
        ParsedHeader header;
        if (parse_header(line, header)) {
            flush();
            current = Record{std::move(header.path), std::move(header.id), std::move(header.class_name), {}};
        }
    }
    flush();
    return records;
}

}  // namespace rbxmd::md
