/**
 * Copyright (c) 2026 Cr4nkSt4r
 */
#pragma once

#include "md/md_node.h"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace rbxmd::md {

struct FormatOptions {
    bool show_class = false;
    bool show_properties = true;
};

// "<path> (<id>) [<class>]" followed by the property lines of the record.
std::string format_record(const Record& record, const FormatOptions& opt = {});

// Records sorted by path, one block each, blocks separated by a blank line.
std::string format_records(std::vector<Record> records, const FormatOptions& opt = {});

// Buckets records by the first segment of their path, keeping record order.
std::map<std::string, std::vector<Record>> group_by_top_level(std::vector<Record> records);

struct ParsedHeader {
    std::string path;
    std::string id;
    std::string class_name;
};

bool parse_header(std::string_view line, ParsedHeader& out);

// Reads every block back. Headers without a class get kDefaultClass.
std::vector<Record> parse_markdown(std::string_view text);

}  // namespace rbxmd::md
