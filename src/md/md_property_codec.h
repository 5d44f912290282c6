/**
 * Copyright (c) 2026 Cr4nkSt4r
 */
#pragma once

#include "md/md_property.h"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rbxmd::md {

struct EncodedProperty {
    std::vector<std::string> lines;
    std::vector<std::string> warnings;
};

// Value text of a single-line property, e.g. "(1, 2, 3)" or "Enum(2)".
// Unsupported values render their raw text.
std::string encode_value(const PropertyValue& value);

// "- Name: value" at the given indent level (two spaces per level). Unsupported
// values produce a marker line, an indented dump of their children and a
// warning.
EncodedProperty encode_property(const Property& prop, int indent_level = 0);

// One entry of the decode inference table. Rules are tried top to bottom and
// the first match wins; the last rule accepts everything as a string.
struct DecodeRule {
    std::string_view name;
    bool (*matches)(std::string_view text);
    PropertyValue (*build)(std::string_view text);
};

std::span<const DecodeRule> decode_rules();
const DecodeRule& match_decode_rule(std::string_view text);
PropertyValue decode_value(std::string_view text);

// Decodes "- Name: value" plus any deeper-indented continuation lines that
// belong to it. Returns nullopt for lines that are not property lines.
std::optional<Property>
decode_property(std::string_view line, std::span<const std::string> continuation = {});

// Groups top-level property lines with their continuation lines and decodes
// each group. Lines that do not decode are reported in `warnings`.
std::vector<Property>
decode_properties(std::span<const std::string> lines, std::vector<std::string>* warnings = nullptr);

}  // namespace rbxmd::md
