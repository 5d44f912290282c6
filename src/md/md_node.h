/**
 * Copyright (c) 2026 Cr4nkSt4r
 */
#pragma once

#include "md/md_property.h"

#include <string>
#include <vector>

namespace rbxmd::md {

inline constexpr std::string_view kNoId = "NoId";
inline constexpr std::string_view kUnnamed = "Unnamed";
inline constexpr std::string_view kDefaultClass = "Part";
inline constexpr std::string_view kPlaceholderClass = "Folder";

// One item of the scene document. Name and UniqueId live in their own fields
// and never appear in `properties`; an empty string means the document did
// not carry the field.
struct Node {
    std::string id;
    std::string class_name;
    std::string name;
    std::vector<Property> properties;
    std::vector<Node> children;

    const Property* find_property(std::string_view prop_name) const {
        for (const auto& p : properties) {
            if (p.name == prop_name) {
                return &p;
            }
        }
        return nullptr;
    }
};

// Flat, path-addressed form of one Node as it appears in the text output.
struct Record {
    std::string path;
    std::string id;
    std::string class_name;
    std::vector<std::string> properties;

    bool operator==(const Record&) const = default;
};

}  // namespace rbxmd::md
