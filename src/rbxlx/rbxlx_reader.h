/**
 * Copyright (c) 2026 Cr4nkSt4r
 */
#pragma once

#include "md/md_node.h"

#include <optional>
#include <string_view>
#include <vector>

#include <pugixml.hpp>

namespace rbxmd::rbxlx {

// Parses a <roblox> document into its top-level items. Throws
// std::runtime_error when the XML cannot be parsed.
std::vector<md::Node> read_document(std::string_view xml_text);

// Reads one <Item> element, including nested items.
md::Node read_item(pugi::xml_node item);

// Converts one typed leaf of a <Properties> block. Elements without a
// name attribute yield nullopt.
std::optional<md::Property> read_property(pugi::xml_node prop);

}  // namespace rbxmd::rbxlx
