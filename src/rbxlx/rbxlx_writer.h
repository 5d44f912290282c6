/**
 * Copyright (c) 2026 Cr4nkSt4r
 */
#pragma once

#include "md/md_node.h"

#include <span>
#include <string>

#include <pugixml.hpp>

namespace rbxmd::rbxlx {

// Appends <Item class=.. referent=..> with a <Properties> block that starts
// with the synthesized Name and UniqueId leaves, followed by nested items.
void write_item(pugi::xml_node parent, const md::Node& node);

// Appends one typed leaf, e.g. <Vector3 name="Size"><X>..</X>...</Vector3>.
void write_property(pugi::xml_node properties, const md::Property& prop);

// Serializes a complete <roblox version="4"> document.
std::string write_document(std::span<const md::Node> roots);

}  // namespace rbxmd::rbxlx
