/**
 * Copyright (c) 2026 Cr4nkSt4r
 */
#pragma once

#include "md/md_filter.h"
#include "md/md_node.h"

#include <span>
#include <string>
#include <unordered_set>
#include <vector>

namespace rbxmd::md {

struct WalkResult {
    std::vector<Record> records;
    std::vector<std::string> warnings;
    std::size_t visited_nodes = 0;
};

// Encodes the properties of one node the way they appear under its record
// header: sorted by name, reserved and empty bookkeeping properties dropped.
std::vector<std::string> encode_node_properties(const Node& node, std::vector<std::string>* warnings);

// Pre-order walk emitting one record per accepted node. `processed_ids` holds
// the identifiers already emitted by this run; a node whose id is in it is
// skipped together with its subtree.
WalkResult walk_tree(
    std::span<const Node> roots,
    const FilterConfig& cfg,
    std::unordered_set<std::string>& processed_ids
);

WalkResult walk_tree(std::span<const Node> roots, const FilterConfig& cfg);

}  // namespace rbxmd::md
