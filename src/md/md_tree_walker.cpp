/**
 * Copyright (c) 2026 Cr4nkSt4r
 */
#include "md/md_tree_walker.h"

#include "md/md_path.h"
#include "md/md_property_codec.h"

#include <algorithm>

namespace rbxmd::md {
namespace {
struct Frame {
    const Node* node = nullptr;
    std::string parent_path;
};

bool is_reserved_property(std::string_view name) {
    return name == "Name" || name == "UniqueId";
}

// AttributesSerialize and Tags are present on almost every item and carry
// nothing when empty.
bool is_empty_bookkeeping(const Property& prop) {
    if (prop.name != "AttributesSerialize" && prop.name != "Tags") {
        return false;
    }
    if (const auto* s = std::get_if<ScalarValue>(&prop.value)) {
        return s->text.find_first_not_of(" \t\r\n") == std::string::npos;
    }
    if (const auto* u = std::get_if<UnsupportedValue>(&prop.value)) {
        return u->children.empty() && u->text.find_first_not_of(" \t\r\n") == std::string::npos;
    }
    return false;
}

void push_children(std::vector<Frame>& stack, const Node& node, const std::string& parent_path) {
    for (auto it = node.children.rbegin(); it != node.children.rend(); ++it) {
        stack.push_back(Frame{&*it, parent_path});
    }
}
}  // namespace

std::vector<std::string> encode_node_properties(const Node& node, std::vector<std::string>* warnings) {
    std::vector<const Property*> sorted;
    sorted.reserve(node.properties.size());
    for (const auto& p : node.properties) {
        if (is_reserved_property(p.name) || is_empty_bookkeeping(p)) {
            continue;
        }
        sorted.push_back(&p);
    }
    std::stable_sort(sorted.begin(), sorted.end(), [](const Property* a, const Property* b) {
        return a->name < b->name;
    });

    std::vector<std::string> lines;
    for (const auto* p : sorted) {
        auto encoded = encode_property(*p);
        lines.insert(lines.end(), encoded.lines.begin(), encoded.lines.end());
        if (warnings != nullptr) {
            warnings->insert(warnings->end(), encoded.warnings.begin(), encoded.warnings.end());
        }
    }
    return lines;
}

WalkResult walk_tree(
    std::span<const Node> roots,
    const FilterConfig& cfg,
    std::unordered_set<std::string>& processed_ids
) {
    WalkResult result;
    std::vector<Frame> stack;
    for (auto it = roots.rbegin(); it != roots.rend(); ++it) {
        stack.push_back(Frame{&*it, {}});
    }

    while (!stack.empty()) {
        Frame frame = std::move(stack.back());
        stack.pop_back();
        const Node& node = *frame.node;
        result.visited_nodes++;

        // A filtered class contributes no segment; its children hang off the
        // same parent path.
        if (!include_class(node.class_name, cfg)) {
            push_children(stack, node, frame.parent_path);
            continue;
        }

        const std::string name = node.name.empty() ? std::string(kUnnamed) : node.name;
        const std::string id = node.id.empty() ? std::string(kNoId) : node.id;
        const bool has_id = id != kNoId;

        if (has_id && processed_ids.count(id) != 0) {
            continue;
        }

        const std::string current_path = join(frame.parent_path, encode_segment(name), name);

        if (!has_id && cfg.exclude_no_id_items) {
            push_children(stack, node, current_path);
            continue;
        }

        if (has_id) {
            processed_ids.insert(id);
        }

        if (include_path(current_path, cfg)) {
            Record record;
            record.path = current_path;
            record.id = id;
            record.class_name = node.class_name;
            record.properties = encode_node_properties(node, &result.warnings);
            result.records.push_back(std::move(record));
        }

        // A descendant may satisfy the whitelist even when this node does not.
        push_children(stack, node, current_path);
    }
    return result;
}

WalkResult walk_tree(std::span<const Node> roots, const FilterConfig& cfg) {
    std::unordered_set<std::string> processed_ids;
    return walk_tree(roots, cfg, processed_ids);
}

}  // namespace rbxmd::md
