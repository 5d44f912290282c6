/**
 * Copyright (c) 2026 Cr4nkSt4r
 */
#include "md/md_tree_builder.h"

#include "md/md_path.h"
#include "md/md_property_codec.h"

namespace rbxmd::md {

TreeBuilder::TreeBuilder() : TreeBuilder(std::random_device{}()) {}

TreeBuilder::TreeBuilder(std::uint64_t seed) : _rng(seed) {}

TreeBuilder::Slot* TreeBuilder::add_slot(Slot& parent, const std::string& name) {
    auto slot = std::make_unique<Slot>();
    slot->node.name = name;
    slot->node.class_name = std::string(kPlaceholderClass);
    slot->node.id = generate_id();
    Slot* raw = slot.get();
    parent.children.push_back(std::move(slot));
    _slot_count++;
    return raw;
}

TreeBuilder::Slot* TreeBuilder::child_slot(Slot& parent, const std::string& key, const std::string& name) {
    auto it = _by_path.find(key);
    if (it != _by_path.end()) {
        // The path may still point into an earlier same-named sibling.
        for (const auto& child : parent.children) {
            if (child.get() == it->second) {
                return it->second;
            }
        }
    }
    Slot* raw = add_slot(parent, name);
    _by_path[key] = raw;
    return raw;
}

std::string TreeBuilder::generate_id() {
    static const char hexdig[] = "0123456789ABCDEF";
    while (true) {
        std::string id;
        id.reserve(32);
        for (int word = 0; word < 2; word++) {
            const std::uint64_t v = _rng();
            for (int i = 0; i < 16; i++) {
                id.push_back(hexdig[(v >> (60 - i * 4)) & 0xFu]);
            }
        }
        if (_used_ids.insert(id).second) {
            return id;
        }
    }
}

void TreeBuilder::insert(
    std::string_view path,
    std::string_view id,
    std::string_view class_name,
    std::vector<Property> properties
) {
    const auto segments = split(path);
    if (segments.empty()) {
        _warnings.push_back("Skipped record with empty path (" + std::string(id) + ")");
        return;
    }

    // Keys are the canonical re-encoding of the segments so that equivalent
    // spellings of a path land on the same node.
    Slot* parent = &_root;
    Slot* slot = nullptr;
    std::string key;
    for (const auto& segment : segments) {
        if (slot != nullptr) {
            parent = slot;
        }
        key = join(key, encode_segment(segment), segment);
        slot = child_slot(*parent, key, segment);
    }

    const std::string node_id = id.empty() ? std::string(kNoId) : std::string(id);
    if (!slot->placeholder) {
        if (slot->node.id != node_id || node_id == kNoId) {
            // Same-named sibling. Later records under this path attach to the
            // newest one, which is the order the walker emits them in.
            slot = add_slot(*parent, segments.back());
            _by_path[key] = slot;
        } else {
            _warnings.push_back("Duplicate record for path " + key + " (" + node_id + "), keeping the last one");
        }
    }
    _used_ids.erase(slot->node.id);
    slot->placeholder = false;
    slot->node.id = node_id;
    slot->node.class_name = class_name.empty() ? std::string(kDefaultClass) : std::string(class_name);
    slot->node.properties = std::move(properties);
    _used_ids.insert(slot->node.id);
}

void TreeBuilder::insert(const Record& record) {
    auto properties = decode_properties(record.properties, &_warnings);
    insert(record.path, record.id, record.class_name, std::move(properties));
}

std::size_t TreeBuilder::count_placeholders(const Slot& slot) {
    std::size_t n = 0;
    for (const auto& child : slot.children) {
        n += (child->placeholder ? 1 : 0) + count_placeholders(*child);
    }
    return n;
}

std::size_t TreeBuilder::placeholder_count() const {
    return count_placeholders(_root);
}

Node TreeBuilder::take(Slot& slot) {
    Node out = std::move(slot.node);
    out.children.reserve(slot.children.size());
    for (auto& child : slot.children) {
        out.children.push_back(take(*child));
    }
    return out;
}

std::vector<Node> TreeBuilder::build() {
    std::vector<Node> roots = take(_root).children;
    _root = Slot{};
    _by_path.clear();
    _slot_count = 0;
    _used_ids.clear();
    return roots;
}

}  // namespace rbxmd::md
