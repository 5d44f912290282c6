/**
 * Copyright (c) 2026 Cr4nkSt4r
 */
#pragma once

#include "md/md_node.h"

#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace rbxmd::md {

// Rebuilds a node tree from records in any order. Segments without a record
// of their own become Folder placeholders, which are filled in place once
// the record for that exact path arrives. A second record for an already
// filled path with a different id becomes a same-named sibling.
class TreeBuilder {
   public:
    TreeBuilder();
    explicit TreeBuilder(std::uint64_t seed);

    void insert(
        std::string_view path,
        std::string_view id,
        std::string_view class_name,
        std::vector<Property> properties
    );
    void insert(const Record& record);

    // Moves the built top-level nodes out, children in first-seen order.
    std::vector<Node> build();

    std::size_t node_count() const { return _slot_count; }
    std::size_t placeholder_count() const;
    const std::vector<std::string>& warnings() const { return _warnings; }

   private:
    struct Slot {
        Node node;
        bool placeholder = true;
        std::vector<std::unique_ptr<Slot>> children;
    };

    Slot* add_slot(Slot& parent, const std::string& name);
    Slot* child_slot(Slot& parent, const std::string& key, const std::string& name);
    static std::size_t count_placeholders(const Slot& slot);
    std::string generate_id();
    static Node take(Slot& slot);

    Slot _root;
    std::unordered_map<std::string, Slot*> _by_path;
    std::unordered_set<std::string> _used_ids;
    std::vector<std::string> _warnings;
    std::size_t _slot_count = 0;
    std::mt19937_64 _rng;
};

}  // namespace rbxmd::md
