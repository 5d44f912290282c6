/// @file test_tree_builder.cpp
/// @brief Tests for rebuilding a node tree from records

#include <catch2/catch_test_macros.hpp>

#include "md/md_path.h"
#include "md/md_tree_builder.h"
#include "md/md_tree_walker.h"

#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

using namespace rbxmd::md;

namespace {
const Node* find_child(const std::vector<Node>& nodes, std::string_view name) {
    for (const auto& n : nodes) {
        if (n.name == name) {
            return &n;
        }
    }
    return nullptr;
}
}  // namespace

TEST_CASE("Placeholders for missing segments", "[md][builder]") {
    TreeBuilder builder(1234);
    builder.insert("Workspace.Map.Tree", "T1", "Part", {});

    REQUIRE(builder.node_count() == 3);
    REQUIRE(builder.placeholder_count() == 2);

    const auto roots = builder.build();
    REQUIRE(roots.size() == 1);
    const auto& workspace = roots[0];
    REQUIRE(workspace.name == "Workspace");
    REQUIRE(workspace.class_name == "Folder");
    REQUIRE(workspace.id.size() == 32);

    const auto* map = find_child(workspace.children, "Map");
    REQUIRE(map != nullptr);
    REQUIRE(map->class_name == "Folder");
    REQUIRE(map->id != workspace.id);

    const auto* tree = find_child(map->children, "Tree");
    REQUIRE(tree != nullptr);
    REQUIRE(tree->id == "T1");
    REQUIRE(tree->class_name == "Part");
}

TEST_CASE("Placeholder completed in place", "[md][builder]") {
    TreeBuilder builder(7);
    builder.insert("Workspace.Map.Tree", "T1", "Part", {});
    builder.insert(
        "Workspace.Map", "M1", "Model", {Property{"Anchored", make_scalar(ScalarKind::Bool, "true")}}
    );

    REQUIRE(builder.placeholder_count() == 1);
    REQUIRE(builder.warnings().empty());

    const auto roots = builder.build();
    const auto* map = find_child(roots[0].children, "Map");
    REQUIRE(map != nullptr);
    REQUIRE(map->id == "M1");
    REQUIRE(map->class_name == "Model");
    REQUIRE(map->properties.size() == 1);
    REQUIRE(map->children.size() == 1);
    REQUIRE(map->children[0].id == "T1");
}

TEST_CASE("Record defaults and duplicates", "[md][builder]") {
    TreeBuilder builder(1);

    SECTION("Empty id and class") {
        builder.insert("Thing", "", "", {});
        const auto roots = builder.build();
        REQUIRE(roots[0].id == "NoId");
        REQUIRE(roots[0].class_name == "Part");
    }

    SECTION("Repeated record for the same id is merged") {
        builder.insert("Thing", "A", "Part", {});
        builder.insert("Thing", "A", "Model", {});
        REQUIRE(builder.warnings().size() == 1);
        const auto roots = builder.build();
        REQUIRE(roots.size() == 1);
        REQUIRE(roots[0].class_name == "Model");
    }

    SECTION("Different ids on one path become siblings") {
        builder.insert("Thing", "A", "Part", {});
        builder.insert("Thing", "B", "Model", {});
        REQUIRE(builder.warnings().empty());
        REQUIRE(builder.node_count() == 2);
        const auto roots = builder.build();
        REQUIRE(roots.size() == 2);
        REQUIRE(roots[0].id == "A");
        REQUIRE(roots[1].id == "B");
        REQUIRE(roots[1].name == "Thing");
    }

    SECTION("Id-less records on one path are kept apart") {
        builder.insert("Thing", "", "Part", {});
        builder.insert("Thing", "", "Part", {});
        REQUIRE(builder.build().size() == 2);
    }

    SECTION("Empty path is rejected") {
        builder.insert("", "A", "Part", {});
        REQUIRE(builder.node_count() == 0);
        REQUIRE(builder.warnings().size() == 1);
    }
}

TEST_CASE("Records decode their property lines", "[md][builder]") {
    TreeBuilder builder(3);
    builder.insert(Record{"Workspace[\"Spawn Point\"]", "S1", "SpawnLocation", {"- Size: (4, 1, 4)", "- Anchored: true"}});
    const auto roots = builder.build();

    const auto* spawn = find_child(roots[0].children, "Spawn Point");
    REQUIRE(spawn != nullptr);
    REQUIRE(spawn->properties.size() == 2);
    REQUIRE(spawn->properties[0] == Property{"Size", Vector3Value{"4", "1", "4"}});
    REQUIRE(spawn->properties[1] == Property{"Anchored", make_scalar(ScalarKind::Bool, "true")});
}

TEST_CASE("Every record path is present after building", "[md][builder]") {
    const std::vector<Record> records = {
        {"Lighting.Sky", "L2", "Sky", {}},
        {"Workspace.Map[\"Big Tree\"].Leaf", "W4", "Part", {}},
        {"Workspace", "W1", "Workspace", {}},
        {"Workspace.Map", "W2", "Model", {}},
        {"ReplicatedStorage[\"a.b\"]", "R1", "Folder", {}},
    };

    TreeBuilder builder(99);
    for (const auto& r : records) {
        builder.insert(r);
    }
    const auto roots = builder.build();

    // Re-flatten and compare against the inserted paths.
    std::unordered_set<std::string> built;
    std::unordered_set<std::string> ids;
    std::function<void(const Node&, const std::string&)> visit = [&](const Node& n, const std::string& parent) {
        const auto path = join(parent, encode_segment(n.name), n.name);
        built.insert(path);
        REQUIRE(ids.insert(n.id).second);
        for (const auto& c : n.children) {
            visit(c, path);
        }
    };
    for (const auto& r : roots) {
        visit(r, "");
    }

    for (const auto& r : records) {
        INFO(r.path);
        REQUIRE(built.count(r.path) == 1);
    }
    REQUIRE(built.count("Lighting") == 1);
    REQUIRE(built.count("Workspace.Map[\"Big Tree\"]") == 1);
}

TEST_CASE("Walk then build keeps the hierarchy", "[md][builder][walker]") {
    Node tree;
    tree.id = "T";
    tree.class_name = "Part";
    tree.name = "Big Tree";
    Node map;
    map.id = "M";
    map.class_name = "Model";
    map.name = "Map";
    map.children.push_back(tree);
    Node workspace;
    workspace.id = "W";
    workspace.class_name = "Workspace";
    workspace.name = "Workspace";
    workspace.children.push_back(map);
    std::vector<Node> roots = {workspace};

    const auto walked = walk_tree(roots, FilterConfig{});
    TreeBuilder builder(5);
    for (const auto& r : walked.records) {
        builder.insert(r);
    }
    REQUIRE(builder.placeholder_count() == 0);

    const auto rebuilt = builder.build();
    REQUIRE(rebuilt.size() == 1);
    REQUIRE(rebuilt[0].id == "W");
    REQUIRE(rebuilt[0].children[0].id == "M");
    REQUIRE(rebuilt[0].children[0].children[0].name == "Big Tree");
    REQUIRE(rebuilt[0].children[0].children[0].id == "T");
}

TEST_CASE("Same-named siblings survive a walk and rebuild", "[md][builder][walker]") {
    auto make = [](std::string id, std::string class_name, std::string name) {
        Node n;
        n.id = std::move(id);
        n.class_name = std::move(class_name);
        n.name = std::move(name);
        return n;
    };

    Node first = make("A", "Part", "Part");
    first.children.push_back(make("A1", "Decal", "Decal"));
    Node second = make("B", "Part", "Part");
    second.children.push_back(make("B1", "Decal", "Decal"));
    Node model = make("M", "Model", "Model");
    model.children = {first, second};
    const std::vector<Node> roots = {model};

    const auto walked = walk_tree(roots, FilterConfig{});
    REQUIRE(walked.records.size() == 5);

    TreeBuilder builder(11);
    for (const auto& r : walked.records) {
        builder.insert(r);
    }
    REQUIRE(builder.warnings().empty());
    REQUIRE(builder.node_count() == 5);
    REQUIRE(builder.placeholder_count() == 0);

    const auto rebuilt = builder.build();
    REQUIRE(rebuilt.size() == 1);
    const auto& parts = rebuilt[0].children;
    REQUIRE(parts.size() == 2);
    REQUIRE(parts[0].id == "A");
    REQUIRE(parts[1].id == "B");
    REQUIRE(parts[0].children.size() == 1);
    REQUIRE(parts[0].children[0].id == "A1");
    REQUIRE(parts[1].children.size() == 1);
    REQUIRE(parts[1].children[0].id == "B1");
}
