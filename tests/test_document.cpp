/// @file test_document.cpp
/// @brief Tests for the record text format

#include <catch2/catch_test_macros.hpp>

#include "md/md_document.h"
#include "md/md_property_codec.h"
#include "md/md_tree_walker.h"

#include <string>
#include <vector>

using namespace rbxmd::md;

TEST_CASE("Formatting records", "[md][document]") {
    const Record record{"Workspace.Baseplate", "U1", "Part", {"- Anchored: true", "- Size: (4, 1, 2)"}};

    SECTION("Default layout") {
        REQUIRE(format_record(record) == "Workspace.Baseplate (U1)\n- Anchored: true\n- Size: (4, 1, 2)\n");
    }

    SECTION("With class") {
        FormatOptions opt;
        opt.show_class = true;
        REQUIRE(format_record(record, opt).rfind("Workspace.Baseplate (U1) [Part]\n", 0) == 0);
    }

    SECTION("Headers only") {
        FormatOptions opt;
        opt.show_properties = false;
        REQUIRE(format_record(record, opt) == "Workspace.Baseplate (U1)\n");
    }
}

TEST_CASE("Records are sorted by path", "[md][document]") {
    const std::vector<Record> records = {
        {"Workspace.B", "2", "Part", {}},
        {"Workspace.A", "1", "Part", {}},
    };
    REQUIRE(format_records(records) == "Workspace.A (1)\n\nWorkspace.B (2)\n\n");
}

TEST_CASE("Grouping by top-level segment", "[md][document]") {
    const std::vector<Record> records = {
        {"Workspace.A", "1", "Part", {}},
        {"Lighting", "2", "Lighting", {}},
        {"Workspace", "3", "Workspace", {}},
        {"[\"My Model\"].Part", "4", "Part", {}},
    };
    const auto groups = group_by_top_level(records);
    REQUIRE(groups.size() == 3);
    REQUIRE(groups.at("Workspace").size() == 2);
    REQUIRE(groups.at("Lighting").size() == 1);
    REQUIRE(groups.at("My Model").size() == 1);
}

TEST_CASE("Parsing headers", "[md][document]") {
    ParsedHeader h;

    SECTION("Path and id") {
        REQUIRE(parse_header("Workspace.Baseplate (U1)", h));
        REQUIRE(h.path == "Workspace.Baseplate");
        REQUIRE(h.id == "U1");
        REQUIRE(h.class_name == "Part");
    }

    SECTION("With class") {
        REQUIRE(parse_header("Workspace (W) [Workspace]", h));
        REQUIRE(h.class_name == "Workspace");
    }

    SECTION("Parentheses inside the name") {
        REQUIRE(parse_header("Workspace[\"Tree (1)\"] (T9)", h));
        REQUIRE(h.path == "Workspace[\"Tree (1)\"]");
        REQUIRE(h.id == "T9");
    }

    SECTION("Not a header") {
        REQUIRE_FALSE(parse_header("just text", h));
    }
}

TEST_CASE("Parsing a document", "[md][document]") {
    const std::string text =
        "Workspace (W) [Workspace]\n"
        "\n"
        "Workspace.Baseplate (U1)\n"
        "- Anchored: true\n"
        "- Position: (1, 2, 3)\n"
        "- Odd [UNSUPPORTED TYPE: Gizmo]\n"
        "  - X: 1\n"
        "\n"
        "Lighting (L)\r\n";

    const auto records = parse_markdown(text);
    REQUIRE(records.size() == 3);
    REQUIRE(records[0] == Record{"Workspace", "W", "Workspace", {}});
    REQUIRE(records[1].path == "Workspace.Baseplate");
    REQUIRE(records[1].class_name == "Part");
    REQUIRE(
        records[1].properties
        == std::vector<std::string>{"- Anchored: true", "- Position: (1, 2, 3)", "- Odd [UNSUPPORTED TYPE: Gizmo]", "  - X: 1"}
    );
    REQUIRE(records[2].id == "L");
}

TEST_CASE("Formatted output parses back", "[md][document]") {
    const std::vector<Record> records = {
        {"Workspace", "W", "Workspace", {}},
        {"Workspace[\"Spawn Point\"]", "S", "SpawnLocation", {"- Duration: 10"}},
    };
    FormatOptions opt;
    opt.show_class = true;
    REQUIRE(parse_markdown(format_records(records, opt)) == records);
}

TEST_CASE("Multi-line values stay inside their record", "[md][document]") {
    Node note;
    note.id = "N1";
    note.class_name = "StringValue";
    note.name = "Note";
    note.properties.push_back(
        Property{"Value", make_scalar(ScalarKind::String, "hello\nLighting.Fake (EVIL) [Script]")}
    );
    Node workspace;
    workspace.id = "W";
    workspace.class_name = "Workspace";
    workspace.name = "Workspace";
    workspace.children.push_back(note);
    const std::vector<Node> roots = {workspace};

    FormatOptions opt;
    opt.show_class = true;
    const auto text = format_records(walk_tree(roots, FilterConfig{}).records, opt);
    const auto records = parse_markdown(text);

    REQUIRE(records.size() == 2);
    REQUIRE(records[0].path == "Workspace");
    REQUIRE(records[1].path == "Workspace.Note");
    REQUIRE(records[1].properties.size() == 1);

    const auto decoded = decode_properties(records[1].properties);
    REQUIRE(decoded.size() == 1);
    REQUIRE(decoded.front() == note.properties.front());
}
