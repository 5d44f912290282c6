/// @file test_rbxlx.cpp
/// @brief Tests for reading and writing .rbxlx documents

#include <catch2/catch_test_macros.hpp>

#include "rbxlx/rbxlx_reader.h"
#include "rbxlx/rbxlx_writer.h"

#include <stdexcept>
#include <string>

using namespace rbxmd;
using namespace rbxmd::md;

namespace {
const char* kPlace = R"(<?xml version="1.0" encoding="utf-8"?>
<roblox xmlns:xmime="http://www.w3.org/2005/05/xmlmime" version="4">
  <Item class="Workspace" referent="RBX0">
    <Properties>
      <string name="Name">Workspace</string>
      <UniqueId name="UniqueId">W000</UniqueId>
    </Properties>
    <Item class="Part" referent="RBX1">
      <Properties>
        <string name="Name">Baseplate</string>
        <UniqueId name="UniqueId">U1</UniqueId>
        <bool name="Anchored">true</bool>
        <Vector3 name="size"><X>512</X><Y>20</Y><Z>512</Z></Vector3>
        <CoordinateFrame name="CFrame">
          <X>0</X><Y>-10</Y><Z>0</Z>
          <R00>1</R00><R01>0</R01><R02>0</R02>
          <R10>0</R10><R11>1</R11><R12>0</R12>
          <R20>0</R20><R21>0</R21><R22>1</R22>
        </CoordinateFrame>
        <Color3uint8 name="Color3uint8">4288914085</Color3uint8>
        <token name="Material">256</token>
        <Faces name="Faces"><faces>3</faces></Faces>
        <Content name="Texture"><url>rbxassetid://123</url></Content>
        <NumberRange name="Range">1 5 </NumberRange>
        <Mystery name="Odd"><A>1</A><B>two</B></Mystery>
      </Properties>
    </Item>
  </Item>
</roblox>
)";
}  // namespace

TEST_CASE("Reading items", "[rbxlx][reader]") {
    const auto roots = rbxlx::read_document(kPlace);
    REQUIRE(roots.size() == 1);

    const auto& workspace = roots[0];
    REQUIRE(workspace.class_name == "Workspace");
    REQUIRE(workspace.name == "Workspace");
    REQUIRE(workspace.id == "W000");
    REQUIRE(workspace.properties.empty());
    REQUIRE(workspace.children.size() == 1);

    const auto& part = workspace.children[0];
    REQUIRE(part.name == "Baseplate");
    REQUIRE(part.id == "U1");
    REQUIRE(part.find_property("Name") == nullptr);
    REQUIRE(part.find_property("UniqueId") == nullptr);

    SECTION("Scalars") {
        REQUIRE(part.find_property("Anchored")->value == PropertyValue{make_scalar(ScalarKind::Bool, "true")});
        REQUIRE(part.find_property("Material")->value == PropertyValue{make_scalar(ScalarKind::Token, "256")});
        REQUIRE(
            part.find_property("Texture")->value
            == PropertyValue{make_scalar(ScalarKind::Content, "rbxassetid://123")}
        );
    }

    SECTION("Structured values") {
        REQUIRE(part.find_property("size")->value == PropertyValue{Vector3Value{"512", "20", "512"}});

        const auto* cf = std::get_if<CFrameValue>(&part.find_property("CFrame")->value);
        REQUIRE(cf != nullptr);
        REQUIRE(cf->components[1] == "-10");
        REQUIRE(cf->components[11] == "1");

        // 0xFFA3A2A5
        REQUIRE(part.find_property("Color3uint8")->value == PropertyValue{Color3uint8Value{"163", "162", "165"}});

        const auto* faces = std::get_if<FaceSetValue>(&part.find_property("Faces")->value);
        REQUIRE(faces != nullptr);
        REQUIRE(faces->has(Face::Right));
        REQUIRE(faces->has(Face::Top));
        REQUIRE_FALSE(faces->has(Face::Back));

        REQUIRE(part.find_property("Range")->value == PropertyValue{NumberRangeValue{"1", "5"}});
    }

    SECTION("Unknown tags") {
        const auto* odd = std::get_if<UnsupportedValue>(&part.find_property("Odd")->value);
        REQUIRE(odd != nullptr);
        REQUIRE(odd->tag == "Mystery");
        REQUIRE(odd->children.size() == 2);
        REQUIRE(odd->children[1] == Property{"B", make_scalar(ScalarKind::String, "two")});
    }
}

TEST_CASE("Malformed XML throws", "[rbxlx][reader]") {
    REQUIRE_THROWS_AS(rbxlx::read_document("<roblox><Item></roblox>"), std::runtime_error);
    REQUIRE_THROWS_AS(rbxlx::read_document(""), std::runtime_error);
}

TEST_CASE("Writing items", "[rbxlx][writer]") {
    Node part;
    part.id = "U1";
    part.class_name = "Part";
    part.name = "Spawn Point";
    part.properties = {
        Property{"Anchored", make_scalar(ScalarKind::Bool, "true")},
        Property{"Size", Vector3Value{"4", "1", "2"}},
    };
    Node folder;
    folder.id = "F1";
    folder.class_name = "Folder";
    folder.name = "Workspace";
    folder.children.push_back(part);
    const std::vector<Node> roots = {folder};

    const auto xml = rbxlx::write_document(roots);
    REQUIRE(xml.find("<roblox") != std::string::npos);
    REQUIRE(xml.find("version=\"4\"") != std::string::npos);
    REQUIRE(xml.find("<Item class=\"Part\" referent=\"U1\">") != std::string::npos);
    REQUIRE(xml.find("<string name=\"Name\">Spawn Point</string>") != std::string::npos);
    REQUIRE(xml.find("<UniqueId name=\"UniqueId\">U1</UniqueId>") != std::string::npos);
    REQUIRE(xml.find("<Vector3 name=\"Size\">") != std::string::npos);

    SECTION("Written documents read back") {
        const auto reread = rbxlx::read_document(xml);
        REQUIRE(reread.size() == 1);
        REQUIRE(reread[0].name == "Workspace");
        REQUIRE(reread[0].children.size() == 1);
        const auto& p = reread[0].children[0];
        REQUIRE(p.id == "U1");
        REQUIRE(p.name == "Spawn Point");
        REQUIRE(p.properties == part.properties);
    }
}

TEST_CASE("Reader and writer agree on structured layouts", "[rbxlx][writer][reader]") {
    CFrameValue cf;
    cf.components = {"1", "2", "3", "1", "0", "0", "0", "1", "0", "0", "0", "1"};
    FaceSetValue faces;
    faces.set(Face::Front);
    faces.set(Face::Left);
    NumberSequenceValue seq;
    seq.keypoints = {{"0", "1", "0"}, {"1", "0", "0"}};
    ColorSequenceValue colors;
    colors.keypoints = {ColorKeypoint{"0", Color3Value{"1", "1", "1"}, "0"}};

    Node n;
    n.id = "N";
    n.class_name = "Part";
    n.name = "N";
    n.properties = {
        Property{"CFrame", cf},
        Property{"PivotOffset", OptionalCFrameValue{cf}},
        Property{"Empty", OptionalCFrameValue{}},
        Property{"Color", Color3uint8Value{"10", "20", "30"}},
        Property{"Faces", faces},
        Property{"Range", NumberRangeValue{"0", "2"}},
        Property{"Rect", Rect2DValue{"0", "1", "2", "3"}},
        Property{"Curve", seq},
        Property{"Gradient", colors},
        Property{"Font", FontValue{"rbxasset://fonts/families/Arial.json", "400", "Normal"}},
        Property{"Physics", PhysicalPropertiesValue{"1", "0.3", "0.5"}},
        Property{"Padding", UDim2Value{"0", "4", "1", "-4"}},
        Property{"Texture", make_scalar(ScalarKind::Content, "rbxassetid://5")},
        Property{"Odd", UnsupportedValue{"Mystery", "", {Property{"A", make_scalar(ScalarKind::String, "1")}}}},
    };
    const std::vector<Node> roots = {n};

    const auto reread = rbxlx::read_document(rbxlx::write_document(roots));
    REQUIRE(reread.size() == 1);
    for (std::size_t i = 0; i < n.properties.size(); i++) {
        INFO(n.properties[i].name);
        REQUIRE(reread[0].properties[i] == n.properties[i]);
    }
}
