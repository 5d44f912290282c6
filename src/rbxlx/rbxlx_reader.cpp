/**
 * Copyright (c) 2026 Cr4nkSt4r
 */
#include "rbxlx/rbxlx_reader.h"

#include <array>
#include <charconv>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>

namespace rbxmd::rbxlx {
namespace {
using namespace rbxmd::md;

// Text of a direct child element, or `def` when the child is missing or empty.
std::string child_text(pugi::xml_node parent, const char* tag, const char* def = "0") {
    const auto child = parent.child(tag);
    if (!child) {
        return def;
    }
    const char* text = child.child_value();
    return (text != nullptr && *text != '\0') ? std::string(text) : std::string(def);
}

bool has_element_children(pugi::xml_node node) {
    for (auto child : node.children()) {
        if (child.type() == pugi::node_element) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> split_ws(std::string_view text) {
    std::vector<std::string> out;
    std::istringstream ss{std::string(text)};
    std::string tok;
    while (ss >> tok) {
        out.push_back(tok);
    }
    return out;
}

Vector3Value read_vector3(pugi::xml_node node) {
    return Vector3Value{child_text(node, "X"), child_text(node, "Y"), child_text(node, "Z")};
}

// Both the X/Y/Z/R00..R22 layout and the indexed V0..V11 / R0..R11 layout are
// accepted.
CFrameValue read_cframe(pugi::xml_node node) {
    static const std::array<const char*, 12> kNamed = {
        "X", "Y", "Z", "R00", "R01", "R02", "R10", "R11", "R12", "R20", "R21", "R22"
    };
    CFrameValue v;
    for (std::size_t i = 0; i < kNamed.size(); i++) {
        if (node.child(kNamed[i])) {
            v.components[i] = child_text(node, kNamed[i]);
            continue;
        }
        const std::string vtag = "V" + std::to_string(i);
        const std::string rtag = "R" + std::to_string(i);
        if (node.child(vtag.c_str())) {
            v.components[i] = child_text(node, vtag.c_str());
        } else {
            v.components[i] = child_text(node, rtag.c_str());
        }
    }
    return v;
}

Color3uint8Value read_color3uint8(pugi::xml_node node) {
    if (has_element_children(node)) {
        return Color3uint8Value{child_text(node, "R"), child_text(node, "G"), child_text(node, "B")};
    }
    const std::string text = node.child_value();
    std::uint32_t packed = 0;
    const auto res = std::from_chars(text.data(), text.data() + text.size(), packed);
    if (res.ec != std::errc()) {
        return Color3uint8Value{};
    }
    return Color3uint8Value{
        std::to_string((packed >> 16) & 0xFFu),
        std::to_string((packed >> 8) & 0xFFu),
        std::to_string(packed & 0xFFu),
    };
}

FaceSetValue read_faces(pugi::xml_node node, bool axes) {
    FaceSetValue v;
    v.axes = axes;
    const auto mask_node = node.child(axes ? "axes" : "faces");
    if (mask_node) {
        unsigned int mask = 0;
        const std::string text = mask_node.child_value();
        const auto res = std::from_chars(text.data(), text.data() + text.size(), mask);
        if (res.ec == std::errc()) {
            v.mask = static_cast<std::uint8_t>(mask & 0x3Fu);
        }
        return v;
    }
    for (const auto& [face, name] : kFaceNames) {
        const std::string tag(name);
        if (child_text(node, tag.c_str(), "false") == "true") {
            v.set(face);
        }
    }
    return v;
}

NumberRangeValue read_number_range(pugi::xml_node node) {
    if (has_element_children(node)) {
        return NumberRangeValue{child_text(node, "Min"), child_text(node, "Max")};
    }
    const auto parts = split_ws(node.child_value());
    NumberRangeValue v;
    if (parts.size() >= 2) {
        v.min = parts[0];
        v.max = parts[1];
    }
    return v;
}

NumberSequenceValue read_number_sequence(pugi::xml_node node) {
    NumberSequenceValue v;
    if (has_element_children(node)) {
        for (auto kp : node.select_nodes(".//Keypoint")) {
            const auto k = kp.node();
            v.keypoints.push_back(
                NumberKeypoint{child_text(k, "Time"), child_text(k, "Value"), child_text(k, "Envelope")}
            );
        }
        return v;
    }
    const auto parts = split_ws(node.child_value());
    for (std::size_t i = 0; i + 2 < parts.size(); i += 3) {
        v.keypoints.push_back(NumberKeypoint{parts[i], parts[i + 1], parts[i + 2]});
    }
    return v;
}

ColorSequenceValue read_color_sequence(pugi::xml_node node) {
    ColorSequenceValue v;
    if (has_element_children(node)) {
        for (auto kp : node.select_nodes(".//Keypoint")) {
            const auto k = kp.node();
            ColorKeypoint out;
            out.time = child_text(k, "Time");
            const auto value = k.child("Value");
            out.color = Color3Value{child_text(value, "R"), child_text(value, "G"), child_text(value, "B")};
            out.envelope = child_text(k, "Envelope");
            v.keypoints.push_back(std::move(out));
        }
        return v;
    }
    const auto parts = split_ws(node.child_value());
    for (std::size_t i = 0; i + 4 < parts.size(); i += 5) {
        ColorKeypoint kp;
        kp.time = parts[i];
        kp.color = Color3Value{parts[i + 1], parts[i + 2], parts[i + 3]};
        kp.envelope = parts[i + 4];
        v.keypoints.push_back(std::move(kp));
    }
    return v;
}

Rect2DValue read_rect(pugi::xml_node node) {
    if (node.child("min") || node.child("max")) {
        const auto min = node.child("min");
        const auto max = node.child("max");
        return Rect2DValue{
            child_text(min, "X"), child_text(min, "Y"), child_text(max, "X"), child_text(max, "Y")
        };
    }
    return Rect2DValue{
        child_text(node, "min_x"),
        child_text(node, "min_y"),
        child_text(node, "max_x"),
        child_text(node, "max_y"),
    };
}

// Content-like leaves may wrap their value in <url> (or carry an empty
// <null/>).
std::string scalar_text(pugi::xml_node node) {
    if (const auto url = node.child("url")) {
        return url.child_value();
    }
    return node.child_value();
}

FontValue read_font(pugi::xml_node node) {
    FontValue v;
    const auto family = node.child("Family");
    v.family = family ? scalar_text(family) : std::string();
    v.weight = child_text(node, "Weight", "");
    v.style = child_text(node, "Style", "");
    return v;
}

UnsupportedValue read_unsupported(pugi::xml_node node) {
    UnsupportedValue v;
    v.tag = node.name();
    if (!has_element_children(node)) {
        v.text = node.child_value();
        return v;
    }
    for (auto child : node.children()) {
        if (child.type() != pugi::node_element) {
            continue;
        }
        if (!child.attribute("name")) {
            v.children.push_back(Property{child.name(), make_scalar(ScalarKind::String, child.child_value())});
            continue;
        }
        if (auto nested = read_property(child)) {
            v.children.push_back(std::move(*nested));
        }
    }
    return v;
}
}  // namespace

std::optional<md::Property> read_property(pugi::xml_node prop) {
    using namespace rbxmd::md;

    const char* name = prop.attribute("name").value();
    if (name == nullptr || *name == '\0') {
        return std::nullopt;
    }
    const std::string_view tag = prop.name();

    Property out;
    out.name = name;
    if (const auto kind = scalar_kind_from_tag(tag)) {
        out.value = make_scalar(*kind, scalar_text(prop));
    } else if (tag == "Vector3") {
        out.value = read_vector3(prop);
    } else if (tag == "Vector2") {
        out.value = Vector2Value{child_text(prop, "X"), child_text(prop, "Y")};
    } else if (tag == "Color3") {
        out.value = Color3Value{child_text(prop, "R"), child_text(prop, "G"), child_text(prop, "B")};
    } else if (tag == "Color3uint8") {
        out.value = read_color3uint8(prop);
    } else if (tag == "CoordinateFrame" || tag == "CFrame") {
        out.value = read_cframe(prop);
    } else if (tag == "OptionalCoordinateFrame") {
        OptionalCFrameValue v;
        if (const auto inner = prop.child("CFrame")) {
            v.value = read_cframe(inner);
        } else if (has_element_children(prop)) {
            v.value = read_cframe(prop);
        }
        out.value = std::move(v);
    } else if (tag == "UDim") {
        out.value = UDimValue{child_text(prop, "S"), child_text(prop, "O")};
    } else if (tag == "UDim2") {
        out.value = UDim2Value{
            child_text(prop, "XS"), child_text(prop, "XO"), child_text(prop, "YS"), child_text(prop, "YO")
        };
    } else if (tag == "NumberRange") {
        out.value = read_number_range(prop);
    } else if (tag == "Rect2D") {
        out.value = read_rect(prop);
    } else if (tag == "Ray") {
        RayValue v;
        v.origin = read_vector3(prop.child("Origin"));
        v.direction = read_vector3(prop.child("Direction"));
        out.value = std::move(v);
    } else if (tag == "Font") {
        out.value = read_font(prop);
    } else if (tag == "PhysicalProperties") {
        out.value = PhysicalPropertiesValue{
            child_text(prop, "Density"), child_text(prop, "Friction"), child_text(prop, "Elasticity")
        };
    } else if (tag == "Faces" || tag == "Axes") {
        out.value = read_faces(prop, tag == "Axes");
    } else if (tag == "NumberSequence") {
        out.value = read_number_sequence(prop);
    } else if (tag == "ColorSequence") {
        out.value = read_color_sequence(prop);
    } else {
        out.value = read_unsupported(prop);
    }
    return out;
}

md::Node read_item(pugi::xml_node item) {
    md::Node node;
    node.class_name = item.attribute("class").value();
    for (auto prop : item.child("Properties").children()) {
        if (prop.type() != pugi::node_element) {
            continue;
        }
        const std::string_view tag = prop.name();
        const std::string_view prop_name = prop.attribute("name").value();
        if (prop_name == "Name" && node.name.empty()) {
            node.name = prop.child_value();
            continue;
        }
        if (prop_name == "UniqueId" && tag == "UniqueId" && node.id.empty()) {
            node.id = prop.child_value();
            continue;
        }
        if (auto p = read_property(prop)) {
            node.properties.push_back(std::move(*p));
        }
    }
    for (auto child : item.children("Item")) {
        node.children.push_back(read_item(child));
    }
    return node;
}

std::vector<md::Node> read_document(std::string_view xml_text) {
    pugi::xml_document doc;
    const auto res = doc.load_buffer(xml_text.data(), xml_text.size());
    if (!res) {
        throw std::runtime_error(
            std::string("Error parsing XML: ") + res.description() + " at offset "
            + std::to_string(res.offset)
        );
    }
    const auto root = doc.document_element();
    if (!root) {
        throw std::runtime_error("Error parsing XML: document has no root element");
    }
    std::vector<md::Node> out;
    for (auto item : root.children("Item")) {
        out.push_back(read_item(item));
    }
    return out;
}

}  // namespace rbxmd::rbxlx
