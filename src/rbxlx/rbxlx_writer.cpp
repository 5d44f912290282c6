/**
 * Copyright (c) 2026 Cr4nkSt4r
 */
#include "rbxlx/rbxlx_writer.h"

#include <array>
#include <charconv>
#include <cstdint>
#include <sstream>

namespace rbxmd::rbxlx {
namespace {
using namespace rbxmd::md;

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

void add_text(pugi::xml_node parent, const char* tag, const std::string& text) {
    parent.append_child(tag).text().set(text.c_str());
}

void write_vector3(pugi::xml_node node, const Vector3Value& v) {
    add_text(node, "X", v.x);
    add_text(node, "Y", v.y);
    add_text(node, "Z", v.z);
}

void write_cframe(pugi::xml_node node, const CFrameValue& v) {
    static const std::array<const char*, 12> kNamed = {
        "X", "Y", "Z", "R00", "R01", "R02", "R10", "R11", "R12", "R20", "R21", "R22"
    };
    for (std::size_t i = 0; i < kNamed.size(); i++) {
        add_text(node, kNamed[i], v.components[i]);
    }
}

std::uint32_t parse_channel(const std::string& text) {
    unsigned int v = 0;
    const auto res = std::from_chars(text.data(), text.data() + text.size(), v);
    if (res.ec != std::errc()) {
        return 0;
    }
    return v > 255u ? 255u : v;
}

std::string join_ws(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& p : parts) {
        out += p;
        out.push_back(' ');
    }
    return out;
}

void write_value(pugi::xml_node node, const PropertyValue& value) {
    std::visit(
        overloaded{
            [&](const ScalarValue& v) {
                if (v.kind == ScalarKind::Content) {
                    if (v.text.empty()) {
                        node.append_child("null");
                    } else {
                        add_text(node, "url", v.text);
                    }
                    return;
                }
                if (v.kind == ScalarKind::ProtectedString && !v.text.empty()) {
                    node.append_child(pugi::node_cdata).set_value(v.text.c_str());
                    return;
                }
                node.text().set(v.text.c_str());
            },
            [&](const Vector2Value& v) {
                add_text(node, "X", v.x);
                add_text(node, "Y", v.y);
            },
            [&](const Vector3Value& v) { write_vector3(node, v); },
            [&](const Color3Value& v) {
                add_text(node, "R", v.r);
                add_text(node, "G", v.g);
                add_text(node, "B", v.b);
            },
            [&](const Color3uint8Value& v) {
                const std::uint32_t packed = 0xFF000000u | (parse_channel(v.r) << 16)
                                             | (parse_channel(v.g) << 8) | parse_channel(v.b);
                node.text().set(std::to_string(packed).c_str());
            },
            [&](const CFrameValue& v) { write_cframe(node, v); },
            [&](const OptionalCFrameValue& v) {
                if (v.value) {
                    write_cframe(node.append_child("CFrame"), *v.value);
                }
            },
            [&](const UDimValue& v) {
                add_text(node, "S", v.scale);
                add_text(node, "O", v.offset);
            },
            [&](const UDim2Value& v) {
                add_text(node, "XS", v.x_scale);
                add_text(node, "XO", v.x_offset);
                add_text(node, "YS", v.y_scale);
                add_text(node, "YO", v.y_offset);
            },
            [&](const NumberRangeValue& v) { node.text().set(join_ws({v.min, v.max}).c_str()); },
            [&](const Rect2DValue& v) {
                auto min = node.append_child("min");
                add_text(min, "X", v.min_x);
                add_text(min, "Y", v.min_y);
                auto max = node.append_child("max");
                add_text(max, "X", v.max_x);
                add_text(max, "Y", v.max_y);
            },
            [&](const RayValue& v) {
                write_vector3(node.append_child("Origin"), v.origin);
                write_vector3(node.append_child("Direction"), v.direction);
            },
            [&](const FontValue& v) {
                add_text(node.append_child("Family"), "url", v.family);
                add_text(node, "Weight", v.weight);
                add_text(node, "Style", v.style);
            },
            [&](const PhysicalPropertiesValue& v) {
                add_text(node, "CustomPhysics", "true");
                add_text(node, "Density", v.density);
                add_text(node, "Friction", v.friction);
                add_text(node, "Elasticity", v.elasticity);
            },
            [&](const FaceSetValue& v) {
                add_text(node, v.axes ? "axes" : "faces", std::to_string(v.mask));
            },
            [&](const NumberSequenceValue& v) {
                std::vector<std::string> parts;
                for (const auto& kp : v.keypoints) {
                    parts.insert(parts.end(), {kp.time, kp.value, kp.envelope});
                }
                node.text().set(join_ws(parts).c_str());
            },
            [&](const ColorSequenceValue& v) {
                std::vector<std::string> parts;
                for (const auto& kp : v.keypoints) {
                    parts.insert(parts.end(), {kp.time, kp.color.r, kp.color.g, kp.color.b, kp.envelope});
                }
                node.text().set(join_ws(parts).c_str());
            },
            [&](const UnsupportedValue& v) {
                if (!v.text.empty()) {
                    node.text().set(v.text.c_str());
                }
                // Components come back as unnamed elements holding their text.
                for (const auto& child : v.children) {
                    const auto* s = std::get_if<ScalarValue>(&child.value);
                    if (s != nullptr && s->kind == ScalarKind::String) {
                        add_text(node, child.name.c_str(), s->text);
                    } else {
                        write_property(node, child);
                    }
                }
            },
        },
        value
    );
}
}  // namespace

void write_property(pugi::xml_node properties, const md::Property& prop) {
    const std::string tag(md::property_value_tag(prop.value));
    auto node = properties.append_child(tag.c_str());
    node.append_attribute("name").set_value(prop.name.c_str());
    write_value(node, prop.value);
}

void write_item(pugi::xml_node parent, const md::Node& node) {
    auto item = parent.append_child("Item");
    item.append_attribute("class").set_value(node.class_name.c_str());
    item.append_attribute("referent").set_value(node.id.c_str());

    auto properties = item.append_child("Properties");
    write_property(properties, md::Property{"Name", md::make_scalar(md::ScalarKind::String, node.name)});
    write_property(properties, md::Property{"UniqueId", md::make_scalar(md::ScalarKind::UniqueId, node.id)});
    for (const auto& prop : node.properties) {
        if (prop.name == "Name" || prop.name == "UniqueId") {
            continue;
        }
        write_property(properties, prop);
    }

    for (const auto& child : node.children) {
        write_item(item, child);
    }
}

std::string write_document(std::span<const md::Node> roots) {
    pugi::xml_document doc;
    auto decl = doc.append_child(pugi::node_declaration);
    decl.append_attribute("version").set_value("1.0");
    decl.append_attribute("encoding").set_value("utf-8");

    auto root = doc.append_child("roblox");
    root.append_attribute("xmlns:xmime").set_value("http://www.w3.org/2005/05/xmlmime");
    root.append_attribute("xmlns:xsi").set_value("http://www.w3.org/2001/XMLSchema-instance");
    root.append_attribute("xsi:noNamespaceSchemaLocation").set_value("http://www.roblox.com/roblox.xsd");
    root.append_attribute("version").set_value("4");

    for (const auto& node : roots) {
        write_item(root, node);
    }

    std::ostringstream ss;
    doc.save(ss, "  ");
    return ss.str();
}

}  // namespace rbxmd::rbxlx
