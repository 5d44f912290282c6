/**
 * Copyright (c) 2026 Cr4nkSt4r
 */
#include "md/md_property.h"

namespace rbxmd::md {
namespace {
template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

constexpr std::array<std::pair<std::string_view, ScalarKind>, 18> kScalarTags = {{
    {"string", ScalarKind::String},
    {"bool", ScalarKind::Bool},
    {"int", ScalarKind::Int32},
    {"int64", ScalarKind::Int64},
    {"float", ScalarKind::Float},
    {"double", ScalarKind::Double},
    {"token", ScalarKind::Token},
    {"Content", ScalarKind::Content},
    {"UniqueId", ScalarKind::UniqueId},
    {"SecurityCapabilities", ScalarKind::SecurityCapabilities},
    {"Enum", ScalarKind::Enum},
    {"BrickColor", ScalarKind::BrickColor},
    {"Ref", ScalarKind::Ref},
    {"SharedString", ScalarKind::SharedString},
    {"BinaryString", ScalarKind::BinaryString},
    {"ProtectedString", ScalarKind::ProtectedString},
    // Aliases, matched on read only.
    {"Reference", ScalarKind::Ref},
    {"ContentId", ScalarKind::Content},
}};
}  // namespace

std::string_view scalar_kind_tag(ScalarKind kind) {
    for (const auto& [tag, k] : kScalarTags) {
        if (k == kind) {
            return tag;
        }
    }
    return "string";
}

std::optional<ScalarKind> scalar_kind_from_tag(std::string_view tag) {
    for (const auto& [t, k] : kScalarTags) {
        if (t == tag) {
            return k;
        }
    }
    return std::nullopt;
}

std::string_view property_value_tag(const PropertyValue& value) {
    return std::visit(
        overloaded{
            [](const ScalarValue& v) { return scalar_kind_tag(v.kind); },
            [](const Vector2Value&) { return std::string_view("Vector2"); },
            [](const Vector3Value&) { return std::string_view("Vector3"); },
            [](const Color3Value&) { return std::string_view("Color3"); },
            [](const Color3uint8Value&) { return std::string_view("Color3uint8"); },
            [](const CFrameValue&) { return std::string_view("CoordinateFrame"); },
            [](const OptionalCFrameValue&) {
                return std::string_view("OptionalCoordinateFrame");
            },
            [](const UDimValue&) { return std::string_view("UDim"); },
            [](const UDim2Value&) { return std::string_view("UDim2"); },
            [](const NumberRangeValue&) { return std::string_view("NumberRange"); },
            [](const Rect2DValue&) { return std::string_view("Rect2D"); },
            [](const RayValue&) { return std::string_view("Ray"); },
            [](const FontValue&) { return std::string_view("Font"); },
            [](const PhysicalPropertiesValue&) {
                return std::string_view("PhysicalProperties");
            },
            [](const FaceSetValue& v) { return std::string_view(v.axes ? "Axes" : "Faces"); },
            [](const NumberSequenceValue&) { return std::string_view("NumberSequence"); },
            [](const ColorSequenceValue&) { return std::string_view("ColorSequence"); },
            [](const UnsupportedValue& v) { return std::string_view(v.tag); },
        },
        value
    );
}

}  // namespace rbxmd::md
