/**
 * Copyright (c) 2026 Cr4nkSt4r
 */
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace rbxmd::md {

// Every component is kept as the text it was read from. The text format has
// no type tags, so numbers are never reformatted on the way through.

enum class ScalarKind : std::uint8_t {
    String,
    Bool,
    Int32,
    Int64,
    Float,
    Double,
    Token,
    Content,
    UniqueId,
    SecurityCapabilities,
    Enum,
    BrickColor,
    Ref,
    SharedString,
    BinaryString,
    ProtectedString,
};

struct ScalarValue {
    ScalarKind kind = ScalarKind::String;
    std::string text;

    bool operator==(const ScalarValue&) const = default;
};

struct Vector2Value {
    std::string x = "0";
    std::string y = "0";

    bool operator==(const Vector2Value&) const = default;
};

struct Vector3Value {
    std::string x = "0";
    std::string y = "0";
    std::string z = "0";

    bool operator==(const Vector3Value&) const = default;
};

struct Color3Value {
    std::string r = "0";
    std::string g = "0";
    std::string b = "0";

    bool operator==(const Color3Value&) const = default;
};

struct Color3uint8Value {
    std::string r = "0";
    std::string g = "0";
    std::string b = "0";

    bool operator==(const Color3uint8Value&) const = default;
};

// Position followed by the row-major 3x3 rotation matrix.
struct CFrameValue {
    std::array<std::string, 12> components{"0", "0", "0", "0", "0", "0",
                                           "0", "0", "0", "0", "0", "0"};

    bool operator==(const CFrameValue&) const = default;
};

struct OptionalCFrameValue {
    std::optional<CFrameValue> value;

    bool operator==(const OptionalCFrameValue&) const = default;
};

struct UDimValue {
    std::string scale = "0";
    std::string offset = "0";

    bool operator==(const UDimValue&) const = default;
};

struct UDim2Value {
    std::string x_scale = "0";
    std::string x_offset = "0";
    std::string y_scale = "0";
    std::string y_offset = "0";

    bool operator==(const UDim2Value&) const = default;
};

struct NumberRangeValue {
    std::string min = "0";
    std::string max = "0";

    bool operator==(const NumberRangeValue&) const = default;
};

struct Rect2DValue {
    std::string min_x = "0";
    std::string min_y = "0";
    std::string max_x = "0";
    std::string max_y = "0";

    bool operator==(const Rect2DValue&) const = default;
};

struct RayValue {
    Vector3Value origin;
    Vector3Value direction;

    bool operator==(const RayValue&) const = default;
};

struct FontValue {
    std::string family;
    std::string weight;
    std::string style;

    bool operator==(const FontValue&) const = default;
};

struct PhysicalPropertiesValue {
    std::string density = "0";
    std::string friction = "0";
    std::string elasticity = "0";

    bool operator==(const PhysicalPropertiesValue&) const = default;
};

// Bit positions follow the NormalId order of the <faces> mask.
enum class Face : std::uint8_t {
    Right = 1u << 0,
    Top = 1u << 1,
    Back = 1u << 2,
    Left = 1u << 3,
    Bottom = 1u << 4,
    Front = 1u << 5,
};

inline constexpr std::array<std::pair<Face, std::string_view>, 6> kFaceNames = {{
    {Face::Top, "Top"},
    {Face::Bottom, "Bottom"},
    {Face::Left, "Left"},
    {Face::Right, "Right"},
    {Face::Front, "Front"},
    {Face::Back, "Back"},
}};

struct FaceSetValue {
    std::uint8_t mask = 0;
    bool axes = false;

    bool has(Face f) const { return (mask & static_cast<std::uint8_t>(f)) != 0; }
    void set(Face f) { mask |= static_cast<std::uint8_t>(f); }

    bool operator==(const FaceSetValue&) const = default;
};

struct NumberKeypoint {
    std::string time = "0";
    std::string value = "0";
    std::string envelope = "0";

    bool operator==(const NumberKeypoint&) const = default;
};

struct NumberSequenceValue {
    std::vector<NumberKeypoint> keypoints;

    bool operator==(const NumberSequenceValue&) const = default;
};

struct ColorKeypoint {
    std::string time = "0";
    Color3Value color;
    std::string envelope = "0";

    bool operator==(const ColorKeypoint&) const = default;
};

struct ColorSequenceValue {
    std::vector<ColorKeypoint> keypoints;

    bool operator==(const ColorSequenceValue&) const = default;
};

struct Property;

// Catch-all for property tags without a template. Leaf elements keep their
// text; structured elements keep one child per sub-element, where unnamed
// components are stored as String scalars named after their tag.
struct UnsupportedValue {
    std::string tag;
    std::string text;
    std::vector<Property> children;

    bool operator==(const UnsupportedValue&) const = default;
};

using PropertyValue = std::variant<
    ScalarValue,
    Vector2Value,
    Vector3Value,
    Color3Value,
    Color3uint8Value,
    CFrameValue,
    OptionalCFrameValue,
    UDimValue,
    UDim2Value,
    NumberRangeValue,
    Rect2DValue,
    RayValue,
    FontValue,
    PhysicalPropertiesValue,
    FaceSetValue,
    NumberSequenceValue,
    ColorSequenceValue,
    UnsupportedValue>;

struct Property {
    std::string name;
    PropertyValue value;

    bool operator==(const Property&) const = default;
};

std::string_view scalar_kind_tag(ScalarKind kind);
std::optional<ScalarKind> scalar_kind_from_tag(std::string_view tag);
std::string_view property_value_tag(const PropertyValue& value);

inline ScalarValue make_scalar(ScalarKind kind, std::string text) {
    return ScalarValue{kind, std::move(text)};
}

}  // namespace rbxmd::md
