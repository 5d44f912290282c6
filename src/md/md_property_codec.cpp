/**
 * Copyright (c) 2026 Cr4nkSt4r
 */
#include "md/md_property_codec.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <limits>
#include <regex>

namespace rbxmd::md {
namespace {
using SvMatch = std::match_results<std::string_view::const_iterator>;

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

// Numeric component inside tuples and wrapped forms.
#define RBXMD_NUM "(-?\\d+(?:\\.\\d+)?(?:[eE][-+]?\\d+)?)"

constexpr std::string_view kUnsupportedMarker = " [UNSUPPORTED TYPE: ";

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

std::size_t indent_of(std::string_view line) {
    std::size_t n = 0;
    while (n < line.size() && line[n] == ' ') {
        n++;
    }
    return n;
}

std::string lower_ascii(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

const std::string& or_default(const std::string& s, const std::string& def) {
    return s.empty() ? def : s;
}

const std::string kZero = "0";

bool regex_full(std::string_view text, const std::regex& re, SvMatch& m) {
    return std::regex_match(text.begin(), text.end(), m, re);
}

bool regex_full(std::string_view text, const std::regex& re) {
    return std::regex_match(text.begin(), text.end(), re);
}

// Inner text of "Prefix(...)", or nullopt when the text is not wrapped.
std::optional<std::string_view> unwrap(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size() + 2 || text.substr(0, prefix.size()) != prefix) {
        return std::nullopt;
    }
    if (text[prefix.size()] != '(' || text.back() != ')') {
        return std::nullopt;
    }
    return text.substr(prefix.size() + 1, text.size() - prefix.size() - 2);
}

std::vector<std::string> split_components(std::string_view inner, char sep) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (true) {
        const std::size_t pos = inner.find(sep, start);
        const auto part = trim(inner.substr(start, pos == std::string_view::npos ? pos : pos - start));
        out.emplace_back(part);
        if (pos == std::string_view::npos) {
            break;
        }
        start = pos + 1;
    }
    return out;
}

std::string join_components(std::span<const std::string> parts, std::string_view sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); i++) {
        if (i > 0) {
            out.append(sep);
        }
        out.append(or_default(parts[i], kZero));
    }
    return out;
}

std::string vector3_text(const Vector3Value& v) {
    return "(" + or_default(v.x, kZero) + ", " + or_default(v.y, kZero) + ", "
           + or_default(v.z, kZero) + ")";
}

std::string cframe_text(const CFrameValue& v) {
    return "CFrame(" + join_components(v.components, ", ") + ")";
}

// Free text is kept on one line: '\\', '\n' and '\r' are written as escapes.
std::string escape_text(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '\\':
                out.append("\\\\");
                break;
            case '\n':
                out.append("\\n");
                break;
            case '\r':
                out.append("\\r");
                break;
            default:
                out.push_back(c);
                break;
        }
    }
    return out;
}

// Unknown escapes are kept as written.
std::string unescape_text(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); i++) {
        if (s[i] != '\\' || i + 1 >= s.size()) {
            out.push_back(s[i]);
            continue;
        }
        const char next = s[i + 1];
        if (next == '\\') {
            out.push_back('\\');
        } else if (next == 'n') {
            out.push_back('\n');
        } else if (next == 'r') {
            out.push_back('\r');
        } else {
            out.push_back('\\');
            out.push_back(next);
        }
        i++;
    }
    return out;
}

std::string scalar_text(const ScalarValue& v) {
    switch (v.kind) {
        case ScalarKind::Bool:
            return v.text.empty() ? std::string("false") : v.text;
        case ScalarKind::Int32:
        case ScalarKind::Int64:
        case ScalarKind::SecurityCapabilities:
            return or_default(v.text, kZero);
        case ScalarKind::Float:
        case ScalarKind::Double:
            return v.text.empty() ? std::string("0.0") : v.text;
        case ScalarKind::Enum:
            return "Enum(" + v.text + ")";
        case ScalarKind::BrickColor:
            return "BrickColor(" + v.text + ")";
        case ScalarKind::Ref:
            return "Ref(" + v.text + ")";
        case ScalarKind::SharedString:
            return "SharedString(" + v.text + ")";
        case ScalarKind::BinaryString:
        case ScalarKind::ProtectedString:
            return "[Binary Data]";
        case ScalarKind::String:
        case ScalarKind::Token:
        case ScalarKind::Content:
            return escape_text(v.text);
        case ScalarKind::UniqueId:
            return v.text;
    }
    return v.text;
}

// ---------------------------------------------------------------------------
// Decode rules

bool is_bool(std::string_view t) {
    const auto lower = lower_ascii(t);
    return lower == "true" || lower == "false";
}

PropertyValue build_bool(std::string_view t) {
    return make_scalar(ScalarKind::Bool, lower_ascii(t));
}

bool is_integer(std::string_view t) {
    static const std::regex re("-?\\d+");
    return regex_full(t, re);
}

PropertyValue build_integer(std::string_view t) {
    long long v = 0;
    const auto res = std::from_chars(t.data(), t.data() + t.size(), v);
    constexpr long long limit = std::numeric_limits<std::int32_t>::max();
    const bool wide = res.ec == std::errc::result_out_of_range || v > limit || v < -limit;
    return make_scalar(wide ? ScalarKind::Int64 : ScalarKind::Int32, std::string(t));
}

bool is_float(std::string_view t) {
    static const std::regex re("-?\\d+\\.\\d+");
    return regex_full(t, re);
}

PropertyValue build_float(std::string_view t) {
    return make_scalar(ScalarKind::Float, std::string(t));
}

const std::regex& rgb_regex() {
    static const std::regex re("RGB\\s*\\(\\s*(\\d+)\\s*,\\s*(\\d+)\\s*,\\s*(\\d+)\\s*\\)");
    return re;
}

bool is_rgb(std::string_view t) {
    return regex_full(t, rgb_regex());
}

PropertyValue build_rgb(std::string_view t) {
    SvMatch m;
    regex_full(t, rgb_regex(), m);
    return Color3uint8Value{m[1].str(), m[2].str(), m[3].str()};
}

const std::regex& vector3_regex() {
    static const std::regex re(
        "\\(\\s*" RBXMD_NUM "\\s*,\\s*" RBXMD_NUM "\\s*,\\s*" RBXMD_NUM "\\s*\\)"
    );
    return re;
}

bool is_vector3(std::string_view t) {
    return regex_full(t, vector3_regex());
}

PropertyValue build_vector3(std::string_view t) {
    SvMatch m;
    regex_full(t, vector3_regex(), m);
    return Vector3Value{m[1].str(), m[2].str(), m[3].str()};
}

const std::regex& vector2_regex() {
    static const std::regex re("\\(\\s*" RBXMD_NUM "\\s*,\\s*" RBXMD_NUM "\\s*\\)");
    return re;
}

bool is_vector2(std::string_view t) {
    return regex_full(t, vector2_regex());
}

PropertyValue build_vector2(std::string_view t) {
    SvMatch m;
    regex_full(t, vector2_regex(), m);
    return Vector2Value{m[1].str(), m[2].str()};
}

bool is_cframe(std::string_view t) {
    const auto inner = unwrap(t, "CFrame");
    return inner && split_components(*inner, ',').size() == 12;
}

PropertyValue build_cframe(std::string_view t) {
    const auto parts = split_components(*unwrap(t, "CFrame"), ',');
    CFrameValue v;
    std::copy(parts.begin(), parts.end(), v.components.begin());
    return v;
}

bool is_nil(std::string_view t) {
    return t == "nil";
}

PropertyValue build_nil(std::string_view) {
    return OptionalCFrameValue{};
}

const std::regex& udim2_regex() {
    static const std::regex re(
        "X\\(\\s*Scale:\\s*" RBXMD_NUM "\\s*,\\s*Offset:\\s*" RBXMD_NUM
        "\\s*\\)\\s*,\\s*Y\\(\\s*Scale:\\s*" RBXMD_NUM "\\s*,\\s*Offset:\\s*" RBXMD_NUM
        "\\s*\\)"
    );
    return re;
}

bool is_udim2(std::string_view t) {
    return regex_full(t, udim2_regex());
}

PropertyValue build_udim2(std::string_view t) {
    SvMatch m;
    regex_full(t, udim2_regex(), m);
    return UDim2Value{m[1].str(), m[2].str(), m[3].str(), m[4].str()};
}

bool is_udim(std::string_view t) {
    return t.find("Scale:") != std::string_view::npos && t.find("Offset:") != std::string_view::npos;
}

PropertyValue build_udim(std::string_view t) {
    static const std::regex scale_re("Scale:\\s*" RBXMD_NUM);
    static const std::regex offset_re("Offset:\\s*" RBXMD_NUM);
    UDimValue v;
    SvMatch m;
    if (std::regex_search(t.begin(), t.end(), m, scale_re)) {
        v.scale = m[1].str();
    }
    if (std::regex_search(t.begin(), t.end(), m, offset_re)) {
        v.offset = m[1].str();
    }
    return v;
}

bool is_binary(std::string_view t) {
    return t.find("[Binary Data]") != std::string_view::npos;
}

PropertyValue build_binary(std::string_view) {
    return make_scalar(ScalarKind::BinaryString, "");
}

constexpr std::string_view wrapper_name(ScalarKind kind) {
    switch (kind) {
        case ScalarKind::SharedString:
            return "SharedString";
        case ScalarKind::Ref:
            return "Ref";
        case ScalarKind::Enum:
            return "Enum";
        case ScalarKind::BrickColor:
            return "BrickColor";
        default:
            return "";
    }
}

template <ScalarKind Kind>
bool is_wrapped(std::string_view t) {
    return unwrap(t, wrapper_name(Kind)).has_value();
}

template <ScalarKind Kind>
PropertyValue build_wrapped(std::string_view t) {
    return make_scalar(Kind, std::string(*unwrap(t, wrapper_name(Kind))));
}

bool is_color3(std::string_view t) {
    const auto inner = unwrap(t, "Color3");
    return inner && split_components(*inner, ',').size() == 3;
}

PropertyValue build_color3(std::string_view t) {
    const auto parts = split_components(*unwrap(t, "Color3"), ',');
    return Color3Value{parts[0], parts[1], parts[2]};
}

const std::regex& range_regex() {
    static const std::regex re("Range\\(\\s*" RBXMD_NUM "\\s+to\\s+" RBXMD_NUM "\\s*\\)");
    return re;
}

bool is_range(std::string_view t) {
    return regex_full(t, range_regex());
}

PropertyValue build_range(std::string_view t) {
    SvMatch m;
    regex_full(t, range_regex(), m);
    return NumberRangeValue{m[1].str(), m[2].str()};
}

const std::regex& rect_regex() {
    static const std::regex re(
        "Rect\\(\\s*" RBXMD_NUM "\\s*,\\s*" RBXMD_NUM "\\s*,\\s*" RBXMD_NUM "\\s*,\\s*" RBXMD_NUM
        "\\s*\\)"
    );
    return re;
}

bool is_rect(std::string_view t) {
    return regex_full(t, rect_regex());
}

PropertyValue build_rect(std::string_view t) {
    SvMatch m;
    regex_full(t, rect_regex(), m);
    return Rect2DValue{m[1].str(), m[2].str(), m[3].str(), m[4].str()};
}

const std::regex& ray_regex() {
    static const std::regex re(
        "Ray\\(\\s*Origin:\\s*\\(\\s*" RBXMD_NUM "\\s*,\\s*" RBXMD_NUM "\\s*,\\s*" RBXMD_NUM
        "\\s*\\)\\s*,\\s*Direction:\\s*\\(\\s*" RBXMD_NUM "\\s*,\\s*" RBXMD_NUM "\\s*,\\s*" RBXMD_NUM
        "\\s*\\)\\s*\\)"
    );
    return re;
}

bool is_ray(std::string_view t) {
    return regex_full(t, ray_regex());
}

PropertyValue build_ray(std::string_view t) {
    SvMatch m;
    regex_full(t, ray_regex(), m);
    RayValue v;
    v.origin = Vector3Value{m[1].str(), m[2].str(), m[3].str()};
    v.direction = Vector3Value{m[4].str(), m[5].str(), m[6].str()};
    return v;
}

const std::regex& physical_regex() {
    static const std::regex re(
        "PhysicalProperties\\(\\s*Density:\\s*" RBXMD_NUM "\\s*,\\s*Friction:\\s*" RBXMD_NUM
        "\\s*,\\s*Elasticity:\\s*" RBXMD_NUM "\\s*\\)"
    );
    return re;
}

bool is_physical(std::string_view t) {
    return regex_full(t, physical_regex());
}

PropertyValue build_physical(std::string_view t) {
    SvMatch m;
    regex_full(t, physical_regex(), m);
    return PhysicalPropertiesValue{m[1].str(), m[2].str(), m[3].str()};
}

bool is_font(std::string_view t) {
    const auto inner = unwrap(t, "Font");
    return inner && split_components(*inner, ',').size() == 3;
}

PropertyValue build_font(std::string_view t) {
    const auto parts = split_components(*unwrap(t, "Font"), ',');
    return FontValue{parts[0], parts[1], parts[2]};
}

std::optional<NumberSequenceValue> parse_number_sequence(std::string_view t) {
    static const std::regex kp_re(
        "t:\\s*" RBXMD_NUM "\\s*,\\s*v:\\s*" RBXMD_NUM "\\s*,\\s*e:\\s*" RBXMD_NUM
    );
    const auto inner = unwrap(t, "NumberSequence");
    if (!inner) {
        return std::nullopt;
    }
    NumberSequenceValue seq;
    if (trim(*inner).empty()) {
        return seq;
    }
    for (const auto& part : split_components(*inner, ';')) {
        std::smatch m;
        if (!std::regex_match(part, m, kp_re)) {
            return std::nullopt;
        }
        seq.keypoints.push_back(NumberKeypoint{m[1].str(), m[2].str(), m[3].str()});
    }
    return seq;
}

bool is_number_sequence(std::string_view t) {
    return parse_number_sequence(t).has_value();
}

PropertyValue build_number_sequence(std::string_view t) {
    return *parse_number_sequence(t);
}

std::optional<ColorSequenceValue> parse_color_sequence(std::string_view t) {
    static const std::regex kp_re(
        "t:\\s*" RBXMD_NUM "\\s*,\\s*rgb\\(\\s*" RBXMD_NUM "\\s*,\\s*" RBXMD_NUM "\\s*,\\s*" RBXMD_NUM
        "\\s*\\)\\s*,\\s*e:\\s*" RBXMD_NUM
    );
    const auto inner = unwrap(t, "ColorSequence");
    if (!inner) {
        return std::nullopt;
    }
    ColorSequenceValue seq;
    if (trim(*inner).empty()) {
        return seq;
    }
    for (const auto& part : split_components(*inner, ';')) {
        std::smatch m;
        if (!std::regex_match(part, m, kp_re)) {
            return std::nullopt;
        }
        ColorKeypoint kp;
        kp.time = m[1].str();
        kp.color = Color3Value{m[2].str(), m[3].str(), m[4].str()};
        kp.envelope = m[5].str();
        seq.keypoints.push_back(std::move(kp));
    }
    return seq;
}

bool is_color_sequence(std::string_view t) {
    return parse_color_sequence(t).has_value();
}

PropertyValue build_color_sequence(std::string_view t) {
    return *parse_color_sequence(t);
}

std::optional<FaceSetValue> parse_faces(std::string_view t) {
    if (t.size() < 2 || t.front() != '[' || t.back() != ']') {
        return std::nullopt;
    }
    const auto inner = t.substr(1, t.size() - 2);
    FaceSetValue faces;
    if (trim(inner).empty()) {
        return faces;
    }
    for (const auto& part : split_components(inner, ',')) {
        const auto it = std::find_if(kFaceNames.begin(), kFaceNames.end(), [&](const auto& kv) {
            return kv.second == part;
        });
        if (it == kFaceNames.end()) {
            return std::nullopt;
        }
        faces.set(it->first);
    }
    return faces;
}

bool is_faces(std::string_view t) {
    return parse_faces(t).has_value();
}

PropertyValue build_faces(std::string_view t) {
    return *parse_faces(t);
}

bool is_anything(std::string_view) {
    return true;
}

PropertyValue build_string(std::string_view t) {
    return make_scalar(ScalarKind::String, unescape_text(t));
}

#undef RBXMD_NUM

const std::array<DecodeRule, 25> kDecodeRules = {{
    {"bool", &is_bool, &build_bool},
    {"integer", &is_integer, &build_integer},
    {"float", &is_float, &build_float},
    {"Color3uint8", &is_rgb, &build_rgb},
    {"Vector3", &is_vector3, &build_vector3},
    {"Vector2", &is_vector2, &build_vector2},
    {"CFrame", &is_cframe, &build_cframe},
    {"OptionalCFrame", &is_nil, &build_nil},
    {"UDim2", &is_udim2, &build_udim2},
    {"UDim", &is_udim, &build_udim},
    {"BinaryString", &is_binary, &build_binary},
    {"SharedString", &is_wrapped<ScalarKind::SharedString>,
     &build_wrapped<ScalarKind::SharedString>},
    {"Ref", &is_wrapped<ScalarKind::Ref>, &build_wrapped<ScalarKind::Ref>},
    {"Enum", &is_wrapped<ScalarKind::Enum>, &build_wrapped<ScalarKind::Enum>},
    {"BrickColor", &is_wrapped<ScalarKind::BrickColor>, &build_wrapped<ScalarKind::BrickColor>},
    {"Color3", &is_color3, &build_color3},
    {"NumberRange", &is_range, &build_range},
    {"Rect2D", &is_rect, &build_rect},
    {"Ray", &is_ray, &build_ray},
    {"PhysicalProperties", &is_physical, &build_physical},
    {"Font", &is_font, &build_font},
    {"NumberSequence", &is_number_sequence, &build_number_sequence},
    {"ColorSequence", &is_color_sequence, &build_color_sequence},
    {"Faces", &is_faces, &build_faces},
    {"string", &is_anything, &build_string},
}};

struct PropertyLine {
    std::string name;
    std::string value;
    std::optional<std::string> unsupported_tag;
};

// Splits "- Name: value", "- Name: text [UNSUPPORTED TYPE: tag]" and the
// block header "- Name [UNSUPPORTED TYPE: tag]".
std::optional<PropertyLine> parse_property_line(std::string_view line) {
    auto body = trim(line);
    if (body.size() < 2 || body.substr(0, 2) != "- ") {
        return std::nullopt;
    }
    body = trim(body.substr(2));

    PropertyLine out;
    const auto marker = body.rfind(kUnsupportedMarker);
    const auto colon = body.find(':');
    if (marker != std::string_view::npos && body.back() == ']'
        && (colon == std::string_view::npos || colon > marker)) {
        const auto tag_start = marker + kUnsupportedMarker.size();
        out.name = std::string(trim(body.substr(0, marker)));
        out.unsupported_tag = std::string(body.substr(tag_start, body.size() - tag_start - 1));
        return out;
    }

    if (colon == std::string_view::npos) {
        return std::nullopt;
    }
    out.name = std::string(trim(body.substr(0, colon)));
    auto value = trim(body.substr(colon + 1));
    if (marker != std::string_view::npos && marker > colon && !value.empty() && value.back() == ']') {
        const auto value_marker = value.rfind(kUnsupportedMarker);
        const auto tag_start = value_marker + kUnsupportedMarker.size();
        out.unsupported_tag = std::string(value.substr(tag_start, value.size() - tag_start - 1));
        value = trim(value.substr(0, value_marker));
    }
    out.value = std::string(value);
    return out;
}

// Unsupported dumps keep their children verbatim: component values are not
// run through inference.
std::optional<Property>
decode_group(std::string_view line, std::span<const std::string> continuation, bool raw_values);

std::vector<Property> decode_children(std::span<const std::string> lines, bool raw_values) {
    std::vector<Property> out;
    if (lines.empty()) {
        return out;
    }
    const std::size_t child_indent = indent_of(lines.front());
    std::size_t i = 0;
    while (i < lines.size()) {
        std::size_t j = i + 1;
        while (j < lines.size() && indent_of(lines[j]) > child_indent) {
            j++;
        }
        if (auto prop = decode_group(lines[i], lines.subspan(i + 1, j - i - 1), raw_values)) {
            out.push_back(std::move(*prop));
        }
        i = j;
    }
    return out;
}

std::optional<Property>
decode_group(std::string_view line, std::span<const std::string> continuation, bool raw_values) {
    auto parsed = parse_property_line(line);
    if (!parsed) {
        return std::nullopt;
    }
    Property prop;
    prop.name = std::move(parsed->name);
    if (parsed->unsupported_tag) {
        UnsupportedValue v;
        v.tag = std::move(*parsed->unsupported_tag);
        v.text = unescape_text(parsed->value);
        v.children = decode_children(continuation, true);
        prop.value = std::move(v);
        return prop;
    }
    if (raw_values) {
        prop.value = make_scalar(ScalarKind::String, unescape_text(parsed->value));
    } else {
        prop.value = decode_value(parsed->value);
    }
    return prop;
}
}  // namespace

std::string encode_value(const PropertyValue& value) {
    return std::visit(
        overloaded{
            [](const ScalarValue& v) { return scalar_text(v); },
            [](const Vector2Value& v) {
                return "(" + or_default(v.x, kZero) + ", " + or_default(v.y, kZero) + ")";
            },
            [](const Vector3Value& v) { return vector3_text(v); },
            [](const Color3Value& v) {
                return "Color3(" + or_default(v.r, kZero) + ", " + or_default(v.g, kZero) + ", "
                       + or_default(v.b, kZero) + ")";
            },
            [](const Color3uint8Value& v) {
                return "RGB(" + or_default(v.r, kZero) + ", " + or_default(v.g, kZero) + ", "
                       + or_default(v.b, kZero) + ")";
            },
            [](const CFrameValue& v) { return cframe_text(v); },
            [](const OptionalCFrameValue& v) {
                return v.value ? cframe_text(*v.value) : std::string("nil");
            },
            [](const UDimValue& v) {
                return "Scale: " + or_default(v.scale, kZero) + ", Offset: "
                       + or_default(v.offset, kZero);
            },
            [](const UDim2Value& v) {
                return "X(Scale: " + or_default(v.x_scale, kZero) + ", Offset: "
                       + or_default(v.x_offset, kZero) + "), Y(Scale: "
                       + or_default(v.y_scale, kZero) + ", Offset: " + or_default(v.y_offset, kZero)
                       + ")";
            },
            [](const NumberRangeValue& v) {
                return "Range(" + or_default(v.min, kZero) + " to " + or_default(v.max, kZero) + ")";
            },
            [](const Rect2DValue& v) {
                return "Rect(" + or_default(v.min_x, kZero) + ", " + or_default(v.min_y, kZero)
                       + ", " + or_default(v.max_x, kZero) + ", " + or_default(v.max_y, kZero) + ")";
            },
            [](const RayValue& v) {
                return "Ray(Origin: " + vector3_text(v.origin)
                       + ", Direction: " + vector3_text(v.direction) + ")";
            },
            [](const FontValue& v) {
                return "Font(" + v.family + ", " + v.weight + ", " + v.style + ")";
            },
            [](const PhysicalPropertiesValue& v) {
                return "PhysicalProperties(Density: " + or_default(v.density, kZero)
                       + ", Friction: " + or_default(v.friction, kZero)
                       + ", Elasticity: " + or_default(v.elasticity, kZero) + ")";
            },
            [](const FaceSetValue& v) {
                std::string out = "[";
                bool first = true;
                for (const auto& [face, name] : kFaceNames) {
                    if (!v.has(face)) {
                        continue;
                    }
                    if (!first) {
                        out.append(", ");
                    }
                    out.append(name);
                    first = false;
                }
                out.push_back(']');
                return out;
            },
            [](const NumberSequenceValue& v) {
                std::string out = "NumberSequence(";
                for (std::size_t i = 0; i < v.keypoints.size(); i++) {
                    const auto& kp = v.keypoints[i];
                    if (i > 0) {
                        out.append("; ");
                    }
                    out.append("t:" + or_default(kp.time, kZero) + ",v:" + or_default(kp.value, kZero)
                               + ",e:" + or_default(kp.envelope, kZero));
                }
                out.push_back(')');
                return out;
            },
            [](const ColorSequenceValue& v) {
                std::string out = "ColorSequence(";
                for (std::size_t i = 0; i < v.keypoints.size(); i++) {
                    const auto& kp = v.keypoints[i];
                    if (i > 0) {
                        out.append("; ");
                    }
                    out.append(
                        "t:" + or_default(kp.time, kZero) + ",rgb(" + or_default(kp.color.r, kZero)
                        + "," + or_default(kp.color.g, kZero) + "," + or_default(kp.color.b, kZero)
                        + "),e:" + or_default(kp.envelope, kZero)
                    );
                }
                out.push_back(')');
                return out;
            },
            [](const UnsupportedValue& v) { return escape_text(v.text); },
        },
        value
    );
}

EncodedProperty encode_property(const Property& prop, int indent_level) {
    EncodedProperty out;
    if (prop.name.empty()) {
        return out;
    }
    const std::string indent(static_cast<std::size_t>(std::max(indent_level, 0)) * 2, ' ');

    const auto* unsupported = std::get_if<UnsupportedValue>(&prop.value);
    if (unsupported == nullptr) {
        out.lines.push_back(indent + "- " + prop.name + ": " + encode_value(prop.value));
        return out;
    }

    out.warnings.push_back(
        "Unsupported property type '" + unsupported->tag + "' for property '" + prop.name + "'"
    );
    const std::string marker =
        std::string(kUnsupportedMarker) + unsupported->tag + "]";
    if (unsupported->children.empty() && !unsupported->text.empty()) {
        out.lines.push_back(indent + "- " + prop.name + ": " + escape_text(unsupported->text) + marker);
        return out;
    }
    out.lines.push_back(indent + "- " + prop.name + marker);
    for (const auto& child : unsupported->children) {
        auto nested = encode_property(child, indent_level + 1);
        out.lines.insert(out.lines.end(), nested.lines.begin(), nested.lines.end());
        out.warnings.insert(out.warnings.end(), nested.warnings.begin(), nested.warnings.end());
    }
    return out;
}

std::span<const DecodeRule> decode_rules() {
    return kDecodeRules;
}

const DecodeRule& match_decode_rule(std::string_view text) {
    const auto rules = decode_rules();
    for (const auto& rule : rules) {
        if (rule.matches(text)) {
            return rule;
        }
    }
    return rules.back();
}

PropertyValue decode_value(std::string_view text) {
    const auto value = trim(text);
    return match_decode_rule(value).build(value);
}

std::optional<Property>
decode_property(std::string_view line, std::span<const std::string> continuation) {
    return decode_group(line, continuation, false);
}

std::vector<Property>
decode_properties(std::span<const std::string> lines, std::vector<std::string>* warnings) {
    std::vector<Property> out;
    if (lines.empty()) {
        return out;
    }
    const std::size_t base_indent = indent_of(lines.front());
    std::size_t i = 0;
    while (i < lines.size()) {
        std::size_t j = i + 1;
        while (j < lines.size() && indent_of(lines[j]) > base_indent) {
            j++;
        }
        auto prop = decode_property(lines[i], lines.subspan(i + 1, j - i - 1));
        if (prop) {
            out.push_back(std::move(*prop));
        } else if (warnings != nullptr) {
            warnings->push_back("Unrecognized property line: " + lines[i]);
        }
        i = j;
    }
    return out;
}

}  // namespace rbxmd::md
