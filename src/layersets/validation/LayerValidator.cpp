#include <layersets/validation/LayerValidator.hpp>

#include <layersets/validation/Sanitizers.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace LS {

namespace {

constexpr std::string_view kTag = "LayerValidator";

enum class StringKind {
    Text,
    Name,
    Identifier,
    ShapeId,
    Color,
    Enum,
    Font,
    Svg,
    PathData,
    ImageSource
};

auto stringKindFor(std::string_view key) -> StringKind {
    if (key == "name")
        return StringKind::Name;
    if (key == "id" || key == "parentGroup")
        return StringKind::Identifier;
    if (key == "shapeId")
        return StringKind::ShapeId;
    if (key == "stroke" || key == "fill" || key == "color" || key == "shadowColor" || key == "textStrokeColor"
        || key == "textShadowColor" || key == "backgroundColor")
        return StringKind::Color;
    if (key == "blendMode" || key == "arrowhead" || key == "arrowStyle" || key == "arrowHeadType"
        || key == "textAlign" || key == "verticalAlign" || key == "fontWeight" || key == "fontStyle"
        || key == "textDecoration" || key == "tailDirection" || key == "tailStyle")
        return StringKind::Enum;
    if (key == "fontFamily")
        return StringKind::Font;
    if (key == "svg")
        return StringKind::Svg;
    if (key == "path")
        return StringKind::PathData;
    if (key == "src")
        return StringKind::ImageSource;
    return StringKind::Text;
}

constexpr std::array<std::string_view, 27> kBlendModes{
    "normal",          "multiply",         "screen",          "overlay",         "darken",
    "lighten",         "color-dodge",      "color-burn",      "hard-light",      "soft-light",
    "difference",      "exclusion",        "hue",             "saturation",      "color",
    "luminosity",      "source-over",      "source-in",       "source-out",      "source-atop",
    "destination-over", "destination-in",  "destination-out", "destination-atop", "lighter",
    "copy",            "xor"};
constexpr std::array<std::string_view, 5> kArrowheads{"none", "arrow", "circle", "diamond", "triangle"};
constexpr std::array<std::string_view, 3> kArrowStyles{"single", "double", "none"};
constexpr std::array<std::string_view, 3> kArrowHeadTypes{"pointed", "chevron", "standard"};
constexpr std::array<std::string_view, 3> kTextAligns{"left", "center", "right"};
constexpr std::array<std::string_view, 3> kVerticalAligns{"top", "middle", "bottom"};
constexpr std::array<std::string_view, 2> kFontWeights{"normal", "bold"};
constexpr std::array<std::string_view, 2> kFontStyles{"normal", "italic"};
constexpr std::array<std::string_view, 3> kTextDecorations{"none", "underline", "line-through"};
constexpr std::array<std::string_view, 8> kTailDirections{"top",      "bottom",    "left",        "right",
                                                          "top-left", "top-right", "bottom-left", "bottom-right"};
constexpr std::array<std::string_view, 3> kTailStyles{"triangle", "curved", "line"};

auto enumValuesFor(std::string_view key) -> std::span<std::string_view const> {
    if (key == "blendMode")
        return kBlendModes;
    if (key == "arrowhead")
        return kArrowheads;
    if (key == "arrowStyle")
        return kArrowStyles;
    if (key == "arrowHeadType")
        return kArrowHeadTypes;
    if (key == "textAlign")
        return kTextAligns;
    if (key == "verticalAlign")
        return kVerticalAligns;
    if (key == "fontWeight")
        return kFontWeights;
    if (key == "fontStyle")
        return kFontStyles;
    if (key == "textDecoration")
        return kTextDecorations;
    if (key == "tailDirection")
        return kTailDirections;
    if (key == "tailStyle")
        return kTailStyles;
    return {};
}

auto isEnumValue(std::string_view key, std::string_view value) -> bool {
    auto values = enumValuesFor(key);
    return std::find(values.begin(), values.end(), value) != values.end();
}

struct IntegerRule {
    std::string_view key;
    int              min;
    int              max;
};

// Integer fields fail the layer when out of range; their value selects the geometry.
constexpr std::array<IntegerRule, 2> kIntegerRules{{{"sides", 3, 100}, {"points", 3, 20}}};

auto formatNumber(double value) -> std::string {
    std::array<char, 32> buffer{};
    auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    return std::string(buffer.data(), result.ptr);
}

auto toLower(std::string_view value) -> std::string {
    std::string out{value};
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) {
        return (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch + 32) : static_cast<char>(ch);
    });
    return out;
}

auto numericValue(nlohmann::json const& value) -> std::optional<double> {
    if (value.is_number())
        return value.get<double>();
    if (value.is_string()) {
        auto const& text = value.get_ref<std::string const&>();
        if (text.empty())
            return std::nullopt;
        double parsed = 0.0;
        auto   result = std::from_chars(text.data(), text.data() + text.size(), parsed);
        if (result.ec == std::errc{} && result.ptr == text.data() + text.size())
            return parsed;
    }
    return std::nullopt;
}

auto booleanValue(nlohmann::json const& value) -> std::optional<bool> {
    if (value.is_boolean())
        return value.get<bool>();
    if (value.is_number_integer() || value.is_number_unsigned()) {
        auto const number = value.get<std::int64_t>();
        if (number == 0 || number == 1)
            return number == 1;
        return std::nullopt;
    }
    if (value.is_string()) {
        auto const& text = value.get_ref<std::string const&>();
        if (text == "1" || text == "true")
            return true;
        if (text == "0" || text == "false" || text.empty())
            return false;
    }
    return std::nullopt;
}

// First family of a CSS font stack, unquoted.
auto primaryFontFamily(std::string_view value) -> std::string_view {
    auto const comma = value.find(',');
    auto       family = value.substr(0, comma);
    while (!family.empty() && (family.front() == ' ' || family.front() == '"' || family.front() == '\''))
        family.remove_prefix(1);
    while (!family.empty() && (family.back() == ' ' || family.back() == '"' || family.back() == '\''))
        family.remove_suffix(1);
    return family;
}

auto sanitizeShapeId(std::string_view raw) -> std::string {
    std::string out;
    for (char ch : raw) {
        if (out.size() >= Sanitize::kMaxIdentifierLength)
            break;
        bool const allowed = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9')
                             || ch == '_' || ch == '-' || ch == '.' || ch == '/';
        if (allowed)
            out.push_back(ch);
    }
    // Never allow traversal segments.
    std::string::size_type pos = 0;
    while ((pos = out.find("..", pos)) != std::string::npos)
        out.erase(pos, 1);
    return out;
}

/*
 * Field visitor that pulls each member of a layer from the raw JSON object, runs it
 * through the rule for its key and records what was consumed.
 */
class LayerFieldSanitizer {
public:
    LayerFieldSanitizer(nlohmann::json const&            raw,
                        std::size_t                      index,
                        ValidatorConfig const&           config,
                        TaggedLogger&                    logger,
                        ValidationResult<LayerDocument>& result)
        : raw_(raw), index_(index), config_(config), logger_(logger), result_(result) {}

    void operator()(char const* key, std::optional<double>& out) {
        auto const* value = lookup(key);
        if (value == nullptr)
            return;
        out = sanitizeNumber(key, *value);
    }

    void operator()(char const* key, std::optional<int>& out) {
        auto const* value = lookup(key);
        if (value == nullptr)
            return;
        auto const rule = std::find_if(kIntegerRules.begin(), kIntegerRules.end(),
                                       [&](IntegerRule const& r) { return r.key == key; });
        int const min = rule == kIntegerRules.end() ? 0 : rule->min;
        int const max = rule == kIntegerRules.end() ? 1000 : rule->max;
        auto      number = numericValue(*value);
        if (!number || !std::isfinite(*number) || std::floor(*number) != *number || *number < min || *number > max) {
            result_.addError("Property '" + std::string{key} + "' must be an integer between " + std::to_string(min)
                                 + " and " + std::to_string(max),
                             std::string{key});
            return;
        }
        out = static_cast<int>(*number);
    }

    void operator()(char const* key, std::optional<bool>& out) {
        auto const* value = lookup(key);
        if (value == nullptr)
            return;
        out = booleanValue(*value);
        if (!out)
            result_.addWarning("Property '" + std::string{key} + "' must be a boolean, dropped", std::string{key});
    }

    void operator()(char const* key, std::optional<std::string>& out) {
        auto const* value = lookup(key);
        if (value == nullptr)
            return;
        if (!value->is_string()) {
            result_.addWarning("Property '" + std::string{key} + "' must be a string, dropped", std::string{key});
            return;
        }
        out = sanitizeString(key, value->get_ref<std::string const&>());
    }

    void operator()(char const* key, std::string& out) {
        std::string_view const name{key};
        auto const*            value = lookup(key);
        if (name == "id") {
            auto const fallback = "layer_" + std::to_string(index_);
            if (value != nullptr && value->is_string()) {
                out = Sanitize::sanitizeIdentifier(value->get_ref<std::string const&>(), fallback);
            } else if (value != nullptr && (value->is_number_integer() || value->is_number_unsigned())) {
                out = Sanitize::sanitizeIdentifier(value->dump(), fallback);
            } else {
                out = fallback;
                result_.addWarning("Missing layer id, assigned '" + fallback + "'", std::string{"id"});
            }
            return;
        }
        if (value == nullptr)
            return;
        if (!value->is_string()) {
            result_.addWarning("Property '" + std::string{key} + "' must be a string, dropped", std::string{key});
            return;
        }
        out = sanitizeString(key, value->get_ref<std::string const&>()).value_or(std::string{});
    }

    void operator()(char const* key, std::vector<Point>& out) {
        auto const* value = lookup(key);
        if (value == nullptr)
            return;
        if (!value->is_array()) {
            result_.addError("Property '" + std::string{key} + "' must be an array of points", std::string{key});
            return;
        }
        auto count = value->size();
        if (count > config_.maxPoints) {
            result_.addWarning("Point list truncated from " + std::to_string(count) + " to "
                                   + std::to_string(config_.maxPoints) + " points",
                               std::string{key});
            count = config_.maxPoints;
        }
        out.clear();
        out.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            auto const&           entry = (*value)[i];
            std::optional<double> px;
            std::optional<double> py;
            if (entry.is_object()) {
                if (auto it = entry.find("x"); it != entry.end())
                    px = numericValue(*it);
                if (auto it = entry.find("y"); it != entry.end())
                    py = numericValue(*it);
            } else if (entry.is_array() && entry.size() == 2) {
                px = numericValue(entry[0]);
                py = numericValue(entry[1]);
            }
            if (!px || !py || !std::isfinite(*px) || !std::isfinite(*py)) {
                result_.addError("Point " + std::to_string(i) + " is malformed", std::string{key});
                return;
            }
            if (std::abs(*px) > config_.coordinateBound || std::abs(*py) > config_.coordinateBound) {
                result_.addError("Point " + std::to_string(i) + " is out of range [-"
                                     + formatNumber(config_.coordinateBound) + ", "
                                     + formatNumber(config_.coordinateBound) + "]",
                                 std::string{key});
                return;
            }
            out.push_back(Point{*px, *py});
        }
    }

    void operator()(char const* key, std::optional<std::vector<RichTextRun>>& out) {
        auto const* value = lookup(key);
        if (value == nullptr)
            return;
        if (!value->is_array()) {
            result_.addWarning("Property '" + std::string{key} + "' must be an array, dropped", std::string{key});
            return;
        }
        if (value->size() > config_.maxRichTextRuns) {
            result_.addError("Too many rich text runs: " + std::to_string(value->size()) + " (max: "
                                 + std::to_string(config_.maxRichTextRuns) + ")",
                             std::string{key});
            return;
        }
        std::vector<RichTextRun> runs;
        runs.reserve(value->size());
        for (std::size_t i = 0; i < value->size(); ++i) {
            auto const& entry = (*value)[i];
            if (!entry.is_object()) {
                result_.addWarning("Rich text run " + std::to_string(i) + " is not an object, dropped",
                                   std::string{key});
                continue;
            }
            RichTextRun run;
            if (auto it = entry.find("text"); it != entry.end() && it->is_string()) {
                auto const& text = it->get_ref<std::string const&>();
                if (!Sanitize::isSafeText(text))
                    securityEvent("markup_neutralized", key);
                run.text = Sanitize::sanitizeRichTextRun(text, config_.maxTextLength);
            }
            if (auto it = entry.find("style"); it != entry.end() && it->is_object())
                run.style = sanitizeStyle(*it);
            runs.push_back(std::move(run));
        }
        out = std::move(runs);
    }

    void operator()(char const* key, std::vector<std::string>& out) {
        auto const* value = lookup(key);
        if (value == nullptr)
            return;
        if (!value->is_array()) {
            result_.addWarning("Property '" + std::string{key} + "' must be an array, dropped", std::string{key});
            return;
        }
        out.clear();
        for (auto const& entry : *value) {
            if (out.size() >= config_.maxChildren) {
                result_.addWarning("Child list truncated to " + std::to_string(config_.maxChildren) + " entries",
                                   std::string{key});
                break;
            }
            if (!entry.is_string()) {
                result_.addWarning("Non-string child id dropped", std::string{key});
                continue;
            }
            auto id = Sanitize::sanitizeIdentifier(entry.get_ref<std::string const&>(), "");
            if (id.empty()) {
                result_.addWarning("Empty child id dropped", std::string{key});
                continue;
            }
            out.push_back(std::move(id));
        }
    }

    void operator()(char const* key, std::vector<ShapePath>& out) {
        auto const* value = lookup(key);
        if (value == nullptr)
            return;
        if (!value->is_array()) {
            result_.addError("Property '" + std::string{key} + "' must be an array of paths", std::string{key});
            return;
        }
        if (value->size() > config_.maxShapePaths) {
            result_.addError("Too many shape paths: " + std::to_string(value->size()) + " (max: "
                                 + std::to_string(config_.maxShapePaths) + ")",
                             std::string{key});
            return;
        }
        out.clear();
        for (std::size_t i = 0; i < value->size(); ++i) {
            auto const& entry = (*value)[i];
            auto        pathIt = entry.is_object() ? entry.find("path") : entry.end();
            if (!entry.is_object() || pathIt == entry.end() || !pathIt->is_string()) {
                result_.addError("Shape path " + std::to_string(i) + " is malformed", std::string{key});
                return;
            }
            auto const& data = pathIt->get_ref<std::string const&>();
            if (data.size() > Sanitize::kMaxSvgLength || !Sanitize::isSafePathData(data)) {
                securityEvent("unsafe_path_data", key);
                result_.addError("Shape path " + std::to_string(i) + " contains invalid path data", std::string{key});
                return;
            }
            ShapePath path;
            path.path = data;
            if (auto it = entry.find("fill"); it != entry.end() && it->is_string())
                path.fill = sanitizeColorField("fill", it->get_ref<std::string const&>());
            if (auto it = entry.find("stroke"); it != entry.end() && it->is_string())
                path.stroke = sanitizeColorField("stroke", it->get_ref<std::string const&>());
            if (auto it = entry.find("strokeWidth"); it != entry.end())
                path.strokeWidth = sanitizeNumber("strokeWidth", *it);
            out.push_back(std::move(path));
        }
    }

    void operator()(char const* key, std::optional<ViewBox>& out) {
        auto const* value = lookup(key);
        if (value == nullptr)
            return;
        std::vector<std::optional<double>> parts;
        if (value->is_array()) {
            for (auto const& entry : *value)
                parts.push_back(numericValue(entry));
        } else if (value->is_string()) {
            std::string_view text = value->get_ref<std::string const&>();
            std::size_t      pos  = 0;
            while (pos < text.size()) {
                while (pos < text.size() && (text[pos] == ' ' || text[pos] == ','))
                    ++pos;
                auto end = pos;
                while (end < text.size() && text[end] != ' ' && text[end] != ',')
                    ++end;
                if (end > pos)
                    parts.push_back(numericValue(nlohmann::json(std::string{text.substr(pos, end - pos)})));
                pos = end;
            }
        }
        bool valid = parts.size() == 4;
        ViewBox box{};
        for (std::size_t i = 0; valid && i < parts.size(); ++i) {
            valid = parts[i].has_value() && std::isfinite(*parts[i]) && std::abs(*parts[i]) <= config_.coordinateBound;
            if (valid)
                box[i] = *parts[i];
        }
        if (!valid) {
            result_.addWarning("Property 'viewBox' must hold four numbers, dropped", std::string{key});
            return;
        }
        out = box;
    }

    [[nodiscard]] auto consumed() const -> phmap::flat_hash_set<std::string> const& { return consumed_; }

private:
    auto lookup(char const* key) -> nlohmann::json const* {
        std::string const name{key};
        consumed_.insert(name);
        if (auto it = raw_.find(name); it != raw_.end() && !it->is_null())
            return &*it;
        // Legacy documents spell the blend mode "blend".
        if (name == "blendMode") {
            consumed_.insert("blend");
            if (auto it = raw_.find("blend"); it != raw_.end() && !it->is_null())
                return &*it;
        }
        return nullptr;
    }

    auto ruleFor(std::string const& key) const -> NumericRule {
        if (auto it = config_.numericRules.find(key); it != config_.numericRules.end())
            return it->second;
        return NumericRule{-config_.coordinateBound, config_.coordinateBound, NumericPolicy::Reject};
    }

    auto sanitizeNumber(std::string const& key, nlohmann::json const& value) -> std::optional<double> {
        auto number = numericValue(value);
        if (!number) {
            result_.addWarning("Property '" + key + "' must be numeric, dropped", key);
            return std::nullopt;
        }
        if (!std::isfinite(*number)) {
            result_.addError("Property '" + key + "' must be a finite number", key);
            return std::nullopt;
        }
        auto const rule = ruleFor(key);
        if (*number >= rule.min && *number <= rule.max)
            return number;

        auto const range = "[" + formatNumber(rule.min) + ", " + formatNumber(rule.max) + "]";
        switch (rule.policy) {
        case NumericPolicy::Clamp:
            result_.addWarning("Property '" + key + "' clamped to " + range, key);
            return std::clamp(*number, rule.min, rule.max);
        case NumericPolicy::Drop:
            result_.addWarning("Property '" + key + "' out of range " + range + ", dropped", key);
            return std::nullopt;
        case NumericPolicy::Reject:
            result_.addError("Property '" + key + "' out of range " + range, key);
            return std::nullopt;
        }
        return std::nullopt;
    }

    auto sanitizeColorField(std::string const& key, std::string const& raw) -> std::string {
        if (!Sanitize::isSafeColor(raw))
            securityEvent("unsafe_color", key);
        if (!Sanitize::isValidColor(raw))
            result_.addWarning("Invalid color for '" + key + "', using default", key);
        return Sanitize::sanitizeColor(raw);
    }

    auto allowedFont(std::string_view raw) const -> std::optional<std::string> {
        auto const wanted = toLower(raw);
        auto const primary = toLower(primaryFontFamily(raw));
        for (auto const& font : config_.allowedFonts) {
            auto const candidate = toLower(font);
            if (candidate == wanted || candidate == primary)
                return font;
        }
        return std::nullopt;
    }

    auto sanitizeString(std::string const& key, std::string const& raw) -> std::optional<std::string> {
        switch (stringKindFor(key)) {
        case StringKind::Text: {
            if (!Sanitize::isSafeText(raw))
                securityEvent("markup_neutralized", key);
            return Sanitize::sanitizeText(raw, config_.maxTextLength);
        }
        case StringKind::Name:
            return Sanitize::sanitizeText(raw, config_.maxNameLength);
        case StringKind::Identifier: {
            auto id = Sanitize::sanitizeIdentifier(raw, "");
            if (id.empty()) {
                result_.addWarning("Property '" + key + "' is not a valid identifier, dropped", key);
                return std::nullopt;
            }
            return id;
        }
        case StringKind::ShapeId: {
            auto id = sanitizeShapeId(raw);
            if (id.empty()) {
                result_.addWarning("Property '" + key + "' is not a valid shape id, dropped", key);
                return std::nullopt;
            }
            return id;
        }
        case StringKind::Color:
            return sanitizeColorField(key, raw);
        case StringKind::Enum:
            if (isEnumValue(key, raw))
                return raw;
            result_.addWarning("Invalid value for '" + key + "', dropped", key);
            return std::nullopt;
        case StringKind::Font:
            if (auto font = allowedFont(raw))
                return font;
            result_.addWarning("Font not allowed, using '" + config_.defaultFont + "'", key);
            return config_.defaultFont;
        case StringKind::Svg: {
            auto svg = Sanitize::sanitizeSvg(raw);
            if (!svg) {
                securityEvent("unsafe_svg", key);
                result_.addError("Invalid SVG: " + svg.error().message.value_or("rejected"), key);
                return std::nullopt;
            }
            return std::move(*svg);
        }
        case StringKind::PathData:
            if (raw.size() > Sanitize::kMaxSvgLength || !Sanitize::isSafePathData(raw)) {
                securityEvent("unsafe_path_data", key);
                result_.addError("Property '" + key + "' contains invalid path data", key);
                return std::nullopt;
            }
            return raw;
        case StringKind::ImageSource:
            if (!Sanitize::isSafeImageDataUrl(raw)) {
                securityEvent("unsafe_image_source", key);
                result_.addError("Image source must be a PNG, JPEG, GIF or WebP data URL", key);
                return std::nullopt;
            }
            if (raw.size() / 4 * 3 > config_.maxImageBytes) {
                result_.addError("Image data exceeds " + std::to_string(config_.maxImageBytes) + " bytes", key);
                return std::nullopt;
            }
            return raw;
        }
        return std::nullopt;
    }

    auto sanitizeStyle(nlohmann::json const& raw) -> TextStyle {
        TextStyle style;
        auto stringAt = [&](char const* key) -> std::optional<std::string> {
            auto it = raw.find(key);
            if (it == raw.end() || !it->is_string())
                return std::nullopt;
            return it->get<std::string>();
        };
        for (char const* key : {"fontWeight", "fontStyle", "textDecoration"}) {
            auto value = stringAt(key);
            if (!value || !isEnumValue(key, *value))
                continue;
            if (std::string_view{key} == "fontWeight")
                style.fontWeight = std::move(value);
            else if (std::string_view{key} == "fontStyle")
                style.fontStyle = std::move(value);
            else
                style.textDecoration = std::move(value);
        }
        if (auto color = stringAt("color")) {
            if (!Sanitize::isSafeColor(*color))
                securityEvent("unsafe_color", "richText.color");
            if (Sanitize::isValidColor(*color))
                style.color = Sanitize::sanitizeColor(*color);
        }
        if (auto color = stringAt("backgroundColor")) {
            if (!Sanitize::isSafeColor(*color))
                securityEvent("unsafe_color", "richText.backgroundColor");
            if (Sanitize::isValidColor(*color))
                style.backgroundColor = Sanitize::sanitizeColor(*color);
        }
        if (auto family = stringAt("fontFamily"))
            style.fontFamily = allowedFont(*family);
        if (auto it = raw.find("fontSize"); it != raw.end()) {
            auto size = numericValue(*it);
            if (size && std::isfinite(*size) && *size >= 1.0 && *size <= 1000.0)
                style.fontSize = size;
        }
        return style;
    }

    void securityEvent(std::string_view reason, std::string_view field) {
        logger_.warning(kTag,
                        "rejected unsafe layer content",
                        {{"reason", std::string{reason}},
                         {"layer", std::to_string(index_)},
                         {"field", std::string{field}}});
    }

    nlohmann::json const&              raw_;
    std::size_t                        index_;
    ValidatorConfig const&             config_;
    TaggedLogger&                      logger_;
    ValidationResult<LayerDocument>&   result_;
    phmap::flat_hash_set<std::string>  consumed_;
};

auto positive(std::optional<double> const& value) -> bool {
    return value.has_value() && *value > 0.0;
}

// Per-type required fields, checked on the sanitized document.
struct RequiredFieldCheck {
    LayerBase const& base;

    auto operator()(TextLayer const& layer) const -> std::optional<std::string> {
        if (layer.text.empty())
            return "Text layer requires non-empty text";
        return std::nullopt;
    }
    auto operator()(TextboxLayer const& layer) const -> std::optional<std::string> {
        if (!layer.width || !layer.height)
            return "Textbox layer requires width and height";
        return std::nullopt;
    }
    auto operator()(CalloutLayer const& layer) const -> std::optional<std::string> {
        if (!layer.box.width || !layer.box.height)
            return "Callout layer requires width and height";
        return std::nullopt;
    }
    auto operator()(RectangleLayer const& layer) const -> std::optional<std::string> {
        if (!layer.width || !layer.height)
            return "Rectangle layer requires width and height";
        return std::nullopt;
    }
    auto operator()(CircleLayer const& layer) const -> std::optional<std::string> {
        if (!layer.radius)
            return "Circle layer requires radius";
        return std::nullopt;
    }
    auto operator()(EllipseLayer const& layer) const -> std::optional<std::string> {
        if ((layer.radiusX && layer.radiusY) || (layer.width && layer.height))
            return std::nullopt;
        return "Ellipse layer requires radiusX and radiusY or width and height";
    }
    auto operator()(PolygonLayer const& layer) const -> std::optional<std::string> {
        if (layer.points.size() >= 3)
            return std::nullopt;
        if (base.x && base.y && positive(layer.radius) && layer.sides && *layer.sides >= 3)
            return std::nullopt;
        return "Polygon layer requires at least 3 points or x, y, radius and sides";
    }
    auto operator()(StarLayer const& layer) const -> std::optional<std::string> {
        if (!layer.points)
            return "Star layer requires a point count";
        if (!positive(layer.outerRadius) && !positive(layer.radius))
            return "Star layer requires a positive outerRadius or radius";
        return std::nullopt;
    }
    auto operator()(LineLayer const& layer) const -> std::optional<std::string> {
        if (!layer.x1 || !layer.y1 || !layer.x2 || !layer.y2)
            return "Line layer requires x1, y1, x2 and y2";
        return std::nullopt;
    }
    auto operator()(ArrowLayer const& layer) const -> std::optional<std::string> {
        if (!layer.line.x1 || !layer.line.y1 || !layer.line.x2 || !layer.line.y2)
            return "Arrow layer requires x1, y1, x2 and y2";
        return std::nullopt;
    }
    auto operator()(PathLayer const& layer) const -> std::optional<std::string> {
        if (layer.points.size() < 2)
            return "Path layer requires at least 2 points";
        return std::nullopt;
    }
    auto operator()(HighlightLayer const& layer) const -> std::optional<std::string> {
        if (layer.points.size() < 2)
            return "Highlight layer requires at least 2 points";
        return std::nullopt;
    }
    auto operator()(CustomShapeLayer const& layer) const -> std::optional<std::string> {
        if (layer.svg || layer.path || !layer.paths.empty())
            return std::nullopt;
        return "Custom shape layer requires svg, path or paths";
    }
    auto operator()(GroupLayer const&) const -> std::optional<std::string> {
        return std::nullopt;
    }
    auto operator()(ImageLayer const& layer) const -> std::optional<std::string> {
        if (!layer.src)
            return "Image layer requires src";
        if (!layer.width || !layer.height)
            return "Image layer requires width and height";
        return std::nullopt;
    }
    auto operator()(BlurLayer const& layer) const -> std::optional<std::string> {
        if (!layer.width || !layer.height)
            return "Blur layer requires width and height";
        return std::nullopt;
    }
};

} // namespace

auto defaultNumericRules() -> NumericRuleTable {
    NumericRuleTable rules;
    auto clamp = [&](char const* key, double min, double max) {
        rules.emplace(key, NumericRule{min, max, NumericPolicy::Clamp});
    };
    auto drop = [&](char const* key, double min, double max) {
        rules.emplace(key, NumericRule{min, max, NumericPolicy::Drop});
    };
    clamp("opacity", 0.0, 1.0);
    clamp("fillOpacity", 0.0, 1.0);
    clamp("strokeOpacity", 0.0, 1.0);
    clamp("tailPosition", 0.0, 1.0);
    drop("fontSize", 1.0, 1000.0);
    drop("strokeWidth", 0.0, 100.0);
    drop("width", 0.0, 10000.0);
    drop("height", 0.0, 10000.0);
    drop("radius", 0.0, 5000.0);
    drop("radiusX", 0.0, 5000.0);
    drop("radiusY", 0.0, 5000.0);
    drop("outerRadius", 0.0, 5000.0);
    drop("innerRadius", 0.0, 5000.0);
    drop("pointRadius", 0.0, 5000.0);
    drop("valleyRadius", 0.0, 5000.0);
    drop("arrowSize", 1.0, 100.0);
    drop("headScale", 0.1, 5.0);
    drop("tailWidth", 0.0, 100.0);
    drop("tailSize", 0.0, 500.0);
    drop("blurRadius", 0.0, 100.0);
    drop("padding", 0.0, 100.0);
    drop("textStrokeWidth", 0.0, 50.0);
    drop("textShadowBlur", 0.0, 50.0);
    drop("textShadowOffsetX", -100.0, 100.0);
    drop("textShadowOffsetY", -100.0, 100.0);
    drop("shadowBlur", 0.0, 100.0);
    drop("shadowOffsetX", -100.0, 100.0);
    drop("shadowOffsetY", -100.0, 100.0);
    drop("shadowSpread", 0.0, 100.0);
    drop("lineHeight", 0.5, 5.0);
    drop("cornerRadius", 0.0, 500.0);
    return rules;
}

auto defaultAllowedFonts() -> std::vector<std::string> {
    return {"Arial",       "Roboto",  "Noto Sans", "Times New Roman", "Courier New", "Georgia",
            "Verdana",     "Helvetica", "Tahoma",  "Trebuchet MS",    "Impact",      "Comic Sans MS",
            "sans-serif",  "serif",   "monospace"};
}

LayerValidator::LayerValidator(ValidatorConfig config, TaggedLogger& logger)
    : config_(std::move(config)), logger_(logger) {}

auto LayerValidator::validateLayer(nlohmann::json const& rawLayer, std::size_t index) const
    -> ValidationResult<LayerDocument> {
    ValidationResult<LayerDocument> result;
    if (!rawLayer.is_object()) {
        result.addError("Layer must be an object");
        return result;
    }
    auto typeIt = rawLayer.find("type");
    if (typeIt == rawLayer.end() || !typeIt->is_string()) {
        result.addError("Missing layer type", std::string{"type"});
        return result;
    }
    auto const& type  = typeIt->get_ref<std::string const&>();
    auto        shape = makeShape(type);
    if (!shape) {
        result.addError("Unsupported layer type: " + Sanitize::sanitizeIdentifier(type, "?"), std::string{"type"});
        return result;
    }

    LayerDocument       document{LayerBase{}, std::move(*shape)};
    LayerFieldSanitizer sanitizer{rawLayer, index, config_, logger_, result};
    visitLayerFields(document, sanitizer);

    for (auto const& [key, value] : rawLayer.items()) {
        if (key == "type" || sanitizer.consumed().count(key) > 0)
            continue;
        result.addWarning("Dropped unknown property '" + Sanitize::sanitizeIdentifier(key, "?") + "'", key);
    }

    if (auto missing = std::visit(RequiredFieldCheck{document.base}, document.shape))
        result.addError(std::move(*missing));

    result.setData(std::move(document));
    return result;
}

auto LayerValidator::validateLayers(nlohmann::json const& rawLayers) const
    -> ValidationResult<std::vector<LayerDocument>> {
    ValidationResult<std::vector<LayerDocument>> result;
    if (!rawLayers.is_array()) {
        result.addError("Layers must be an array");
        result.setMetadata("originalLayerCount", 0);
        result.setMetadata("validatedLayerCount", 0);
        return result;
    }

    result.setMetadata("originalLayerCount", rawLayers.size());
    if (rawLayers.size() > config_.maxLayerCount) {
        result.addError("Too many layers: " + std::to_string(rawLayers.size()) + " (max: "
                        + std::to_string(config_.maxLayerCount) + ")");
        result.setMetadata("validatedLayerCount", 0);
        logger_.warning(kTag,
                        "layer batch exceeds layer count limit",
                        {{"metric", "layer_count"},
                         {"value", std::to_string(rawLayers.size())},
                         {"limit", std::to_string(config_.maxLayerCount)}});
        return result;
    }
    if (rawLayers.empty()) {
        result.addWarning("No layers provided");
        result.setMetadata("validatedLayerCount", 0);
        return result;
    }

    std::vector<LayerDocument> layers;
    layers.reserve(rawLayers.size());
    for (std::size_t i = 0; i < rawLayers.size(); ++i) {
        auto layerResult = validateLayer(rawLayers[i], i);
        auto const prefix = "Layer " + std::to_string(i) + ": ";
        for (auto const& issue : layerResult.errors())
            result.addError(prefix + issue.message, issue.field);
        for (auto const& issue : layerResult.warnings())
            result.addWarning(prefix + issue.message, issue.field);
        if (layerResult.isValid())
            layers.push_back(layerResult.takeData());
    }
    result.setMetadata("validatedLayerCount", layers.size());
    result.setData(std::move(layers));

    if (!result.isValid()) {
        logger_.info(kTag,
                     "layer batch rejected",
                     {{"errors", std::to_string(result.errors().size())},
                      {"layers", std::to_string(rawLayers.size())}});
    } else if (!result.warnings().empty()) {
        logger_.debug(kTag, "layer batch sanitized", {{"warnings", std::to_string(result.warnings().size())}});
    }
    return result;
}

} // namespace LS
