#pragma once

#include <array>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

/*
 * Canonical typed form of one annotation layer.
 *
 * Every struct exposes a static visit(self, visitor) that presents its fields as
 * (json key, member) pairs. JSON encoding, decoding and validation all walk the
 * same field list, so the set of keys a layer type accepts is defined once here.
 */
namespace LS {

struct Point {
    double x = 0.0;
    double y = 0.0;

    bool operator==(Point const&) const = default;
};

struct TextStyle {
    std::optional<std::string> fontWeight;
    std::optional<std::string> fontStyle;
    std::optional<std::string> textDecoration;
    std::optional<std::string> color;
    std::optional<std::string> backgroundColor;
    std::optional<std::string> fontFamily;
    std::optional<double>      fontSize;

    bool operator==(TextStyle const&) const = default;

    template <typename Self, typename Visitor>
    static void visit(Self& self, Visitor&& v) {
        v("fontWeight", self.fontWeight);
        v("fontStyle", self.fontStyle);
        v("textDecoration", self.textDecoration);
        v("color", self.color);
        v("backgroundColor", self.backgroundColor);
        v("fontFamily", self.fontFamily);
        v("fontSize", self.fontSize);
    }
};

struct RichTextRun {
    std::string text;
    TextStyle   style;

    bool operator==(RichTextRun const&) const = default;
};

// One sub-path of a multi-path custom shape.
struct ShapePath {
    std::string                path;
    std::optional<std::string> fill;
    std::optional<std::string> stroke;
    std::optional<double>      strokeWidth;

    bool operator==(ShapePath const&) const = default;

    template <typename Self, typename Visitor>
    static void visit(Self& self, Visitor&& v) {
        v("path", self.path);
        v("fill", self.fill);
        v("stroke", self.stroke);
        v("strokeWidth", self.strokeWidth);
    }
};

using ViewBox = std::array<double, 4>;

struct LayerBase {
    std::string                             id;
    std::optional<std::string>              name;
    std::optional<bool>                     visible;
    std::optional<bool>                     locked;
    std::optional<double>                   opacity;
    std::optional<std::string>              blendMode;
    std::optional<double>                   x;
    std::optional<double>                   y;
    std::optional<double>                   rotation;
    std::optional<std::string>              stroke;
    std::optional<std::string>              fill;
    std::optional<double>                   strokeWidth;
    std::optional<double>                   fillOpacity;
    std::optional<double>                   strokeOpacity;
    std::optional<bool>                     shadow;
    std::optional<std::string>              shadowColor;
    std::optional<double>                   shadowBlur;
    std::optional<double>                   shadowOffsetX;
    std::optional<double>                   shadowOffsetY;
    std::optional<double>                   shadowSpread;
    std::optional<std::string>              parentGroup;
    std::optional<std::vector<RichTextRun>> richText;

    bool operator==(LayerBase const&) const = default;

    template <typename Self, typename Visitor>
    static void visit(Self& self, Visitor&& v) {
        v("id", self.id);
        v("name", self.name);
        v("visible", self.visible);
        v("locked", self.locked);
        v("opacity", self.opacity);
        v("blendMode", self.blendMode);
        v("x", self.x);
        v("y", self.y);
        v("rotation", self.rotation);
        v("stroke", self.stroke);
        v("fill", self.fill);
        v("strokeWidth", self.strokeWidth);
        v("fillOpacity", self.fillOpacity);
        v("strokeOpacity", self.strokeOpacity);
        v("shadow", self.shadow);
        v("shadowColor", self.shadowColor);
        v("shadowBlur", self.shadowBlur);
        v("shadowOffsetX", self.shadowOffsetX);
        v("shadowOffsetY", self.shadowOffsetY);
        v("shadowSpread", self.shadowSpread);
        v("parentGroup", self.parentGroup);
        v("richText", self.richText);
    }
};

// Font and outline settings shared by the text-bearing layer types.
struct TextAppearance {
    std::optional<double>      fontSize;
    std::optional<std::string> fontFamily;
    std::optional<std::string> fontWeight;
    std::optional<std::string> fontStyle;
    std::optional<std::string> textAlign;
    std::optional<std::string> color;
    std::optional<std::string> textStrokeColor;
    std::optional<double>      textStrokeWidth;
    std::optional<bool>        textShadow;
    std::optional<std::string> textShadowColor;
    std::optional<double>      textShadowBlur;
    std::optional<double>      textShadowOffsetX;
    std::optional<double>      textShadowOffsetY;
    std::optional<double>      lineHeight;

    bool operator==(TextAppearance const&) const = default;

    template <typename Self, typename Visitor>
    static void visit(Self& self, Visitor&& v) {
        v("fontSize", self.fontSize);
        v("fontFamily", self.fontFamily);
        v("fontWeight", self.fontWeight);
        v("fontStyle", self.fontStyle);
        v("textAlign", self.textAlign);
        v("color", self.color);
        v("textStrokeColor", self.textStrokeColor);
        v("textStrokeWidth", self.textStrokeWidth);
        v("textShadow", self.textShadow);
        v("textShadowColor", self.textShadowColor);
        v("textShadowBlur", self.textShadowBlur);
        v("textShadowOffsetX", self.textShadowOffsetX);
        v("textShadowOffsetY", self.textShadowOffsetY);
        v("lineHeight", self.lineHeight);
    }
};

struct TextLayer {
    static constexpr std::string_view kType = "text";

    std::string    text;
    TextAppearance appearance;

    bool operator==(TextLayer const&) const = default;

    template <typename Self, typename Visitor>
    static void visit(Self& self, Visitor&& v) {
        v("text", self.text);
        TextAppearance::visit(self.appearance, v);
    }
};

struct TextboxLayer {
    static constexpr std::string_view kType = "textbox";

    std::optional<double>      width;
    std::optional<double>      height;
    std::optional<std::string> text;
    TextAppearance             appearance;
    std::optional<std::string> verticalAlign;
    std::optional<double>      padding;
    std::optional<double>      cornerRadius;

    bool operator==(TextboxLayer const&) const = default;

    template <typename Self, typename Visitor>
    static void visit(Self& self, Visitor&& v) {
        v("width", self.width);
        v("height", self.height);
        v("text", self.text);
        TextAppearance::visit(self.appearance, v);
        v("verticalAlign", self.verticalAlign);
        v("padding", self.padding);
        v("cornerRadius", self.cornerRadius);
    }
};

// A textbox with a pointer tail.
struct CalloutLayer {
    static constexpr std::string_view kType = "callout";

    TextboxLayer               box;
    std::optional<std::string> tailDirection;
    std::optional<double>      tailPosition;
    std::optional<double>      tailSize;
    std::optional<std::string> tailStyle;
    std::optional<double>      tailTipX;
    std::optional<double>      tailTipY;
    std::optional<double>      tailWidth;

    bool operator==(CalloutLayer const&) const = default;

    template <typename Self, typename Visitor>
    static void visit(Self& self, Visitor&& v) {
        TextboxLayer::visit(self.box, v);
        v("tailDirection", self.tailDirection);
        v("tailPosition", self.tailPosition);
        v("tailSize", self.tailSize);
        v("tailStyle", self.tailStyle);
        v("tailTipX", self.tailTipX);
        v("tailTipY", self.tailTipY);
        v("tailWidth", self.tailWidth);
    }
};

struct RectangleLayer {
    static constexpr std::string_view kType = "rectangle";

    std::optional<double> width;
    std::optional<double> height;
    std::optional<double> cornerRadius;

    bool operator==(RectangleLayer const&) const = default;

    template <typename Self, typename Visitor>
    static void visit(Self& self, Visitor&& v) {
        v("width", self.width);
        v("height", self.height);
        v("cornerRadius", self.cornerRadius);
    }
};

struct CircleLayer {
    static constexpr std::string_view kType = "circle";

    std::optional<double> radius;

    bool operator==(CircleLayer const&) const = default;

    template <typename Self, typename Visitor>
    static void visit(Self& self, Visitor&& v) {
        v("radius", self.radius);
    }
};

struct EllipseLayer {
    static constexpr std::string_view kType = "ellipse";

    std::optional<double> radiusX;
    std::optional<double> radiusY;
    // Legacy documents size ellipses by bounding box.
    std::optional<double> width;
    std::optional<double> height;

    bool operator==(EllipseLayer const&) const = default;

    template <typename Self, typename Visitor>
    static void visit(Self& self, Visitor&& v) {
        v("radiusX", self.radiusX);
        v("radiusY", self.radiusY);
        v("width", self.width);
        v("height", self.height);
    }
};

// Either an explicit vertex list or a regular polygon around (x, y).
struct PolygonLayer {
    static constexpr std::string_view kType = "polygon";

    std::vector<Point>    points;
    std::optional<double> radius;
    std::optional<int>    sides;
    std::optional<double> cornerRadius;

    bool operator==(PolygonLayer const&) const = default;

    template <typename Self, typename Visitor>
    static void visit(Self& self, Visitor&& v) {
        v("points", self.points);
        v("radius", self.radius);
        v("sides", self.sides);
        v("cornerRadius", self.cornerRadius);
    }
};

struct StarLayer {
    static constexpr std::string_view kType = "star";

    std::optional<int>    points;
    std::optional<double> outerRadius;
    std::optional<double> innerRadius;
    std::optional<double> radius;
    std::optional<double> pointRadius;
    std::optional<double> valleyRadius;

    bool operator==(StarLayer const&) const = default;

    template <typename Self, typename Visitor>
    static void visit(Self& self, Visitor&& v) {
        v("points", self.points);
        v("outerRadius", self.outerRadius);
        v("innerRadius", self.innerRadius);
        v("radius", self.radius);
        v("pointRadius", self.pointRadius);
        v("valleyRadius", self.valleyRadius);
    }
};

struct LineLayer {
    static constexpr std::string_view kType = "line";

    std::optional<double> x1;
    std::optional<double> y1;
    std::optional<double> x2;
    std::optional<double> y2;

    bool operator==(LineLayer const&) const = default;

    template <typename Self, typename Visitor>
    static void visit(Self& self, Visitor&& v) {
        v("x1", self.x1);
        v("y1", self.y1);
        v("x2", self.x2);
        v("y2", self.y2);
    }
};

struct ArrowLayer {
    static constexpr std::string_view kType = "arrow";

    LineLayer                  line;
    std::optional<std::string> arrowhead;
    std::optional<std::string> arrowStyle;
    std::optional<std::string> arrowHeadType;
    std::optional<double>      arrowSize;
    std::optional<double>      headScale;
    std::optional<double>      tailWidth;

    bool operator==(ArrowLayer const&) const = default;

    template <typename Self, typename Visitor>
    static void visit(Self& self, Visitor&& v) {
        LineLayer::visit(self.line, v);
        v("arrowhead", self.arrowhead);
        v("arrowStyle", self.arrowStyle);
        v("arrowHeadType", self.arrowHeadType);
        v("arrowSize", self.arrowSize);
        v("headScale", self.headScale);
        v("tailWidth", self.tailWidth);
    }
};

struct PathLayer {
    static constexpr std::string_view kType = "path";

    std::vector<Point> points;

    bool operator==(PathLayer const&) const = default;

    template <typename Self, typename Visitor>
    static void visit(Self& self, Visitor&& v) {
        v("points", self.points);
    }
};

// Freehand marker stroke; geometry is a point list like a path.
struct HighlightLayer {
    static constexpr std::string_view kType = "highlight";

    std::vector<Point> points;

    bool operator==(HighlightLayer const&) const = default;

    template <typename Self, typename Visitor>
    static void visit(Self& self, Visitor&& v) {
        v("points", self.points);
    }
};

struct CustomShapeLayer {
    static constexpr std::string_view kType = "customShape";

    std::optional<std::string> shapeId;
    std::optional<ViewBox>     viewBox;
    std::optional<std::string> svg;
    std::optional<std::string> path;
    std::vector<ShapePath>     paths;
    std::optional<bool>        isMultiPath;
    std::optional<bool>        strokeOnly;
    std::optional<double>      width;
    std::optional<double>      height;

    bool operator==(CustomShapeLayer const&) const = default;

    template <typename Self, typename Visitor>
    static void visit(Self& self, Visitor&& v) {
        v("shapeId", self.shapeId);
        v("viewBox", self.viewBox);
        v("svg", self.svg);
        v("path", self.path);
        v("paths", self.paths);
        v("isMultiPath", self.isMultiPath);
        v("strokeOnly", self.strokeOnly);
        v("width", self.width);
        v("height", self.height);
    }
};

struct GroupLayer {
    static constexpr std::string_view kType = "group";

    std::vector<std::string> children;
    std::optional<bool>      expanded;

    bool operator==(GroupLayer const&) const = default;

    template <typename Self, typename Visitor>
    static void visit(Self& self, Visitor&& v) {
        v("children", self.children);
        v("expanded", self.expanded);
    }
};

struct ImageLayer {
    static constexpr std::string_view kType = "image";

    std::optional<std::string> src;
    std::optional<double>      width;
    std::optional<double>      height;
    std::optional<double>      originalWidth;
    std::optional<double>      originalHeight;
    std::optional<bool>        preserveAspectRatio;

    bool operator==(ImageLayer const&) const = default;

    template <typename Self, typename Visitor>
    static void visit(Self& self, Visitor&& v) {
        v("src", self.src);
        v("width", self.width);
        v("height", self.height);
        v("originalWidth", self.originalWidth);
        v("originalHeight", self.originalHeight);
        v("preserveAspectRatio", self.preserveAspectRatio);
    }
};

// Blurs the image region under its bounds.
struct BlurLayer {
    static constexpr std::string_view kType = "blur";

    std::optional<double> width;
    std::optional<double> height;
    std::optional<double> blurRadius;

    bool operator==(BlurLayer const&) const = default;

    template <typename Self, typename Visitor>
    static void visit(Self& self, Visitor&& v) {
        v("width", self.width);
        v("height", self.height);
        v("blurRadius", self.blurRadius);
    }
};

using LayerShape = std::variant<TextLayer,
                                TextboxLayer,
                                CalloutLayer,
                                RectangleLayer,
                                CircleLayer,
                                EllipseLayer,
                                PolygonLayer,
                                StarLayer,
                                LineLayer,
                                ArrowLayer,
                                PathLayer,
                                HighlightLayer,
                                CustomShapeLayer,
                                GroupLayer,
                                ImageLayer,
                                BlurLayer>;

struct LayerDocument {
    LayerBase  base;
    LayerShape shape;

    bool operator==(LayerDocument const&) const = default;

    [[nodiscard]] auto type() const -> std::string_view;

    template <typename T>
    [[nodiscard]] auto as() const -> T const* {
        return std::get_if<T>(&shape);
    }
};

// Default-constructed shape for a type discriminant, or nullopt for unknown types.
[[nodiscard]] auto makeShape(std::string_view type) -> std::optional<LayerShape>;

[[nodiscard]] auto supportedLayerTypes() -> std::span<std::string_view const>;

// Walks base fields, then the fields of the active shape alternative.
template <typename Doc, typename Visitor>
void visitLayerFields(Doc& document, Visitor&& v) {
    LayerBase::visit(document.base, v);
    std::visit([&](auto& shape) { std::remove_cvref_t<decltype(shape)>::visit(shape, v); }, document.shape);
}

} // namespace LS
