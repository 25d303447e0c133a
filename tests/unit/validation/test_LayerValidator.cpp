#include "../LayerSetsTestHelper.hpp"

#include <layersets/model/LayerJson.hpp>
#include <layersets/validation/LayerValidator.hpp>

#include <doctest/doctest.h>

#include <algorithm>
#include <string>
#include <vector>

using namespace LS;
using json = nlohmann::json;

namespace {

auto anyMessageContains(std::vector<std::string> const& messages, std::string_view needle) -> bool {
    return std::any_of(messages.begin(), messages.end(),
                       [&](std::string const& message) { return message.find(needle) != std::string::npos; });
}

} // namespace

TEST_SUITE("LayerValidator") {
    TEST_CASE("text layer is accepted and canonicalized") {
        Test::CollectingLog log;
        LayerValidator      validator{ValidatorConfig{}, log.logger};

        auto result = validator.validateLayers(json::array({Test::textLayer("l1", "Hello")}));
        REQUIRE(result.isValid());
        REQUIRE(result.data().size() == 1);
        auto const& layer = result.data().front();
        CHECK(layer.type() == "text");
        CHECK(layer.base.id == "l1");
        REQUIRE(layer.as<TextLayer>() != nullptr);
        CHECK(layer.as<TextLayer>()->text == "Hello");
        CHECK(layer.base.x == 10.0);
        CHECK(result.metadata()["originalLayerCount"] == 1);
        CHECK(result.metadata()["validatedLayerCount"] == 1);
    }

    TEST_CASE("empty layer list is valid with a warning") {
        Test::CollectingLog log;
        LayerValidator      validator{ValidatorConfig{}, log.logger};

        auto result = validator.validateLayers(json::array());
        CHECK(result.isValid());
        CHECK(result.data().empty());
        CHECK(anyMessageContains(result.warningMessages(), "No layers provided"));
    }

    TEST_CASE("batches over the layer limit are rejected as a whole") {
        Test::CollectingLog log;
        LayerValidator      validator{ValidatorConfig{}, log.logger};

        auto tooMany = validator.validateLayers(Test::textLayers(101));
        CHECK_FALSE(tooMany.isValid());
        CHECK(anyMessageContains(tooMany.errorMessages(), "Too many layers: 101 (max: 100)"));
        CHECK(tooMany.data().empty());

        auto atLimit = validator.validateLayers(Test::textLayers(100));
        CHECK(atLimit.isValid());
        CHECK(atLimit.data().size() == 100);
    }

    TEST_CASE("input that is not an array fails") {
        Test::CollectingLog log;
        LayerValidator      validator{ValidatorConfig{}, log.logger};

        CHECK_FALSE(validator.validateLayers(json::object()).isValid());
        CHECK_FALSE(validator.validateLayers(json("layers")).isValid());
    }

    TEST_CASE("missing or unknown types fail the layer") {
        Test::CollectingLog log;
        LayerValidator      validator{ValidatorConfig{}, log.logger};

        auto missing = validator.validateLayers(json::array({json{{"id", "a"}, {"x", 1}}}));
        CHECK_FALSE(missing.isValid());
        CHECK(anyMessageContains(missing.errorMessages(), "Layer 0: Missing layer type"));

        auto unknown = validator.validateLayers(json::array({json{{"id", "a"}, {"type", "bogus"}}}));
        CHECK_FALSE(unknown.isValid());
        CHECK(anyMessageContains(unknown.errorMessages(), "Unsupported layer type: bogus"));

        auto notObject = validator.validateLayer(json(42));
        CHECK_FALSE(notObject.isValid());
    }

    TEST_CASE("one failing layer fails the batch and keeps order of the rest") {
        Test::CollectingLog log;
        LayerValidator      validator{ValidatorConfig{}, log.logger};

        auto layers = json::array({Test::textLayer("first", "One"),
                                   json{{"id", "bad"}, {"type", "circle"}},
                                   Test::textLayer("third", "Three")});
        auto result = validator.validateLayers(layers);
        CHECK_FALSE(result.isValid());
        CHECK(anyMessageContains(result.errorMessages(), "Layer 1: Circle layer requires radius"));
        REQUIRE(result.data().size() == 2);
        CHECK(result.data()[0].base.id == "first");
        CHECK(result.data()[1].base.id == "third");
    }

    TEST_CASE("required fields are enforced per type") {
        Test::CollectingLog log;
        LayerValidator      validator{ValidatorConfig{}, log.logger};

        CHECK_FALSE(validator.validateLayer(json{{"type", "text"}, {"text", ""}}).isValid());
        CHECK_FALSE(validator.validateLayer(json{{"type", "rectangle"}, {"width", 10}}).isValid());
        CHECK_FALSE(validator.validateLayer(json{{"type", "line"}, {"x1", 0}, {"y1", 0}, {"x2", 1}}).isValid());
        CHECK_FALSE(validator.validateLayer(json{{"type", "path"}, {"points", json::array({{{"x", 0}, {"y", 0}}})}})
                        .isValid());
        CHECK(validator.validateLayer(json{{"type", "ellipse"}, {"width", 10}, {"height", 5}}).isValid());
        CHECK(validator.validateLayer(json{{"type", "ellipse"}, {"radiusX", 10}, {"radiusY", 5}}).isValid());
        CHECK(validator.validateLayer(json{{"type", "polygon"}, {"x", 5}, {"y", 5}, {"radius", 10}, {"sides", 6}})
                  .isValid());
        CHECK(validator
                  .validateLayer(json{{"type", "polygon"},
                                      {"points", json::array({json::array({0, 0}), json::array({5, 0}),
                                                              json::array({0, 5})})}})
                  .isValid());
        CHECK(validator.validateLayer(json{{"type", "star"}, {"points", 5}, {"outerRadius", 20}}).isValid());
        CHECK(validator.validateLayer(json{{"type", "blur"}, {"width", 40}, {"height", 20}}).isValid());
        CHECK(validator.validateLayer(json{{"type", "textbox"}, {"width", 100}, {"height", 40}}).isValid());
    }

    TEST_CASE("group with empty children is valid") {
        Test::CollectingLog log;
        LayerValidator      validator{ValidatorConfig{}, log.logger};

        auto result = validator.validateLayer(json{{"id", "g1"}, {"type", "group"}, {"children", json::array()}});
        REQUIRE(result.isValid());
        REQUIRE(result.data().as<GroupLayer>() != nullptr);
        CHECK(result.data().as<GroupLayer>()->children.empty());
    }

    TEST_CASE("group children are reduced to identifiers") {
        Test::CollectingLog log;
        LayerValidator      validator{ValidatorConfig{}, log.logger};

        auto result = validator.validateLayer(
            json{{"id", "g1"}, {"type", "group"}, {"children", json::array({"a1", "<b2>", 7, "!!"})}});
        REQUIRE(result.isValid());
        CHECK(result.data().as<GroupLayer>()->children == std::vector<std::string>{"a1", "b2"});
        CHECK(result.warnings().size() == 2);
    }

    TEST_CASE("opacity out of range is clamped with a warning") {
        Test::CollectingLog log;
        LayerValidator      validator{ValidatorConfig{}, log.logger};

        auto layer  = Test::textLayer("l1", "Hi");
        layer["opacity"] = 1.5;
        auto result = validator.validateLayer(layer);
        REQUIRE(result.isValid());
        CHECK(result.data().base.opacity == 1.0);
        CHECK(anyMessageContains(result.warningMessages(), "Property 'opacity' clamped to [0, 1]"));

        layer["opacity"] = -3;
        CHECK(validator.validateLayer(layer).data().base.opacity == 0.0);
    }

    TEST_CASE("coordinates beyond the bound are rejected") {
        Test::CollectingLog log;
        LayerValidator      validator{ValidatorConfig{}, log.logger};

        auto layer = Test::textLayer("l1", "Hi");
        layer["x"] = 200000;
        auto result = validator.validateLayer(layer);
        CHECK_FALSE(result.isValid());
        CHECK(anyMessageContains(result.errorMessages(), "Property 'x' out of range"));

        auto path = json{{"type", "path"},
                         {"points", json::array({{{"x", 0}, {"y", 0}}, {{"x", 0}, {"y", -150000}}})}};
        auto pathResult = validator.validateLayer(path);
        CHECK_FALSE(pathResult.isValid());
        CHECK(anyMessageContains(pathResult.errorMessages(), "Point 1 is out of range"));
    }

    TEST_CASE("dimensions outside their range are dropped") {
        Test::CollectingLog log;
        LayerValidator      validator{ValidatorConfig{}, log.logger};

        auto result = validator.validateLayer(
            json{{"type", "rectangle"}, {"width", 50}, {"height", 20}, {"strokeWidth", 500}});
        REQUIRE(result.isValid());
        CHECK_FALSE(result.data().base.strokeWidth.has_value());
        CHECK(anyMessageContains(result.warningMessages(), "strokeWidth"));
    }

    TEST_CASE("numeric policy is configurable per field") {
        Test::CollectingLog log;
        ValidatorConfig     config;
        config.numericRules["strokeWidth"] = NumericRule{0.0, 100.0, NumericPolicy::Reject};
        LayerValidator validator{config, log.logger};

        auto result = validator.validateLayer(
            json{{"type", "rectangle"}, {"width", 50}, {"height", 20}, {"strokeWidth", 500}});
        CHECK_FALSE(result.isValid());
    }

    TEST_CASE("non finite numbers fail the layer") {
        Test::CollectingLog log;
        LayerValidator      validator{ValidatorConfig{}, log.logger};

        auto layer = Test::textLayer("l1", "Hi");
        layer["rotation"] = "inf";
        CHECK_FALSE(validator.validateLayer(layer).isValid());
    }

    TEST_CASE("numeric strings are accepted") {
        Test::CollectingLog log;
        LayerValidator      validator{ValidatorConfig{}, log.logger};

        auto result = validator.validateLayer(json{{"type", "circle"}, {"radius", "12.5"}, {"x", "3"}});
        REQUIRE(result.isValid());
        CHECK(result.data().as<CircleLayer>()->radius == 12.5);
        CHECK(result.data().base.x == 3.0);
    }

    TEST_CASE("unknown keys are dropped with a warning") {
        Test::CollectingLog log;
        LayerValidator      validator{ValidatorConfig{}, log.logger};

        auto layer = Test::textLayer("l1", "Hi");
        layer["onclick"] = "alert(1)";
        layer["__proto__"] = json::object();
        auto result = validator.validateLayer(layer);
        REQUIRE(result.isValid());
        CHECK(anyMessageContains(result.warningMessages(), "Dropped unknown property 'onclick'"));

        auto encoded = layerToJson(result.data());
        CHECK_FALSE(encoded.contains("onclick"));
        CHECK_FALSE(encoded.contains("__proto__"));
    }

    TEST_CASE("legacy blend key maps to blendMode") {
        Test::CollectingLog log;
        LayerValidator      validator{ValidatorConfig{}, log.logger};

        auto result = validator.validateLayer(
            json{{"type", "rectangle"}, {"width", 10}, {"height", 10}, {"blend", "multiply"}});
        REQUIRE(result.isValid());
        CHECK(result.data().base.blendMode == "multiply");
        CHECK_FALSE(anyMessageContains(result.warningMessages(), "blend"));

        auto invalid = validator.validateLayer(
            json{{"type", "rectangle"}, {"width", 10}, {"height", 10}, {"blendMode", "explode"}});
        REQUIRE(invalid.isValid());
        CHECK_FALSE(invalid.data().base.blendMode.has_value());
    }

    TEST_CASE("missing id is assigned from the layer index") {
        Test::CollectingLog log;
        LayerValidator      validator{ValidatorConfig{}, log.logger};

        auto result = validator.validateLayers(
            json::array({Test::textLayer("a", "A"), json{{"type", "circle"}, {"radius", 4}}}));
        REQUIRE(result.isValid());
        CHECK(result.data()[1].base.id == "layer_1");
        CHECK(anyMessageContains(result.warningMessages(), "Layer 1: Missing layer id"));

        auto first = validator.validateLayers(json::array({json{{"type", "circle"}, {"radius", 4}}}));
        REQUIRE(first.isValid());
        CHECK(first.data()[0].base.id == "layer_0");
    }

    TEST_CASE("text fields are sanitized") {
        Test::CollectingLog log;
        LayerValidator      validator{ValidatorConfig{}, log.logger};

        auto result = validator.validateLayer(Test::textLayer("x", "<img src=x onerror=alert(1)>Hi"));
        REQUIRE(result.isValid());
        CHECK(result.data().as<TextLayer>()->text == "Hi");
        CHECK(log.contains("LayerValidator", "rejected unsafe layer content"));
    }

    TEST_CASE("markup only text leaves the text layer empty and invalid") {
        Test::CollectingLog log;
        LayerValidator      validator{ValidatorConfig{}, log.logger};

        CHECK_FALSE(validator.validateLayer(Test::textLayer("x", "<script>alert(1)</script>")).isValid());
    }

    TEST_CASE("colors fall back to black and unsafe values are logged") {
        Test::CollectingLog log;
        LayerValidator      validator{ValidatorConfig{}, log.logger};

        auto result = validator.validateLayer(json{{"type", "rectangle"},
                                                   {"width", 10},
                                                   {"height", 10},
                                                   {"fill", "javascript:alert(1)"},
                                                   {"stroke", "#F00"}});
        REQUIRE(result.isValid());
        CHECK(result.data().base.fill == "#000000");
        CHECK(result.data().base.stroke == "#ff0000");
        CHECK(anyMessageContains(result.warningMessages(), "Invalid color for 'fill'"));
        CHECK(log.contains("LayerValidator", "rejected unsafe layer content"));
    }

    TEST_CASE("fonts are limited to the allow list") {
        Test::CollectingLog log;
        LayerValidator      validator{ValidatorConfig{}, log.logger};

        auto layer = Test::textLayer("t", "Hi");
        layer["fontFamily"] = "'comic sans ms', cursive";
        auto allowed = validator.validateLayer(layer);
        REQUIRE(allowed.isValid());
        CHECK(allowed.data().as<TextLayer>()->appearance.fontFamily == "Comic Sans MS");

        layer["fontFamily"] = "url(evil.woff)";
        auto replaced = validator.validateLayer(layer);
        REQUIRE(replaced.isValid());
        CHECK(replaced.data().as<TextLayer>()->appearance.fontFamily == "Arial");
        CHECK(anyMessageContains(replaced.warningMessages(), "Font not allowed"));
    }

    TEST_CASE("rich text runs are capped at 100") {
        Test::CollectingLog log;
        LayerValidator      validator{ValidatorConfig{}, log.logger};

        auto runs = json::array();
        for (int i = 0; i < 101; ++i)
            runs.push_back(json{{"text", "r"}});
        auto result = validator.validateLayer(
            json{{"type", "textbox"}, {"width", 100}, {"height", 50}, {"richText", runs}});
        CHECK_FALSE(result.isValid());
        CHECK(anyMessageContains(result.errorMessages(), "Too many rich text runs: 101 (max: 100)"));

        runs.erase(runs.begin());
        CHECK(validator.validateLayer(json{{"type", "textbox"}, {"width", 100}, {"height", 50}, {"richText", runs}})
                  .isValid());
    }

    TEST_CASE("rich text styles keep only allowed values") {
        Test::CollectingLog log;
        LayerValidator      validator{ValidatorConfig{}, log.logger};

        auto runs = json::array({json{{"text", "<b>Bold</b> "},
                                      {"style",
                                       {{"fontWeight", "bold"},
                                        {"textDecoration", "blink"},
                                        {"color", "#0F0"},
                                        {"backgroundColor", "expression(x)"},
                                        {"cursor", "pointer"}}}},
                                 json{{"text", "plain"}, {"style", {{"textDecoration", "underline"}}}}});
        auto result = validator.validateLayer(
            json{{"type", "textbox"}, {"width", 100}, {"height", 50}, {"richText", runs}});
        REQUIRE(result.isValid());
        CHECK(result.warnings().empty());

        auto const& parsed = *result.data().base.richText;
        REQUIRE(parsed.size() == 2);
        CHECK(parsed[0].text == "Bold ");
        CHECK(parsed[0].style.fontWeight == "bold");
        CHECK_FALSE(parsed[0].style.textDecoration.has_value());
        CHECK(parsed[0].style.color == "#00ff00");
        CHECK_FALSE(parsed[0].style.backgroundColor.has_value());
        CHECK(parsed[1].style.textDecoration == "underline");
    }

    TEST_CASE("point lists are truncated to the configured maximum") {
        Test::CollectingLog log;
        LayerValidator      validator{ValidatorConfig{}, log.logger};

        auto points = json::array();
        for (int i = 0; i < 1500; ++i)
            points.push_back(json{{"x", i % 100}, {"y", i % 50}});
        auto result = validator.validateLayer(json{{"type", "path"}, {"points", points}});
        REQUIRE(result.isValid());
        CHECK(result.data().as<PathLayer>()->points.size() == 1000);
        CHECK(anyMessageContains(result.warningMessages(), "Point list truncated from 1500 to 1000"));
    }

    TEST_CASE("integer geometry fields are range checked") {
        Test::CollectingLog log;
        LayerValidator      validator{ValidatorConfig{}, log.logger};

        auto tooManyPoints = validator.validateLayer(json{{"type", "star"}, {"points", 25}, {"radius", 10}});
        CHECK_FALSE(tooManyPoints.isValid());
        CHECK(anyMessageContains(tooManyPoints.errorMessages(), "Property 'points' must be an integer between 3 and 20"));

        CHECK_FALSE(validator.validateLayer(json{{"type", "star"}, {"points", 4.5}, {"radius", 10}}).isValid());
    }

    TEST_CASE("custom shapes validate their path data") {
        Test::CollectingLog log;
        LayerValidator      validator{ValidatorConfig{}, log.logger};

        auto single = validator.validateLayer(json{{"type", "customShape"},
                                                   {"shapeId", "arrows/../../etc/curved"},
                                                   {"path", "M0 0 L10 10 Z"},
                                                   {"viewBox", "0 0 24 24"},
                                                   {"width", 48},
                                                   {"height", 48}});
        REQUIRE(single.isValid());
        auto const* shape = single.data().as<CustomShapeLayer>();
        REQUIRE(shape != nullptr);
        CHECK(shape->path == "M0 0 L10 10 Z");
        REQUIRE(shape->viewBox.has_value());
        CHECK((*shape->viewBox)[2] == 24.0);
        REQUIRE(shape->shapeId.has_value());
        CHECK(shape->shapeId->find("..") == std::string::npos);

        auto multi = validator.validateLayer(
            json{{"type", "customShape"},
                 {"isMultiPath", true},
                 {"paths", json::array({json{{"path", "M0 0h4"}, {"fill", "red"}},
                                        json{{"path", "M1 1v2"}, {"stroke", "bogus"}}})}});
        REQUIRE(multi.isValid());
        REQUIRE(multi.data().as<CustomShapeLayer>()->paths.size() == 2);
        CHECK(multi.data().as<CustomShapeLayer>()->paths[1].stroke == "#000000");

        auto unsafe = validator.validateLayer(json{{"type", "customShape"}, {"path", "M0 0 javascript:x"}});
        CHECK_FALSE(unsafe.isValid());

        auto empty = validator.validateLayer(json{{"type", "customShape"}, {"width", 10}});
        CHECK_FALSE(empty.isValid());
    }

    TEST_CASE("custom shape SVG is screened") {
        Test::CollectingLog log;
        LayerValidator      validator{ValidatorConfig{}, log.logger};

        auto clean = validator.validateLayer(
            json{{"type", "customShape"}, {"svg", "<svg><circle cx='5' cy='5' r='4'/></svg>"}});
        CHECK(clean.isValid());

        auto script = validator.validateLayer(
            json{{"type", "customShape"}, {"svg", "<svg><script>alert(1)</script></svg>"}});
        CHECK_FALSE(script.isValid());
        CHECK(anyMessageContains(script.errorMessages(), "Invalid SVG: SVG contains script element"));
    }

    TEST_CASE("image layers require a raster data URL") {
        Test::CollectingLog log;
        LayerValidator      validator{ValidatorConfig{}, log.logger};

        auto ok = validator.validateLayer(json{{"type", "image"},
                                               {"src", "data:image/png;base64,iVBORw0KGgo="},
                                               {"width", 10},
                                               {"height", 10}});
        CHECK(ok.isValid());

        auto remote = validator.validateLayer(
            json{{"type", "image"}, {"src", "https://example.org/x.png"}, {"width", 10}, {"height", 10}});
        CHECK_FALSE(remote.isValid());

        ValidatorConfig small;
        small.maxImageBytes = 4;
        LayerValidator strict{small, log.logger};
        auto big = strict.validateLayer(json{{"type", "image"},
                                             {"src", "data:image/png;base64,iVBORw0KGgoAAAANSUhEUg=="},
                                             {"width", 10},
                                             {"height", 10}});
        CHECK_FALSE(big.isValid());
    }

    TEST_CASE("booleans accept common encodings and drop the rest") {
        Test::CollectingLog log;
        LayerValidator      validator{ValidatorConfig{}, log.logger};

        auto layer = Test::textLayer("t", "Hi");
        layer["visible"] = 0;
        layer["locked"]  = "true";
        layer["shadow"]  = "maybe";
        auto result = validator.validateLayer(layer);
        REQUIRE(result.isValid());
        CHECK(result.data().base.visible == false);
        CHECK(result.data().base.locked == true);
        CHECK_FALSE(result.data().base.shadow.has_value());
    }

    TEST_CASE("arrow and callout layers carry their extra fields") {
        Test::CollectingLog log;
        LayerValidator      validator{ValidatorConfig{}, log.logger};

        auto arrow = validator.validateLayer(json{{"type", "arrow"},
                                                  {"x1", 0},
                                                  {"y1", 0},
                                                  {"x2", 50},
                                                  {"y2", 50},
                                                  {"arrowhead", "triangle"},
                                                  {"arrowSize", 12}});
        REQUIRE(arrow.isValid());
        CHECK(arrow.data().as<ArrowLayer>()->arrowhead == "triangle");
        CHECK(arrow.data().as<ArrowLayer>()->line.x2 == 50.0);

        auto callout = validator.validateLayer(json{{"type", "callout"},
                                                    {"width", 120},
                                                    {"height", 60},
                                                    {"text", "Note"},
                                                    {"tailDirection", "bottom-left"},
                                                    {"tailPosition", 2}});
        REQUIRE(callout.isValid());
        CHECK(callout.data().as<CalloutLayer>()->box.text == "Note");
        CHECK(callout.data().as<CalloutLayer>()->tailDirection == "bottom-left");
        CHECK(callout.data().as<CalloutLayer>()->tailPosition == 1.0);
    }
}
