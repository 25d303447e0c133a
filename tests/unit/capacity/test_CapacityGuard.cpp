#include "../LayerSetsTestHelper.hpp"

#include <layersets/capacity/CapacityGuard.hpp>

#include <doctest/doctest.h>

#include <chrono>
#include <string>
#include <vector>

using namespace LS;
using namespace std::chrono_literals;

namespace {

auto textDocuments(std::size_t count) -> std::vector<LayerDocument> {
    std::vector<LayerDocument> layers;
    for (std::size_t i = 0; i < count; ++i) {
        LayerDocument layer{LayerBase{}, TextLayer{}};
        layer.base.id = "l" + std::to_string(i);
        layers.push_back(std::move(layer));
    }
    return layers;
}

auto pathDocument(std::size_t points) -> LayerDocument {
    PathLayer path;
    path.points.assign(points, Point{1.0, 2.0});
    return LayerDocument{LayerBase{}, std::move(path)};
}

// A custom shape of `paths` sub-paths, each with `points` coordinate pairs.
auto shapeDocument(std::size_t paths, std::size_t points) -> LayerDocument {
    std::string data = "M0 0";
    for (std::size_t i = 1; i < points; ++i)
        data += " L" + std::to_string(i) + " " + std::to_string(i);
    CustomShapeLayer shape;
    shape.paths.assign(paths, ShapePath{data, std::nullopt, std::nullopt, std::nullopt});
    shape.isMultiPath = true;
    return LayerDocument{LayerBase{}, std::move(shape)};
}

auto unlimitedRates() -> CapacityConfig {
    CapacityConfig config;
    config.saveRate   = {0, 0};
    config.renderRate = {0, 0};
    config.createRate = {0, 0};
    return config;
}

} // namespace

TEST_SUITE("CapacityGuard") {
    TEST_CASE("layer count boundary") {
        Test::CollectingLog log;
        CapacityGuard       guard{CapacityConfig{}, log.logger};

        CHECK(guard.isLayerCountAllowed(0));
        CHECK(guard.isLayerCountAllowed(100));
        CHECK_FALSE(guard.isLayerCountAllowed(101));
        CHECK_FALSE(guard.isLayerCountAllowed(-1));
    }

    TEST_CASE("image dimension boundary") {
        Test::CollectingLog log;
        CapacityGuard       guard{CapacityConfig{}, log.logger};

        CHECK(guard.isImageSizeAllowed(8192, 8192));
        CHECK_FALSE(guard.isImageSizeAllowed(8193, 100));
        CHECK_FALSE(guard.isImageSizeAllowed(100, 8193));
        CHECK_FALSE(guard.isImageSizeAllowed(0, 100));
        CHECK(guard.isImageSizeAllowed(std::nullopt, std::nullopt));
    }

    TEST_CASE("data size boundary") {
        Test::CollectingLog log;
        CapacityGuard       guard{CapacityConfig{}, log.logger};

        CHECK(guard.isDataSizeAllowed(0));
        CHECK(guard.isDataSizeAllowed(2 * 1024 * 1024));
        CHECK_FALSE(guard.isDataSizeAllowed(2 * 1024 * 1024 + 1));
    }

    TEST_CASE("complexity weights") {
        CHECK(CapacityGuard::layerComplexity(LayerDocument{LayerBase{}, CircleLayer{}}) == 1);
        CHECK(CapacityGuard::layerComplexity(LayerDocument{LayerBase{}, ArrowLayer{}}) == 3);
        CHECK(CapacityGuard::layerComplexity(LayerDocument{LayerBase{}, CustomShapeLayer{}}) == 12);
        CHECK(CapacityGuard::layerComplexity(pathDocument(10)) == 12);
        CHECK(CapacityGuard::layerComplexity(pathDocument(1000)) == 32);

        LayerDocument rich{LayerBase{}, TextboxLayer{}};
        rich.base.richText = std::vector<RichTextRun>(25);
        CHECK(CapacityGuard::layerComplexity(rich) == 5);
    }

    TEST_CASE("complex path sets are rejected") {
        Test::CollectingLog log;
        CapacityGuard       guard{unlimitedRates(), log.logger};

        std::vector<LayerDocument> paths(100, pathDocument(10));
        CHECK(CapacityGuard::complexityScore(paths) == 1200);
        CHECK_FALSE(guard.isComplexityAllowed(paths));

        SaveCapacityCheck check;
        check.principal = "user:1";
        check.layers    = paths;
        auto result     = guard.enforceSave(check);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::CapacityExceeded);
        CHECK(result.error().message->starts_with("Layer set too complex"));
        CHECK(log.contains("CapacityGuard", "capacity check failed"));

        auto simple = textDocuments(100);
        CHECK(guard.isComplexityAllowed(simple));
    }

    TEST_CASE("custom shapes are weighted by their path data") {
        CustomShapeLayer single;
        single.path = "M1e-5 2 L3 4 Z";
        CHECK(CapacityGuard::layerComplexity(LayerDocument{LayerBase{}, single}) == 12);

        // 12 + 100 sub-paths + 100 * 100 points / 50
        CHECK(CapacityGuard::layerComplexity(shapeDocument(100, 100)) == 312);
        CHECK(CapacityGuard::layerComplexity(shapeDocument(1, 2)) == 13);

        CustomShapeLayer svg;
        svg.svg = std::string(4096, ' ');
        CHECK(CapacityGuard::layerComplexity(LayerDocument{LayerBase{}, svg}) == 16);
    }

    TEST_CASE("sets of large custom shapes exceed the budget") {
        Test::CollectingLog log;
        CapacityGuard       guard{unlimitedRates(), log.logger};

        std::vector<LayerDocument> shapes(4, shapeDocument(100, 100));
        CHECK(CapacityGuard::complexityScore(shapes) == 1248);

        SaveCapacityCheck check;
        check.principal = "user:1";
        check.layers    = shapes;
        auto result     = guard.enforceSave(check);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::CapacityExceeded);
        CHECK(result.error().message->starts_with("Layer set too complex"));

        std::vector<LayerDocument> small(10, shapeDocument(1, 2));
        CHECK(guard.isComplexityAllowed(small));
    }

    TEST_CASE("enforceSave reports the first failing limit") {
        Test::CollectingLog log;
        CapacityGuard       guard{unlimitedRates(), log.logger};

        auto              layers = textDocuments(101);
        SaveCapacityCheck check;
        check.principal = "user:1";
        check.layers    = layers;
        check.dataBytes = 10 * 1024 * 1024;

        auto tooMany = guard.enforceSave(check);
        REQUIRE_FALSE(tooMany.has_value());
        CHECK(tooMany.error().message == "Too many layers: 101 (max: 100)");

        layers.pop_back();
        check.layers = layers;
        auto tooLarge = guard.enforceSave(check);
        REQUIRE_FALSE(tooLarge.has_value());
        CHECK(tooLarge.error().code == Error::Code::CapacityExceeded);
        CHECK(tooLarge.error().message->starts_with("Layer data too large"));

        check.dataBytes   = 1024;
        check.imageWidth  = 9000;
        check.imageHeight = 600;
        auto tooWide = guard.enforceSave(check);
        REQUIRE_FALSE(tooWide.has_value());
        CHECK(tooWide.error().message->starts_with("Image dimensions not supported"));

        check.imageWidth = 8192;
        CHECK(guard.enforceSave(check).has_value());
    }

    TEST_CASE("save rate limit applies per principal") {
        Test::CollectingLog log;
        CapacityConfig      config = unlimitedRates();
        config.saveRate            = {30, 10};
        CapacityGuard guard{config, log.logger};

        auto              layers = textDocuments(1);
        SaveCapacityCheck check;
        check.principal = "user:7";
        check.layers    = layers;

        auto const now = CapacityGuard::Clock::now();
        for (int i = 0; i < 10; ++i) {
            CAPTURE(i);
            CHECK(guard.enforceSave(check, now).has_value());
        }
        auto limited = guard.enforceSave(check, now);
        REQUIRE_FALSE(limited.has_value());
        CHECK(limited.error().code == Error::Code::RateLimited);
        CHECK(log.contains("CapacityGuard", "rate limit exceeded"));

        check.principal = "user:8";
        CHECK(guard.enforceSave(check, now).has_value());

        // 30 per minute refills one token every two seconds.
        check.principal = "user:7";
        CHECK(guard.enforceSave(check, now + 2100ms).has_value());
    }

    TEST_CASE("creating new sets has its own budget") {
        Test::CollectingLog log;
        CapacityConfig      config = unlimitedRates();
        config.createRate          = {10, 2};
        CapacityGuard guard{config, log.logger};

        auto              layers = textDocuments(1);
        SaveCapacityCheck check;
        check.principal     = "user:3";
        check.layers        = layers;
        check.createsNewSet = true;

        auto const now = CapacityGuard::Clock::now();
        CHECK(guard.enforceSave(check, now).has_value());
        CHECK(guard.enforceSave(check, now).has_value());
        auto limited = guard.enforceSave(check, now);
        REQUIRE_FALSE(limited.has_value());
        CHECK(limited.error().code == Error::Code::RateLimited);
        CHECK(limited.error().message == "Too many new layer sets, try again later");

        check.createsNewSet = false;
        CHECK(guard.enforceSave(check, now).has_value());
    }

    TEST_CASE("render checks use the render bucket") {
        Test::CollectingLog log;
        CapacityConfig      config = unlimitedRates();
        config.renderRate          = {60, 1};
        CapacityGuard guard{config, log.logger};

        auto const now = CapacityGuard::Clock::now();
        CHECK(guard.checkRateLimit("ip:1", RateAction::Render, now));
        CHECK_FALSE(guard.checkRateLimit("ip:1", RateAction::Render, now));
        CHECK(guard.checkRateLimit("ip:1", RateAction::Save, now));
    }

    TEST_CASE("rate action names") {
        CHECK(rateActionToString(RateAction::Create) == "create");
        CHECK(parseRateAction("render") == RateAction::Render);
        CHECK_FALSE(parseRateAction("delete").has_value());
    }
}
