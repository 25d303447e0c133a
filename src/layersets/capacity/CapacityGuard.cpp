#include <layersets/capacity/CapacityGuard.hpp>

#include <algorithm>
#include <string_view>
#include <utility>
#include <variant>

namespace LS {

namespace {

constexpr std::string_view kTag = "CapacityGuard";

constexpr std::int64_t kSimpleWeight    = 1;
constexpr std::int64_t kMediumWeight    = 3;
constexpr std::int64_t kComplexWeight   = 12;
constexpr std::int64_t kPointsPerUnit   = 50;
constexpr std::int64_t kRunsPerUnit     = 10;
constexpr std::int64_t kSvgBytesPerUnit = 1024;

// Coordinate pairs in SVG path data, counted from its numeric tokens.
auto pathDataPoints(std::string_view data) -> std::int64_t {
    std::int64_t numbers  = 0;
    bool         inNumber = false;
    bool         exponent = false;
    for (char ch : data) {
        bool const numeric = (ch >= '0' && ch <= '9') || ch == '.';
        if (numeric && !inNumber)
            ++numbers;
        bool const exponentSign = exponent && (ch == '-' || ch == '+');
        exponent                = inNumber && (ch == 'e' || ch == 'E');
        inNumber                = numeric || exponent || exponentSign;
    }
    return (numbers + 1) / 2;
}

auto customShapeWeight(CustomShapeLayer const& layer) -> std::int64_t {
    std::int64_t points = layer.path ? pathDataPoints(*layer.path) : 0;
    for (auto const& sub : layer.paths)
        points += pathDataPoints(sub.path);
    std::int64_t score = kComplexWeight + static_cast<std::int64_t>(layer.paths.size()) + points / kPointsPerUnit;
    if (layer.svg)
        score += static_cast<std::int64_t>(layer.svg->size()) / kSvgBytesPerUnit;
    return score;
}

struct ShapeWeight {
    auto operator()(TextLayer const&) const -> std::int64_t { return kSimpleWeight; }
    auto operator()(RectangleLayer const&) const -> std::int64_t { return kSimpleWeight; }
    auto operator()(CircleLayer const&) const -> std::int64_t { return kSimpleWeight; }
    auto operator()(EllipseLayer const&) const -> std::int64_t { return kSimpleWeight; }
    auto operator()(BlurLayer const&) const -> std::int64_t { return kSimpleWeight; }

    auto operator()(TextboxLayer const&) const -> std::int64_t { return kMediumWeight; }
    auto operator()(CalloutLayer const&) const -> std::int64_t { return kMediumWeight; }
    auto operator()(LineLayer const&) const -> std::int64_t { return kMediumWeight; }
    auto operator()(ArrowLayer const&) const -> std::int64_t { return kMediumWeight; }
    auto operator()(StarLayer const&) const -> std::int64_t { return kMediumWeight; }
    auto operator()(GroupLayer const&) const -> std::int64_t { return kMediumWeight; }
    auto operator()(ImageLayer const&) const -> std::int64_t { return kMediumWeight; }
    auto operator()(PolygonLayer const& layer) const -> std::int64_t {
        return kMediumWeight + static_cast<std::int64_t>(layer.points.size()) / kPointsPerUnit;
    }

    auto operator()(PathLayer const& layer) const -> std::int64_t {
        return kComplexWeight + static_cast<std::int64_t>(layer.points.size()) / kPointsPerUnit;
    }
    auto operator()(HighlightLayer const& layer) const -> std::int64_t {
        return kComplexWeight + static_cast<std::int64_t>(layer.points.size()) / kPointsPerUnit;
    }
    auto operator()(CustomShapeLayer const& layer) const -> std::int64_t { return customShapeWeight(layer); }
};

} // namespace

CapacityGuard::CapacityGuard(CapacityConfig config, TaggedLogger& logger)
    : config_(std::move(config))
    , logger_(logger)
    , limiter_(config_.maxRateBuckets) {
    limiter_.setLimit(RateAction::Save, config_.saveRate);
    limiter_.setLimit(RateAction::Render, config_.renderRate);
    limiter_.setLimit(RateAction::Create, config_.createRate);
}

auto CapacityGuard::isLayerCountAllowed(std::int64_t count) const -> bool {
    return count >= 0 && count <= static_cast<std::int64_t>(config_.maxLayerCount);
}

auto CapacityGuard::layerComplexity(LayerDocument const& layer) -> std::int64_t {
    auto score = std::visit(ShapeWeight{}, layer.shape);
    if (layer.base.richText)
        score += static_cast<std::int64_t>(layer.base.richText->size()) / kRunsPerUnit;
    return score;
}

auto CapacityGuard::complexityScore(std::span<LayerDocument const> layers) -> std::int64_t {
    std::int64_t total = 0;
    for (auto const& layer : layers)
        total += layerComplexity(layer);
    return total;
}

auto CapacityGuard::isComplexityAllowed(std::span<LayerDocument const> layers) const -> bool {
    return complexityScore(layers) <= config_.maxComplexity;
}

auto CapacityGuard::isImageSizeAllowed(std::optional<std::int64_t> width,
                                       std::optional<std::int64_t> height) const -> bool {
    if (!width || !height)
        return true;
    auto within = [&](std::int64_t value) { return value >= 1 && value <= config_.maxImageDimension; };
    return within(*width) && within(*height);
}

auto CapacityGuard::isDataSizeAllowed(std::int64_t bytes) const -> bool {
    return bytes >= 0 && bytes <= config_.maxBytes;
}

auto CapacityGuard::checkRateLimit(std::string_view principal, RateAction action, Clock::time_point now) -> bool {
    if (limiter_.allow(principal, action, now))
        return true;
    logger_.warning(kTag,
                    "rate limit exceeded",
                    {{"metric", "rate"},
                     {"action", std::string{rateActionToString(action)}},
                     {"principal", std::string{principal}}});
    return false;
}

auto CapacityGuard::reject(Error::Code      code,
                           std::string_view metric,
                           std::int64_t     value,
                           std::int64_t     limit,
                           std::string      message) const -> Expected<void> {
    logger_.warning(kTag,
                    "capacity check failed",
                    {{"metric", std::string{metric}}, {"value", std::to_string(value)}, {"limit", std::to_string(limit)}});
    return std::unexpected(Error{code, std::move(message)});
}

auto CapacityGuard::enforceSave(SaveCapacityCheck const& check, Clock::time_point now) -> Expected<void> {
    auto const count = static_cast<std::int64_t>(check.layers.size());
    if (!isLayerCountAllowed(count)) {
        return reject(Error::Code::CapacityExceeded, "layer_count", count,
                      static_cast<std::int64_t>(config_.maxLayerCount),
                      "Too many layers: " + std::to_string(count) + " (max: " + std::to_string(config_.maxLayerCount) + ")");
    }
    auto const complexity = complexityScore(check.layers);
    if (complexity > config_.maxComplexity) {
        return reject(Error::Code::CapacityExceeded, "complexity", complexity, config_.maxComplexity,
                      "Layer set too complex: " + std::to_string(complexity) + " (max: "
                          + std::to_string(config_.maxComplexity) + ")");
    }
    if (!isDataSizeAllowed(check.dataBytes)) {
        return reject(Error::Code::CapacityExceeded, "data_bytes", check.dataBytes, config_.maxBytes,
                      "Layer data too large: " + std::to_string(check.dataBytes) + " bytes (max: "
                          + std::to_string(config_.maxBytes) + ")");
    }
    if (!isImageSizeAllowed(check.imageWidth, check.imageHeight)) {
        auto const largest = std::max(check.imageWidth.value_or(0), check.imageHeight.value_or(0));
        return reject(Error::Code::CapacityExceeded, "image_dimension", largest, config_.maxImageDimension,
                      "Image dimensions not supported (max: " + std::to_string(config_.maxImageDimension) + ")");
    }
    if (!checkRateLimit(check.principal, RateAction::Save, now)) {
        return std::unexpected(Error{Error::Code::RateLimited, "Too many saves, try again later"});
    }
    if (check.createsNewSet && !checkRateLimit(check.principal, RateAction::Create, now)) {
        return std::unexpected(Error{Error::Code::RateLimited, "Too many new layer sets, try again later"});
    }
    return {};
}

} // namespace LS
