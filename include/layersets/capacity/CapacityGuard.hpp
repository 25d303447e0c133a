#pragma once

#include <layersets/capacity/TokenBucketRateLimiter.hpp>
#include <layersets/core/Error.hpp>
#include <layersets/log/TaggedLogger.hpp>
#include <layersets/model/LayerDocument.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace LS {

struct CapacityConfig {
    std::size_t       maxLayerCount     = 100;
    std::int64_t      maxComplexity     = 1000;
    std::int64_t      maxImageDimension = 8192;
    std::int64_t      maxBytes          = 2 * 1024 * 1024;
    RateLimitSettings saveRate{30, 10};
    RateLimitSettings renderRate{120, 30};
    RateLimitSettings createRate{10, 5};
    std::size_t       maxRateBuckets = TokenBucketRateLimiter::kDefaultMaxBuckets;
};

struct SaveCapacityCheck {
    std::string                     principal;
    std::span<LayerDocument const>  layers;
    std::int64_t                    dataBytes = 0;
    std::optional<std::int64_t>     imageWidth;
    std::optional<std::int64_t>     imageHeight;
    bool                            createsNewSet = false;
};

/*
 * Resource limits applied to validated layer sets before they reach storage.
 * Rate limiting is per (principal, action) and in-process.
 */
class CapacityGuard {
public:
    using Clock = TokenBucketRateLimiter::Clock;

    CapacityGuard(CapacityConfig config, TaggedLogger& logger);

    [[nodiscard]] auto isLayerCountAllowed(std::int64_t count) const -> bool;

    [[nodiscard]] static auto layerComplexity(LayerDocument const& layer) -> std::int64_t;
    [[nodiscard]] static auto complexityScore(std::span<LayerDocument const> layers) -> std::int64_t;
    [[nodiscard]] auto        isComplexityAllowed(std::span<LayerDocument const> layers) const -> bool;

    // Unknown dimensions are allowed.
    [[nodiscard]] auto isImageSizeAllowed(std::optional<std::int64_t> width,
                                          std::optional<std::int64_t> height) const -> bool;

    [[nodiscard]] auto isDataSizeAllowed(std::int64_t bytes) const -> bool;

    // Consumes a token when allowed.
    [[nodiscard]] auto checkRateLimit(std::string_view  principal,
                                      RateAction        action,
                                      Clock::time_point now = Clock::now()) -> bool;

    // Runs every check a save needs; the first failure is returned as a typed error.
    [[nodiscard]] auto enforceSave(SaveCapacityCheck const& check, Clock::time_point now = Clock::now())
        -> Expected<void>;

    [[nodiscard]] auto config() const -> CapacityConfig const& { return config_; }

private:
    auto reject(Error::Code code, std::string_view metric, std::int64_t value, std::int64_t limit,
                std::string message) const -> Expected<void>;

    CapacityConfig         config_;
    TaggedLogger&          logger_;
    TokenBucketRateLimiter limiter_;
};

} // namespace LS
