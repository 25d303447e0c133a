#pragma once

#include <parallel_hashmap/phmap.h>
#include <parallel_hashmap/phmap_utils.h>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace LS {

enum class RateAction {
    Save,
    Render,
    Create
};

inline constexpr std::size_t kRateActionCount = 3;

[[nodiscard]] auto rateActionToString(RateAction action) -> std::string_view;
[[nodiscard]] auto parseRateAction(std::string_view name) -> std::optional<RateAction>;

// A non-positive rate or burst leaves the action unlimited.
struct RateLimitSettings {
    std::int64_t perMinute = 0;
    std::int64_t burst     = 0;
};

/*
 * Token buckets keyed by (principal, action), each action with its own rate and burst.
 *
 * The table is bounded. When a new key arrives at a full table, buckets that have
 * refilled to their burst are dropped first, since a fresh bucket behaves the same.
 * If none has, the fullest bucket is evicted, so principals that spent their budget
 * are the last to lose their state.
 */
class TokenBucketRateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::size_t kDefaultMaxBuckets = 4096;

    explicit TokenBucketRateLimiter(std::size_t maxBuckets = kDefaultMaxBuckets);

    auto setLimit(RateAction action, RateLimitSettings settings) -> void;
    [[nodiscard]] auto limited(RateAction action) const -> bool;

    // Consumes a token when allowed.
    auto allow(std::string_view principal, RateAction action, Clock::time_point now = Clock::now()) -> bool;

    // Tokens left for the key at `now`; the burst size for keys without a bucket.
    [[nodiscard]] auto available(std::string_view principal, RateAction action, Clock::time_point now = Clock::now()) const
        -> double;

    [[nodiscard]] auto trackedKeys() const -> std::size_t;
    [[nodiscard]] auto maxBuckets() const -> std::size_t { return maxBuckets_; }

private:
    struct BucketKey {
        std::string principal;
        RateAction  action = RateAction::Save;

        bool operator==(BucketKey const&) const = default;

        friend auto hash_value(BucketKey const& key) -> std::size_t {
            return phmap::HashState().combine(0, key.principal, static_cast<int>(key.action));
        }
    };

    struct Bucket {
        double            tokens = 0.0;
        Clock::time_point lastRefill{};
    };

    struct ActionLimit {
        double capacity        = 0.0;
        double refillPerSecond = 0.0;

        [[nodiscard]] auto enabled() const -> bool { return capacity > 0.0 && refillPerSecond > 0.0; }
    };

    [[nodiscard]] auto limitFor(RateAction action) const -> ActionLimit const&;
    [[nodiscard]] auto tokensAt(Bucket const& bucket, ActionLimit const& limit, Clock::time_point now) const -> double;
    auto makeRoomLocked(Clock::time_point now) -> void;

    std::size_t                                    maxBuckets_;
    std::array<ActionLimit, kRateActionCount>      limits_{};
    phmap::flat_hash_map<BucketKey, Bucket>        buckets_;
    mutable std::mutex                             mutex_;
};

} // namespace LS
