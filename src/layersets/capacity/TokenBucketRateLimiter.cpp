#include <layersets/capacity/TokenBucketRateLimiter.hpp>

#include <algorithm>

namespace LS {

namespace {

constexpr std::string_view kUnknownPrincipal = "<unknown>";

auto actionIndex(RateAction action) -> std::size_t {
    return static_cast<std::size_t>(action);
}

} // namespace

auto rateActionToString(RateAction action) -> std::string_view {
    switch (action) {
    case RateAction::Save:
        return "save";
    case RateAction::Render:
        return "render";
    case RateAction::Create:
        return "create";
    }
    return "save";
}

auto parseRateAction(std::string_view name) -> std::optional<RateAction> {
    if (name == "save")
        return RateAction::Save;
    if (name == "render")
        return RateAction::Render;
    if (name == "create")
        return RateAction::Create;
    return std::nullopt;
}

TokenBucketRateLimiter::TokenBucketRateLimiter(std::size_t maxBuckets)
    : maxBuckets_(std::max<std::size_t>(maxBuckets, 1)) {}

auto TokenBucketRateLimiter::setLimit(RateAction action, RateLimitSettings settings) -> void {
    ActionLimit limit;
    if (settings.perMinute > 0 && settings.burst > 0) {
        limit.capacity        = static_cast<double>(settings.burst);
        limit.refillPerSecond = static_cast<double>(settings.perMinute) / 60.0;
    }
    std::lock_guard const lock{mutex_};
    limits_[actionIndex(action)] = limit;
    // Buckets of this action were filled under the old limit.
    for (auto it = buckets_.begin(); it != buckets_.end();) {
        if (it->first.action == action)
            buckets_.erase(it++);
        else
            ++it;
    }
}

auto TokenBucketRateLimiter::limited(RateAction action) const -> bool {
    std::lock_guard const lock{mutex_};
    return limitFor(action).enabled();
}

auto TokenBucketRateLimiter::limitFor(RateAction action) const -> ActionLimit const& {
    return limits_[actionIndex(action)];
}

auto TokenBucketRateLimiter::tokensAt(Bucket const& bucket, ActionLimit const& limit, Clock::time_point now) const
    -> double {
    if (now <= bucket.lastRefill)
        return bucket.tokens;
    auto const elapsed = std::chrono::duration<double>(now - bucket.lastRefill).count();
    return std::min(limit.capacity, bucket.tokens + elapsed * limit.refillPerSecond);
}

auto TokenBucketRateLimiter::allow(std::string_view principal, RateAction action, Clock::time_point now) -> bool {
    std::lock_guard const lock{mutex_};
    auto const& limit = limitFor(action);
    if (!limit.enabled())
        return true;

    BucketKey key{std::string{principal.empty() ? kUnknownPrincipal : principal}, action};
    auto      it = buckets_.find(key);
    if (it == buckets_.end()) {
        if (buckets_.size() >= maxBuckets_)
            makeRoomLocked(now);
        it = buckets_.emplace(std::move(key), Bucket{limit.capacity, now}).first;
    }

    auto& bucket      = it->second;
    bucket.tokens     = tokensAt(bucket, limit, now);
    bucket.lastRefill = std::max(bucket.lastRefill, now);
    if (bucket.tokens < 1.0)
        return false;
    bucket.tokens -= 1.0;
    return true;
}

auto TokenBucketRateLimiter::available(std::string_view principal, RateAction action, Clock::time_point now) const
    -> double {
    std::lock_guard const lock{mutex_};
    auto const& limit = limitFor(action);
    auto        it    = buckets_.find(BucketKey{std::string{principal.empty() ? kUnknownPrincipal : principal}, action});
    if (it == buckets_.end())
        return limit.capacity;
    return tokensAt(it->second, limit, now);
}

auto TokenBucketRateLimiter::trackedKeys() const -> std::size_t {
    std::lock_guard const lock{mutex_};
    return buckets_.size();
}

auto TokenBucketRateLimiter::makeRoomLocked(Clock::time_point now) -> void {
    auto   fullest       = buckets_.end();
    double fullestTokens = -1.0;
    for (auto it = buckets_.begin(); it != buckets_.end();) {
        auto const& limit  = limitFor(it->first.action);
        auto const  tokens = tokensAt(it->second, limit, now);
        if (!limit.enabled() || tokens >= limit.capacity) {
            buckets_.erase(it++);
            continue;
        }
        if (tokens > fullestTokens) {
            fullestTokens = tokens;
            fullest       = it;
        }
        ++it;
    }
    if (buckets_.size() < maxBuckets_)
        return;
    if (fullest != buckets_.end())
        buckets_.erase(fullest);
}

} // namespace LS
