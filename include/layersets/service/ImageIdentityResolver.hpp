#pragma once

#include <layersets/core/Error.hpp>

#include <nlohmann/json.hpp>
#include <parallel_hashmap/phmap.h>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace LS {

struct ImageIdentity {
    std::string                 imageName;
    std::string                 contentHash;
    std::string                 mimeType;
    std::optional<std::int64_t> width;
    std::optional<std::int64_t> height;
    bool                        foreign = false;
};

// Trims, maps spaces to underscores and rejects characters that cannot appear in a file title.
[[nodiscard]] auto normalizeImageName(std::string_view raw) -> Expected<std::string>;

// Stable stand-in hash for remotely hosted files that expose none: "foreign_" + hex sha1(name).
[[nodiscard]] auto foreignFallbackHash(std::string_view imageName) -> std::string;

// Splits "image/png" into ("image", "png"); a value without a slash becomes (value, "").
[[nodiscard]] auto splitMimeType(std::string_view mime) -> std::pair<std::string, std::string>;

/*
 * Maps a logical image name to its current content identity. Returns NotFound when the
 * image is unknown.
 */
class ImageIdentityResolver {
public:
    virtual ~ImageIdentityResolver() = default;

    [[nodiscard]] virtual auto resolve(std::string_view imageName) -> Expected<ImageIdentity> = 0;
};

// In-memory registry, optionally loaded from a JSON manifest of the form
// { "<name>": { "sha1": "...", "mime": "...", "width": N, "height": N, "foreign": bool } }.
class StaticImageIdentityResolver final : public ImageIdentityResolver {
public:
    StaticImageIdentityResolver() = default;

    [[nodiscard]] static auto fromJson(nlohmann::json const& manifest) -> Expected<StaticImageIdentityResolver>;

    auto registerImage(ImageIdentity identity) -> Expected<void>;

    [[nodiscard]] auto resolve(std::string_view imageName) -> Expected<ImageIdentity> override;

    StaticImageIdentityResolver(StaticImageIdentityResolver&& other) noexcept;
    StaticImageIdentityResolver& operator=(StaticImageIdentityResolver&&) = delete;

private:
    phmap::flat_hash_map<std::string, ImageIdentity> images_;
    mutable std::mutex                               mutex_;
};

} // namespace LS
