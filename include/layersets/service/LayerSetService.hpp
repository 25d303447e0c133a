#pragma once

#include <layersets/capacity/CapacityGuard.hpp>
#include <layersets/core/Error.hpp>
#include <layersets/log/TaggedLogger.hpp>
#include <layersets/service/ImageIdentityResolver.hpp>
#include <layersets/storage/RevisionStore.hpp>
#include <layersets/validation/LayerValidator.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace LS {

struct LayerSetServiceConfig {
    std::int64_t maxBytes       = 2 * 1024 * 1024;
    std::string  defaultSetName = "default";
};

struct SaveLayerSetRequest {
    std::string                imageName;
    std::optional<std::string> contentHash;
    std::optional<std::string> setName;
    // Either a JSON array of layers or {layers, backgroundVisible, backgroundOpacity}.
    std::string                rawLayers;
    std::int64_t               userId = 0;
    // Rate-limit key; defaults to "user:<userId>".
    std::string                principal;
};

struct SaveLayerSetResult {
    std::int64_t             revisionId  = 0;
    std::int64_t             revision    = 0;
    std::string              setName;
    std::string              contentHash;
    std::int64_t             prunedCount = 0;
    std::vector<std::string> warnings;
};

struct SetActionRequest {
    std::string  imageName;
    std::string  setName;
    std::string  newName;
    std::int64_t userId  = 0;
    bool         isAdmin = false;
};

/*
 * Write and read entry point for layer sets: raw input is parsed, validated, checked
 * against capacity limits and handed to the store. All collaborators are injected.
 */
class LayerSetService {
public:
    LayerSetService(LayerSetServiceConfig  config,
                    LayerValidator const&  validator,
                    CapacityGuard&         guard,
                    RevisionStore&         store,
                    ImageIdentityResolver& resolver,
                    TaggedLogger&          logger);

    [[nodiscard]] auto save(SaveLayerSetRequest const& request) -> Expected<SaveLayerSetResult>;

    [[nodiscard]] auto load(std::string_view imageName, std::optional<std::string_view> setName = std::nullopt)
        -> Expected<std::optional<NamedSetLookup>>;
    [[nodiscard]] auto loadRevision(std::int64_t id) -> Expected<std::optional<LayerSetRevision>>;

    [[nodiscard]] auto listSets(std::string_view imageName) -> Expected<std::vector<NamedSetSummary>>;
    [[nodiscard]] auto listRevisions(std::string_view imageName, std::string_view setName, std::int64_t limit = 50)
        -> Expected<std::vector<RevisionSummary>>;

    [[nodiscard]] auto renameSet(SetActionRequest const& request) -> Expected<std::int64_t>;
    [[nodiscard]] auto deleteSet(SetActionRequest const& request) -> Expected<std::int64_t>;

    [[nodiscard]] auto authorizeRender(std::string_view principal) -> Expected<void>;

private:
    struct ParsedLayers {
        nlohmann::json layers;
        bool           backgroundVisible = true;
        double         backgroundOpacity = 1.0;
    };

    [[nodiscard]] auto parseLayers(std::string const& raw) const -> Expected<ParsedLayers>;
    [[nodiscard]] auto resolveHash(std::string const& imageName) -> Expected<std::string>;
    [[nodiscard]] auto checkSetPermission(std::string const& imageName, std::string const& contentHash,
                                          std::string const& setName, SetActionRequest const& request)
        -> Expected<void>;

    LayerSetServiceConfig  config_;
    LayerValidator const&  validator_;
    CapacityGuard&         guard_;
    RevisionStore&         store_;
    ImageIdentityResolver& resolver_;
    TaggedLogger&          logger_;
};

} // namespace LS
