#include <layersets/service/LayerSetService.hpp>

#include <layersets/validation/Sanitizers.hpp>

#include <algorithm>
#include <cmath>
#include <span>
#include <tuple>
#include <utility>

namespace LS {

namespace {

constexpr std::string_view kTag = "LayerSetService";

auto joinMessages(std::vector<std::string> const& messages) -> std::string {
    std::string joined;
    for (auto const& message : messages) {
        if (!joined.empty())
            joined.append("; ");
        joined.append(message);
    }
    return joined;
}

} // namespace

LayerSetService::LayerSetService(LayerSetServiceConfig  config,
                                 LayerValidator const&  validator,
                                 CapacityGuard&         guard,
                                 RevisionStore&         store,
                                 ImageIdentityResolver& resolver,
                                 TaggedLogger&          logger)
    : config_(std::move(config))
    , validator_(validator)
    , guard_(guard)
    , store_(store)
    , resolver_(resolver)
    , logger_(logger) {}

auto LayerSetService::parseLayers(std::string const& raw) const -> Expected<ParsedLayers> {
    auto json = nlohmann::json::parse(raw, nullptr, false);
    if (json.is_discarded()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "Layer data is not valid JSON"});
    }

    ParsedLayers parsed;
    if (json.is_array()) {
        parsed.layers = std::move(json);
        return parsed;
    }
    if (json.is_object()) {
        auto layers = json.find("layers");
        if (layers == json.end() || !layers->is_array()) {
            return std::unexpected(Error{Error::Code::MalformedInput, "Layer data object requires a layers array"});
        }
        parsed.layers = std::move(*layers);
        if (auto visible = json.find("backgroundVisible"); visible != json.end()) {
            if (visible->is_boolean())
                parsed.backgroundVisible = visible->get<bool>();
            else if (visible->is_number())
                parsed.backgroundVisible = visible->get<double>() != 0.0;
        }
        if (auto opacity = json.find("backgroundOpacity"); opacity != json.end() && opacity->is_number()) {
            auto const value = opacity->get<double>();
            parsed.backgroundOpacity = std::isfinite(value) ? std::clamp(value, 0.0, 1.0) : 1.0;
        }
        return parsed;
    }
    return std::unexpected(Error{Error::Code::MalformedInput, "Layer data must be an array or an object"});
}

auto LayerSetService::resolveHash(std::string const& imageName) -> Expected<std::string> {
    auto identity = resolver_.resolve(imageName);
    if (!identity)
        return std::unexpected(identity.error());
    if (identity->contentHash.empty()) {
        return std::unexpected(Error{Error::Code::InvalidParameter, "No content hash available for " + imageName});
    }
    return identity->contentHash;
}

auto LayerSetService::save(SaveLayerSetRequest const& request) -> Expected<SaveLayerSetResult> {
    if (request.userId <= 0) {
        return std::unexpected(Error{Error::Code::InvalidParameter, "A positive user id is required"});
    }
    auto imageName = normalizeImageName(request.imageName);
    if (!imageName)
        return std::unexpected(imageName.error());

    auto const rawBytes = static_cast<std::int64_t>(request.rawLayers.size());
    if (rawBytes > config_.maxBytes) {
        logger_.warning(kTag,
                        "capacity check failed",
                        {{"metric", "raw_bytes"},
                         {"value", std::to_string(rawBytes)},
                         {"limit", std::to_string(config_.maxBytes)}});
        return std::unexpected(Error{Error::Code::CapacityExceeded,
                                     "Layer data too large: " + std::to_string(rawBytes) + " bytes (max: "
                                         + std::to_string(config_.maxBytes) + ")"});
    }

    auto parsed = parseLayers(request.rawLayers);
    if (!parsed)
        return std::unexpected(parsed.error());

    auto const setName = Sanitize::sanitizeSetName(request.setName.value_or(std::string{}), config_.defaultSetName);

    auto const layerCount = static_cast<std::int64_t>(parsed->layers.size());
    if (!guard_.isLayerCountAllowed(layerCount)) {
        logger_.warning(kTag,
                        "capacity check failed",
                        {{"metric", "layer_count"},
                         {"value", std::to_string(layerCount)},
                         {"limit", std::to_string(guard_.config().maxLayerCount)}});
        return std::unexpected(Error{Error::Code::CapacityExceeded,
                                     "Too many layers: " + std::to_string(layerCount) + " (max: "
                                         + std::to_string(guard_.config().maxLayerCount) + ")"});
    }

    auto validated = validator_.validateLayers(parsed->layers);
    if (!validated.isValid()) {
        auto messages = validated.errorMessages();
        logger_.warning(kTag,
                        "layer validation failed",
                        {{"image", *imageName}, {"errors", std::to_string(messages.size())}});
        return std::unexpected(Error{Error::Code::ValidationFailed, "Layer validation failed", std::move(messages)});
    }
    auto warnings = validated.warningMessages();
    if (!warnings.empty()) {
        logger_.info(kTag, "layer validation warnings", {{"image", *imageName}, {"warnings", joinMessages(warnings)}});
    }
    auto layers = validated.takeData();

    std::optional<ImageIdentity> identity;
    if (auto resolved = resolver_.resolve(*imageName)) {
        identity = std::move(*resolved);
    } else if (resolved.error().code != Error::Code::NotFound || !request.contentHash || request.contentHash->empty()) {
        return std::unexpected(resolved.error());
    }
    std::string contentHash;
    if (request.contentHash && !request.contentHash->empty())
        contentHash = *request.contentHash;
    else if (identity)
        contentHash = identity->contentHash;
    if (contentHash.empty()) {
        return std::unexpected(Error{Error::Code::InvalidParameter, "No content hash available for " + *imageName});
    }
    if (identity && identity->foreign && contentHash.starts_with("foreign_")) {
        logger_.warning(kTag, "using fallback hash for foreign file", {{"image", *imageName}, {"hash", contentHash}});
    }

    auto exists = store_.namedSetExists(*imageName, contentHash, setName);
    if (!exists)
        return std::unexpected(exists.error());

    SaveCapacityCheck check;
    check.principal     = request.principal.empty() ? "user:" + std::to_string(request.userId) : request.principal;
    check.layers        = std::span<LayerDocument const>{layers};
    check.dataBytes     = rawBytes;
    check.createsNewSet = !*exists;
    if (identity) {
        check.imageWidth  = identity->width;
        check.imageHeight = identity->height;
    }
    if (auto allowed = guard_.enforceSave(check); !allowed)
        return std::unexpected(allowed.error());

    SaveRevisionRequest write;
    write.imageName         = *imageName;
    write.contentHash       = contentHash;
    write.setName           = setName;
    write.userId            = request.userId;
    write.layers            = std::move(layers);
    write.backgroundVisible = parsed->backgroundVisible;
    write.backgroundOpacity = parsed->backgroundOpacity;
    if (identity) {
        std::tie(write.majorMime, write.minorMime) = splitMimeType(identity->mimeType);
    }

    auto saved = store_.save(write);
    if (!saved)
        return std::unexpected(saved.error());

    SaveLayerSetResult result;
    result.revisionId  = saved->id;
    result.revision    = saved->revision;
    result.setName     = setName;
    result.contentHash = std::move(contentHash);
    result.prunedCount = saved->prunedCount;
    result.warnings    = std::move(warnings);
    return result;
}

auto LayerSetService::load(std::string_view imageName, std::optional<std::string_view> setName)
    -> Expected<std::optional<NamedSetLookup>> {
    auto name = normalizeImageName(imageName);
    if (!name)
        return std::unexpected(name.error());
    auto hash = resolveHash(*name);
    if (!hash)
        return std::unexpected(hash.error());
    auto const set = Sanitize::sanitizeSetName(setName.value_or(std::string_view{}), config_.defaultSetName);
    return store_.getByName(*name, *hash, set);
}

auto LayerSetService::loadRevision(std::int64_t id) -> Expected<std::optional<LayerSetRevision>> {
    return store_.getById(id);
}

auto LayerSetService::listSets(std::string_view imageName) -> Expected<std::vector<NamedSetSummary>> {
    auto name = normalizeImageName(imageName);
    if (!name)
        return std::unexpected(name.error());
    auto hash = resolveHash(*name);
    if (!hash)
        return std::unexpected(hash.error());
    return store_.listNamedSets(*name, *hash);
}

auto LayerSetService::listRevisions(std::string_view imageName, std::string_view setName, std::int64_t limit)
    -> Expected<std::vector<RevisionSummary>> {
    auto name = normalizeImageName(imageName);
    if (!name)
        return std::unexpected(name.error());
    auto hash = resolveHash(*name);
    if (!hash)
        return std::unexpected(hash.error());
    return store_.listRevisions(*name, *hash, Sanitize::sanitizeSetName(setName, config_.defaultSetName), limit);
}

auto LayerSetService::checkSetPermission(std::string const&      imageName,
                                         std::string const&      contentHash,
                                         std::string const&      setName,
                                         SetActionRequest const& request) -> Expected<void> {
    auto owner = store_.getNamedSetOwner(imageName, contentHash, setName);
    if (!owner)
        return std::unexpected(owner.error());
    if (!*owner) {
        return std::unexpected(Error{Error::Code::NotFound, "Layer set not found: " + setName});
    }
    if (**owner != request.userId && !request.isAdmin) {
        logger_.warning(kTag,
                        "set permission denied",
                        {{"image", imageName}, {"set", setName}, {"userId", std::to_string(request.userId)}});
        return std::unexpected(Error{Error::Code::InvalidPermissions,
                                     "Only the creator of a layer set or an administrator may change it"});
    }
    return {};
}

auto LayerSetService::renameSet(SetActionRequest const& request) -> Expected<std::int64_t> {
    if (request.userId <= 0) {
        return std::unexpected(Error{Error::Code::InvalidParameter, "A positive user id is required"});
    }
    if (!Sanitize::isValidSetName(request.newName)) {
        return std::unexpected(Error{Error::Code::InvalidParameter, "Invalid set name"});
    }
    auto name = normalizeImageName(request.imageName);
    if (!name)
        return std::unexpected(name.error());
    auto hash = resolveHash(*name);
    if (!hash)
        return std::unexpected(hash.error());

    auto const from = Sanitize::sanitizeSetName(request.setName, config_.defaultSetName);
    auto const to   = Sanitize::sanitizeSetName(request.newName, config_.defaultSetName);
    if (auto permitted = checkSetPermission(*name, *hash, from, request); !permitted)
        return std::unexpected(permitted.error());
    return store_.renameNamedSet(*name, *hash, from, to);
}

auto LayerSetService::deleteSet(SetActionRequest const& request) -> Expected<std::int64_t> {
    if (request.userId <= 0) {
        return std::unexpected(Error{Error::Code::InvalidParameter, "A positive user id is required"});
    }
    auto name = normalizeImageName(request.imageName);
    if (!name)
        return std::unexpected(name.error());
    auto hash = resolveHash(*name);
    if (!hash)
        return std::unexpected(hash.error());

    auto const set = Sanitize::sanitizeSetName(request.setName, config_.defaultSetName);
    if (auto permitted = checkSetPermission(*name, *hash, set, request); !permitted)
        return std::unexpected(permitted.error());
    return store_.deleteNamedSet(*name, *hash, set);
}

auto LayerSetService::authorizeRender(std::string_view principal) -> Expected<void> {
    if (!guard_.checkRateLimit(principal, RateAction::Render)) {
        return std::unexpected(Error{Error::Code::RateLimited, "Too many render requests, try again later"});
    }
    return {};
}

} // namespace LS
