#pragma once

#include <layersets/model/LayerDocument.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace LS {

inline constexpr int kPayloadSchemaVersion = 1;

// The document persisted in each revision row.
struct LayerSetPayload {
    int                        schemaVersion = kPayloadSchemaVersion;
    std::string                createdAt;
    std::vector<LayerDocument> layers;
    bool                       backgroundVisible = true;
    double                     backgroundOpacity = 1.0;

    bool operator==(LayerSetPayload const&) const = default;
};

/*
 * One immutable stored revision of a named set. Identity is
 * (imageName, contentHash, setName, revision); id is the row key and is never reused.
 */
struct LayerSetRevision {
    std::int64_t    id         = 0;
    std::string     imageName;
    std::string     contentHash;
    std::string     setName;
    std::int64_t    revision   = 0;
    std::int64_t    userId     = 0;
    std::string     timestamp;
    std::int64_t    sizeBytes  = 0;
    std::int64_t    layerCount = 0;
    std::string     majorMime;
    std::string     minorMime;
    LayerSetPayload payload;
};

struct RevisionSummary {
    std::int64_t id         = 0;
    std::int64_t revision   = 0;
    std::int64_t userId     = 0;
    std::string  timestamp;
    std::int64_t sizeBytes  = 0;
    std::int64_t layerCount = 0;
    std::string  setName;
};

struct NamedSetSummary {
    std::string                 setName;
    std::int64_t                revisionCount    = 0;
    std::int64_t                latestRevision   = 0;
    std::int64_t                latestRevisionId = 0;
    std::int64_t                latestUserId     = 0;
    std::string                 latestTimestamp;
    std::optional<std::int64_t> creatorUserId;
};

} // namespace LS
