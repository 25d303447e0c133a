#pragma once

#include <layersets/core/Error.hpp>
#include <layersets/log/TaggedLogger.hpp>
#include <layersets/model/LayerDocument.hpp>
#include <layersets/model/LayerSetRevision.hpp>

#include <parallel_hashmap/phmap.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace LS {

namespace Storage {
class SqliteConnection;
class SqliteTransaction;
} // namespace Storage

struct RevisionStoreConfig {
    std::string               databasePath       = "layersets.db";
    std::int64_t              maxBytes           = 2 * 1024 * 1024;
    std::int64_t              maxNamedSets       = 15;
    std::int64_t              maxRevisionsPerSet = 25;
    std::string               defaultSetName     = "default";
    std::chrono::milliseconds busyTimeout{5000};
    std::size_t               cacheCapacity   = 100;
    int                       maxSaveAttempts = 3;
    std::chrono::milliseconds retryBackoff{100};
    bool                      walMode = true;
};

struct SaveRevisionRequest {
    std::string                imageName;
    std::string                contentHash;
    std::string                setName;
    std::int64_t               userId = 0;
    std::vector<LayerDocument> layers;
    bool                       backgroundVisible = true;
    double                     backgroundOpacity = 1.0;
    std::string                majorMime;
    std::string                minorMime;
};

struct SavedRevision {
    std::int64_t id          = 0;
    std::int64_t revision    = 0;
    std::int64_t sizeBytes   = 0;
    std::int64_t prunedCount = 0;
    bool         createdSet  = false;
};

// Result of a by-name read. resolvedContentHash differs from the requested hash when
// the lookup fell back to the most recent row of the set under any hash.
struct NamedSetLookup {
    LayerSetRevision revision;
    std::string      resolvedContentHash;
    bool             usedFallback = false;
};

/*
 * SQLite-backed store of immutable layer set revisions.
 *
 * Revision allocation, the named-set gate, the insert and automatic pruning run in one
 * BEGIN IMMEDIATE transaction, so concurrent writers (threads or processes sharing the
 * database file) never receive the same revision number. Within a process the
 * connection is serialized by a recursive mutex.
 */
class RevisionStore {
public:
    using Timeout = std::optional<std::chrono::milliseconds>;

private:
    // The store mutex plus the connection busy timeout of one acquisition. Releasing puts
    // back the timeout that was in force before, so nested acquisitions unwind in order.
    class StoreLock {
    public:
        StoreLock(std::unique_lock<std::recursive_timed_mutex> lock,
                  Storage::SqliteConnection&                   db,
                  std::chrono::milliseconds                    wait);
        StoreLock(StoreLock&& other) noexcept;
        StoreLock& operator=(StoreLock&&) = delete;
        ~StoreLock();

        auto release() -> void;

    private:
        std::unique_lock<std::recursive_timed_mutex> lock_;
        Storage::SqliteConnection*                   db_ = nullptr;
        std::chrono::milliseconds                    previous_{0};
    };

public:
    // Holds the store lock and an open transaction until commit() or destruction.
    class Transaction {
    public:
        Transaction(Transaction&&) noexcept;
        Transaction& operator=(Transaction&&) = delete;
        ~Transaction();

        [[nodiscard]] auto commit() -> Expected<void>;

    private:
        friend class RevisionStore;
        Transaction(StoreLock lock, std::unique_ptr<Storage::SqliteTransaction> tx);

        StoreLock                                   lock_;
        std::unique_ptr<Storage::SqliteTransaction> tx_;
    };

    [[nodiscard]] static auto open(RevisionStoreConfig config, TaggedLogger& logger)
        -> Expected<std::unique_ptr<RevisionStore>>;

    ~RevisionStore();

    RevisionStore(RevisionStore const&)            = delete;
    RevisionStore& operator=(RevisionStore const&) = delete;

    [[nodiscard]] auto save(SaveRevisionRequest const& request, Timeout timeout = std::nullopt)
        -> Expected<SavedRevision>;

    // Rows are immutable, so hits are served from a bounded cache.
    [[nodiscard]] auto getById(std::int64_t id) -> Expected<std::optional<LayerSetRevision>>;

    // Never cached.
    [[nodiscard]] auto getLatest(std::string_view                imageName,
                                 std::string_view                contentHash,
                                 std::optional<std::string_view> setName = std::nullopt)
        -> Expected<std::optional<LayerSetRevision>>;

    [[nodiscard]] auto getByName(std::string_view imageName, std::string_view contentHash, std::string_view setName)
        -> Expected<std::optional<NamedSetLookup>>;

    // Newest first; limit is clamped to [1, 200].
    [[nodiscard]] auto listRevisions(std::string_view imageName,
                                     std::string_view contentHash,
                                     std::string_view setName,
                                     std::int64_t     limit = 50) -> Expected<std::vector<RevisionSummary>>;

    [[nodiscard]] auto listNamedSets(std::string_view imageName, std::string_view contentHash)
        -> Expected<std::vector<NamedSetSummary>>;

    // Returns the number of rows deleted.
    [[nodiscard]] auto pruneOldRevisions(std::string_view imageName,
                                         std::string_view contentHash,
                                         std::string_view setName,
                                         std::int64_t     keepCount) -> Expected<std::int64_t>;

    // Best effort; failures are logged. An empty contentHash removes rows under every hash.
    auto deleteAllForImage(std::string_view imageName, std::string_view contentHash) -> bool;

    [[nodiscard]] auto deleteNamedSet(std::string_view imageName, std::string_view contentHash, std::string_view setName)
        -> Expected<std::int64_t>;

    [[nodiscard]] auto renameNamedSet(std::string_view imageName,
                                      std::string_view contentHash,
                                      std::string_view fromName,
                                      std::string_view toName) -> Expected<std::int64_t>;

    [[nodiscard]] auto namedSetExists(std::string_view imageName, std::string_view contentHash, std::string_view setName)
        -> Expected<bool>;

    [[nodiscard]] auto countNamedSets(std::string_view imageName, std::string_view contentHash) -> Expected<std::int64_t>;

    // Creator of the first revision of the set.
    [[nodiscard]] auto getNamedSetOwner(std::string_view imageName, std::string_view contentHash, std::string_view setName)
        -> Expected<std::optional<std::int64_t>>;

    // Content hash of the most recent row of the set under any hash.
    [[nodiscard]] auto findSetContentHash(std::string_view imageName, std::string_view setName)
        -> Expected<std::optional<std::string>>;

    [[nodiscard]] auto beginTransaction(Timeout timeout = std::nullopt) -> Expected<Transaction>;

    [[nodiscard]] auto config() const -> RevisionStoreConfig const& { return config_; }

    // SQLite busy timeout currently set on the connection.
    [[nodiscard]] auto connectionBusyTimeout() const -> std::chrono::milliseconds;

private:
    RevisionStore(RevisionStoreConfig config, TaggedLogger& logger, std::unique_ptr<Storage::SqliteConnection> db);

    auto initializeSchema() -> Expected<void>;
    auto acquire(Timeout timeout) -> Expected<StoreLock>;
    auto saveAttempt(SaveRevisionRequest const& request, std::string_view setName, std::string const& blob,
                     std::string const& timestamp, std::int64_t layerCount) -> Expected<SavedRevision>;
    auto pruneLocked(std::string_view imageName, std::string_view contentHash, std::string_view setName,
                     std::int64_t keepCount) -> Expected<std::int64_t>;
    auto countNamedSetsLocked(std::string_view imageName, std::string_view contentHash) -> Expected<std::int64_t>;
    auto namedSetExistsLocked(std::string_view imageName, std::string_view contentHash, std::string_view setName)
        -> Expected<bool>;
    auto latestLocked(std::string_view imageName, std::string_view contentHash, std::string_view setName)
        -> Expected<std::optional<LayerSetRevision>>;
    auto resolveSetName(std::string_view setName) const -> std::string;

    auto cacheLookup(std::int64_t id) const -> std::optional<LayerSetRevision>;
    auto cacheInsert(LayerSetRevision const& revision) -> void;
    auto cacheClear() -> void;

    RevisionStoreConfig                        config_;
    TaggedLogger&                              logger_;
    std::unique_ptr<Storage::SqliteConnection> db_;
    mutable std::recursive_timed_mutex         mutex_;

    phmap::flat_hash_map<std::int64_t, LayerSetRevision> cache_;
    std::deque<std::int64_t>                             cacheOrder_;
};

} // namespace LS
