#include <layersets/storage/RevisionStore.hpp>

#include "SqliteConnection.hpp"

#include <layersets/core/TimeUtils.hpp>
#include <layersets/model/LayerJson.hpp>
#include <layersets/validation/Sanitizers.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <thread>
#include <utility>

namespace LS {

using Storage::SqliteStatement;
using Storage::SqliteTransaction;

namespace {

constexpr std::string_view kTag = "RevisionStore";

constexpr std::int64_t kMaxListLimit = 200;

constexpr std::string_view kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS layer_sets (
  ls_id             INTEGER PRIMARY KEY AUTOINCREMENT,
  ls_img_name       TEXT    NOT NULL CHECK (length(ls_img_name) > 0),
  ls_img_major_mime TEXT    NOT NULL DEFAULT '',
  ls_img_minor_mime TEXT    NOT NULL DEFAULT '',
  ls_img_sha1       TEXT    NOT NULL CHECK (length(ls_img_sha1) > 0),
  ls_json_blob      TEXT    NOT NULL,
  ls_user_id        INTEGER NOT NULL CHECK (ls_user_id > 0),
  ls_timestamp      TEXT    NOT NULL,
  ls_revision       INTEGER NOT NULL CHECK (ls_revision >= 1),
  ls_name           TEXT    NOT NULL CHECK (length(ls_name) > 0),
  ls_size           INTEGER NOT NULL CHECK (ls_size >= 0),
  ls_layer_count    INTEGER NOT NULL CHECK (ls_layer_count >= 0)
);
CREATE UNIQUE INDEX IF NOT EXISTS ls_img_name_set_revision
  ON layer_sets (ls_img_name, ls_img_sha1, ls_name, ls_revision);
CREATE INDEX IF NOT EXISTS ls_img_name_set_timestamp
  ON layer_sets (ls_img_name, ls_name, ls_timestamp);
PRAGMA user_version = 1;
)SQL";

constexpr std::string_view kRevisionColumns =
    "ls_id, ls_img_name, ls_img_sha1, ls_name, ls_revision, ls_user_id, ls_timestamp, ls_size, "
    "ls_layer_count, ls_img_major_mime, ls_img_minor_mime, ls_json_blob";

auto selectRevisionSql(std::string_view tail) -> std::string {
    std::string sql{"SELECT "};
    sql.append(kRevisionColumns);
    sql.append(" FROM layer_sets ");
    sql.append(tail);
    return sql;
}

// Decodes the current row of a statement selected with kRevisionColumns.
auto readRevision(SqliteStatement const& stmt, std::int64_t maxBytes) -> Expected<LayerSetRevision> {
    LayerSetRevision revision;
    revision.id          = stmt.columnInt64(0);
    revision.imageName   = stmt.columnText(1);
    revision.contentHash = stmt.columnText(2);
    revision.setName     = stmt.columnText(3);
    revision.revision    = stmt.columnInt64(4);
    revision.userId      = stmt.columnInt64(5);
    revision.timestamp   = stmt.columnText(6);
    revision.sizeBytes   = stmt.columnInt64(7);
    revision.layerCount  = stmt.columnInt64(8);
    revision.majorMime   = stmt.columnText(9);
    revision.minorMime   = stmt.columnText(10);

    auto const blob = stmt.columnText(11);
    if (static_cast<std::int64_t>(blob.size()) > maxBytes) {
        return std::unexpected(Error{Error::Code::StorageFailure,
                                     "Stored layer data too large for layer set " + std::to_string(revision.id)});
    }
    auto json = nlohmann::json::parse(blob, nullptr, false);
    if (json.is_discarded()) {
        return std::unexpected(Error{Error::Code::StorageFailure,
                                     "Invalid JSON in layer set " + std::to_string(revision.id)});
    }
    auto payload = payloadFromJson(json);
    if (!payload) {
        return std::unexpected(Error{Error::Code::StorageFailure,
                                     "Undecodable payload in layer set " + std::to_string(revision.id),
                                     {describeError(payload.error())}});
    }
    revision.payload = std::move(*payload);
    return revision;
}

auto bindKey(SqliteStatement& stmt, std::string_view imageName, std::string_view contentHash) -> Expected<void> {
    if (auto bound = stmt.bind(1, imageName); !bound)
        return bound;
    return stmt.bind(2, contentHash);
}

auto bindKey(SqliteStatement& stmt, std::string_view imageName, std::string_view contentHash, std::string_view setName)
    -> Expected<void> {
    if (auto bound = bindKey(stmt, imageName, contentHash); !bound)
        return bound;
    return stmt.bind(3, setName);
}

auto equalsIgnoreCase(std::string_view lhs, std::string_view rhs) -> bool {
    return std::ranges::equal(lhs, rhs, [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

// Runs a single-value aggregate query; an empty result yields zero.
auto queryInt64(SqliteStatement& stmt) -> Expected<std::int64_t> {
    auto row = stmt.step();
    if (!row)
        return std::unexpected(row.error());
    if (!*row || stmt.columnIsNull(0))
        return 0;
    return stmt.columnInt64(0);
}

} // namespace

RevisionStore::StoreLock::StoreLock(std::unique_lock<std::recursive_timed_mutex> lock,
                                    Storage::SqliteConnection&                   db,
                                    std::chrono::milliseconds                    wait)
    : lock_(std::move(lock))
    , db_(&db)
    , previous_(db.busyTimeout()) {
    db_->setBusyTimeout(wait);
}

RevisionStore::StoreLock::StoreLock(StoreLock&& other) noexcept
    : lock_(std::move(other.lock_))
    , db_(std::exchange(other.db_, nullptr))
    , previous_(other.previous_) {}

RevisionStore::StoreLock::~StoreLock() {
    release();
}

auto RevisionStore::StoreLock::release() -> void {
    if (db_) {
        db_->setBusyTimeout(previous_);
        db_ = nullptr;
    }
    if (lock_.owns_lock())
        lock_.unlock();
}

RevisionStore::Transaction::Transaction(StoreLock lock, std::unique_ptr<Storage::SqliteTransaction> tx)
    : lock_(std::move(lock))
    , tx_(std::move(tx)) {}

RevisionStore::Transaction::Transaction(Transaction&&) noexcept = default;

RevisionStore::Transaction::~Transaction() = default;

auto RevisionStore::Transaction::commit() -> Expected<void> {
    if (!tx_) {
        return std::unexpected(Error{Error::Code::StorageFailure, "Transaction is no longer active"});
    }
    auto result = tx_->commit();
    tx_.reset();
    lock_.release();
    return result;
}

RevisionStore::RevisionStore(RevisionStoreConfig config, TaggedLogger& logger,
                             std::unique_ptr<Storage::SqliteConnection> db)
    : config_(std::move(config))
    , logger_(logger)
    , db_(std::move(db)) {}

RevisionStore::~RevisionStore() = default;

auto RevisionStore::open(RevisionStoreConfig config, TaggedLogger& logger) -> Expected<std::unique_ptr<RevisionStore>> {
    if (config.databasePath.empty()) {
        return std::unexpected(Error{Error::Code::InvalidParameter, "Database path must not be empty"});
    }
    if (config.maxBytes <= 0 || config.maxNamedSets < 1 || config.maxRevisionsPerSet < 1
        || config.maxSaveAttempts < 1) {
        return std::unexpected(Error{Error::Code::InvalidParameter, "Store limits must be positive"});
    }
    if (config.defaultSetName.empty()) {
        return std::unexpected(Error{Error::Code::InvalidParameter, "Default set name must not be empty"});
    }

    auto connection = Storage::SqliteConnection::open(config.databasePath);
    if (!connection) {
        logger.error(kTag, "failed to open database",
                     {{"path", config.databasePath}, {"error", describeError(connection.error())}});
        return std::unexpected(connection.error());
    }
    (*connection)->setBusyTimeout(config.busyTimeout);

    bool const wal = config.walMode;
    std::unique_ptr<RevisionStore> store{new RevisionStore(std::move(config), logger, std::move(*connection))};
    if (wal) {
        if (auto pragma = store->db_->execute("PRAGMA journal_mode = WAL; PRAGMA synchronous = NORMAL;"); !pragma) {
            logger.error(kTag, "failed to enable WAL", {{"error", describeError(pragma.error())}});
            return std::unexpected(pragma.error());
        }
    }
    if (auto schema = store->initializeSchema(); !schema) {
        logger.error(kTag, "failed to initialize schema", {{"error", describeError(schema.error())}});
        return std::unexpected(schema.error());
    }
    logger.debug(kTag, "store opened", {{"path", store->config_.databasePath}});
    return store;
}

auto RevisionStore::initializeSchema() -> Expected<void> {
    std::scoped_lock lock(mutex_);
    return db_->execute(kSchema);
}

auto RevisionStore::acquire(Timeout timeout) -> Expected<StoreLock> {
    auto const wait = timeout.value_or(config_.busyTimeout);
    std::unique_lock<std::recursive_timed_mutex> lock(mutex_, std::defer_lock);
    if (!lock.try_lock_for(wait)) {
        return std::unexpected(Error{Error::Code::Timeout, "Timed out waiting for the layer set store"});
    }
    return StoreLock{std::move(lock), *db_, wait};
}

auto RevisionStore::connectionBusyTimeout() const -> std::chrono::milliseconds {
    std::scoped_lock lock(mutex_);
    return db_->busyTimeout();
}

auto RevisionStore::resolveSetName(std::string_view setName) const -> std::string {
    if (setName.empty())
        return config_.defaultSetName;
    return std::string{setName};
}

auto RevisionStore::save(SaveRevisionRequest const& request, Timeout timeout) -> Expected<SavedRevision> {
    if (request.imageName.empty() || request.contentHash.empty() || request.userId <= 0) {
        logger_.warning(kTag,
                        "invalid save parameters",
                        {{"image", request.imageName},
                         {"hash", request.contentHash},
                         {"userId", std::to_string(request.userId)}});
        return std::unexpected(Error{Error::Code::InvalidParameter,
                                     "Image name, content hash and a positive user id are required"});
    }
    auto const setName = resolveSetName(request.setName);

    LayerSetPayload payload;
    payload.createdAt         = currentTimestamp();
    payload.layers            = request.layers;
    payload.backgroundVisible = request.backgroundVisible;
    payload.backgroundOpacity = request.backgroundOpacity;
    auto const blob = payloadToJson(payload).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    auto const size = static_cast<std::int64_t>(blob.size());
    if (size > config_.maxBytes) {
        logger_.warning(kTag,
                        "capacity check failed",
                        {{"metric", "data_bytes"},
                         {"value", std::to_string(size)},
                         {"limit", std::to_string(config_.maxBytes)}});
        return std::unexpected(Error{Error::Code::CapacityExceeded,
                                     "Layer data too large: " + std::to_string(size) + " bytes (max: "
                                         + std::to_string(config_.maxBytes) + ")"});
    }
    auto const layerCount = static_cast<std::int64_t>(request.layers.size());

    std::optional<Error> lastError;
    for (int attempt = 0; attempt < config_.maxSaveAttempts; ++attempt) {
        if (attempt > 0) {
            std::this_thread::sleep_for(config_.retryBackoff * attempt);
        }
        auto lock = acquire(timeout);
        if (!lock) {
            logger_.warning(kTag, "save timed out waiting for store", {{"image", request.imageName}});
            return std::unexpected(lock.error());
        }

        auto saved = saveAttempt(request, setName, blob, payload.createdAt, layerCount);
        if (saved) {
            logger_.info(kTag,
                         "layer set saved",
                         {{"image", request.imageName},
                          {"set", setName},
                          {"revision", std::to_string(saved->revision)},
                          {"id", std::to_string(saved->id)},
                          {"bytes", std::to_string(saved->sizeBytes)}});
            return saved;
        }
        if (saved.error().code != Error::Code::Conflict) {
            auto level = isRetryableAsIs(saved.error().code) ? LogLevel::Error : LogLevel::Warning;
            logger_.log(level,
                        kTag,
                        "save failed",
                        {{"image", request.imageName}, {"set", setName}, {"error", describeError(saved.error())}});
            return saved;
        }
        logger_.warning(kTag,
                        "revision conflict, retrying",
                        {{"image", request.imageName}, {"set", setName}, {"attempt", std::to_string(attempt + 1)}});
        lastError = saved.error();
    }

    logger_.error(kTag,
                  "save failed after retries",
                  {{"image", request.imageName},
                   {"set", setName},
                   {"attempts", std::to_string(config_.maxSaveAttempts)}});
    std::vector<std::string> details;
    if (lastError)
        details.push_back(describeError(*lastError));
    return std::unexpected(Error{Error::Code::StorageFailure,
                                 "Failed to save layer set after " + std::to_string(config_.maxSaveAttempts)
                                     + " attempts",
                                 std::move(details)});
}

auto RevisionStore::saveAttempt(SaveRevisionRequest const& request,
                                std::string_view           setName,
                                std::string const&         blob,
                                std::string const&         timestamp,
                                std::int64_t               layerCount) -> Expected<SavedRevision> {
    auto tx = SqliteTransaction::begin(*db_);
    if (!tx)
        return std::unexpected(tx.error());

    auto exists = namedSetExistsLocked(request.imageName, request.contentHash, setName);
    if (!exists)
        return std::unexpected(exists.error());
    if (!*exists) {
        auto count = countNamedSetsLocked(request.imageName, request.contentHash);
        if (!count)
            return std::unexpected(count.error());
        if (*count >= config_.maxNamedSets) {
            logger_.warning(kTag,
                            "capacity check failed",
                            {{"metric", "named_sets"},
                             {"value", std::to_string(*count)},
                             {"limit", std::to_string(config_.maxNamedSets)}});
            return std::unexpected(Error{Error::Code::CapacityExceeded,
                                         "Maximum number of named sets reached (max: "
                                             + std::to_string(config_.maxNamedSets) + ")"});
        }
    }

    auto next = db_->prepare("SELECT COALESCE(MAX(ls_revision), 0) + 1 FROM layer_sets "
                             "WHERE ls_img_name = ?1 AND ls_img_sha1 = ?2 AND ls_name = ?3");
    if (!next)
        return std::unexpected(next.error());
    if (auto bound = bindKey(*next, request.imageName, request.contentHash, setName); !bound)
        return std::unexpected(bound.error());
    auto revision = queryInt64(*next);
    if (!revision)
        return std::unexpected(revision.error());

    auto insert = db_->prepare(
        "INSERT INTO layer_sets (ls_img_name, ls_img_sha1, ls_name, ls_img_major_mime, ls_img_minor_mime, "
        "ls_json_blob, ls_user_id, ls_timestamp, ls_revision, ls_size, ls_layer_count) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11)");
    if (!insert)
        return std::unexpected(insert.error());
    auto& stmt = *insert;
    for (auto bound : {bindKey(stmt, request.imageName, request.contentHash, setName),
                       stmt.bind(4, std::string_view{request.majorMime}),
                       stmt.bind(5, std::string_view{request.minorMime}),
                       stmt.bind(6, std::string_view{blob}),
                       stmt.bind(7, request.userId),
                       stmt.bind(8, std::string_view{timestamp}),
                       stmt.bind(9, *revision),
                       stmt.bind(10, static_cast<std::int64_t>(blob.size())),
                       stmt.bind(11, layerCount)}) {
        if (!bound)
            return std::unexpected(bound.error());
    }
    if (auto inserted = stmt.run(); !inserted)
        return std::unexpected(inserted.error());

    SavedRevision saved;
    saved.id         = db_->lastInsertRowId();
    saved.revision   = *revision;
    saved.sizeBytes  = static_cast<std::int64_t>(blob.size());
    saved.createdSet = !*exists;

    auto pruned = pruneLocked(request.imageName, request.contentHash, setName, config_.maxRevisionsPerSet);
    if (!pruned)
        return std::unexpected(pruned.error());
    saved.prunedCount = *pruned;

    if (auto committed = tx->commit(); !committed)
        return std::unexpected(committed.error());
    return saved;
}

auto RevisionStore::getById(std::int64_t id) -> Expected<std::optional<LayerSetRevision>> {
    if (id <= 0) {
        return std::unexpected(Error{Error::Code::InvalidParameter, "Layer set id must be positive"});
    }
    std::scoped_lock lock(mutex_);
    if (auto cached = cacheLookup(id))
        return cached;

    auto stmt = db_->prepare(selectRevisionSql("WHERE ls_id = ?1"));
    if (!stmt)
        return std::unexpected(stmt.error());
    if (auto bound = stmt->bind(1, id); !bound)
        return std::unexpected(bound.error());
    auto row = stmt->step();
    if (!row)
        return std::unexpected(row.error());
    if (!*row)
        return std::optional<LayerSetRevision>{};

    auto revision = readRevision(*stmt, config_.maxBytes);
    if (!revision) {
        logger_.error(kTag, "failed to decode layer set", {{"id", std::to_string(id)}});
        return std::unexpected(revision.error());
    }
    cacheInsert(*revision);
    return std::optional<LayerSetRevision>{std::move(*revision)};
}

auto RevisionStore::latestLocked(std::string_view imageName, std::string_view contentHash, std::string_view setName)
    -> Expected<std::optional<LayerSetRevision>> {
    auto stmt = db_->prepare(selectRevisionSql(
        "WHERE ls_img_name = ?1 AND ls_img_sha1 = ?2 AND ls_name = ?3 ORDER BY ls_revision DESC LIMIT 1"));
    if (!stmt)
        return std::unexpected(stmt.error());
    if (auto bound = bindKey(*stmt, imageName, contentHash, setName); !bound)
        return std::unexpected(bound.error());
    auto row = stmt->step();
    if (!row)
        return std::unexpected(row.error());
    if (!*row)
        return std::optional<LayerSetRevision>{};
    auto revision = readRevision(*stmt, config_.maxBytes);
    if (!revision) {
        logger_.error(kTag, "failed to decode latest layer set", {{"image", std::string{imageName}}});
        return std::unexpected(revision.error());
    }
    return std::optional<LayerSetRevision>{std::move(*revision)};
}

auto RevisionStore::getLatest(std::string_view                imageName,
                              std::string_view                contentHash,
                              std::optional<std::string_view> setName) -> Expected<std::optional<LayerSetRevision>> {
    std::scoped_lock lock(mutex_);
    return latestLocked(imageName, contentHash, resolveSetName(setName.value_or(std::string_view{})));
}

auto RevisionStore::getByName(std::string_view imageName, std::string_view contentHash, std::string_view setName)
    -> Expected<std::optional<NamedSetLookup>> {
    std::scoped_lock lock(mutex_);
    auto const name = resolveSetName(setName);

    auto direct = latestLocked(imageName, contentHash, name);
    if (!direct)
        return std::unexpected(direct.error());
    if (*direct) {
        return std::optional<NamedSetLookup>{NamedSetLookup{std::move(**direct), std::string{contentHash}, false}};
    }

    auto storedHash = findSetContentHash(imageName, name);
    if (!storedHash)
        return std::unexpected(storedHash.error());
    if (!*storedHash || **storedHash == contentHash)
        return std::optional<NamedSetLookup>{};

    auto fallback = latestLocked(imageName, **storedHash, name);
    if (!fallback)
        return std::unexpected(fallback.error());
    if (!*fallback)
        return std::optional<NamedSetLookup>{};

    logger_.info(kTag,
                 "content hash fallback",
                 {{"image", std::string{imageName}},
                  {"set", name},
                  {"requested", std::string{contentHash}},
                  {"resolved", **storedHash}});
    return std::optional<NamedSetLookup>{NamedSetLookup{std::move(**fallback), std::move(**storedHash), true}};
}

auto RevisionStore::listRevisions(std::string_view imageName,
                                  std::string_view contentHash,
                                  std::string_view setName,
                                  std::int64_t     limit) -> Expected<std::vector<RevisionSummary>> {
    limit = std::clamp<std::int64_t>(limit, 1, kMaxListLimit);
    std::scoped_lock lock(mutex_);
    auto stmt = db_->prepare("SELECT ls_id, ls_revision, ls_user_id, ls_timestamp, ls_size, ls_layer_count, ls_name "
                             "FROM layer_sets WHERE ls_img_name = ?1 AND ls_img_sha1 = ?2 AND ls_name = ?3 "
                             "ORDER BY ls_revision DESC LIMIT ?4");
    if (!stmt)
        return std::unexpected(stmt.error());
    if (auto bound = bindKey(*stmt, imageName, contentHash, resolveSetName(setName)); !bound)
        return std::unexpected(bound.error());
    if (auto bound = stmt->bind(4, limit); !bound)
        return std::unexpected(bound.error());

    std::vector<RevisionSummary> summaries;
    while (true) {
        auto row = stmt->step();
        if (!row)
            return std::unexpected(row.error());
        if (!*row)
            break;
        RevisionSummary summary;
        summary.id         = stmt->columnInt64(0);
        summary.revision   = stmt->columnInt64(1);
        summary.userId     = stmt->columnInt64(2);
        summary.timestamp  = stmt->columnText(3);
        summary.sizeBytes  = stmt->columnInt64(4);
        summary.layerCount = stmt->columnInt64(5);
        summary.setName    = stmt->columnText(6);
        summaries.push_back(std::move(summary));
    }
    return summaries;
}

auto RevisionStore::listNamedSets(std::string_view imageName, std::string_view contentHash)
    -> Expected<std::vector<NamedSetSummary>> {
    std::scoped_lock lock(mutex_);
    auto stmt = db_->prepare("SELECT ls_name, COUNT(*), MAX(ls_revision) FROM layer_sets "
                             "WHERE ls_img_name = ?1 AND ls_img_sha1 = ?2 GROUP BY ls_name ORDER BY ls_name");
    if (!stmt)
        return std::unexpected(stmt.error());
    if (auto bound = bindKey(*stmt, imageName, contentHash); !bound)
        return std::unexpected(bound.error());

    std::vector<NamedSetSummary> sets;
    while (true) {
        auto row = stmt->step();
        if (!row)
            return std::unexpected(row.error());
        if (!*row)
            break;
        NamedSetSummary summary;
        summary.setName        = stmt->columnText(0);
        summary.revisionCount  = stmt->columnInt64(1);
        summary.latestRevision = stmt->columnInt64(2);
        sets.push_back(std::move(summary));
    }

    auto latest = db_->prepare("SELECT ls_id, ls_user_id, ls_timestamp FROM layer_sets "
                               "WHERE ls_img_name = ?1 AND ls_img_sha1 = ?2 AND ls_name = ?3 AND ls_revision = ?4");
    if (!latest)
        return std::unexpected(latest.error());
    for (auto& summary : sets) {
        latest->reset();
        if (auto bound = bindKey(*latest, imageName, contentHash, summary.setName); !bound)
            return std::unexpected(bound.error());
        if (auto bound = latest->bind(4, summary.latestRevision); !bound)
            return std::unexpected(bound.error());
        auto row = latest->step();
        if (!row)
            return std::unexpected(row.error());
        if (*row) {
            summary.latestRevisionId = latest->columnInt64(0);
            summary.latestUserId     = latest->columnInt64(1);
            summary.latestTimestamp  = latest->columnText(2);
        }
        auto owner = getNamedSetOwner(imageName, contentHash, summary.setName);
        if (!owner)
            return std::unexpected(owner.error());
        summary.creatorUserId = *owner;
    }
    return sets;
}

auto RevisionStore::pruneLocked(std::string_view imageName,
                                std::string_view contentHash,
                                std::string_view setName,
                                std::int64_t     keepCount) -> Expected<std::int64_t> {
    auto stmt = db_->prepare("DELETE FROM layer_sets WHERE ls_id IN ("
                             "SELECT ls_id FROM layer_sets WHERE ls_img_name = ?1 AND ls_img_sha1 = ?2 "
                             "AND ls_name = ?3 ORDER BY ls_revision DESC LIMIT -1 OFFSET ?4)");
    if (!stmt)
        return std::unexpected(stmt.error());
    if (auto bound = bindKey(*stmt, imageName, contentHash, setName); !bound)
        return std::unexpected(bound.error());
    if (auto bound = stmt->bind(4, keepCount); !bound)
        return std::unexpected(bound.error());
    if (auto ran = stmt->run(); !ran)
        return std::unexpected(ran.error());

    auto const deleted = db_->changes();
    if (deleted > 0) {
        cacheClear();
        logger_.info(kTag,
                     "pruned old revisions",
                     {{"image", std::string{imageName}},
                      {"set", std::string{setName}},
                      {"deleted", std::to_string(deleted)},
                      {"kept", std::to_string(keepCount)}});
    }
    return deleted;
}

auto RevisionStore::pruneOldRevisions(std::string_view imageName,
                                      std::string_view contentHash,
                                      std::string_view setName,
                                      std::int64_t     keepCount) -> Expected<std::int64_t> {
    if (keepCount < 1) {
        return std::unexpected(Error{Error::Code::InvalidParameter, "keepCount must be at least 1"});
    }
    auto lock = acquire(std::nullopt);
    if (!lock)
        return std::unexpected(lock.error());
    auto tx = SqliteTransaction::begin(*db_);
    if (!tx)
        return std::unexpected(tx.error());
    auto deleted = pruneLocked(imageName, contentHash, resolveSetName(setName), keepCount);
    if (!deleted)
        return deleted;
    if (auto committed = tx->commit(); !committed)
        return std::unexpected(committed.error());
    return deleted;
}

auto RevisionStore::deleteAllForImage(std::string_view imageName, std::string_view contentHash) -> bool {
    auto lock = acquire(std::nullopt);
    if (!lock) {
        logger_.error(kTag, "failed to delete layer sets for image",
                      {{"image", std::string{imageName}}, {"error", describeError(lock.error())}});
        return false;
    }
    auto removed = [&]() -> Expected<std::int64_t> {
        auto tx = SqliteTransaction::begin(*db_);
        if (!tx)
            return std::unexpected(tx.error());
        auto stmt = contentHash.empty()
                        ? db_->prepare("DELETE FROM layer_sets WHERE ls_img_name = ?1")
                        : db_->prepare("DELETE FROM layer_sets WHERE ls_img_name = ?1 AND ls_img_sha1 = ?2");
        if (!stmt)
            return std::unexpected(stmt.error());
        auto bound = contentHash.empty() ? stmt->bind(1, imageName) : bindKey(*stmt, imageName, contentHash);
        if (!bound)
            return std::unexpected(bound.error());
        if (auto ran = stmt->run(); !ran)
            return std::unexpected(ran.error());
        auto const deleted = db_->changes();
        if (auto committed = tx->commit(); !committed)
            return std::unexpected(committed.error());
        return deleted;
    }();

    if (!removed) {
        logger_.error(kTag, "failed to delete layer sets for image",
                      {{"image", std::string{imageName}}, {"error", describeError(removed.error())}});
        return false;
    }
    cacheClear();
    logger_.info(kTag,
                 "layer sets deleted for image",
                 {{"image", std::string{imageName}},
                  {"hash", std::string{contentHash}},
                  {"deleted", std::to_string(*removed)}});
    return true;
}

auto RevisionStore::deleteNamedSet(std::string_view imageName, std::string_view contentHash, std::string_view setName)
    -> Expected<std::int64_t> {
    auto const name = resolveSetName(setName);
    auto       lock = acquire(std::nullopt);
    if (!lock)
        return std::unexpected(lock.error());
    auto tx = SqliteTransaction::begin(*db_);
    if (!tx)
        return std::unexpected(tx.error());

    auto stmt = db_->prepare("DELETE FROM layer_sets WHERE ls_img_name = ?1 AND ls_img_sha1 = ?2 AND ls_name = ?3");
    if (!stmt)
        return std::unexpected(stmt.error());
    if (auto bound = bindKey(*stmt, imageName, contentHash, name); !bound)
        return std::unexpected(bound.error());
    if (auto ran = stmt->run(); !ran)
        return std::unexpected(ran.error());
    auto const deleted = db_->changes();
    if (deleted == 0) {
        return std::unexpected(Error{Error::Code::NotFound, "Layer set not found: " + name});
    }
    if (auto committed = tx->commit(); !committed)
        return std::unexpected(committed.error());

    cacheClear();
    logger_.info(kTag,
                 "named set deleted",
                 {{"image", std::string{imageName}}, {"set", name}, {"deleted", std::to_string(deleted)}});
    return deleted;
}

auto RevisionStore::renameNamedSet(std::string_view imageName,
                                   std::string_view contentHash,
                                   std::string_view fromName,
                                   std::string_view toName) -> Expected<std::int64_t> {
    auto const from = resolveSetName(fromName);
    if (!Sanitize::isValidSetName(toName)) {
        return std::unexpected(Error{Error::Code::InvalidParameter, "Invalid set name"});
    }
    if (equalsIgnoreCase(toName, config_.defaultSetName)) {
        return std::unexpected(Error{Error::Code::InvalidParameter, "Cannot rename a set to the default set name"});
    }
    if (toName == from) {
        return std::unexpected(Error{Error::Code::InvalidParameter, "New set name is the same as the current one"});
    }

    auto lock = acquire(std::nullopt);
    if (!lock)
        return std::unexpected(lock.error());
    auto tx = SqliteTransaction::begin(*db_);
    if (!tx)
        return std::unexpected(tx.error());

    auto source = namedSetExistsLocked(imageName, contentHash, from);
    if (!source)
        return std::unexpected(source.error());
    if (!*source)
        return std::unexpected(Error{Error::Code::NotFound, "Layer set not found: " + from});
    auto target = namedSetExistsLocked(imageName, contentHash, toName);
    if (!target)
        return std::unexpected(target.error());
    if (*target)
        return std::unexpected(Error{Error::Code::Conflict, "Layer set already exists: " + std::string{toName}});

    auto stmt = db_->prepare("UPDATE layer_sets SET ls_name = ?4 "
                             "WHERE ls_img_name = ?1 AND ls_img_sha1 = ?2 AND ls_name = ?3");
    if (!stmt)
        return std::unexpected(stmt.error());
    if (auto bound = bindKey(*stmt, imageName, contentHash, from); !bound)
        return std::unexpected(bound.error());
    if (auto bound = stmt->bind(4, toName); !bound)
        return std::unexpected(bound.error());
    if (auto ran = stmt->run(); !ran)
        return std::unexpected(ran.error());
    auto const renamed = db_->changes();
    if (auto committed = tx->commit(); !committed)
        return std::unexpected(committed.error());

    cacheClear();
    logger_.info(kTag,
                 "named set renamed",
                 {{"image", std::string{imageName}},
                  {"from", from},
                  {"to", std::string{toName}},
                  {"rows", std::to_string(renamed)}});
    return renamed;
}

auto RevisionStore::namedSetExistsLocked(std::string_view imageName,
                                         std::string_view contentHash,
                                         std::string_view setName) -> Expected<bool> {
    auto stmt = db_->prepare("SELECT 1 FROM layer_sets "
                             "WHERE ls_img_name = ?1 AND ls_img_sha1 = ?2 AND ls_name = ?3 LIMIT 1");
    if (!stmt)
        return std::unexpected(stmt.error());
    if (auto bound = bindKey(*stmt, imageName, contentHash, setName); !bound)
        return std::unexpected(bound.error());
    return stmt->step();
}

auto RevisionStore::namedSetExists(std::string_view imageName, std::string_view contentHash, std::string_view setName)
    -> Expected<bool> {
    std::scoped_lock lock(mutex_);
    return namedSetExistsLocked(imageName, contentHash, resolveSetName(setName));
}

auto RevisionStore::countNamedSetsLocked(std::string_view imageName, std::string_view contentHash)
    -> Expected<std::int64_t> {
    auto stmt = db_->prepare("SELECT COUNT(DISTINCT ls_name) FROM layer_sets WHERE ls_img_name = ?1 AND ls_img_sha1 = ?2");
    if (!stmt)
        return std::unexpected(stmt.error());
    if (auto bound = bindKey(*stmt, imageName, contentHash); !bound)
        return std::unexpected(bound.error());
    return queryInt64(*stmt);
}

auto RevisionStore::countNamedSets(std::string_view imageName, std::string_view contentHash) -> Expected<std::int64_t> {
    std::scoped_lock lock(mutex_);
    return countNamedSetsLocked(imageName, contentHash);
}

auto RevisionStore::getNamedSetOwner(std::string_view imageName, std::string_view contentHash, std::string_view setName)
    -> Expected<std::optional<std::int64_t>> {
    std::scoped_lock lock(mutex_);
    auto stmt = db_->prepare("SELECT ls_user_id FROM layer_sets "
                             "WHERE ls_img_name = ?1 AND ls_img_sha1 = ?2 AND ls_name = ?3 "
                             "ORDER BY ls_revision ASC LIMIT 1");
    if (!stmt)
        return std::unexpected(stmt.error());
    if (auto bound = bindKey(*stmt, imageName, contentHash, resolveSetName(setName)); !bound)
        return std::unexpected(bound.error());
    auto row = stmt->step();
    if (!row)
        return std::unexpected(row.error());
    if (!*row)
        return std::optional<std::int64_t>{};
    return std::optional<std::int64_t>{stmt->columnInt64(0)};
}

auto RevisionStore::findSetContentHash(std::string_view imageName, std::string_view setName)
    -> Expected<std::optional<std::string>> {
    std::scoped_lock lock(mutex_);
    auto stmt = db_->prepare("SELECT ls_img_sha1 FROM layer_sets WHERE ls_img_name = ?1 AND ls_name = ?2 "
                             "ORDER BY ls_timestamp DESC, ls_id DESC LIMIT 1");
    if (!stmt)
        return std::unexpected(stmt.error());
    if (auto bound = stmt->bind(1, imageName); !bound)
        return std::unexpected(bound.error());
    if (auto bound = stmt->bind(2, std::string_view{resolveSetName(setName)}); !bound)
        return std::unexpected(bound.error());
    auto row = stmt->step();
    if (!row)
        return std::unexpected(row.error());
    if (!*row)
        return std::optional<std::string>{};
    return std::optional<std::string>{stmt->columnText(0)};
}

auto RevisionStore::beginTransaction(Timeout timeout) -> Expected<Transaction> {
    auto lock = acquire(timeout);
    if (!lock)
        return std::unexpected(lock.error());
    auto tx = SqliteTransaction::begin(*db_);
    if (!tx)
        return std::unexpected(tx.error());
    return Transaction{std::move(*lock), std::make_unique<SqliteTransaction>(std::move(*tx))};
}

auto RevisionStore::cacheLookup(std::int64_t id) const -> std::optional<LayerSetRevision> {
    auto it = cache_.find(id);
    if (it == cache_.end())
        return std::nullopt;
    return it->second;
}

auto RevisionStore::cacheInsert(LayerSetRevision const& revision) -> void {
    if (config_.cacheCapacity == 0)
        return;
    if (cache_.count(revision.id) > 0)
        return;
    while (cache_.size() >= config_.cacheCapacity && !cacheOrder_.empty()) {
        cache_.erase(cacheOrder_.front());
        cacheOrder_.pop_front();
    }
    cache_.emplace(revision.id, revision);
    cacheOrder_.push_back(revision.id);
}

auto RevisionStore::cacheClear() -> void {
    cache_.clear();
    cacheOrder_.clear();
}

} // namespace LS
