#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <vecstore/profiling.h>
#include <vecstore/vector/distance.h>
#include <vecstore/vector/sqlite_vec_backend.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <system_error>

namespace vecstore::vector {

namespace {

constexpr const char* kBackupFormat = "vecstore-sqlite";

std::filesystem::path manifestPathFor(const std::filesystem::path& backup) {
    return std::filesystem::path(backup.string() + ".manifest.json");
}

Result<void> checkManifest(const nlohmann::json& manifest, const IndexConfig& config) {
    try {
        if (manifest.value("format", std::string{}) != kBackupFormat) {
            return Error{ErrorCode::IntegrityError, "not written by the SQLite backend"};
        }
        auto dim = manifest.value("dimension", size_t{0});
        if (dim != config.dimension) {
            return Error{ErrorCode::IntegrityError,
                         "dimension " + std::to_string(dim) + " does not match index dimension " +
                             std::to_string(config.dimension)};
        }
        auto model = manifest.value("model", std::string{});
        if (model != config.modelName) {
            return Error{ErrorCode::IntegrityError, "model '" + model +
                                                        "' does not match index model '" +
                                                        config.modelName + "'"};
        }
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::IntegrityError, std::string("malformed manifest: ") + e.what()};
    }
    return {};
}

} // namespace

SqliteVecBackend::SqliteVecBackend(std::filesystem::path basePath, BackendOptions options)
    : AbstractVectorIndexBackend(std::move(basePath)), options_(options) {}

SqliteVecBackend::~SqliteVecBackend() {
    cleanup();
}

Result<void> SqliteVecBackend::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        return {};
    }
    if (basePath_.empty()) {
        return Error{ErrorCode::InvalidArgument, "Base path must not be empty"};
    }
    initialized_ = true;
    spdlog::debug("SqliteVecBackend initialized (base={}, sqlite {})", basePath_.string(),
                  metadata::Database::version());
    return {};
}

Result<void> SqliteVecBackend::openDatabase(const std::filesystem::path& path, bool create) {
    auto db = std::make_unique<metadata::Database>();
    auto openResult = db->open(path.string(), create ? metadata::ConnectionMode::Create
                                                     : metadata::ConnectionMode::ReadWrite);
    if (!openResult)
        return openResult;

    auto r = db->setBusyTimeout(options_.busy_timeout);
    if (!r)
        return r;
    r = db->enableWAL();
    if (!r)
        return r;
    r = registerDistanceFunctions(db->handle());
    if (!r)
        return r;

    auto caps = VirtualIndexManager::probeCapabilities(*db, options_.enable_accelerated);

    auto catalog = std::make_unique<MetadataCatalog>(*db);
    r = catalog->initializeSchema();
    if (!r)
        return r;

    auto indexManager = std::make_unique<VirtualIndexManager>(*db, std::move(caps));
    records_ = std::make_unique<VectorRecordStore>(*db, *indexManager);
    indexManager_ = std::move(indexManager);
    catalog_ = std::move(catalog);
    db_ = std::move(db);
    dbPath_ = path;
    return {};
}

Result<void> SqliteVecBackend::bindIndex(const IndexConfig& config, bool create) {
    MetadataOptions options;
    options.documentId = config.documentId;
    options.indexType = config.indexType;

    IndexMetadata meta;
    if (create) {
        auto created = catalog_->getOrCreateMetadata(config.modelName, config.dimension, options);
        if (!created)
            return created.error();
        meta = created.value();
    } else {
        auto found =
            catalog_->findByModelAndDimension(config.modelName, config.dimension, config.documentId);
        if (!found)
            return found.error();
        if (!found.value()) {
            return Error{ErrorCode::NotFound, "No catalog entry for " + config.modelName + "/" +
                                                  std::to_string(config.dimension) + " in " +
                                                  dbPath_.string()};
        }
        meta = *found.value();
    }

    auto table = TableIdentifier::create(meta.tableIdentifier);
    if (!table)
        return table.error();

    auto ensured = indexManager_->ensureTable(table.value(), config.dimension);
    if (!ensured)
        return ensured;

    metadata_ = meta;
    table_ = table.value();
    config_ = config;
    config_.indexType = meta.indexType;
    return {};
}

Result<std::string> SqliteVecBackend::createIndex(const IndexConfig& config) {
    VECSTORE_ZONE_SCOPED_N("SqliteVecBackend::createIndex");

    auto valid = validateConfig(config);
    if (!valid)
        return valid.error();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
        return Error{ErrorCode::NotInitialized, "Backend not initialized"};
    }

    auto path = indexPathFor(config);
    if (table_) {
        if (dbPath_ == path) {
            return dbPath_.string();
        }
        return Error{ErrorCode::InvalidState,
                     "Backend already bound to " + dbPath_.string() + ", cannot create " +
                         path.string()};
    }

    auto dirResult = ensureIndexDirectory(path);
    if (!dirResult)
        return dirResult.error();

    auto openResult = openDatabase(path, true);
    if (!openResult) {
        closeLocked();
        return openResult.error();
    }

    auto bindResult = bindIndex(config, true);
    if (!bindResult) {
        spdlog::error("Failed to create vector index {}: {}", path.string(),
                      bindResult.error().message);
        closeLocked();
        return bindResult.error();
    }

    auto kind = indexManager_->tableKind(*table_);
    spdlog::info("Vector index ready: {} (table={}, kind={})", path.string(), table_->str(),
                 kind ? tableKindToString(kind.value()) : "unknown");
    return dbPath_.string();
}

Result<void> SqliteVecBackend::loadIndex(const IndexConfig& config) {
    VECSTORE_ZONE_SCOPED_N("SqliteVecBackend::loadIndex");

    auto valid = validateConfig(config);
    if (!valid)
        return valid;

    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
        return Error{ErrorCode::NotInitialized, "Backend not initialized"};
    }

    auto path = indexPathFor(config);
    if (table_) {
        if (dbPath_ == path) {
            return {};
        }
        return Error{ErrorCode::InvalidState, "Backend already bound to " + dbPath_.string()};
    }

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Error{ErrorCode::NotFound, "Vector index not found: " + path.string()};
    }

    auto openResult = openDatabase(path, false);
    if (!openResult) {
        closeLocked();
        return openResult;
    }

    auto bindResult = bindIndex(config, false);
    if (!bindResult) {
        closeLocked();
        return bindResult;
    }

    spdlog::debug("Loaded vector index {} (table={})", path.string(), table_->str());
    return {};
}

Result<void> SqliteVecBackend::requireReady() const {
    if (!initialized_) {
        return Error{ErrorCode::NotInitialized, "Backend not initialized"};
    }
    if (!db_ || !table_) {
        return Error{ErrorCode::InvalidState, "No index loaded"};
    }
    return {};
}

Result<void> SqliteVecBackend::adjustCount(int64_t delta) {
    if (delta == 0 || !metadata_) {
        return {};
    }
    auto r = catalog_->incrementVectorCount(metadata_->id, delta);
    if (r) {
        metadata_->totalVectors = std::max<int64_t>(0, metadata_->totalVectors + delta);
    }
    return r;
}

Result<void> SqliteVecBackend::saveIndex() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ready = requireReady();
    if (!ready)
        return ready;
    return db_->checkpoint();
}

Result<void> SqliteVecBackend::addVectors(const std::vector<float>& vector, int64_t chunkId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ready = requireReady();
    if (!ready)
        return ready;

    auto valid = validateDimensions(vector, config_.dimension);
    if (!valid)
        return valid;

    auto r = records_->addVector(*table_, chunkId, vector, config_.dimension);
    if (!r)
        return r;
    return adjustCount(1);
}

Result<size_t> SqliteVecBackend::addVectorBatch(const std::vector<VectorEntry>& entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ready = requireReady();
    if (!ready)
        return ready.error();

    auto added = records_->addVectors(*table_, entries, config_.dimension);
    if (!added)
        return added;

    auto r = adjustCount(static_cast<int64_t>(added.value()));
    if (!r)
        return r.error();
    return added;
}

Result<size_t> SqliteVecBackend::removeVectors(const std::vector<int64_t>& chunkIds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ready = requireReady();
    if (!ready)
        return ready.error();

    auto removed = records_->deleteByChunkIds(*table_, chunkIds);
    if (!removed)
        return removed;

    auto r = adjustCount(-static_cast<int64_t>(removed.value()));
    if (!r)
        return r.error();
    return removed;
}

Result<VectorSearchResult> SqliteVecBackend::search(const std::vector<float>& query, size_t k) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ready = requireReady();
    if (!ready)
        return ready.error();
    return records_->search(*table_, query, k, config_.dimension);
}

Result<VectorSearchResult> SqliteVecBackend::searchWithThreshold(const std::vector<float>& query,
                                                                 size_t k,
                                                                 float distanceThreshold) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ready = requireReady();
    if (!ready)
        return ready.error();
    return records_->search(*table_, query, k, config_.dimension, distanceThreshold);
}

Result<std::vector<int64_t>> SqliteVecBackend::chunkIds() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ready = requireReady();
    if (!ready)
        return ready.error();
    return records_->chunkIds(*table_);
}

Result<IndexStats> SqliteVecBackend::getStats() {
    std::lock_guard<std::mutex> lock(mutex_);

    IndexStats stats;
    stats.isInitialized = initialized_ && db_ && table_;
    stats.dimension = config_.dimension;
    stats.indexType = config_.indexType;
    if (!stats.isInitialized) {
        return stats;
    }

    auto total = records_->count(*table_);
    if (!total)
        return total.error();
    stats.totalVectors = total.value();

    // The catalog counter drifts if rows were written outside this class
    if (metadata_ && metadata_->totalVectors != static_cast<int64_t>(total.value())) {
        auto r = catalog_->setVectorCount(metadata_->id, static_cast<int64_t>(total.value()));
        if (r) {
            metadata_->totalVectors = static_cast<int64_t>(total.value());
        } else {
            spdlog::warn("Failed to resync vector count for '{}': {}", table_->str(),
                         r.error().message);
        }
    }
    return stats;
}

Result<void> SqliteVecBackend::resetIndex() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ready = requireReady();
    if (!ready)
        return ready;

    auto r = indexManager_->dropTable(*table_);
    if (!r)
        return r;
    r = indexManager_->ensureTable(*table_, config_.dimension);
    if (!r)
        return r;
    r = catalog_->setVectorCount(metadata_->id, 0);
    if (!r)
        return r;
    metadata_->totalVectors = 0;

    spdlog::info("Reset vector index '{}'", table_->str());
    return {};
}

Result<void> SqliteVecBackend::optimizeIndex() {
    VECSTORE_ZONE_SCOPED_N("SqliteVecBackend::optimizeIndex");

    std::lock_guard<std::mutex> lock(mutex_);
    auto ready = requireReady();
    if (!ready)
        return ready;

    auto migrated = indexManager_->migrateToAccelerated(*table_, config_.dimension);
    if (!migrated)
        return migrated.error();

    return db_->optimize();
}

Result<void> SqliteVecBackend::backupIndex(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ready = requireReady();
    if (!ready)
        return ready;

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        return Error{ErrorCode::InvalidArgument, "Backup target already exists: " + path.string()};
    }
    auto dir = ensureIndexDirectory(path);
    if (!dir)
        return dir;

    auto r = db_->checkpoint();
    if (!r)
        return r;
    r = db_->backupTo(path.string());
    if (!r)
        return r;

    auto count = records_->count(*table_);
    if (!count)
        return count.error();

    nlohmann::json manifest;
    manifest["format"] = kBackupFormat;
    manifest["model"] = config_.modelName;
    manifest["dimension"] = config_.dimension;
    manifest["document_id"] =
        config_.documentId ? nlohmann::json(*config_.documentId) : nlohmann::json(nullptr);
    manifest["table"] = table_->str();
    manifest["index_type"] = config_.indexType;
    manifest["vector_count"] = count.value();
    manifest["created_at"] = std::chrono::duration_cast<std::chrono::seconds>(
                                 std::chrono::system_clock::now().time_since_epoch())
                                 .count();

    std::ofstream out(manifestPathFor(path));
    if (!out) {
        return Error{ErrorCode::IOError,
                     "Failed to write backup manifest " + manifestPathFor(path).string()};
    }
    out << manifest.dump(2);

    spdlog::info("Backed up vector index '{}' ({} vectors) to {}", table_->str(), count.value(),
                 path.string());
    return {};
}

Result<void> SqliteVecBackend::restoreIndex(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ready = requireReady();
    if (!ready)
        return ready;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Error{ErrorCode::NotFound, "Backup not found: " + path.string()};
    }

    auto manifestPath = manifestPathFor(path);
    if (std::filesystem::exists(manifestPath, ec)) {
        std::ifstream in(manifestPath);
        nlohmann::json manifest = nlohmann::json::parse(in, nullptr, false);
        if (manifest.is_discarded() || !manifest.is_object()) {
            return Error{ErrorCode::IntegrityError,
                         "Malformed backup manifest " + manifestPath.string()};
        }
        auto checked = checkManifest(manifest, config_);
        if (!checked) {
            return Error{ErrorCode::IntegrityError,
                         "Backup " + path.string() + ": " + checked.error().message};
        }
    } else {
        spdlog::warn("No manifest next to backup {}, restoring without checks", path.string());
    }

    auto r = db_->restoreFrom(path.string());
    if (!r)
        return r;

    // The restored file carries its own catalog; rebind to it
    auto rebind = bindIndex(config_, false);
    if (!rebind) {
        return Error{ErrorCode::IntegrityError,
                     "Restored index is unusable: " + rebind.error().message};
    }

    spdlog::info("Restored vector index '{}' from {}", table_->str(), path.string());
    return {};
}

void SqliteVecBackend::closeLocked() {
    records_.reset();
    indexManager_.reset();
    catalog_.reset();
    if (db_) {
        db_->close();
        db_.reset();
    }
    metadata_.reset();
    table_.reset();
    dbPath_.clear();
}

void SqliteVecBackend::cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        spdlog::debug("Closing vector index {}", dbPath_.string());
    }
    closeLocked();
    initialized_ = false;
}

Result<void> SqliteVecBackend::deleteDocumentIndex(int64_t documentId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.modelName.empty() || config_.dimension == 0) {
        return Error{ErrorCode::InvalidState, "Backend has no model configured"};
    }

    auto path = documentIndexPath(documentId, config_.modelName, config_.dimension);

    if (table_ && dbPath_ == path) {
        auto r = indexManager_->dropTable(*table_);
        if (!r)
            return r;
        r = catalog_->deleteMetadata(metadata_->id);
        if (!r)
            return r;
        closeLocked();
    }

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return {};
    }
    auto removed = removeIndexFiles(path);
    if (!removed)
        return removed;

    spdlog::info("Deleted document index {} (model={}, dim={})", documentId, config_.modelName,
                 config_.dimension);
    return {};
}

bool SqliteVecBackend::isInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

bool SqliteVecBackend::isReady() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_ && db_ && table_;
}

std::string SqliteVecBackend::indexPath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dbPath_.string();
}

BackendCapabilities SqliteVecBackend::capabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!indexManager_) {
        return BackendCapabilities{false, "no index open"};
    }
    return indexManager_->capabilities();
}

std::optional<IndexMetadata> SqliteVecBackend::metadata() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metadata_;
}

} // namespace vecstore::vector
