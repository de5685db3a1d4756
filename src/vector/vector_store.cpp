#include <spdlog/spdlog.h>
#include <vecstore/profiling.h>
#include <vecstore/vector/abstract_vector_backend.h>
#include <vecstore/vector/vector_store.h>

#include <atomic>
#include <cmath>
#include <map>
#include <mutex>
#include <set>
#include <system_error>
#include <tuple>

namespace vecstore::vector {

using BackendPtr = std::shared_ptr<IVectorIndexBackend>;

namespace {

Result<void> applyLogLevel(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && name != "off") {
        return Error{ErrorCode::InvalidArgument, "Unknown log level '" + name + "'"};
    }
    spdlog::set_level(level);
    return {};
}

Result<void> validateRecord(const EmbeddingRecord& record) {
    if (record.model.empty()) {
        return Error{ErrorCode::ValidationError, "Embedding record has no model"};
    }
    if (record.dimensions == 0) {
        return Error{ErrorCode::ValidationError, "Embedding record has no dimensions"};
    }
    if (record.embedding.empty()) {
        return Error{ErrorCode::ValidationError, "Embedding must not be empty"};
    }
    if (record.embedding.size() != record.dimensions) {
        return Error{ErrorCode::ValidationError,
                     "Embedding for chunk " + std::to_string(record.chunkId) + " has " +
                         std::to_string(record.embedding.size()) + " values, expected " +
                         std::to_string(record.dimensions)};
    }
    for (float v : record.embedding) {
        if (!std::isfinite(v)) {
            return Error{ErrorCode::ValidationError, "Embedding for chunk " +
                                                         std::to_string(record.chunkId) +
                                                         " contains a non-finite value"};
        }
    }
    return {};
}

void keepFirstError(Result<void>& first, const Error& error) {
    spdlog::error("{}", error.message);
    if (first) {
        first = error;
    }
}

} // namespace

class VectorStore::Impl {
public:
    Impl(config::VectorStoreConfig cfg, std::shared_ptr<InstancePool> pool)
        : config_(std::move(cfg)),
          pool_(pool ? std::move(pool) : std::make_shared<InstancePool>(config_.max_pool_size)) {}

    Result<void> initialize() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (initialized_) {
            return {};
        }

        auto valid = config_.validate();
        if (!valid)
            return valid;

        auto type = parseBackendType(config_.backend);
        if (!type)
            return type.error();

        auto level = applyLogLevel(config_.log_level);
        if (!level) {
            spdlog::warn("{}; keeping current log level", level.error().message);
        }

        if (type.value() == VectorBackendType::SqliteVec) {
            for (const char* sub : {"models", "documents"}) {
                std::error_code ec;
                std::filesystem::create_directories(config_.base_path / sub, ec);
                if (ec) {
                    return Error{ErrorCode::IOError, "Failed to create " +
                                                         (config_.base_path / sub).string() +
                                                         ": " + ec.message()};
                }
            }
        }

        backendType_ = type.value();
        initialized_ = true;
        spdlog::info("Vector store initialized (backend={}, base={}, accelerated={})",
                     backendTypeToString(backendType_), config_.base_path.string(),
                     config_.enable_accelerated);
        return {};
    }

    Result<void> requireInitialized() const {
        if (!initialized_) {
            return Error{ErrorCode::NotInitialized, "Vector store not initialized"};
        }
        return {};
    }

    PoolKey keyFor(const std::string& model, size_t dim, std::optional<int64_t> docId) const {
        return docId ? PoolKey::forDocument(*docId, model, dim, config_.base_path)
                     : PoolKey::forModel(model, dim, config_.base_path);
    }

    Result<BackendPtr> resolve(const std::string& model, size_t dim, std::optional<int64_t> docId,
                               bool create, const std::string& indexType = {}) {
        InstanceFactoryConfig factory;
        factory.type = backendType_;
        factory.basePath = config_.base_path;
        factory.index.modelName = model;
        factory.index.dimension = dim;
        factory.index.documentId = docId;
        factory.index.indexType = indexType.empty() ? config_.default_index_type : indexType;
        factory.options.enable_accelerated = config_.enable_accelerated;
        factory.options.busy_timeout = config_.busy_timeout;
        factory.create_if_missing = create;
        return pool_->getInstance(keyFor(model, dim, docId), factory);
    }

    std::filesystem::path indexPath(const std::string& model, size_t dim,
                                    std::optional<int64_t> docId) const {
        return indexFilePath(config_.base_path, indexFileExtension(backendType_), model, dim,
                             docId);
    }

    void rememberDocument(int64_t docId, const std::string& model, size_t dim) {
        std::lock_guard<std::mutex> lock(mutex_);
        knownDocuments_.emplace(docId, model, dim);
        if (!currentModel_) {
            currentModel_ = EmbeddingModelConfig{model, dim};
            spdlog::debug("Current model set to {}/{}", model, dim);
        }
    }

    Result<VectorSearchResult> runSearch(const std::vector<float>& query, size_t k,
                                         const std::string& model, size_t dim,
                                         std::optional<int64_t> docId,
                                         std::optional<float> threshold) {
        if (query.size() != dim) {
            return Error{ErrorCode::ValidationError,
                         "Query vector dimension mismatch: expected " + std::to_string(dim) +
                             ", got " + std::to_string(query.size())};
        }

        auto instance = resolve(model, dim, docId, false);
        if (!instance) {
            if (instance.error().code == ErrorCode::NotFound) {
                spdlog::debug("No index for {}/{}{}; returning empty result", model, dim,
                              docId ? " document " + std::to_string(*docId) : "");
                return VectorSearchResult{};
            }
            return instance.error();
        }

        return threshold ? instance.value()->searchWithThreshold(query, k, *threshold)
                         : instance.value()->search(query, k);
    }

    /// Model and dimension a search without explicit arguments should target
    std::optional<EmbeddingModelConfig> searchTarget(const std::vector<float>& query,
                                                     const std::optional<std::string>& model,
                                                     std::optional<size_t> dim) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (model) {
            size_t d = dim ? *dim
                           : (currentModel_ && currentModel_->name == *model
                                  ? currentModel_->dimensions
                                  : query.size());
            return EmbeddingModelConfig{*model, d};
        }
        if (currentModel_) {
            return EmbeddingModelConfig{currentModel_->name,
                                        dim.value_or(currentModel_->dimensions)};
        }
        return std::nullopt;
    }

    Result<BackendPtr> currentInstance(bool create) {
        auto ready = requireInitialized();
        if (!ready)
            return ready.error();

        std::optional<EmbeddingModelConfig> current;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            current = currentModel_;
        }
        if (!current) {
            return Error{ErrorCode::InvalidState, "No current model; create or load an index first"};
        }
        return resolve(current->name, current->dimensions, std::nullopt, create);
    }

    config::VectorStoreConfig config_;
    std::shared_ptr<InstancePool> pool_;
    VectorBackendType backendType_ = VectorBackendType::SqliteVec;
    std::atomic<bool> initialized_{false};

    mutable std::mutex mutex_;
    std::optional<EmbeddingModelConfig> currentModel_;
    std::set<std::tuple<int64_t, std::string, size_t>> knownDocuments_;
};

VectorStore::VectorStore(config::VectorStoreConfig config, std::shared_ptr<InstancePool> pool)
    : pImpl(std::make_unique<Impl>(std::move(config), std::move(pool))) {}

VectorStore::~VectorStore() {
    if (pImpl && pImpl->initialized_) {
        shutdown();
    }
}

Result<void> VectorStore::initialize() {
    return pImpl->initialize();
}

bool VectorStore::isInitialized() const {
    return pImpl->initialized_;
}

void VectorStore::shutdown() {
    auto size = pImpl->pool_->size();
    pImpl->pool_->clearAll();
    pImpl->initialized_ = false;
    spdlog::info("Vector store shut down ({} pooled indices released)", size);
}

const config::VectorStoreConfig& VectorStore::config() const {
    return pImpl->config_;
}

Result<void> VectorStore::createIndex(const std::string& modelName, size_t dimension,
                                      const std::string& indexType) {
    auto ready = pImpl->requireInitialized();
    if (!ready)
        return ready;
    if (modelName.empty() || dimension == 0) {
        return Error{ErrorCode::ValidationError, "Model name and dimension are required"};
    }

    auto instance = pImpl->resolve(modelName, dimension, std::nullopt, true, indexType);
    if (!instance)
        return instance.error();

    std::lock_guard<std::mutex> lock(pImpl->mutex_);
    pImpl->currentModel_ = EmbeddingModelConfig{modelName, dimension};
    return {};
}

Result<void> VectorStore::loadIndex(const std::string& modelName, size_t dimension) {
    auto ready = pImpl->requireInitialized();
    if (!ready)
        return ready;

    auto instance = pImpl->resolve(modelName, dimension, std::nullopt, false);
    if (!instance)
        return instance.error();

    std::lock_guard<std::mutex> lock(pImpl->mutex_);
    pImpl->currentModel_ = EmbeddingModelConfig{modelName, dimension};
    return {};
}

Result<void> VectorStore::switchModel(const std::string& modelName, size_t dimension) {
    if (currentModel()) {
        auto saved = saveIndex();
        if (!saved && saved.error().code != ErrorCode::NotFound) {
            spdlog::warn("Failed to save current index before switching model: {}",
                         saved.error().message);
        }
    }
    return createIndex(modelName, dimension);
}

std::optional<EmbeddingModelConfig> VectorStore::currentModel() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex_);
    return pImpl->currentModel_;
}

Result<void> VectorStore::storeEmbedding(const EmbeddingRecord& record) {
    VECSTORE_ZONE_SCOPED_N("VectorStore::storeEmbedding");

    auto ready = pImpl->requireInitialized();
    if (!ready)
        return ready;
    auto valid = validateRecord(record);
    if (!valid)
        return valid;

    auto docIndex = pImpl->resolve(record.model, record.dimensions, record.documentId, true);
    if (!docIndex)
        return docIndex.error();
    auto added = docIndex.value()->addVectors(record.embedding, record.chunkId);
    if (!added)
        return added;
    pImpl->rememberDocument(record.documentId, record.model, record.dimensions);

    if (pImpl->config_.mirror_to_model_index) {
        auto modelIndex = pImpl->resolve(record.model, record.dimensions, std::nullopt, true);
        if (!modelIndex)
            return modelIndex.error();
        auto mirrored = modelIndex.value()->addVectors(record.embedding, record.chunkId);
        if (!mirrored) {
            spdlog::error("Chunk {} stored for document {} but not in the {} model index: {}",
                          record.chunkId, record.documentId, record.model,
                          mirrored.error().message);
            return mirrored;
        }
    }
    return {};
}

Result<size_t> VectorStore::storeEmbeddings(const std::vector<EmbeddingRecord>& records) {
    VECSTORE_ZONE_SCOPED_N("VectorStore::storeEmbeddings");

    auto ready = pImpl->requireInitialized();
    if (!ready)
        return ready.error();

    using DocKey = std::tuple<int64_t, std::string, size_t>;
    using ModelKey = std::pair<std::string, size_t>;
    std::map<DocKey, std::vector<VectorEntry>> byDocument;
    std::map<ModelKey, std::vector<VectorEntry>> byModel;

    for (const auto& record : records) {
        auto valid = validateRecord(record);
        if (!valid)
            return valid.error();
        VectorEntry entry{record.chunkId, record.embedding};
        byDocument[DocKey{record.documentId, record.model, record.dimensions}].push_back(entry);
        if (pImpl->config_.mirror_to_model_index) {
            byModel[ModelKey{record.model, record.dimensions}].push_back(std::move(entry));
        }
    }

    size_t stored = 0;
    for (const auto& [key, entries] : byDocument) {
        const auto& [docId, model, dim] = key;
        auto instance = pImpl->resolve(model, dim, docId, true);
        if (!instance)
            return instance.error();
        auto added = instance.value()->addVectorBatch(entries);
        if (!added)
            return added;
        stored += added.value();
        pImpl->rememberDocument(docId, model, dim);
    }

    for (const auto& [key, entries] : byModel) {
        auto instance = pImpl->resolve(key.first, key.second, std::nullopt, true);
        if (!instance)
            return instance.error();
        auto added = instance.value()->addVectorBatch(entries);
        if (!added)
            return added;
    }

    spdlog::debug("Stored {} embeddings across {} document indices", stored, byDocument.size());
    return stored;
}

Result<VectorSearchResult> VectorStore::search(const std::vector<float>& queryVector, size_t k,
                                               const std::optional<std::string>& modelName,
                                               std::optional<size_t> dimension,
                                               std::optional<float> distanceThreshold) {
    auto ready = pImpl->requireInitialized();
    if (!ready)
        return ready.error();
    if (queryVector.empty()) {
        return Error{ErrorCode::ValidationError, "Query vector must not be empty"};
    }

    auto target = pImpl->searchTarget(queryVector, modelName, dimension);
    if (!target) {
        spdlog::debug("Search without a model and nothing indexed yet");
        return VectorSearchResult{};
    }
    return pImpl->runSearch(queryVector, k, target->name, target->dimensions, std::nullopt,
                            distanceThreshold);
}

Result<VectorSearchResult> VectorStore::searchDocument(const std::vector<float>& queryVector,
                                                       int64_t documentId, size_t k,
                                                       const std::optional<std::string>& modelName,
                                                       std::optional<size_t> dimension,
                                                       std::optional<float> distanceThreshold) {
    auto ready = pImpl->requireInitialized();
    if (!ready)
        return ready.error();
    if (queryVector.empty()) {
        return Error{ErrorCode::ValidationError, "Query vector must not be empty"};
    }

    auto target = pImpl->searchTarget(queryVector, modelName, dimension);
    if (!target) {
        return VectorSearchResult{};
    }
    return pImpl->runSearch(queryVector, k, target->name, target->dimensions, documentId,
                            distanceThreshold);
}

Result<void> VectorStore::deleteDocumentIndex(int64_t documentId) {
    VECSTORE_ZONE_SCOPED_N("VectorStore::deleteDocumentIndex");

    auto ready = pImpl->requireInitialized();
    if (!ready)
        return ready;

    std::set<std::pair<std::string, size_t>> specs;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex_);
        for (const auto& [docId, model, dim] : pImpl->knownDocuments_) {
            if (docId == documentId) {
                specs.emplace(model, dim);
            }
        }
    }

    const auto documentsDir = pImpl->config_.base_path / "documents";
    const std::string ext = indexFileExtension(pImpl->backendType_);
    std::error_code ec;
    if (std::filesystem::is_directory(documentsDir, ec)) {
        for (const auto& entry : std::filesystem::directory_iterator(documentsDir, ec)) {
            auto parsed = parseIndexFileName(entry.path().filename().string(), ext);
            if (parsed && parsed->documentId && *parsed->documentId == documentId) {
                specs.emplace(parsed->modelName, parsed->dimension);
            }
        }
    }
    if (ec) {
        spdlog::warn("Could not scan {}: {}", documentsDir.string(), ec.message());
    }

    Result<void> outcome;
    for (const auto& [model, dim] : specs) {
        std::vector<int64_t> chunkIds;

        auto instance = pImpl->resolve(model, dim, documentId, false);
        if (instance) {
            auto ids = instance.value()->chunkIds();
            if (ids) {
                chunkIds = ids.value();
            } else {
                keepFirstError(outcome, ids.error());
            }
            auto deleted = instance.value()->deleteDocumentIndex(documentId);
            if (!deleted)
                keepFirstError(outcome, deleted.error());
        } else if (instance.error().code != ErrorCode::NotFound) {
            keepFirstError(outcome, instance.error());
        }

        pImpl->pool_->clearInstance(pImpl->keyFor(model, dim, documentId));

        if (pImpl->backendType_ == VectorBackendType::SqliteVec) {
            // Covers files that never made it into the catalog
            auto removed = removeIndexFiles(pImpl->indexPath(model, dim, documentId));
            if (!removed)
                keepFirstError(outcome, removed.error());
        }

        if (pImpl->config_.mirror_to_model_index && !chunkIds.empty()) {
            auto modelIndex = pImpl->resolve(model, dim, std::nullopt, false);
            if (modelIndex) {
                auto removed = modelIndex.value()->removeVectors(chunkIds);
                if (!removed)
                    keepFirstError(outcome, removed.error());
            } else if (modelIndex.error().code != ErrorCode::NotFound) {
                keepFirstError(outcome, modelIndex.error());
            }
        }

        std::lock_guard<std::mutex> lock(pImpl->mutex_);
        pImpl->knownDocuments_.erase(std::make_tuple(documentId, model, dim));
    }

    if (!specs.empty()) {
        spdlog::info("Deleted {} index(es) of document {}", specs.size(), documentId);
    }
    return outcome;
}

Result<void> VectorStore::deleteModelIndex(const std::string& modelName, size_t dimension) {
    auto ready = pImpl->requireInitialized();
    if (!ready)
        return ready;

    auto instance = pImpl->resolve(modelName, dimension, std::nullopt, false);
    if (instance) {
        instance.value()->cleanup();
    } else if (instance.error().code != ErrorCode::NotFound) {
        return instance.error();
    }
    pImpl->pool_->clearInstance(pImpl->keyFor(modelName, dimension, std::nullopt));

    if (pImpl->backendType_ == VectorBackendType::SqliteVec) {
        auto removed = removeIndexFiles(pImpl->indexPath(modelName, dimension, std::nullopt));
        if (!removed)
            return removed;
    }
    spdlog::info("Deleted model index {}/{}", modelName, dimension);
    return {};
}

bool VectorStore::documentIndexExists(int64_t documentId, const std::string& modelName,
                                      size_t dimension) const {
    if (pImpl->backendType_ == VectorBackendType::InMemory) {
        return pImpl->pool_->hasInstance(pImpl->keyFor(modelName, dimension, documentId));
    }
    std::error_code ec;
    return std::filesystem::exists(pImpl->indexPath(modelName, dimension, documentId), ec);
}

std::filesystem::path VectorStore::documentIndexPath(int64_t documentId,
                                                     const std::string& modelName,
                                                     size_t dimension) const {
    return pImpl->indexPath(modelName, dimension, documentId);
}

Result<IndexStats> VectorStore::getIndexStats() {
    IndexStats stats;
    stats.indexType = pImpl->config_.default_index_type;

    auto current = currentModel();
    if (!pImpl->initialized_ || !current) {
        return stats;
    }
    stats.currentModel = current->name;
    stats.dimension = current->dimensions;

    auto instance = pImpl->resolve(current->name, current->dimensions, std::nullopt, false);
    if (!instance) {
        if (instance.error().code == ErrorCode::NotFound)
            return stats;
        return instance.error();
    }

    auto backendStats = instance.value()->getStats();
    if (!backendStats)
        return backendStats;
    stats = backendStats.value();
    stats.currentModel = current->name;
    return stats;
}

Result<void> VectorStore::saveIndex() {
    auto instance = pImpl->currentInstance(false);
    if (!instance)
        return instance.error();
    return instance.value()->saveIndex();
}

Result<void> VectorStore::resetIndex() {
    auto instance = pImpl->currentInstance(false);
    if (!instance)
        return instance.error();
    return instance.value()->resetIndex();
}

Result<void> VectorStore::optimizeIndex() {
    auto instance = pImpl->currentInstance(false);
    if (!instance)
        return instance.error();
    return instance.value()->optimizeIndex();
}

Result<void> VectorStore::backupIndex(const std::filesystem::path& path) {
    auto instance = pImpl->currentInstance(false);
    if (!instance)
        return instance.error();
    return instance.value()->backupIndex(path);
}

Result<void> VectorStore::restoreIndex(const std::filesystem::path& path) {
    auto instance = pImpl->currentInstance(true);
    if (!instance)
        return instance.error();
    return instance.value()->restoreIndex(path);
}

InstancePool::Stats VectorStore::poolStats() const {
    return pImpl->pool_->stats();
}

void VectorStore::clearPool() {
    pImpl->pool_->clearAll();
}

} // namespace vecstore::vector
