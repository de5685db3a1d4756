#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <vecstore/profiling.h>
#include <vecstore/vector/distance.h>
#include <vecstore/vector/in_memory_backend.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <system_error>
#include <unordered_set>

namespace vecstore::vector {

namespace {
constexpr const char* kBackupFormat = "vecstore-memory";
}

InMemoryBackend::InMemoryBackend(std::filesystem::path basePath)
    : AbstractVectorIndexBackend(std::move(basePath)) {}

Result<void> InMemoryBackend::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    initialized_ = true;
    return {};
}

Result<std::string> InMemoryBackend::createIndex(const IndexConfig& config) {
    auto valid = validateConfig(config);
    if (!valid)
        return valid.error();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
        return Error{ErrorCode::NotInitialized, "Backend not initialized"};
    }
    if (bound_) {
        if (indexPathFor(config) == indexPathFor(config_)) {
            return "memory:" + indexPathFor(config_).string();
        }
        return Error{ErrorCode::InvalidState,
                     "Backend already bound to " + indexPathFor(config_).string()};
    }

    config_ = config;
    bound_ = true;
    rows_.clear();
    spdlog::debug("Created in-memory vector index {}/{}", config.modelName, config.dimension);
    return "memory:" + indexPathFor(config_).string();
}

Result<void> InMemoryBackend::loadIndex(const IndexConfig& config) {
    auto valid = validateConfig(config);
    if (!valid)
        return valid;

    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
        return Error{ErrorCode::NotInitialized, "Backend not initialized"};
    }
    if (bound_ && indexPathFor(config) == indexPathFor(config_)) {
        return {};
    }
    return Error{ErrorCode::NotFound,
                 "In-memory index " + indexPathFor(config).string() + " does not exist"};
}

Result<void> InMemoryBackend::saveIndex() {
    std::lock_guard<std::mutex> lock(mutex_);
    return requireReady();
}

Result<void> InMemoryBackend::requireReady() const {
    if (!initialized_) {
        return Error{ErrorCode::NotInitialized, "Backend not initialized"};
    }
    if (!bound_) {
        return Error{ErrorCode::InvalidState, "No index loaded"};
    }
    return {};
}

Result<void> InMemoryBackend::addVectors(const std::vector<float>& vector, int64_t chunkId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ready = requireReady();
    if (!ready)
        return ready;
    auto valid = validateDimensions(vector, config_.dimension);
    if (!valid)
        return valid;

    rows_.push_back(VectorEntry{chunkId, vector});
    return {};
}

Result<size_t> InMemoryBackend::addVectorBatch(const std::vector<VectorEntry>& entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ready = requireReady();
    if (!ready)
        return ready.error();

    for (const auto& entry : entries) {
        auto valid = validateDimensions(entry.embedding, config_.dimension);
        if (!valid)
            return valid.error();
    }
    rows_.insert(rows_.end(), entries.begin(), entries.end());
    return entries.size();
}

Result<size_t> InMemoryBackend::removeVectors(const std::vector<int64_t>& chunkIds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ready = requireReady();
    if (!ready)
        return ready.error();

    std::unordered_set<int64_t> doomed(chunkIds.begin(), chunkIds.end());
    size_t before = rows_.size();
    rows_.erase(std::remove_if(rows_.begin(), rows_.end(),
                               [&](const VectorEntry& e) { return doomed.count(e.chunkId) > 0; }),
                rows_.end());
    return before - rows_.size();
}

Result<VectorSearchResult> InMemoryBackend::searchLocked(const std::vector<float>& query,
                                                         size_t k,
                                                         std::optional<float> threshold) const {
    VECSTORE_VECTOR_SEARCH_ZONE(k);

    auto ready = requireReady();
    if (!ready)
        return ready.error();
    auto valid = validateDimensions(query, config_.dimension);
    if (!valid)
        return valid.error();
    if (threshold && std::isnan(*threshold)) {
        return Error{ErrorCode::ValidationError, "Distance threshold must not be NaN"};
    }

    VectorSearchResult result;
    if (rows_.empty() || k == 0) {
        return result;
    }

    std::vector<std::pair<float, int64_t>> scored;
    scored.reserve(rows_.size());
    for (const auto& row : rows_) {
        float d = l2Distance(query, row.embedding);
        if (threshold && d > *threshold)
            continue;
        scored.emplace_back(d, row.chunkId);
    }

    const size_t limit = std::min(k, scored.size());
    std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(limit),
                      scored.end());
    for (size_t i = 0; i < limit; ++i) {
        result.push(scored[i].second, scored[i].first);
    }
    return result;
}

Result<VectorSearchResult> InMemoryBackend::search(const std::vector<float>& query, size_t k) {
    std::lock_guard<std::mutex> lock(mutex_);
    return searchLocked(query, k, std::nullopt);
}

Result<VectorSearchResult> InMemoryBackend::searchWithThreshold(const std::vector<float>& query,
                                                                size_t k,
                                                                float distanceThreshold) {
    std::lock_guard<std::mutex> lock(mutex_);
    return searchLocked(query, k, distanceThreshold);
}

Result<std::vector<int64_t>> InMemoryBackend::chunkIds() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ready = requireReady();
    if (!ready)
        return ready.error();

    std::vector<int64_t> ids;
    ids.reserve(rows_.size());
    for (const auto& row : rows_) {
        ids.push_back(row.chunkId);
    }
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    return ids;
}

Result<IndexStats> InMemoryBackend::getStats() {
    std::lock_guard<std::mutex> lock(mutex_);
    IndexStats stats;
    stats.totalVectors = rows_.size();
    stats.dimension = config_.dimension;
    stats.indexType = config_.indexType;
    stats.isInitialized = initialized_ && bound_;
    return stats;
}

Result<void> InMemoryBackend::resetIndex() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ready = requireReady();
    if (!ready)
        return ready;
    rows_.clear();
    return {};
}

Result<void> InMemoryBackend::optimizeIndex() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ready = requireReady();
    if (!ready)
        return ready;
    rows_.shrink_to_fit();
    return {};
}

Result<void> InMemoryBackend::backupIndex(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ready = requireReady();
    if (!ready)
        return ready;

    auto dir = ensureIndexDirectory(path);
    if (!dir)
        return dir;

    nlohmann::json doc;
    doc["format"] = kBackupFormat;
    doc["model"] = config_.modelName;
    doc["dimension"] = config_.dimension;
    doc["index_type"] = config_.indexType;
    doc["document_id"] =
        config_.documentId ? nlohmann::json(*config_.documentId) : nlohmann::json(nullptr);
    auto& vectors = doc["vectors"] = nlohmann::json::array();
    for (const auto& row : rows_) {
        vectors.push_back({{"chunk_id", row.chunkId}, {"embedding", row.embedding}});
    }

    std::ofstream out(path);
    if (!out) {
        return Error{ErrorCode::IOError, "Failed to open backup file " + path.string()};
    }
    out << doc.dump();
    if (!out) {
        return Error{ErrorCode::IOError, "Failed to write backup file " + path.string()};
    }
    spdlog::info("Backed up in-memory index ({} vectors) to {}", rows_.size(), path.string());
    return {};
}

Result<void> InMemoryBackend::restoreIndex(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ready = requireReady();
    if (!ready)
        return ready;

    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::NotFound, "Backup not found: " + path.string()};
    }
    nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Error{ErrorCode::IntegrityError, "Not an in-memory index backup: " + path.string()};
    }

    std::vector<VectorEntry> restored;
    try {
        if (doc.value("format", std::string{}) != kBackupFormat) {
            return Error{ErrorCode::IntegrityError,
                         "Not an in-memory index backup: " + path.string()};
        }
        if (doc.value("dimension", size_t{0}) != config_.dimension) {
            return Error{ErrorCode::IntegrityError,
                         "Backup dimension does not match index dimension"};
        }
        for (const auto& item : doc.at("vectors")) {
            VectorEntry entry;
            entry.chunkId = item.at("chunk_id").get<int64_t>();
            entry.embedding = item.at("embedding").get<std::vector<float>>();
            auto valid = validateDimensions(entry.embedding, config_.dimension);
            if (!valid) {
                return Error{ErrorCode::IntegrityError, "Backup entry for chunk " +
                                                            std::to_string(entry.chunkId) + ": " +
                                                            valid.error().message};
            }
            restored.push_back(std::move(entry));
        }
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::IntegrityError, std::string("Corrupt backup: ") + e.what()};
    }

    rows_ = std::move(restored);
    spdlog::info("Restored in-memory index ({} vectors) from {}", rows_.size(), path.string());
    return {};
}

void InMemoryBackend::cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);
    rows_.clear();
    bound_ = false;
    initialized_ = false;
}

bool InMemoryBackend::documentIndexExists(int64_t documentId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bound_ && config_.documentId && *config_.documentId == documentId;
}

Result<void> InMemoryBackend::deleteDocumentIndex(int64_t documentId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (bound_ && config_.documentId && *config_.documentId == documentId) {
        rows_.clear();
        bound_ = false;
        spdlog::info("Deleted in-memory document index {}", documentId);
    }
    return {};
}

bool InMemoryBackend::isInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

bool InMemoryBackend::isReady() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_ && bound_;
}

std::string InMemoryBackend::indexPath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bound_ ? "memory:" + indexPathFor(config_).string() : std::string{};
}

BackendCapabilities InMemoryBackend::capabilities() const {
    return BackendCapabilities{false, "in-memory brute-force index"};
}

} // namespace vecstore::vector
