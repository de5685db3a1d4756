#pragma once

#include <vecstore/core/types.h>
#include <vecstore/vector/index_types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vecstore::vector {

/**
 * @brief Available index storage engines
 */
enum class VectorBackendType {
    SqliteVec, ///< SQLite database per index, vec0 table when available
    InMemory   ///< Process-local brute-force index
};

const char* backendTypeToString(VectorBackendType type);

/**
 * @brief Connection-level settings shared by all backends
 */
struct BackendOptions {
    bool enable_accelerated = true;
    std::chrono::milliseconds busy_timeout{5000};
};

Result<VectorBackendType> parseBackendType(const std::string& name);

/// Extension (without dot) of the index files a backend type writes
const char* indexFileExtension(VectorBackendType type);

/**
 * @brief Abstract interface for one logical vector index
 *
 * An instance is bound to a single (model, dimension[, document]) index by createIndex() or
 * loadIndex(). Implementations are safe to call from several threads.
 */
class IVectorIndexBackend {
public:
    virtual ~IVectorIndexBackend() = default;

    /**
     * @brief Prepare the backend; must be called before any other operation
     */
    virtual Result<void> initialize() = 0;

    /**
     * @brief Open or create the index described by config and ensure its table exists
     * @return Location of the index (file path for persistent backends)
     */
    virtual Result<std::string> createIndex(const IndexConfig& config) = 0;

    /**
     * @brief Open an existing index
     * @return NotFound when the index has never been created
     */
    virtual Result<void> loadIndex(const IndexConfig& config) = 0;

    /**
     * @brief Flush pending writes to durable storage
     */
    virtual Result<void> saveIndex() = 0;

    virtual Result<void> addVectors(const std::vector<float>& vector, int64_t chunkId) = 0;

    /**
     * @brief Insert a batch atomically
     * @return Number of vectors written
     */
    virtual Result<size_t> addVectorBatch(const std::vector<VectorEntry>& entries) = 0;

    virtual Result<size_t> removeVectors(const std::vector<int64_t>& chunkIds) = 0;

    virtual Result<VectorSearchResult> search(const std::vector<float>& query, size_t k) = 0;

    virtual Result<VectorSearchResult> searchWithThreshold(const std::vector<float>& query,
                                                           size_t k, float distanceThreshold) = 0;

    virtual Result<std::vector<int64_t>> chunkIds() = 0;

    virtual Result<IndexStats> getStats() = 0;

    /**
     * @brief Remove every vector, keeping the index itself
     */
    virtual Result<void> resetIndex() = 0;

    virtual Result<void> optimizeIndex() = 0;

    virtual Result<void> backupIndex(const std::filesystem::path& path) = 0;
    virtual Result<void> restoreIndex(const std::filesystem::path& path) = 0;

    /**
     * @brief Release the underlying storage; the instance must be re-initialized afterwards
     */
    virtual void cleanup() = 0;

    /**
     * @brief Whether a per-document index exists for documentId with this instance's
     *        model and dimension
     */
    virtual bool documentIndexExists(int64_t documentId) const = 0;

    /**
     * @brief Drop the per-document index for documentId (same model and dimension)
     *
     * Deleting an index that does not exist is a no-op.
     */
    virtual Result<void> deleteDocumentIndex(int64_t documentId) = 0;

    virtual bool isInitialized() const = 0;

    /// Initialized and bound to an index
    virtual bool isReady() const = 0;

    virtual std::string indexPath() const = 0;

    virtual BackendCapabilities capabilities() const = 0;

    virtual const IndexConfig& config() const = 0;
};

/**
 * @brief Create a backend instance rooted at basePath
 */
std::unique_ptr<IVectorIndexBackend>
createVectorIndexBackend(VectorBackendType type, const std::filesystem::path& basePath,
                         const BackendOptions& options = {});

} // namespace vecstore::vector
