#pragma once

#include <vecstore/metadata/database.h>
#include <vecstore/vector/abstract_vector_backend.h>
#include <vecstore/vector/metadata_catalog.h>
#include <vecstore/vector/table_identifier.h>
#include <vecstore/vector/vector_record_store.h>
#include <vecstore/vector/virtual_index_manager.h>

#include <memory>
#include <mutex>
#include <optional>

namespace vecstore::vector {

/**
 * @brief SQLite-backed vector index
 *
 * Each logical index lives in its own database file holding the catalog table and the vector
 * table. The sqlite-vec vec0 module is used when it can be registered on the connection;
 * otherwise the index runs in degraded mode with a plain table and brute-force search.
 */
class SqliteVecBackend : public AbstractVectorIndexBackend {
public:
    explicit SqliteVecBackend(std::filesystem::path basePath, BackendOptions options = {});
    ~SqliteVecBackend() override;

    SqliteVecBackend(const SqliteVecBackend&) = delete;
    SqliteVecBackend& operator=(const SqliteVecBackend&) = delete;

    Result<void> initialize() override;
    Result<std::string> createIndex(const IndexConfig& config) override;
    Result<void> loadIndex(const IndexConfig& config) override;
    Result<void> saveIndex() override;

    Result<void> addVectors(const std::vector<float>& vector, int64_t chunkId) override;
    Result<size_t> addVectorBatch(const std::vector<VectorEntry>& entries) override;
    Result<size_t> removeVectors(const std::vector<int64_t>& chunkIds) override;

    Result<VectorSearchResult> search(const std::vector<float>& query, size_t k) override;
    Result<VectorSearchResult> searchWithThreshold(const std::vector<float>& query, size_t k,
                                                   float distanceThreshold) override;
    Result<std::vector<int64_t>> chunkIds() override;

    Result<IndexStats> getStats() override;
    Result<void> resetIndex() override;
    Result<void> optimizeIndex() override;
    Result<void> backupIndex(const std::filesystem::path& path) override;
    Result<void> restoreIndex(const std::filesystem::path& path) override;
    void cleanup() override;

    Result<void> deleteDocumentIndex(int64_t documentId) override;

    bool isInitialized() const override;
    bool isReady() const override;
    std::string indexPath() const override;
    BackendCapabilities capabilities() const override;

    /// Catalog row of the bound index
    std::optional<IndexMetadata> metadata() const;

protected:
    std::string fileExtension() const override {
        return indexFileExtension(VectorBackendType::SqliteVec);
    }

private:
    Result<void> openDatabase(const std::filesystem::path& path, bool create);
    Result<void> bindIndex(const IndexConfig& config, bool create);
    Result<void> requireReady() const;
    Result<void> adjustCount(int64_t delta);
    void closeLocked();

    BackendOptions options_;
    mutable std::mutex mutex_;
    bool initialized_ = false;

    std::filesystem::path dbPath_;
    std::unique_ptr<metadata::Database> db_;
    std::unique_ptr<MetadataCatalog> catalog_;
    std::unique_ptr<VirtualIndexManager> indexManager_;
    std::unique_ptr<VectorRecordStore> records_;
    std::optional<IndexMetadata> metadata_;
    std::optional<TableIdentifier> table_;
};

} // namespace vecstore::vector
