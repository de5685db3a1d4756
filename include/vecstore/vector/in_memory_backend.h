#pragma once

#include <vecstore/vector/abstract_vector_backend.h>

#include <mutex>

namespace vecstore::vector {

/**
 * @brief Process-local index with exact brute-force search
 *
 * Nothing is persisted except through backupIndex(); loadIndex() therefore only succeeds for
 * the index the instance already holds.
 */
class InMemoryBackend : public AbstractVectorIndexBackend {
public:
    explicit InMemoryBackend(std::filesystem::path basePath);
    ~InMemoryBackend() override = default;

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

    bool documentIndexExists(int64_t documentId) const override;
    Result<void> deleteDocumentIndex(int64_t documentId) override;

    bool isInitialized() const override;
    bool isReady() const override;
    std::string indexPath() const override;
    BackendCapabilities capabilities() const override;

protected:
    std::string fileExtension() const override {
        return indexFileExtension(VectorBackendType::InMemory);
    }

private:
    Result<void> requireReady() const;
    Result<VectorSearchResult> searchLocked(const std::vector<float>& query, size_t k,
                                            std::optional<float> threshold) const;

    mutable std::mutex mutex_;
    bool initialized_ = false;
    bool bound_ = false;
    std::vector<VectorEntry> rows_;
};

} // namespace vecstore::vector
