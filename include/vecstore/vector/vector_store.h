#pragma once

#include <vecstore/config/vector_store_config.h>
#include <vecstore/core/types.h>
#include <vecstore/vector/embedding_record.h>
#include <vecstore/vector/index_types.h>
#include <vecstore/vector/instance_pool.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vecstore::vector {

/**
 * @brief Model whose corpus-wide index is the default target of search and maintenance calls
 */
struct EmbeddingModelConfig {
    std::string name;
    size_t dimensions = 0;
};

/**
 * @brief Public entry point of the embedding store
 *
 * Writes go to the per-document index of the record and, when mirror_to_model_index is set, to
 * the corpus-wide index of its model. Every logical index is resolved through the instance
 * pool. Searching an index that was never written returns an empty result and creates nothing.
 */
class VectorStore {
public:
    explicit VectorStore(config::VectorStoreConfig config,
                         std::shared_ptr<InstancePool> pool = nullptr);
    ~VectorStore();

    VectorStore(const VectorStore&) = delete;
    VectorStore& operator=(const VectorStore&) = delete;

    /**
     * @brief Validate the configuration, apply the log level and create the base directories
     */
    Result<void> initialize();
    bool isInitialized() const;

    /**
     * @brief Flush and release every pooled index
     */
    void shutdown();

    // Corpus-wide index management
    Result<void> createIndex(const std::string& modelName, size_t dimension,
                             const std::string& indexType = {});
    Result<void> loadIndex(const std::string& modelName, size_t dimension);
    Result<void> switchModel(const std::string& modelName, size_t dimension);
    std::optional<EmbeddingModelConfig> currentModel() const;

    Result<void> storeEmbedding(const EmbeddingRecord& record);

    /**
     * @brief Store several records; all are validated before the first write
     * @return Number of records stored
     */
    Result<size_t> storeEmbeddings(const std::vector<EmbeddingRecord>& records);

    /**
     * @brief k-NN over the corpus-wide index of a model (current model by default)
     */
    Result<VectorSearchResult> search(const std::vector<float>& queryVector, size_t k = 10,
                                      const std::optional<std::string>& modelName = std::nullopt,
                                      std::optional<size_t> dimension = std::nullopt,
                                      std::optional<float> distanceThreshold = std::nullopt);

    /**
     * @brief k-NN restricted to one document's index
     */
    Result<VectorSearchResult>
    searchDocument(const std::vector<float>& queryVector, int64_t documentId, size_t k = 10,
                   const std::optional<std::string>& modelName = std::nullopt,
                   std::optional<size_t> dimension = std::nullopt,
                   std::optional<float> distanceThreshold = std::nullopt);

    /**
     * @brief Remove every per-document index of documentId (all models)
     *
     * Evicts the pooled instances and removes the document's chunk ids from the matching
     * corpus-wide indices. Deleting a document without indices is a no-op.
     */
    Result<void> deleteDocumentIndex(int64_t documentId);

    Result<void> deleteModelIndex(const std::string& modelName, size_t dimension);

    bool documentIndexExists(int64_t documentId, const std::string& modelName,
                             size_t dimension) const;
    std::filesystem::path documentIndexPath(int64_t documentId, const std::string& modelName,
                                            size_t dimension) const;

    /**
     * @brief Stats of the current model's corpus-wide index
     */
    Result<IndexStats> getIndexStats();

    // Maintenance of the current model's corpus-wide index
    Result<void> saveIndex();
    Result<void> resetIndex();
    Result<void> optimizeIndex();
    Result<void> backupIndex(const std::filesystem::path& path);
    Result<void> restoreIndex(const std::filesystem::path& path);

    InstancePool::Stats poolStats() const;
    void clearPool();

    const config::VectorStoreConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace vecstore::vector
