#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vecstore::vector {

/**
 * @brief Catalog row describing one logical index
 */
struct IndexMetadata {
    int64_t id = 0;
    std::string modelName;
    size_t dimension = 0;
    std::optional<int64_t> documentId; ///< Set for per-document indices
    std::string tableIdentifier;
    std::string indexType = "flat";
    int64_t totalVectors = 0;
    int64_t createdAt = 0; ///< Unix seconds
};

/**
 * @brief Which logical index a backend instance serves
 */
struct IndexConfig {
    std::string modelName;
    size_t dimension = 0;
    std::optional<int64_t> documentId;
    std::string indexType = "flat";
};

/**
 * @brief One (chunk id, embedding) pair for batch writes
 */
struct VectorEntry {
    int64_t chunkId = 0;
    std::vector<float> embedding;
};

/**
 * @brief k-NN result as parallel arrays ordered by ascending distance
 *
 * indices[i] == i; it is a rank, not a row id.
 */
struct VectorSearchResult {
    std::vector<int64_t> chunkIds;
    std::vector<float> distances;
    std::vector<size_t> indices;

    [[nodiscard]] size_t size() const { return chunkIds.size(); }
    [[nodiscard]] bool empty() const { return chunkIds.empty(); }

    void push(int64_t chunkId, float distance) {
        indices.push_back(chunkIds.size());
        chunkIds.push_back(chunkId);
        distances.push_back(distance);
    }
};

struct IndexStats {
    size_t totalVectors = 0;
    size_t dimension = 0;
    std::string indexType;
    bool isInitialized = false;
    std::string currentModel;
};

/**
 * @brief Result of probing a connection for the accelerated vec0 module
 */
struct BackendCapabilities {
    bool accelerated = false;
    std::string detail; ///< Why acceleration is (un)available, for logs and diagnostics
};

} // namespace vecstore::vector
