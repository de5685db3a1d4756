#pragma once

#include <vecstore/core/types.h>

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace vecstore::vector {

/**
 * @brief One embedding as handed over by the producer
 *
 * content and metadata belong to the chunk store; the index only persists chunkId and the
 * embedding.
 */
struct EmbeddingRecord {
    int64_t chunkId = 0;
    int64_t documentId = 0;
    std::string content;
    std::vector<float> embedding;
    std::string model;
    size_t dimensions = 0;
    nlohmann::json metadata;

    /**
     * @brief Decode {chunkId, documentId, content?, embedding, model, dimensions?, metadata?}
     *
     * chunkId goes through normalizeChunkId(); dimensions defaults to the embedding length.
     */
    static Result<EmbeddingRecord> fromJson(const nlohmann::json& j);

    nlohmann::json toJson() const;
};

} // namespace vecstore::vector
