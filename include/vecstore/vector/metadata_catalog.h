#pragma once

#include <vecstore/core/types.h>
#include <vecstore/metadata/database.h>
#include <vecstore/vector/index_types.h>
#include <vecstore/vector/table_identifier.h>

#include <optional>
#include <string>
#include <vector>

namespace vecstore::vector {

/**
 * @brief Options for MetadataCatalog::getOrCreateMetadata
 */
struct MetadataOptions {
    std::optional<int64_t> documentId;
    std::optional<std::string> tableName; ///< Look up / register under an explicit table name
    std::string indexType = "flat";
};

/**
 * @brief Persistent registry of vector indices
 *
 * Maps (model, dimension[, document]) to a stable table identifier and index type. The catalog
 * only manages rows; dropping the physical table is VirtualIndexManager's job and callers
 * sequence the two.
 *
 * Not thread-safe; the owning backend serializes access to its connection.
 */
class MetadataCatalog {
public:
    static constexpr const char* kTableName = "vector_index_metadata";

    explicit MetadataCatalog(metadata::Database& db);

    /**
     * @brief Create the catalog table and its unique key if missing
     */
    Result<void> initializeSchema();

    /**
     * @brief Return the row for the key, creating it with totalVectors = 0 if absent
     *
     * Runs under BEGIN IMMEDIATE. A concurrent writer that wins the insert race is resolved by
     * re-reading its row.
     */
    Result<IndexMetadata> getOrCreateMetadata(const std::string& modelName, size_t dimension,
                                              const MetadataOptions& options = {});

    Result<std::optional<IndexMetadata>> findByTableIdentifier(const std::string& name);
    Result<std::optional<IndexMetadata>>
    findByModelAndDimension(const std::string& modelName, size_t dimension,
                            std::optional<int64_t> documentId = std::nullopt);
    Result<std::optional<IndexMetadata>> findById(int64_t id);
    Result<std::vector<IndexMetadata>> listAll();

    /// Adjust the vector counter; it never drops below zero
    Result<void> incrementVectorCount(int64_t id, int64_t delta);
    Result<void> setVectorCount(int64_t id, int64_t count);

    Result<void> deleteMetadata(int64_t id);

private:
    Result<std::optional<IndexMetadata>> queryOne(const std::string& whereClause,
                                                  const std::string& param);
    Result<std::optional<IndexMetadata>> findByKey(const std::string& modelName, size_t dimension,
                                                   std::optional<int64_t> documentId);
    Result<IndexMetadata> insertRow(const std::string& modelName, size_t dimension,
                                    const MetadataOptions& options);

    metadata::Database& db_;
};

} // namespace vecstore::vector
