#pragma once

#include <vecstore/core/types.h>
#include <vecstore/metadata/database.h>
#include <vecstore/vector/index_types.h>
#include <vecstore/vector/table_identifier.h>
#include <vecstore/vector/virtual_index_manager.h>

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace vecstore::vector {

/**
 * @brief Convert a chunk id received as a floating-point number to an integer
 *
 * Fractional values are truncated toward zero and logged; NaN, infinities and values outside
 * the int64 range are rejected with ValidationError.
 */
Result<int64_t> normalizeChunkId(double raw);

/// Largest k the vec0 KNN constraint accepts
inline constexpr size_t kMaxAcceleratedK = 4096;

enum class SearchPath { Accelerated, BruteForce };

/**
 * @brief Pick the k-NN strategy for a table
 *
 * vec0 is used only when the module is loaded, the table is a vec0 table and k is within
 * kMaxAcceleratedK; every other case scans the table with vecstore_l2_distance.
 */
SearchPath chooseSearchPath(bool moduleAvailable, TableKind kind, size_t k);

/**
 * @brief Row-level operations and k-NN search on one vector table
 *
 * Search takes the vec0 path only when the connection has the accelerated capability, the
 * table is a vec0 table and k fits the vec0 limit; otherwise it computes vecstore_l2_distance
 * over every row. A vec0 table opened without the module reads as empty and rejects writes
 * with SchemaError.
 * Not thread-safe; the owning backend serializes access.
 */
class VectorRecordStore {
public:
    VectorRecordStore(metadata::Database& db, VirtualIndexManager& indexManager);

    /**
     * @brief Insert one (chunkId, embedding) row
     * @return ValidationError when embedding is empty or embedding.size() != dimension
     */
    Result<void> addVector(const TableIdentifier& table, int64_t chunkId,
                           std::span<const float> embedding, size_t dimension);

    /**
     * @brief Insert several rows in one transaction
     *
     * Every entry is validated before the first write; on any failure nothing is written.
     * @return Number of rows inserted
     */
    Result<size_t> addVectors(const TableIdentifier& table, const std::vector<VectorEntry>& entries,
                              size_t dimension);

    /// Removing an unknown chunk id is not an error; returns rows removed
    Result<size_t> deleteByChunkId(const TableIdentifier& table, int64_t chunkId);
    Result<size_t> deleteByChunkIds(const TableIdentifier& table,
                                    std::span<const int64_t> chunkIds);

    /// 0 for a missing table
    Result<size_t> count(const TableIdentifier& table);

    /// Distinct chunk ids in ascending order; empty for a missing table
    Result<std::vector<int64_t>> chunkIds(const TableIdentifier& table);

    /**
     * @brief k nearest neighbours by L2 distance
     *
     * k is clamped to the row count. When distanceThreshold is set only rows with
     * distance <= threshold are returned; the filter is applied inside the query.
     * A missing table yields an empty result.
     */
    Result<VectorSearchResult> search(const TableIdentifier& table,
                                      std::span<const float> queryVector, size_t k,
                                      std::optional<size_t> dimension = std::nullopt,
                                      std::optional<float> distanceThreshold = std::nullopt);

private:
    Result<void> insertRow(const TableIdentifier& table, int64_t chunkId,
                           std::span<const float> embedding);
    Result<TableKind> writableKind(const TableIdentifier& table);
    Result<TableKind> readableKind(const TableIdentifier& table);
    Result<VectorSearchResult> searchAccelerated(const TableIdentifier& table,
                                                 std::span<const float> query, size_t k,
                                                 std::optional<float> threshold);
    Result<VectorSearchResult> searchBruteForce(const TableIdentifier& table,
                                                std::span<const float> query, size_t k,
                                                std::optional<float> threshold);
    Result<VectorSearchResult> collect(metadata::Statement& stmt);

    metadata::Database& db_;
    VirtualIndexManager& indexManager_;
};

} // namespace vecstore::vector
