#include <spdlog/spdlog.h>
#include <vecstore/profiling.h>
#include <vecstore/vector/distance.h>
#include <vecstore/vector/vector_record_store.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace vecstore::vector {

namespace {

Result<void> validateEmbedding(std::span<const float> embedding, size_t dimension,
                               const char* what) {
    if (embedding.empty()) {
        return Error{ErrorCode::ValidationError, std::string(what) + " must not be empty"};
    }
    if (embedding.size() != dimension) {
        return Error{ErrorCode::ValidationError,
                     std::string(what) + " dimension mismatch: expected " +
                         std::to_string(dimension) + ", got " + std::to_string(embedding.size())};
    }
    for (float v : embedding) {
        if (!std::isfinite(v)) {
            return Error{ErrorCode::ValidationError,
                         std::string(what) + " contains a non-finite value"};
        }
    }
    return {};
}

std::span<const std::byte> asBytes(const std::vector<std::byte>& blob) {
    return {blob.data(), blob.size()};
}

} // namespace

Result<int64_t> normalizeChunkId(double raw) {
    if (!std::isfinite(raw)) {
        return Error{ErrorCode::ValidationError, "Chunk id must be a finite number"};
    }
    double truncated = std::trunc(raw);
    // 2^63 is exactly representable; anything at or above it overflows int64
    constexpr double kLimit = 9223372036854775808.0;
    if (truncated >= kLimit || truncated < -kLimit) {
        return Error{ErrorCode::ValidationError,
                     "Chunk id out of range: " + std::to_string(raw)};
    }
    if (truncated != raw) {
        spdlog::warn("Fractional chunk id {} truncated to {}", raw,
                     static_cast<int64_t>(truncated));
    }
    return static_cast<int64_t>(truncated);
}

VectorRecordStore::VectorRecordStore(metadata::Database& db, VirtualIndexManager& indexManager)
    : db_(db), indexManager_(indexManager) {}

SearchPath chooseSearchPath(bool moduleAvailable, TableKind kind, size_t k) {
    if (moduleAvailable && kind == TableKind::Accelerated && k <= kMaxAcceleratedK) {
        return SearchPath::Accelerated;
    }
    return SearchPath::BruteForce;
}

Result<TableKind> VectorRecordStore::writableKind(const TableIdentifier& table) {
    auto kind = indexManager_.tableKind(table);
    if (!kind)
        return kind.error();
    if (kind.value() == TableKind::Accelerated && !indexManager_.accelerated()) {
        return Error{ErrorCode::SchemaError,
                     "Table '" + table.str() +
                         "' is a vec0 table but the vec0 module is not available"};
    }
    return kind.value();
}

Result<TableKind> VectorRecordStore::readableKind(const TableIdentifier& table) {
    auto kind = indexManager_.tableKind(table);
    if (!kind)
        return kind.error();
    if (kind.value() == TableKind::Accelerated && !indexManager_.accelerated()) {
        // The rows exist but cannot be read without the module; report an empty table
        spdlog::warn("Table '{}' is a vec0 table but the vec0 module is not available; "
                     "reading it as empty",
                     table.str());
        return TableKind::Missing;
    }
    return kind.value();
}

Result<void> VectorRecordStore::insertRow(const TableIdentifier& table, int64_t chunkId,
                                          std::span<const float> embedding) {
    auto stmtResult =
        db_.prepare("INSERT INTO " + table.quoted() + " (chunk_id, embedding) VALUES (?, ?)");
    if (!stmtResult)
        return stmtResult.error();

    auto stmt = std::move(stmtResult).value();
    auto blob = encodeVector(embedding);
    auto bindResult = stmt.bindAll(chunkId, asBytes(blob));
    if (!bindResult)
        return bindResult;
    return stmt.execute();
}

Result<void> VectorRecordStore::addVector(const TableIdentifier& table, int64_t chunkId,
                                          std::span<const float> embedding, size_t dimension) {
    VECSTORE_ZONE_SCOPED_N("VectorRecordStore::addVector");

    auto valid = validateEmbedding(embedding, dimension, "Embedding");
    if (!valid)
        return valid;

    auto kind = writableKind(table);
    if (!kind)
        return kind.error();
    if (kind.value() == TableKind::Missing) {
        return Error{ErrorCode::NotFound, "Vector table '" + table.str() + "' does not exist"};
    }
    return insertRow(table, chunkId, embedding);
}

Result<size_t> VectorRecordStore::addVectors(const TableIdentifier& table,
                                             const std::vector<VectorEntry>& entries,
                                             size_t dimension) {
    VECSTORE_ZONE_SCOPED_N("VectorRecordStore::addVectors");

    for (size_t i = 0; i < entries.size(); ++i) {
        auto valid = validateEmbedding(entries[i].embedding, dimension, "Embedding");
        if (!valid) {
            return Error{valid.error().code,
                         valid.error().message + " (entry " + std::to_string(i) + ", chunk " +
                             std::to_string(entries[i].chunkId) + ")"};
        }
    }
    if (entries.empty()) {
        return size_t{0};
    }

    auto kind = writableKind(table);
    if (!kind)
        return kind.error();
    if (kind.value() == TableKind::Missing) {
        return Error{ErrorCode::NotFound, "Vector table '" + table.str() + "' does not exist"};
    }

    auto txResult = db_.transaction([&]() -> Result<void> {
        for (const auto& entry : entries) {
            auto r = insertRow(table, entry.chunkId, entry.embedding);
            if (!r)
                return r;
        }
        return {};
    });
    if (!txResult)
        return txResult.error();

    spdlog::debug("Inserted {} vectors into '{}'", entries.size(), table.str());
    return entries.size();
}

Result<size_t> VectorRecordStore::deleteByChunkId(const TableIdentifier& table, int64_t chunkId) {
    const int64_t ids[] = {chunkId};
    return deleteByChunkIds(table, ids);
}

Result<size_t> VectorRecordStore::deleteByChunkIds(const TableIdentifier& table,
                                                   std::span<const int64_t> chunkIds) {
    if (chunkIds.empty()) {
        return size_t{0};
    }

    auto kind = writableKind(table);
    if (!kind)
        return kind.error();
    if (kind.value() == TableKind::Missing) {
        return size_t{0};
    }

    auto stmtResult = db_.prepare("DELETE FROM " + table.quoted() + " WHERE chunk_id = ?");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();

    size_t removed = 0;
    auto txResult = db_.transaction([&]() -> Result<void> {
        for (int64_t id : chunkIds) {
            auto r = stmt.reset();
            if (!r)
                return r;
            r = stmt.bind(1, id);
            if (!r)
                return r;
            r = stmt.execute();
            if (!r)
                return r;
            removed += static_cast<size_t>(db_.changes());
        }
        return {};
    });
    if (!txResult)
        return txResult.error();

    spdlog::debug("Removed {} rows for {} chunk ids from '{}'", removed, chunkIds.size(),
                  table.str());
    return removed;
}

Result<size_t> VectorRecordStore::count(const TableIdentifier& table) {
    auto kind = readableKind(table);
    if (!kind)
        return kind.error();
    if (kind.value() == TableKind::Missing) {
        return size_t{0};
    }

    auto stmtResult = db_.prepare("SELECT COUNT(*) FROM " + table.quoted());
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    return static_cast<size_t>(stmt.getInt64(0));
}

Result<std::vector<int64_t>> VectorRecordStore::chunkIds(const TableIdentifier& table) {
    auto kind = readableKind(table);
    if (!kind)
        return kind.error();
    if (kind.value() == TableKind::Missing) {
        return std::vector<int64_t>{};
    }

    auto stmtResult =
        db_.prepare("SELECT DISTINCT chunk_id FROM " + table.quoted() + " ORDER BY chunk_id");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();

    std::vector<int64_t> ids;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;
        ids.push_back(stmt.getInt64(0));
    }
    return ids;
}

Result<VectorSearchResult> VectorRecordStore::collect(metadata::Statement& stmt) {
    VectorSearchResult result;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;
        result.push(stmt.getInt64(0), static_cast<float>(stmt.getDouble(1)));
    }
    return result;
}

Result<VectorSearchResult> VectorRecordStore::searchAccelerated(const TableIdentifier& table,
                                                                std::span<const float> query,
                                                                size_t k,
                                                                std::optional<float> threshold) {
    // vec0 requires the k constraint on the KNN query itself
    std::string knn = "SELECT chunk_id, distance FROM " + table.quoted() +
                      " WHERE embedding MATCH ? AND k = ? ORDER BY distance";
    std::string sql =
        threshold ? "SELECT chunk_id, distance FROM (" + knn + ") WHERE distance <= ? "
                                                               "ORDER BY distance"
                  : knn;

    auto stmtResult = db_.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();

    auto blob = encodeVector(query);
    auto bindResult = threshold ? stmt.bindAll(asBytes(blob), static_cast<int64_t>(k),
                                               static_cast<double>(*threshold))
                                : stmt.bindAll(asBytes(blob), static_cast<int64_t>(k));
    if (!bindResult)
        return bindResult.error();
    return collect(stmt);
}

Result<VectorSearchResult> VectorRecordStore::searchBruteForce(const TableIdentifier& table,
                                                               std::span<const float> query,
                                                               size_t k,
                                                               std::optional<float> threshold) {
    std::string sql = std::string("SELECT chunk_id, distance FROM (SELECT chunk_id, ") +
                      kL2DistanceFunction + "(embedding, ?) AS distance FROM " + table.quoted() +
                      ")" + (threshold ? " WHERE distance <= ?" : "") +
                      " ORDER BY distance ASC, chunk_id ASC LIMIT ?";

    auto stmtResult = db_.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();

    auto blob = encodeVector(query);
    auto bindResult = threshold ? stmt.bindAll(asBytes(blob), static_cast<double>(*threshold),
                                               static_cast<int64_t>(k))
                                : stmt.bindAll(asBytes(blob), static_cast<int64_t>(k));
    if (!bindResult)
        return bindResult.error();
    return collect(stmt);
}

Result<VectorSearchResult> VectorRecordStore::search(const TableIdentifier& table,
                                                     std::span<const float> queryVector, size_t k,
                                                     std::optional<size_t> dimension,
                                                     std::optional<float> distanceThreshold) {
    VECSTORE_VECTOR_SEARCH_ZONE(k);

    if (queryVector.empty()) {
        return Error{ErrorCode::ValidationError, "Query vector must not be empty"};
    }
    if (dimension) {
        auto valid = validateEmbedding(queryVector, *dimension, "Query vector");
        if (!valid)
            return valid.error();
    }
    if (distanceThreshold && std::isnan(*distanceThreshold)) {
        return Error{ErrorCode::ValidationError, "Distance threshold must not be NaN"};
    }

    auto kind = readableKind(table);
    if (!kind)
        return kind.error();
    if (kind.value() == TableKind::Missing || k == 0) {
        return VectorSearchResult{};
    }

    if (!dimension) {
        auto declared = indexManager_.declaredDimension(table);
        if (!declared)
            return declared.error();
        if (declared.value()) {
            auto valid = validateEmbedding(queryVector, *declared.value(), "Query vector");
            if (!valid)
                return valid.error();
        }
    }

    auto total = count(table);
    if (!total)
        return total.error();
    if (total.value() == 0) {
        return VectorSearchResult{};
    }
    const size_t limit = std::min(k, total.value());

    const SearchPath path = chooseSearchPath(indexManager_.accelerated(), kind.value(), limit);
    spdlog::debug("Searching '{}' (k={}, rows={}, path={})", table.str(), limit, total.value(),
                  path == SearchPath::Accelerated ? "vec0" : "brute-force");

    auto result = path == SearchPath::Accelerated
                      ? searchAccelerated(table, queryVector, limit, distanceThreshold)
                      : searchBruteForce(table, queryVector, limit, distanceThreshold);
    if (!result) {
        spdlog::error("Vector search on '{}' failed: {}", table.str(), result.error().message);
    }
    return result;
}

} // namespace vecstore::vector
