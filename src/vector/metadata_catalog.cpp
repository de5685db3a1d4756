#include <spdlog/spdlog.h>
#include <vecstore/profiling.h>
#include <vecstore/vector/metadata_catalog.h>

#include <algorithm>
#include <chrono>

namespace vecstore::vector {

namespace {

constexpr const char* kSelectColumns =
    "SELECT id, model_name, dimension, document_id, table_name, index_type, total_vectors, "
    "created_at FROM vector_index_metadata ";

IndexMetadata readRow(const metadata::Statement& stmt) {
    IndexMetadata meta;
    meta.id = stmt.getInt64(0);
    meta.modelName = stmt.getString(1);
    meta.dimension = static_cast<size_t>(stmt.getInt64(2));
    if (!stmt.isNull(3)) {
        meta.documentId = stmt.getInt64(3);
    }
    meta.tableIdentifier = stmt.getString(4);
    meta.indexType = stmt.getString(5);
    meta.totalVectors = stmt.getInt64(6);
    meta.createdAt = stmt.getInt64(7);
    return meta;
}

int64_t nowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace

MetadataCatalog::MetadataCatalog(metadata::Database& db) : db_(db) {}

Result<void> MetadataCatalog::initializeSchema() {
    auto result = db_.execute(R"(
        CREATE TABLE IF NOT EXISTS vector_index_metadata (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            model_name TEXT NOT NULL,
            dimension INTEGER NOT NULL CHECK(dimension > 0),
            document_id INTEGER,
            table_name TEXT NOT NULL UNIQUE,
            index_type TEXT NOT NULL DEFAULT 'flat',
            total_vectors INTEGER NOT NULL DEFAULT 0,
            created_at INTEGER NOT NULL
        )
    )");
    if (!result)
        return result;

    // NULL document ids would never collide in a plain UNIQUE index
    return db_.execute("CREATE UNIQUE INDEX IF NOT EXISTS idx_vector_index_metadata_key "
                       "ON vector_index_metadata(model_name, dimension, "
                       "COALESCE(document_id, -1))");
}

Result<std::optional<IndexMetadata>> MetadataCatalog::queryOne(const std::string& whereClause,
                                                               const std::string& param) {
    auto stmtResult = db_.prepare(kSelectColumns + whereClause);
    if (!stmtResult)
        return stmtResult.error();

    auto stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, param);
    if (!bindResult)
        return bindResult.error();

    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    if (!stepResult.value())
        return std::optional<IndexMetadata>{};
    return std::optional<IndexMetadata>{readRow(stmt)};
}

Result<std::optional<IndexMetadata>> MetadataCatalog::findByTableIdentifier(const std::string& name) {
    return queryOne("WHERE table_name = ?", name);
}

Result<std::optional<IndexMetadata>> MetadataCatalog::findById(int64_t id) {
    auto stmtResult = db_.prepare(std::string(kSelectColumns) + "WHERE id = ?");
    if (!stmtResult)
        return stmtResult.error();

    auto stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, id);
    if (!bindResult)
        return bindResult.error();

    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    if (!stepResult.value())
        return std::optional<IndexMetadata>{};
    return std::optional<IndexMetadata>{readRow(stmt)};
}

Result<std::optional<IndexMetadata>> MetadataCatalog::findByKey(const std::string& modelName,
                                                                size_t dimension,
                                                                std::optional<int64_t> documentId) {
    auto stmtResult = db_.prepare(std::string(kSelectColumns) +
                                  "WHERE model_name = ? AND dimension = ? AND "
                                  "COALESCE(document_id, -1) = COALESCE(?, -1)");
    if (!stmtResult)
        return stmtResult.error();

    auto stmt = std::move(stmtResult).value();
    Result<void> bindResult;
    if (documentId) {
        bindResult = stmt.bindAll(modelName, static_cast<int64_t>(dimension), *documentId);
    } else {
        bindResult = stmt.bindAll(modelName, static_cast<int64_t>(dimension), nullptr);
    }
    if (!bindResult)
        return bindResult.error();

    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    if (!stepResult.value())
        return std::optional<IndexMetadata>{};
    return std::optional<IndexMetadata>{readRow(stmt)};
}

Result<std::optional<IndexMetadata>>
MetadataCatalog::findByModelAndDimension(const std::string& modelName, size_t dimension,
                                         std::optional<int64_t> documentId) {
    return findByKey(modelName, dimension, documentId);
}

Result<std::vector<IndexMetadata>> MetadataCatalog::listAll() {
    auto stmtResult = db_.prepare(std::string(kSelectColumns) + "ORDER BY id");
    if (!stmtResult)
        return stmtResult.error();

    auto stmt = std::move(stmtResult).value();
    std::vector<IndexMetadata> rows;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;
        rows.push_back(readRow(stmt));
    }
    return rows;
}

Result<IndexMetadata> MetadataCatalog::insertRow(const std::string& modelName, size_t dimension,
                                                 const MetadataOptions& options) {
    std::string tableName;
    if (options.tableName) {
        auto ident = TableIdentifier::create(*options.tableName);
        if (!ident)
            return ident.error();
        tableName = ident.value().str();
    } else {
        tableName = TableIdentifier::forIndex(modelName, dimension, options.documentId).str();
    }

    auto stmtResult = db_.prepare("INSERT INTO vector_index_metadata "
                                  "(model_name, dimension, document_id, table_name, index_type, "
                                  "total_vectors, created_at) VALUES (?, ?, ?, ?, ?, 0, ?)");
    if (!stmtResult)
        return stmtResult.error();

    auto stmt = std::move(stmtResult).value();
    IndexMetadata meta;
    meta.modelName = modelName;
    meta.dimension = dimension;
    meta.documentId = options.documentId;
    meta.tableIdentifier = tableName;
    meta.indexType = options.indexType;
    meta.totalVectors = 0;
    meta.createdAt = nowSeconds();

    Result<void> bindResult;
    if (options.documentId) {
        bindResult = stmt.bindAll(modelName, static_cast<int64_t>(dimension), *options.documentId,
                                  tableName, options.indexType, meta.createdAt);
    } else {
        bindResult = stmt.bindAll(modelName, static_cast<int64_t>(dimension), nullptr, tableName,
                                  options.indexType, meta.createdAt);
    }
    if (!bindResult)
        return bindResult.error();

    auto execResult = stmt.execute();
    if (!execResult)
        return execResult.error();

    meta.id = db_.lastInsertRowId();
    spdlog::info("Registered vector index '{}' (model={}, dim={}{})", tableName, modelName,
                 dimension,
                 options.documentId ? ", document=" + std::to_string(*options.documentId) : "");
    return meta;
}

Result<IndexMetadata> MetadataCatalog::getOrCreateMetadata(const std::string& modelName,
                                                          size_t dimension,
                                                          const MetadataOptions& options) {
    VECSTORE_ZONE_SCOPED_N("MetadataCatalog::getOrCreateMetadata");

    if (modelName.empty()) {
        return Error{ErrorCode::ValidationError, "Model name must not be empty"};
    }
    if (dimension == 0) {
        return Error{ErrorCode::ValidationError, "Dimension must be positive"};
    }
    if (options.tableName && !TableIdentifier::isValid(*options.tableName)) {
        return Error{ErrorCode::ValidationError,
                     "Invalid table identifier '" + *options.tableName + "'"};
    }

    auto lookup = [&]() -> Result<std::optional<IndexMetadata>> {
        if (options.tableName) {
            return findByTableIdentifier(*options.tableName);
        }
        return findByKey(modelName, dimension, options.documentId);
    };

    std::optional<IndexMetadata> found;
    auto txResult = db_.transaction(
        [&]() -> Result<void> {
            auto existing = lookup();
            if (!existing)
                return existing.error();
            if (existing.value()) {
                found = existing.value();
                return {};
            }
            auto inserted = insertRow(modelName, dimension, options);
            if (!inserted)
                return inserted.error();
            found = inserted.value();
            return {};
        },
        metadata::TransactionMode::Immediate);

    if (txResult) {
        const auto& meta = *found;
        if (meta.modelName != modelName || meta.dimension != dimension) {
            return Error{ErrorCode::IntegrityError,
                         "Table '" + meta.tableIdentifier + "' is registered for model " +
                             meta.modelName + " dim " + std::to_string(meta.dimension)};
        }
        return meta;
    }

    if (txResult.error().code != ErrorCode::IntegrityError) {
        return txResult.error();
    }

    // Another connection inserted the same key first
    spdlog::debug("Catalog insert for {}/{} lost a race, re-reading", modelName, dimension);
    auto winner = lookup();
    if (!winner)
        return winner.error();
    if (!winner.value()) {
        return txResult.error();
    }
    return *winner.value();
}

Result<void> MetadataCatalog::incrementVectorCount(int64_t id, int64_t delta) {
    auto stmtResult = db_.prepare("UPDATE vector_index_metadata "
                                  "SET total_vectors = MAX(0, total_vectors + ?) WHERE id = ?");
    if (!stmtResult)
        return stmtResult.error();

    auto stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bindAll(delta, id);
    if (!bindResult)
        return bindResult;
    return stmt.execute();
}

Result<void> MetadataCatalog::setVectorCount(int64_t id, int64_t count) {
    auto stmtResult =
        db_.prepare("UPDATE vector_index_metadata SET total_vectors = ? WHERE id = ?");
    if (!stmtResult)
        return stmtResult.error();

    auto stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bindAll(std::max<int64_t>(0, count), id);
    if (!bindResult)
        return bindResult;
    return stmt.execute();
}

Result<void> MetadataCatalog::deleteMetadata(int64_t id) {
    auto stmtResult = db_.prepare("DELETE FROM vector_index_metadata WHERE id = ?");
    if (!stmtResult)
        return stmtResult.error();

    auto stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, id);
    if (!bindResult)
        return bindResult;
    return stmt.execute();
}

} // namespace vecstore::vector
