#include <spdlog/spdlog.h>
#include <vecstore/profiling.h>
#include <vecstore/vector/virtual_index_manager.h>

#include <regex>
#include <string>

#ifdef VECSTORE_HAS_SQLITE_VEC
extern "C" {
#include "sqlite-vec.h"
}
#endif

namespace vecstore::vector {

namespace {

bool vec0ModuleListed(metadata::Database& db) {
    auto stmtResult = db.prepare("SELECT 1 FROM pragma_module_list WHERE name='vec0'");
    if (!stmtResult) {
        spdlog::debug("Could not query pragma_module_list: {}", stmtResult.error().message);
        return false;
    }
    auto stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    return stepResult && stepResult.value();
}

} // namespace

const char* tableKindToString(TableKind kind) {
    switch (kind) {
        case TableKind::Missing:
            return "missing";
        case TableKind::Accelerated:
            return "vec0";
        case TableKind::Plain:
            return "plain";
    }
    return "unknown";
}

VirtualIndexManager::VirtualIndexManager(metadata::Database& db, BackendCapabilities capabilities)
    : db_(db), capabilities_(std::move(capabilities)) {}

BackendCapabilities VirtualIndexManager::probeCapabilities(metadata::Database& db,
                                                           bool enableAccelerated) {
    BackendCapabilities caps;
    if (!enableAccelerated) {
        caps.detail = "accelerated index disabled by configuration";
        return caps;
    }

#ifdef VECSTORE_HAS_SQLITE_VEC
    // sqlite-vec is linked statically; registering it makes the vec0 module available
    char* errorMsg = nullptr;
    int rc = sqlite3_vec_init(db.handle(), &errorMsg, nullptr);
    if (rc != SQLITE_OK) {
        caps.detail = std::string("sqlite-vec initialization failed: ") +
                      (errorMsg ? errorMsg : "unknown error");
        if (errorMsg) {
            sqlite3_free(errorMsg);
        }
        spdlog::warn("{}", caps.detail);
        return caps;
    }
#endif

    // The module may also be present through an auto-extension registered by the host
    if (vec0ModuleListed(db)) {
        caps.accelerated = true;
        caps.detail = "vec0 module available";
        spdlog::debug("vec0 module available on {}", db.path());
    } else {
#ifdef VECSTORE_HAS_SQLITE_VEC
        caps.detail = "sqlite-vec initialized but vec0 module not listed";
#else
        caps.detail = "sqlite-vec not compiled in";
#endif
        spdlog::warn("Accelerated vector index unavailable ({}); using brute-force search",
                     caps.detail);
    }
    return caps;
}

Result<std::optional<std::string>> VirtualIndexManager::tableSql(const TableIdentifier& table) {
    auto stmtResult =
        db_.prepare("SELECT sql FROM sqlite_master WHERE type='table' AND name = ?");
    if (!stmtResult)
        return stmtResult.error();

    auto stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, table.str());
    if (!bindResult)
        return bindResult.error();

    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    if (!stepResult.value())
        return std::optional<std::string>{};
    return std::optional<std::string>{stmt.getString(0)};
}

bool VirtualIndexManager::tableExists(const TableIdentifier& table) {
    auto exists = db_.tableExists(table.str());
    if (!exists) {
        spdlog::debug("tableExists({}) failed: {}", table.str(), exists.error().message);
        return false;
    }
    return exists.value();
}

Result<TableKind> VirtualIndexManager::tableKind(const TableIdentifier& table) {
    auto sql = tableSql(table);
    if (!sql)
        return sql.error();
    if (!sql.value())
        return TableKind::Missing;

    static const std::regex vec0Pattern(R"(using\s+vec0\s*\()", std::regex::icase);
    return std::regex_search(*sql.value(), vec0Pattern) ? TableKind::Accelerated
                                                        : TableKind::Plain;
}

Result<std::optional<size_t>> VirtualIndexManager::declaredDimension(const TableIdentifier& table) {
    auto sql = tableSql(table);
    if (!sql)
        return sql.error();
    if (!sql.value())
        return std::optional<size_t>{};

    static const std::regex floatPattern(R"(embedding\s+float\s*\[\s*(\d+)\s*\])",
                                         std::regex::icase);
    static const std::regex blobPattern(R"(length\s*\(\s*embedding\s*\)\s*=\s*(\d+))",
                                        std::regex::icase);
    std::smatch match;
    const std::string& ddl = *sql.value();
    if (std::regex_search(ddl, match, floatPattern)) {
        return std::optional<size_t>{std::stoul(match[1].str())};
    }
    if (std::regex_search(ddl, match, blobPattern)) {
        return std::optional<size_t>{std::stoul(match[1].str()) / sizeof(float)};
    }
    return Error{ErrorCode::SchemaError,
                 "Table '" + table.str() + "' does not declare an embedding width"};
}

Result<void> VirtualIndexManager::createAcceleratedTable(const TableIdentifier& table,
                                                         size_t dimension) {
    std::string sql = "CREATE VIRTUAL TABLE IF NOT EXISTS " + table.quoted() +
                      " USING vec0(chunk_id INTEGER, embedding FLOAT[" +
                      std::to_string(dimension) + "])";
    spdlog::debug("{}", sql);
    return db_.execute(sql);
}

Result<void> VirtualIndexManager::createPlainTable(const TableIdentifier& table,
                                                   size_t dimension) {
    std::string sql = "CREATE TABLE IF NOT EXISTS " + table.quoted() +
                      " (id INTEGER PRIMARY KEY, chunk_id INTEGER NOT NULL, "
                      "embedding BLOB NOT NULL CHECK(length(embedding) = " +
                      std::to_string(dimension * sizeof(float)) + "))";
    spdlog::debug("{}", sql);
    auto result = db_.execute(sql);
    if (!result)
        return result;
    return db_.execute("CREATE INDEX IF NOT EXISTS \"" + table.str() + "_chunk_idx\" ON " +
                       table.quoted() + "(chunk_id)");
}

Result<void> VirtualIndexManager::ensureTable(const TableIdentifier& table, size_t dimension) {
    VECSTORE_ZONE_SCOPED_N("VirtualIndexManager::ensureTable");

    if (dimension == 0) {
        return Error{ErrorCode::ValidationError, "Dimension must be positive"};
    }

    auto kind = tableKind(table);
    if (!kind)
        return kind.error();

    if (kind.value() != TableKind::Missing) {
        auto declared = declaredDimension(table);
        if (!declared)
            return declared.error();
        if (declared.value() && *declared.value() != dimension) {
            return Error{ErrorCode::SchemaError,
                         "Table '" + table.str() + "' declares dimension " +
                             std::to_string(*declared.value()) + ", expected " +
                             std::to_string(dimension)};
        }
        return {};
    }

    if (capabilities_.accelerated) {
        auto created = createAcceleratedTable(table, dimension);
        if (created) {
            spdlog::info("Created vec0 table '{}' (dim={})", table.str(), dimension);
            return {};
        }
        spdlog::warn("Failed to create vec0 table '{}': {}; falling back to plain table",
                     table.str(), created.error().message);
    }

    auto plain = createPlainTable(table, dimension);
    if (!plain) {
        spdlog::error("Failed to create vector table '{}': {}", table.str(),
                      plain.error().message);
        return Error{ErrorCode::SchemaError,
                     "Failed to create vector table '" + table.str() + "': " +
                         plain.error().message};
    }
    spdlog::info("Created plain vector table '{}' (dim={}, brute-force search)", table.str(),
                 dimension);
    return {};
}

Result<bool> VirtualIndexManager::migrateToAccelerated(const TableIdentifier& table,
                                                       size_t dimension) {
    if (!capabilities_.accelerated) {
        return false;
    }

    auto kind = tableKind(table);
    if (!kind)
        return kind.error();
    if (kind.value() != TableKind::Plain) {
        return false;
    }

    auto legacy = table.withSuffix("_legacy");
    if (!legacy)
        return legacy.error();

    auto txResult = db_.transaction([&]() -> Result<void> {
        auto r = db_.execute("ALTER TABLE " + table.quoted() + " RENAME TO " +
                             legacy.value().quoted());
        if (!r)
            return r;
        r = createAcceleratedTable(table, dimension);
        if (!r)
            return r;
        r = db_.execute("INSERT INTO " + table.quoted() +
                        " (chunk_id, embedding) SELECT chunk_id, embedding FROM " +
                        legacy.value().quoted() + " ORDER BY id");
        if (!r)
            return r;
        return db_.execute("DROP TABLE " + legacy.value().quoted());
    });
    if (!txResult) {
        spdlog::error("Migration of '{}' to vec0 failed: {}", table.str(),
                      txResult.error().message);
        return txResult.error();
    }

    spdlog::info("Migrated vector table '{}' to vec0", table.str());
    return true;
}

Result<void> VirtualIndexManager::dropTable(const TableIdentifier& table) {
    auto result = db_.execute("DROP TABLE IF EXISTS " + table.quoted());
    if (result) {
        spdlog::debug("Dropped vector table '{}'", table.str());
    }
    return result;
}

} // namespace vecstore::vector
