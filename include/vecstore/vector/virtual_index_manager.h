#pragma once

#include <vecstore/core/types.h>
#include <vecstore/metadata/database.h>
#include <vecstore/vector/index_types.h>
#include <vecstore/vector/table_identifier.h>

#include <optional>

namespace vecstore::vector {

/**
 * @brief Physical shape of a vector table
 */
enum class TableKind {
    Missing,     ///< No such table
    Accelerated, ///< vec0 virtual table
    Plain        ///< Ordinary table with a BLOB column (degraded mode)
};

const char* tableKindToString(TableKind kind);

/**
 * @brief Creates, verifies and migrates the physical vector table of an index
 *
 * Holds the capability flag probed for the connection: when the vec0 module is available new
 * tables are created as
 *   CREATE VIRTUAL TABLE "t" USING vec0(chunk_id INTEGER, embedding FLOAT[dim])
 * otherwise a plain table with the same columns is created so that writes keep working and
 * search uses the brute-force path.
 */
class VirtualIndexManager {
public:
    VirtualIndexManager(metadata::Database& db, BackendCapabilities capabilities);

    /**
     * @brief Register sqlite-vec on the connection (when enabled and compiled in) and check
     *        that the vec0 module is listed in pragma_module_list
     *
     * Never fails: an unavailable module is reported through BackendCapabilities.
     */
    static BackendCapabilities probeCapabilities(metadata::Database& db, bool enableAccelerated);

    /**
     * @brief Create the table if missing and verify its width otherwise
     *
     * @return SchemaError if an existing table declares a different width, or if neither the
     *         accelerated nor the plain table could be created. A failed vec0 creation alone is
     *         logged and absorbed by falling back to a plain table.
     */
    Result<void> ensureTable(const TableIdentifier& table, size_t dimension);

    /// Side-effect free existence check
    bool tableExists(const TableIdentifier& table);

    Result<TableKind> tableKind(const TableIdentifier& table);

    /**
     * @brief Width declared in the table's DDL, or nullopt when the table is missing
     */
    Result<std::optional<size_t>> declaredDimension(const TableIdentifier& table);

    /**
     * @brief Rebuild a plain table as a vec0 table, preserving rows
     * @return true if a migration happened, false if nothing needed doing
     */
    Result<bool> migrateToAccelerated(const TableIdentifier& table, size_t dimension);

    Result<void> dropTable(const TableIdentifier& table);

    [[nodiscard]] bool accelerated() const { return capabilities_.accelerated; }
    [[nodiscard]] const BackendCapabilities& capabilities() const { return capabilities_; }

private:
    Result<void> createAcceleratedTable(const TableIdentifier& table, size_t dimension);
    Result<void> createPlainTable(const TableIdentifier& table, size_t dimension);
    Result<std::optional<std::string>> tableSql(const TableIdentifier& table);

    metadata::Database& db_;
    BackendCapabilities capabilities_;
};

} // namespace vecstore::vector
