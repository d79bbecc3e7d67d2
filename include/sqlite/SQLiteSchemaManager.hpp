#pragma once

/**
 * @file SQLiteSchemaManager.hpp
 * @brief SQLite-specific schema catalog.
 *
 * Lists user tables and their indexes for the index advisor and the
 * optimizer, using SQLite's sqlite_master table and PRAGMA commands.
 */

#include "SchemaManager.hpp"
#include "SQLiteConnectionPool.hpp"
#include "SQLiteResultSet.hpp"

namespace sqltune {

/**
 * @class SQLiteSchemaManager
 * @brief SchemaManager implementation for SQLite databases.
 *
 * System Tables and PRAGMAs Used:
 * - sqlite_master: user tables (names starting with "sqlite_" are skipped)
 * - PRAGMA index_list(table): Index list
 * - PRAGMA index_info(index): Index columns
 * - PRAGMA database_list: File backing the "main" schema
 *
 * Automatic indexes created for PRIMARY KEY and UNIQUE constraints
 * (sqlite_autoindex_*) are not reported.
 *
 * Thread Safety:
 * - All methods acquire a connection from the pool and are thread-safe.
 * - Each call holds one pooled connection for its duration, so callers must
 *   not hold the pool's last free connection while calling in.
 */
class SQLiteSchemaManager : public SchemaManager {
public:
    /**
     * @brief Construct an SQLite schema manager.
     * @param pool Connection pool for database access.
     */
    explicit SQLiteSchemaManager(SQLiteConnectionPool& pool);

    ~SQLiteSchemaManager() override = default;

    /**
     * @brief Get list of user tables, ordered by name.
     * @return Table names from sqlite_master.
     * @throws SQLiteException if sqlite_master cannot be queried.
     * @throws PoolUnavailableError if the pool is not usable.
     */
    std::vector<std::string> getTables() override;

    /**
     * @brief Get the explicit indexes of a table.
     * @param table Table name.
     * @return Indexes with their columns, or std::nullopt on failure.
     */
    std::optional<std::vector<IndexInfo>> getIndexes(const std::string& table) override;

    /**
     * @brief Get the file name of the "main" database.
     * @return Path from PRAGMA database_list (empty for in-memory), or
     *         std::nullopt on failure.
     */
    std::optional<std::string> getDatabaseFile() override;

private:
    SQLiteConnectionPool& m_pool;  ///< Connection pool
};

}  // namespace sqltune
