#include "SQLiteSchemaManager.hpp"
#include "SqlHeuristics.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace sqltune {

SQLiteSchemaManager::SQLiteSchemaManager(SQLiteConnectionPool& pool)
    : m_pool(pool) {}

std::vector<std::string> SQLiteSchemaManager::getTables() {
    std::vector<std::string> tables;
    PooledConnection conn(m_pool);

    SQLiteResultSet rs(conn->prepare(
        "SELECT name FROM sqlite_master WHERE type='table' AND name NOT LIKE 'sqlite_%' ORDER BY name"));
    if (!rs) {
        throw SQLiteException(conn->errorCode(), "Failed to list tables: " + conn->lastError());
    }

    while (rs.step()) {
        tables.push_back(rs.getString(0));
    }
    if (rs.lastResult() != SQLITE_DONE) {
        throw SQLiteException(conn->get(), "Failed to list tables");
    }
    return tables;
}

std::optional<std::vector<IndexInfo>> SQLiteSchemaManager::getIndexes(const std::string& table) {
    std::vector<IndexInfo> indexes;
    try {
        PooledConnection conn(m_pool);

        SQLiteResultSet rs(conn->prepare("PRAGMA index_list(" +
                                         heuristics::quoteIdentifier(table) + ")"));
        if (!rs) {
            spdlog::warn("Failed to list indexes of '{}': {}", table, conn->lastError());
            return std::nullopt;
        }

        // Columns: seq, name, unique, origin, partial
        while (rs.step()) {
            IndexInfo idx;
            idx.name = rs.getString(1);
            if (idx.name.rfind("sqlite_autoindex_", 0) == 0) continue;
            idx.table = table;
            idx.unique = rs.getInt64(2) != 0;

            SQLiteResultSet idx_rs(conn->prepare("PRAGMA index_info(" +
                                                 heuristics::quoteIdentifier(idx.name) + ")"));
            if (!idx_rs) {
                spdlog::warn("Failed to read columns of index '{}': {}", idx.name, conn->lastError());
                return std::nullopt;
            }
            // Columns: seqno, cid, name (NULL for expressions)
            while (idx_rs.step()) {
                idx.columns.push_back(idx_rs.getString(2));
            }

            indexes.push_back(std::move(idx));
        }
        if (rs.lastResult() != SQLITE_DONE) {
            spdlog::warn("Failed to list indexes of '{}': {}", table, conn->lastError());
            return std::nullopt;
        }
    } catch (const std::exception& e) {
        spdlog::warn("Index lookup for '{}' failed: {}", table, e.what());
        return std::nullopt;
    }
    return indexes;
}

std::optional<std::string> SQLiteSchemaManager::getDatabaseFile() {
    try {
        PooledConnection conn(m_pool);
        SQLiteResultSet rs(conn->prepare("PRAGMA database_list"));
        if (!rs) return std::nullopt;

        // Columns: seq, name, file
        while (rs.step()) {
            if (rs.getInt64(0) == 0) {
                return rs.getString(2);
            }
        }
    } catch (const std::exception& e) {
        spdlog::debug("Could not resolve database file: {}", e.what());
    }
    return std::nullopt;
}

}  // namespace sqltune
