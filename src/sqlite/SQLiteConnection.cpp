/**
 * @file SQLiteConnection.cpp
 * @brief Implementation of the RAII SQLite connection wrapper.
 */

#include "SQLiteConnection.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace sqltune {

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteConnection::SQLiteConnection(const std::string& dbPath) : m_path(dbPath) {
    int rc = sqlite3_open_v2(dbPath.c_str(), &m_db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        m_lastError = m_db ? sqlite3_errmsg(m_db) : ErrorHandler::getErrorMessage(rc);
        spdlog::error("Failed to open SQLite database '{}': {}", dbPath, m_lastError);
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
    }
}

SQLiteConnection::~SQLiteConnection() {
    close();
}

void SQLiteConnection::close() {
    if (m_db) {
        // sqlite3_close_v2 defers the close until outstanding statements finish
        sqlite3_close_v2(m_db);
        m_db = nullptr;
    }
    m_holdsWriteMutex = false;
}

// ============================================================================
// Move Operations
// ============================================================================

SQLiteConnection::SQLiteConnection(SQLiteConnection&& other) noexcept
    : m_db(other.m_db)
    , m_path(std::move(other.m_path))
    , m_lastError(std::move(other.m_lastError))
    , m_holdsWriteMutex(other.m_holdsWriteMutex)
    , m_settingsVersion(other.m_settingsVersion) {
    other.m_db = nullptr;
    other.m_holdsWriteMutex = false;
}

SQLiteConnection& SQLiteConnection::operator=(SQLiteConnection&& other) noexcept {
    if (this != &other) {
        close();
        m_db = other.m_db;
        m_path = std::move(other.m_path);
        m_lastError = std::move(other.m_lastError);
        m_holdsWriteMutex = other.m_holdsWriteMutex;
        m_settingsVersion = other.m_settingsVersion;
        other.m_db = nullptr;
        other.m_holdsWriteMutex = false;
    }
    return *this;
}

std::string SQLiteConnection::filename() const {
    if (!m_db) return "";
    const char* name = sqlite3_db_filename(m_db, "main");
    return name ? name : "";
}

// ============================================================================
// Query Execution
// ============================================================================

bool SQLiteConnection::execute(const std::string& sql) {
    if (!m_db) {
        m_lastError = "connection is closed";
        return false;
    }

    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        m_lastError = errMsg ? errMsg : ErrorHandler::getErrorMessage(rc);
        if (errMsg) sqlite3_free(errMsg);
        spdlog::debug("SQLite exec failed ({}): {}", sql, m_lastError);
        return false;
    }
    return true;
}

sqlite3_stmt* SQLiteConnection::prepare(const std::string& sql) {
    if (!m_db) {
        m_lastError = "connection is closed";
        return nullptr;
    }

    // Compile SQL into a prepared statement for execution
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(m_db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        m_lastError = sqlite3_errmsg(m_db);
        spdlog::debug("SQLite prepare failed ({}): {}", sql, m_lastError);
        return nullptr;
    }
    return stmt;
}

SQLiteResultSet SQLiteConnection::prepareQuery(const CompiledQuery& query) {
    sqlite3_stmt* stmt = prepare(query.sql);
    if (!stmt) {
        throw SQLiteException(errorCode(), "Failed to prepare query: " + lastError());
    }

    SQLiteResultSet rs(stmt);
    int rc = rs.bindAll(query.parameters);
    if (rc != SQLITE_OK) {
        m_lastError = sqlite3_errmsg(m_db);
        throw SQLiteException(rc, "Failed to bind parameters: " + m_lastError);
    }
    return rs;
}

QueryResult SQLiteConnection::run(SQLiteResultSet& statement) {
    QueryResult result;

    const int columns = statement.columnCount();
    for (int i = 0; i < columns; ++i) {
        result.columns.push_back(statement.columnName(i));
    }

    while (statement.step()) {
        Row row;
        row.reserve(static_cast<size_t>(columns));
        for (int i = 0; i < columns; ++i) {
            row.push_back(statement.getValue(i));
        }
        result.rows.push_back(std::move(row));
    }

    if (statement.lastResult() != SQLITE_DONE) {
        m_lastError = sqlite3_errmsg(m_db);
        throw SQLiteException(statement.lastResult(), "Query failed: " + m_lastError);
    }

    if (!statement.isReadOnly()) {
        result.numAffectedRows = changes();
        result.insertId = lastInsertRowId();
    }

    return result;
}

QueryResult SQLiteConnection::executeQuery(const CompiledQuery& query) {
    SQLiteResultSet statement = prepareQuery(query);
    return run(statement);
}

bool SQLiteConnection::inTransaction() const {
    return m_db && sqlite3_get_autocommit(m_db) == 0;
}

// ============================================================================
// Error and Status Information
// ============================================================================

std::string SQLiteConnection::lastError() const {
    if (!m_lastError.empty()) return m_lastError;
    return m_db ? sqlite3_errmsg(m_db) : "no connection";
}

int SQLiteConnection::errorCode() const {
    return m_db ? sqlite3_extended_errcode(m_db) : SQLITE_ERROR;
}

int64_t SQLiteConnection::lastInsertRowId() const {
    return m_db ? sqlite3_last_insert_rowid(m_db) : 0;
}

int SQLiteConnection::changes() const {
    return m_db ? sqlite3_changes(m_db) : 0;
}

}  // namespace sqltune
