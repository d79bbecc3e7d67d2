#pragma once

/**
 * @file SQLiteConnection.hpp
 * @brief RAII wrapper for one physical SQLite database handle.
 *
 * A connection is owned by its pool while idle and exclusively by the
 * caller that acquired it while in use. Besides the raw handle it carries
 * the "holds the process write mutex" flag the pool uses to release the
 * write lock when a connection comes back without a commit or rollback.
 */

#include "CompiledQuery.hpp"
#include "SQLiteResultSet.hpp"
#include <sqlite3.h>
#include <string>
#include <cstddef>
#include <cstdint>

namespace sqltune {

/**
 * @class SQLiteConnection
 * @brief RAII wrapper for an SQLite database file connection.
 *
 * The connection is automatically closed when the object is destroyed.
 *
 * Two execution styles are offered:
 * - execute() for statements whose failure the caller wants to handle as
 *   a value (returns false, lastError() holds the message). PRAGMA tuning
 *   and transaction control use this.
 * - executeQuery() / prepareQuery() + run() for CompiledQuery values, which
 *   throw SQLiteException on failure.
 *
 * Usage:
 * @code
 *   SQLiteConnection conn("/path/to/database.db");
 *   if (conn.isValid()) {
 *       conn.execute("CREATE TABLE IF NOT EXISTS test (id INTEGER)");
 *       auto result = conn.executeQuery({"SELECT * FROM test WHERE id = ?", {int64_t{1}}});
 *   }
 * @endcode
 *
 * Thread Safety:
 * - A connection must only be used by the thread that currently holds it.
 */
class SQLiteConnection {
public:
    /**
     * @brief Open a connection to an SQLite database file.
     * @param dbPath Path to the database file, or ":memory:".
     *
     * Creates the database file if it doesn't exist. Check isValid()
     * afterwards; lastError() explains a failed open.
     */
    explicit SQLiteConnection(const std::string& dbPath);

    /**
     * @brief Destructor - closes the database connection.
     */
    ~SQLiteConnection();

    // Non-copyable
    SQLiteConnection(const SQLiteConnection&) = delete;
    SQLiteConnection& operator=(const SQLiteConnection&) = delete;

    // Movable
    SQLiteConnection(SQLiteConnection&& other) noexcept;
    SQLiteConnection& operator=(SQLiteConnection&& other) noexcept;

    /**
     * @brief Get the underlying sqlite3 handle.
     * @return Raw sqlite3* pointer (still owned by this object).
     */
    sqlite3* get() const { return m_db; }

    /**
     * @brief Check if the connection is valid and open.
     * @return true if the database handle is valid.
     */
    bool isValid() const { return m_db != nullptr; }

    /**
     * @brief Close the handle early.
     *
     * Safe to call more than once; the destructor calls it too.
     */
    void close();

    /**
     * @brief Path the connection was opened with.
     */
    const std::string& path() const { return m_path; }

    /**
     * @brief Absolute file name of the "main" database.
     * @return File name reported by SQLite, or empty for in-memory and
     *         temporary databases.
     */
    std::string filename() const;

    /**
     * @brief Execute one or more SQL statements, discarding any rows.
     * @param sql SQL text.
     * @return true on success, false on error (see lastError()/errorCode()).
     */
    bool execute(const std::string& sql);

    /**
     * @brief Prepare a SQL statement for execution.
     * @param sql The SQL statement to prepare.
     * @return sqlite3_stmt* on success (caller must finalize), nullptr on error.
     *
     * The caller is responsible for finalizing the statement, typically
     * by wrapping it in SQLiteResultSet.
     */
    sqlite3_stmt* prepare(const std::string& sql);

    /**
     * @brief Prepare a compiled query and bind its parameters.
     * @param query SQL text and positional parameters.
     * @return Statement ready to run.
     * @throws SQLiteException if preparation or binding fails.
     */
    SQLiteResultSet prepareQuery(const CompiledQuery& query);

    /**
     * @brief Step a prepared statement to completion.
     * @param statement Statement from prepareQuery().
     * @return Collected rows, or change counts for writes.
     * @throws SQLiteException if a step fails.
     */
    QueryResult run(SQLiteResultSet& statement);

    /**
     * @brief Prepare and run a compiled query.
     * @throws SQLiteException on failure.
     */
    QueryResult executeQuery(const CompiledQuery& query);

    /**
     * @brief Whether an explicit transaction is open on this handle.
     * @return true when SQLite is not in autocommit mode.
     */
    bool inTransaction() const;

    /**
     * @brief Whether this connection currently owns its pool's write mutex.
     */
    bool holdsWriteMutex() const { return m_holdsWriteMutex; }
    void setHoldsWriteMutex(bool holds) { m_holdsWriteMutex = holds; }

    /**
     * @brief Number of pool-wide settings already run on this connection.
     *
     * Maintained by SQLiteConnectionPool to replay settings that were
     * added while the connection was checked out.
     */
    size_t settingsVersion() const { return m_settingsVersion; }
    void setSettingsVersion(size_t version) { m_settingsVersion = version; }

    /**
     * @brief Message of the last failed operation on this connection.
     */
    std::string lastError() const;

    /**
     * @brief Get the last SQLite error code.
     * @return Extended SQLite error code (SQLITE_OK = 0, SQLITE_ERROR = 1, etc.).
     */
    int errorCode() const;

    /**
     * @brief Get the rowid of the last inserted row.
     * @return Last insert rowid, or 0 if no inserts performed.
     */
    int64_t lastInsertRowId() const;

    /**
     * @brief Get the number of rows changed by the last statement.
     * @return Number of rows inserted, updated, or deleted.
     */
    int changes() const;

private:
    sqlite3* m_db = nullptr;         ///< SQLite database handle
    std::string m_path;              ///< Path to database file
    std::string m_lastError;         ///< Message of the last failure
    bool m_holdsWriteMutex = false;  ///< Set between BEGIN IMMEDIATE and COMMIT/ROLLBACK
    size_t m_settingsVersion = 0;    ///< Pool settings applied so far
};

}  // namespace sqltune
