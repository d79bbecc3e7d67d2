#pragma once

/**
 * @file SQLiteResultSet.hpp
 * @brief RAII wrapper for SQLite prepared statements and their results.
 *
 * Owns a sqlite3_stmt for its whole lifetime: parameter binding, row
 * stepping and typed column access, finalizing the statement on
 * destruction.
 */

#include "CompiledQuery.hpp"
#include <sqlite3.h>
#include <string>
#include <vector>

namespace sqltune {

/**
 * @class SQLiteResultSet
 * @brief RAII wrapper for a prepared SQLite statement.
 *
 * SQLite uses step() both to execute a statement and to fetch its rows.
 * Each call to step() advances to the next row (or completes the statement
 * for DML). The result code of the last step is kept so callers can tell
 * "no more rows" apart from an error.
 *
 * Usage:
 * @code
 *   SQLiteResultSet rs(conn.prepare("SELECT id, name FROM users WHERE id > ?"));
 *   rs.bind(1, int64_t{10});
 *   while (rs.step()) {
 *       int64_t id = rs.getInt64(0);
 *       std::string name = rs.getString(1);
 *   }
 *   if (rs.lastResult() != SQLITE_DONE) {
 *       // error
 *   }
 * @endcode
 *
 * Thread Safety:
 * - Not thread-safe; a statement belongs to the thread holding its connection.
 */
class SQLiteResultSet {
public:
    /**
     * @brief Construct a result set wrapper.
     * @param stmt sqlite3_stmt handle to manage (takes ownership), or nullptr.
     */
    explicit SQLiteResultSet(sqlite3_stmt* stmt = nullptr);

    /**
     * @brief Destructor - finalizes the statement if still owned.
     */
    ~SQLiteResultSet();

    // Non-copyable
    SQLiteResultSet(const SQLiteResultSet&) = delete;
    SQLiteResultSet& operator=(const SQLiteResultSet&) = delete;

    // Movable
    SQLiteResultSet(SQLiteResultSet&& other) noexcept;
    SQLiteResultSet& operator=(SQLiteResultSet&& other) noexcept;

    /**
     * @brief Get the underlying sqlite3_stmt handle.
     * @return Raw sqlite3_stmt* pointer (still owned by this object).
     */
    sqlite3_stmt* get() const { return m_stmt; }

    /**
     * @brief Boolean conversion - true if statement is valid.
     */
    explicit operator bool() const { return m_stmt != nullptr; }

    /**
     * @brief Bind one positional parameter.
     * @param index One-based parameter index.
     * @param value Value to bind (copied into SQLite).
     * @return SQLite result code of the bind call.
     */
    int bind(int index, const Value& value);

    /**
     * @brief Bind parameters 1..N from a vector.
     * @param values Parameters in order.
     * @return SQLITE_OK, or the code of the first failing bind.
     */
    int bindAll(const std::vector<Value>& values);

    /**
     * @brief Step to the next row.
     * @return true if a row is available, false if done or error.
     *
     * Use lastResult() after a false return to distinguish SQLITE_DONE
     * from an error code.
     */
    bool step();

    /**
     * @brief Result code returned by the most recent step().
     * @return SQLITE_ROW, SQLITE_DONE, an error code, or SQLITE_OK before
     *         the first step.
     */
    int lastResult() const { return m_lastResult; }

    /**
     * @brief Whether the statement leaves the database unchanged.
     * @return Result of sqlite3_stmt_readonly(); true for a null statement.
     *
     * SELECTs and most PRAGMA reads are read-only; INSERT/UPDATE/DELETE,
     * DDL and BEGIN IMMEDIATE are not.
     */
    bool isReadOnly() const;

    /**
     * @brief Get the number of columns in the result.
     * @return Column count.
     */
    int columnCount() const;

    /**
     * @brief Get a column name by index.
     * @param index Zero-based column index.
     * @return Column name.
     */
    std::string columnName(int index) const;

    /**
     * @brief Get a column value as a string.
     * @param index Zero-based column index.
     * @return String value, or empty string if NULL.
     */
    std::string getString(int index) const;

    /**
     * @brief Get a column value as a 64-bit integer.
     * @param index Zero-based column index.
     * @return Integer value, or 0 if NULL or non-numeric.
     */
    int64_t getInt64(int index) const;

    /**
     * @brief Get a column value as a double.
     * @param index Zero-based column index.
     * @return Floating point value, or 0.0 if NULL.
     */
    double getDouble(int index) const;

    /**
     * @brief Get a column value using its storage class.
     * @param index Zero-based column index.
     * @return nullptr, int64_t, double, std::string or Blob.
     */
    Value getValue(int index) const;

    /**
     * @brief Check if a column value is NULL.
     * @param index Zero-based column index.
     * @return true if the column value is NULL.
     */
    bool isNull(int index) const;

    /**
     * @brief Finalize the statement and release resources.
     *
     * This is called automatically by the destructor.
     */
    void finalize();

private:
    sqlite3_stmt* m_stmt;          ///< SQLite prepared statement handle (owned)
    int m_lastResult = SQLITE_OK;  ///< Code of the last sqlite3_step()
};

}  // namespace sqltune
