#pragma once

#include <sqlite3.h>
#include <string>
#include <stdexcept>

namespace sqltune {

// SQLite result code classification
class ErrorHandler {
public:
    // Strip extended result bits (SQLITE_BUSY_SNAPSHOT -> SQLITE_BUSY)
    static int primaryCode(int sqliteError) { return sqliteError & 0xff; }

    // Lock contention that outlasted busy_timeout
    static bool isBusy(int sqliteError);

    // Check if error is retryable
    static bool isRetryable(int sqliteError);

    static bool isConstraintViolation(int sqliteError);

    // Get human-readable error message
    static std::string getErrorMessage(int sqliteError);
    static std::string getErrorMessage(sqlite3* db);
};

// RAII wrapper for setting/clearing error context
class ErrorContext {
public:
    ErrorContext(const std::string& context);
    ~ErrorContext();

    static std::string current();

private:
    static thread_local std::string s_currentContext;
    std::string m_previous;
};

// Exception for SQLite errors
class SQLiteException : public std::runtime_error {
public:
    SQLiteException(int errorCode, const std::string& message);
    SQLiteException(sqlite3* db, const std::string& context);

    int errorCode() const { return m_errorCode; }
    bool isBusy() const { return ErrorHandler::isBusy(m_errorCode); }

private:
    int m_errorCode;
};

// Raised when a pool is used before init() or after destroy()
class PoolUnavailableError : public std::runtime_error {
public:
    explicit PoolUnavailableError(const std::string& message)
        : std::runtime_error(message) {}
};

}  // namespace sqltune
