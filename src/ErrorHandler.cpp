#include "ErrorHandler.hpp"

namespace sqltune {

thread_local std::string ErrorContext::s_currentContext;

bool ErrorHandler::isBusy(int sqlite_error) {
    switch (primaryCode(sqlite_error)) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return true;
        default:
            return false;
    }
}

bool ErrorHandler::isRetryable(int sqlite_error) {
    switch (primaryCode(sqlite_error)) {
        // Lock contention clears once the other writer finishes
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
        // Schema changed between prepare and step
        case SQLITE_SCHEMA:
            return true;
        default:
            return false;
    }
}

bool ErrorHandler::isConstraintViolation(int sqlite_error) {
    return primaryCode(sqlite_error) == SQLITE_CONSTRAINT;
}

std::string ErrorHandler::getErrorMessage(int sqlite_error) {
    const char* msg = sqlite3_errstr(sqlite_error);
    if (msg && *msg) {
        return std::string(msg);
    }
    return "SQLite error " + std::to_string(sqlite_error);
}

std::string ErrorHandler::getErrorMessage(sqlite3* db) {
    if (!db) {
        return "No connection";
    }
    const char* err = sqlite3_errmsg(db);
    if (err && *err) {
        return std::string(err);
    }
    return getErrorMessage(sqlite3_extended_errcode(db));
}

ErrorContext::ErrorContext(const std::string& context)
    : m_previous(s_currentContext) {
    if (s_currentContext.empty()) {
        s_currentContext = context;
    } else {
        s_currentContext = s_currentContext + " > " + context;
    }
}

ErrorContext::~ErrorContext() {
    s_currentContext = m_previous;
}

std::string ErrorContext::current() {
    return s_currentContext;
}

SQLiteException::SQLiteException(int error_code, const std::string& message)
    : std::runtime_error(message)
    , m_errorCode(error_code) {
}

SQLiteException::SQLiteException(sqlite3* db, const std::string& context)
    : std::runtime_error(context + ": " + ErrorHandler::getErrorMessage(db))
    , m_errorCode(db ? sqlite3_extended_errcode(db) : SQLITE_MISUSE) {
}

}  // namespace sqltune
