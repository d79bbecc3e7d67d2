/**
 * @file SQLiteResultSet.cpp
 * @brief Implementation of the RAII SQLite statement wrapper.
 *
 * Binds CompiledQuery parameters and converts result cells back into
 * Value variants according to their SQLite storage class.
 */

#include "SQLiteResultSet.hpp"
#include <type_traits>

namespace sqltune {

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteResultSet::SQLiteResultSet(sqlite3_stmt* stmt) : m_stmt(stmt) {}

SQLiteResultSet::~SQLiteResultSet() {
    finalize();
}

// ============================================================================
// Move Operations
// ============================================================================

SQLiteResultSet::SQLiteResultSet(SQLiteResultSet&& other) noexcept
    : m_stmt(other.m_stmt), m_lastResult(other.m_lastResult) {
    other.m_stmt = nullptr;
}

SQLiteResultSet& SQLiteResultSet::operator=(SQLiteResultSet&& other) noexcept {
    if (this != &other) {
        finalize();
        m_stmt = other.m_stmt;
        m_lastResult = other.m_lastResult;
        other.m_stmt = nullptr;
    }
    return *this;
}

// ============================================================================
// Parameter Binding
// ============================================================================

int SQLiteResultSet::bind(int index, const Value& value) {
    if (!m_stmt) return SQLITE_MISUSE;

    return std::visit([this, index](const auto& v) -> int {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return sqlite3_bind_null(m_stmt, index);
        } else if constexpr (std::is_same_v<T, double>) {
            return sqlite3_bind_double(m_stmt, index, v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return sqlite3_bind_int64(m_stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return sqlite3_bind_text(m_stmt, index, v.data(), static_cast<int>(v.size()),
                                     SQLITE_TRANSIENT);
        } else {
            return sqlite3_bind_blob(m_stmt, index, v.data(), static_cast<int>(v.size()),
                                     SQLITE_TRANSIENT);
        }
    }, value);
}

int SQLiteResultSet::bindAll(const std::vector<Value>& values) {
    for (size_t i = 0; i < values.size(); ++i) {
        int rc = bind(static_cast<int>(i) + 1, values[i]);
        if (rc != SQLITE_OK) return rc;
    }
    return SQLITE_OK;
}

// ============================================================================
// Row Iteration
// ============================================================================

bool SQLiteResultSet::step() {
    if (!m_stmt) {
        m_lastResult = SQLITE_MISUSE;
        return false;
    }
    // SQLITE_ROW indicates a row is available; SQLITE_DONE means no more rows
    m_lastResult = sqlite3_step(m_stmt);
    return m_lastResult == SQLITE_ROW;
}

bool SQLiteResultSet::isReadOnly() const {
    return m_stmt ? sqlite3_stmt_readonly(m_stmt) != 0 : true;
}

// ============================================================================
// Column Access
// ============================================================================

int SQLiteResultSet::columnCount() const {
    return m_stmt ? sqlite3_column_count(m_stmt) : 0;
}

std::string SQLiteResultSet::columnName(int index) const {
    if (!m_stmt) return "";
    const char* name = sqlite3_column_name(m_stmt, index);
    return name ? name : "";
}

std::string SQLiteResultSet::getString(int index) const {
    if (!m_stmt || isNull(index)) return "";
    const unsigned char* text = sqlite3_column_text(m_stmt, index);
    return text ? reinterpret_cast<const char*>(text) : "";
}

int64_t SQLiteResultSet::getInt64(int index) const {
    if (!m_stmt) return 0;
    return sqlite3_column_int64(m_stmt, index);
}

double SQLiteResultSet::getDouble(int index) const {
    if (!m_stmt) return 0.0;
    return sqlite3_column_double(m_stmt, index);
}

Value SQLiteResultSet::getValue(int index) const {
    if (!m_stmt) return nullptr;

    switch (sqlite3_column_type(m_stmt, index)) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(m_stmt, index));
        case SQLITE_FLOAT:
            return getDouble(index);
        case SQLITE_TEXT:
            return getString(index);
        case SQLITE_BLOB: {
            const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(m_stmt, index));
            int size = sqlite3_column_bytes(m_stmt, index);
            return data ? Blob(data, data + size) : Blob{};
        }
        default:
            return nullptr;
    }
}

bool SQLiteResultSet::isNull(int index) const {
    if (!m_stmt) return true;
    return sqlite3_column_type(m_stmt, index) == SQLITE_NULL;
}

// ============================================================================
// Statement Management
// ============================================================================

void SQLiteResultSet::finalize() {
    if (m_stmt) {
        sqlite3_finalize(m_stmt);
        m_stmt = nullptr;
    }
}

}  // namespace sqltune
