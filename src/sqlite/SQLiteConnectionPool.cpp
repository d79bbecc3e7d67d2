/**
 * @file SQLiteConnectionPool.cpp
 * @brief Implementation of the SQLite connection pool and transaction manager.
 *
 * Connections are handed out strictly first-come first-served: a released
 * connection goes directly to the oldest waiter, and acquire() only takes
 * an idle connection when nobody is queued ahead of it.
 */

#include "SQLiteConnectionPool.hpp"
#include "SqlHeuristics.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace sqltune {

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteConnectionPool::SQLiteConnectionPool(WriteMutexRegistry& registry)
    : m_registry(registry) {}

SQLiteConnectionPool::~SQLiteConnectionPool() {
    destroy();
    // Connections still checked out can no longer come back
    if (m_detachPending) {
        m_registry.detach(m_path);
    }
}

// ============================================================================
// Initialization
// ============================================================================

void SQLiteConnectionPool::runOrThrow(SQLiteConnection& conn, const std::string& sql,
                                      const char* what) {
    if (!conn.execute(sql)) {
        throw SQLiteException(conn.errorCode(), std::string(what) + ": " + conn.lastError());
    }
}

void SQLiteConnectionPool::applyPragmas(SQLiteConnection& conn, const PoolConfig& config) {
    runOrThrow(conn, "PRAGMA busy_timeout = " + std::to_string(config.busy_timeout.count()),
               "Failed to set busy_timeout");
    runOrThrow(conn, "PRAGMA journal_mode = " + toString(config.journal_mode),
               "Failed to set journal_mode");
    runOrThrow(conn, "PRAGMA synchronous = " + toString(config.synchronous),
               "Failed to set synchronous");
    runOrThrow(conn, "PRAGMA journal_size_limit = " + std::to_string(config.journal_size_limit),
               "Failed to set journal_size_limit");
    runOrThrow(conn, "PRAGMA temp_store = " + toString(config.temp_store),
               "Failed to set temp_store");
}

void SQLiteConnectionPool::init(const PoolConfig& config, ConnectionHook hook) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_initialized) {
        throw std::logic_error("Connection pool is already initialized");
    }
    if (m_detachPending) {
        throw std::logic_error("Connection pool still has a writer from before destroy()");
    }

    const bool inMemory = config.database_path.empty() || config.database_path == ":memory:";
    const std::string openPath = inMemory ? ":memory:" : config.database_path;
    size_t size = inMemory ? 1 : std::max<size_t>(config.pool_size, 1);
    if (inMemory && config.pool_size > 1) {
        spdlog::debug("In-memory database: pool size {} reduced to 1", config.pool_size);
    }

    // Closed automatically if any step below throws
    std::vector<std::unique_ptr<SQLiteConnection>> opened;
    for (size_t i = 0; i < size; ++i) {
        auto conn = std::make_unique<SQLiteConnection>(openPath);
        if (!conn->isValid()) {
            throw SQLiteException(SQLITE_CANTOPEN,
                                  "Failed to open SQLite database '" + openPath + "': " +
                                      conn->lastError());
        }
        applyPragmas(*conn, config);
        if (hook) hook(*conn);
        opened.push_back(std::move(conn));
    }

    std::string path = opened.front()->filename();
    if (path.empty()) path = ":memory:";

    m_writeMutex = m_registry.attach(path);
    m_path = path;
    m_available = std::move(opened);
    m_total = m_available.size();
    m_settings.clear();
    m_initialized = true;

    spdlog::info("SQLite connection pool initialized with {} connections for {}", m_total, m_path);
}

// ============================================================================
// Connection Acquisition and Release
// ============================================================================

std::unique_ptr<SQLiteConnection> SQLiteConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!m_initialized) {
        throw PoolUnavailableError("Connection pool is not initialized or has been destroyed");
    }

    if (!m_available.empty() && m_waiters.empty()) {
        auto conn = std::move(m_available.back());
        m_available.pop_back();
        return conn;
    }

    auto waiter = std::make_shared<Waiter>();
    m_waiters.push_back(waiter);
    m_cv.wait(lock, [&] { return waiter->conn != nullptr || !m_initialized; });

    if (!waiter->conn) {
        throw PoolUnavailableError("Connection pool was destroyed while waiting for a connection");
    }
    return std::move(waiter->conn);
}

void SQLiteConnectionPool::release(std::unique_ptr<SQLiteConnection> conn) {
    if (!conn) return;

    if (conn->holdsWriteMutex()) {
        spdlog::warn("Connection released while holding the write mutex; rolling back");
        if (conn->inTransaction() && !conn->execute("ROLLBACK")) {
            spdlog::error("Rollback of abandoned transaction failed: {}", conn->lastError());
        }
        releaseWriteMutex(*conn);
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_initialized) {
        // Pool destroyed while this connection was checked out
        if (m_total > 0) --m_total;
        return;
    }

    replaySettings(*conn);
    if (!m_waiters.empty()) {
        m_waiters.front()->conn = std::move(conn);
        m_waiters.pop_front();
        m_cv.notify_all();
        return;
    }
    m_available.push_back(std::move(conn));
}

// ============================================================================
// Per-connection Settings
// ============================================================================

void SQLiteConnectionPool::applyToAllConnections(const std::string& sql) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_initialized) {
        throw PoolUnavailableError("Connection pool is not initialized or has been destroyed");
    }

    m_settings.push_back(sql);
    for (auto& conn : m_available) {
        runOrThrow(*conn, sql, "Failed to apply connection setting");
        conn->setSettingsVersion(m_settings.size());
    }
    spdlog::debug("Applied '{}' to {} idle connections, {} checked out", sql,
                  m_available.size(), m_total - m_available.size());
}

// Caller holds m_mutex
void SQLiteConnectionPool::replaySettings(SQLiteConnection& conn) {
    for (size_t i = conn.settingsVersion(); i < m_settings.size(); ++i) {
        if (!conn.execute(m_settings[i])) {
            spdlog::warn("Failed to apply '{}' to a released connection: {}", m_settings[i],
                         conn.lastError());
        }
    }
    conn.setSettingsVersion(m_settings.size());
}

// ============================================================================
// Transactions
// ============================================================================

void SQLiteConnectionPool::lockWriteMutex(SQLiteConnection& conn) {
    std::shared_ptr<WriteMutex> mutex;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_initialized || !m_writeMutex) {
            throw PoolUnavailableError("Connection pool is not initialized or has been destroyed");
        }
        mutex = m_writeMutex;
        ++m_writeUsers;
    }
    mutex->lock();
    conn.setHoldsWriteMutex(true);
}

void SQLiteConnectionPool::releaseWriteMutex(SQLiteConnection& conn) {
    if (!conn.holdsWriteMutex()) return;
    conn.setHoldsWriteMutex(false);

    std::shared_ptr<WriteMutex> mutex;
    std::string detachPath;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        mutex = m_writeMutex;
        if (m_writeUsers > 0) --m_writeUsers;
        if (m_writeUsers == 0 && m_detachPending) {
            m_detachPending = false;
            detachPath = m_path;
        }
    }
    if (mutex) mutex->unlock();

    if (!detachPath.empty()) {
        m_registry.detach(detachPath);
        spdlog::debug("Last writer of destroyed pool for {} finished; write mutex detached",
                      detachPath);
    }
}

void SQLiteConnectionPool::beginTransaction(SQLiteConnection& conn) {
    lockWriteMutex(conn);

    if (!conn.execute("BEGIN IMMEDIATE")) {
        int code = conn.errorCode();
        std::string message = conn.lastError();
        releaseWriteMutex(conn);
        if (ErrorHandler::isRetryable(code)) {
            spdlog::warn("Transaction on {} not started, retryable error: {}", databasePath(),
                         message);
        }
        throw SQLiteException(code, "Failed to begin transaction: " + message);
    }
}

void SQLiteConnectionPool::commitTransaction(SQLiteConnection& conn) {
    if (conn.execute("COMMIT")) {
        releaseWriteMutex(conn);
        return;
    }

    int code = conn.errorCode();
    std::string message = conn.lastError();
    if (ErrorHandler::isConstraintViolation(code)) {
        spdlog::warn("Commit on {} rejected by a deferred constraint: {}", databasePath(), message);
    }
    if (conn.inTransaction() && !conn.execute("ROLLBACK")) {
        spdlog::error("Rollback after failed commit failed: {}", conn.lastError());
    }
    releaseWriteMutex(conn);
    throw SQLiteException(code, "Failed to commit transaction: " + message);
}

void SQLiteConnectionPool::rollbackTransaction(SQLiteConnection& conn) {
    bool ok = conn.execute("ROLLBACK");
    int code = conn.errorCode();
    std::string message = ok ? "" : conn.lastError();
    releaseWriteMutex(conn);
    if (!ok) {
        throw SQLiteException(code, "Failed to roll back transaction: " + message);
    }
}

void SQLiteConnectionPool::savepoint(SQLiteConnection& conn, const std::string& name) {
    runOrThrow(conn, "SAVEPOINT " + heuristics::quoteIdentifier(name), "Failed to create savepoint");
}

void SQLiteConnectionPool::rollbackToSavepoint(SQLiteConnection& conn, const std::string& name) {
    runOrThrow(conn, "ROLLBACK TO SAVEPOINT " + heuristics::quoteIdentifier(name),
               "Failed to roll back to savepoint");
}

void SQLiteConnectionPool::releaseSavepoint(SQLiteConnection& conn, const std::string& name) {
    runOrThrow(conn, "RELEASE SAVEPOINT " + heuristics::quoteIdentifier(name),
               "Failed to release savepoint");
}

// ============================================================================
// Query Execution
// ============================================================================

QueryResult SQLiteConnectionPool::executeQuery(SQLiteConnection& conn, const CompiledQuery& query) {
    auto start = std::chrono::steady_clock::now();

    SQLiteResultSet statement = conn.prepareQuery(query);
    QueryResult result;
    if (conn.holdsWriteMutex() || conn.inTransaction() || statement.isReadOnly()) {
        result = conn.run(statement);
    } else {
        lockWriteMutex(conn);
        try {
            result = conn.run(statement);
        } catch (...) {
            releaseWriteMutex(conn);
            throw;
        }
        releaseWriteMutex(conn);
    }

    double elapsedMs = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();

    QueryListener listener;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        listener = m_listener;
    }
    if (listener) listener(query.sql, elapsedMs);

    return result;
}

void SQLiteConnectionPool::setQueryListener(QueryListener listener) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listener = std::move(listener);
}

// ============================================================================
// Pool Statistics and Management
// ============================================================================

bool SQLiteConnectionPool::healthCheck() {
    if (!isInitialized()) return false;

    PooledConnection conn(*this);
    SQLiteResultSet rs(conn->prepare("SELECT 1"));
    if (!rs) return false;
    return rs.step() && rs.getInt64(0) == 1;
}

void SQLiteConnectionPool::destroy() {
    std::string path;
    bool detachNow = true;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_initialized) return;

        m_initialized = false;
        m_total -= m_available.size();
        m_available.clear();
        m_waiters.clear();
        m_settings.clear();
        path = m_path;

        // A checked-out connection mid-transaction keeps the registry entry
        // alive so new pools on the same file still queue behind it
        detachNow = m_writeUsers == 0;
        m_detachPending = !detachNow;
    }
    // Waiters wake up, see the pool closed and throw
    m_cv.notify_all();

    if (detachNow) {
        m_registry.detach(path);
        spdlog::info("SQLite connection pool for {} destroyed", path);
    } else {
        spdlog::info("SQLite connection pool for {} destroyed; write mutex kept until its "
                     "holder finishes", path);
    }
}

size_t SQLiteConnectionPool::availableCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_available.size();
}

size_t SQLiteConnectionPool::totalCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_total;
}

size_t SQLiteConnectionPool::waitingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_waiters.size();
}

bool SQLiteConnectionPool::isInitialized() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_initialized;
}

std::string SQLiteConnectionPool::databasePath() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_path;
}

}  // namespace sqltune
