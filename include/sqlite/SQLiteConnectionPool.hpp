#pragma once

/**
 * @file SQLiteConnectionPool.hpp
 * @brief Connection pool and transaction manager for one SQLite database file.
 *
 * SQLite allows any number of concurrent readers but only one writer per
 * database file. This pool hands out physical connections to callers in
 * strict FIFO order and serializes writes through a process-wide
 * WriteMutex shared by every pool opened on the same file, so a writer
 * waits in the mutex instead of inside a blocking SQLite lock call.
 */

#include "ConnectionPool.hpp"
#include "Config.hpp"
#include "CompiledQuery.hpp"
#include "SQLiteConnection.hpp"
#include "WriteMutex.hpp"
#include "WriteMutexRegistry.hpp"
#include <deque>
#include <vector>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <string>

namespace sqltune {

/**
 * @class SQLiteConnectionPool
 * @brief Pool of SQLite connections with write serialization.
 *
 * Lifecycle:
 * - init() opens the connections, applies the baseline PRAGMAs and attaches
 *   to the registry's write mutex for the resolved file path.
 * - acquire()/release() move connections in and out of the pool.
 * - destroy() closes idle connections and fails pending waiters. It
 *   detaches from the registry at once, or when the last checked-out
 *   connection using the write mutex lets go of it. The destructor calls it.
 *
 * Per-connection settings:
 * - applyToAllConnections() runs a setter such as "PRAGMA foreign_keys = ON"
 *   on every idle connection immediately and on each checked-out
 *   connection when it is released, before anyone else can acquire it.
 *
 * Write Serialization:
 * - beginTransaction() takes the write mutex before issuing
 *   BEGIN IMMEDIATE and marks the connection as its holder.
 * - commitTransaction()/rollbackTransaction() release it.
 * - executeQuery() outside a transaction takes the mutex around a single
 *   write statement; reads run without it.
 * - A connection released while still holding the mutex has its open
 *   transaction rolled back and the mutex released.
 *
 * Usage:
 * @code
 *   WriteMutexRegistry registry;
 *   SQLiteConnectionPool pool(registry);
 *   pool.init(config.pool);
 *   {
 *       PooledConnection conn(pool);
 *       pool.beginTransaction(*conn);
 *       pool.executeQuery(*conn, {"INSERT INTO t VALUES (?)", {int64_t{1}}});
 *       pool.commitTransaction(*conn);
 *   }
 * @endcode
 *
 * Thread Safety:
 * - All pool methods may be called from any thread.
 * - A connection is used only by the thread that acquired it.
 *
 * @see SQLiteConnection for individual connection usage
 */
class SQLiteConnectionPool : public ConnectionPool {
public:
    /// Runs once on every new connection, after the baseline PRAGMAs
    using ConnectionHook = std::function<void(SQLiteConnection&)>;

    /// Receives every statement run through executeQuery() and its duration
    using QueryListener = std::function<void(const std::string& sql, double elapsedMs)>;

    /**
     * @brief Create an uninitialized pool.
     * @param registry Registry providing the per-file write mutex. Must
     *                 outlive the pool.
     */
    explicit SQLiteConnectionPool(WriteMutexRegistry& registry);

    /**
     * @brief Destructor - destroys the pool if still initialized.
     */
    ~SQLiteConnectionPool() override;

    /**
     * @brief Open the pool's connections.
     * @param config Database path, pool size and baseline PRAGMA values.
     * @param hook Optional per-connection setup callback.
     * @throws SQLiteException if a connection cannot be opened or a PRAGMA
     *         fails; connections opened so far are closed.
     * @throws std::logic_error if the pool is already initialized, or was
     *         destroyed while a checked-out connection still uses the
     *         write mutex.
     *
     * An in-memory database (":memory:" or empty path) always gets exactly
     * one connection, because each in-memory connection is a separate
     * database.
     */
    void init(const PoolConfig& config, ConnectionHook hook = {});

    /**
     * @brief Take a connection, waiting in FIFO order if none is free.
     * @return Connection owned by the caller until release().
     * @throws PoolUnavailableError before init() or after destroy(),
     *         including for callers woken by destroy().
     */
    std::unique_ptr<SQLiteConnection> acquire();

    /**
     * @brief Return a connection to the pool.
     * @param conn Connection from acquire(). Null is ignored.
     *
     * Settings added by applyToAllConnections() while the connection was
     * out are run first. Then the connection goes to the oldest waiter if
     * any, else it becomes available. After destroy() the connection is
     * closed instead.
     */
    void release(std::unique_ptr<SQLiteConnection> conn);

    /**
     * @brief Run a per-connection setting on every connection of the pool.
     * @param sql Setter statement, e.g. "PRAGMA cache_size = -64000".
     * @throws PoolUnavailableError before init() or after destroy().
     * @throws SQLiteException if the setting fails on an idle connection.
     *
     * Idle connections run it now. Checked-out connections run it in
     * release(), where a failure is logged and the connection is still
     * returned to the pool.
     */
    void applyToAllConnections(const std::string& sql);

    // ----- Transactions -----

    /**
     * @brief Take the write mutex and start an immediate transaction.
     * @param conn Connection acquired from this pool.
     * @throws SQLiteException if BEGIN IMMEDIATE fails (mutex released).
     *         A busy database is logged as a warning before throwing.
     */
    void beginTransaction(SQLiteConnection& conn);

    /**
     * @brief Commit and release the write mutex.
     * @throws SQLiteException if COMMIT fails, e.g. on a deferred foreign
     *         key violation. The transaction is rolled back and the mutex
     *         released before throwing.
     */
    void commitTransaction(SQLiteConnection& conn);

    /**
     * @brief Roll back and release the write mutex.
     * @throws SQLiteException if ROLLBACK fails (mutex still released).
     */
    void rollbackTransaction(SQLiteConnection& conn);

    /// Nested transaction control; never touches the write mutex.
    void savepoint(SQLiteConnection& conn, const std::string& name);
    void rollbackToSavepoint(SQLiteConnection& conn, const std::string& name);
    void releaseSavepoint(SQLiteConnection& conn, const std::string& name);

    /**
     * @brief Run a compiled query on a connection from this pool.
     * @return Rows for reads, change counts for writes.
     * @throws SQLiteException on prepare, bind or step failure.
     *
     * Inside an explicit transaction the statement runs directly. Outside
     * one, a write holds the write mutex for the statement's duration and a
     * read runs without it.
     */
    QueryResult executeQuery(SQLiteConnection& conn, const CompiledQuery& query);

    /**
     * @brief Install a listener called after each successful executeQuery().
     */
    void setQueryListener(QueryListener listener);

    // ----- ConnectionPool interface implementation -----

    size_t availableCount() const override;
    size_t totalCount() const override;
    size_t waitingCount() const override;

    /**
     * @brief Run "SELECT 1" on a pooled connection.
     * @return false if the pool is not initialized or the query fails.
     */
    bool healthCheck() override;

    void destroy() override;
    bool isInitialized() const override;
    std::string databasePath() const override;

private:
    struct Waiter {
        std::unique_ptr<SQLiteConnection> conn;
    };

    void lockWriteMutex(SQLiteConnection& conn);
    void releaseWriteMutex(SQLiteConnection& conn);
    void replaySettings(SQLiteConnection& conn);
    void applyPragmas(SQLiteConnection& conn, const PoolConfig& config);
    void runOrThrow(SQLiteConnection& conn, const std::string& sql, const char* what);

    WriteMutexRegistry& m_registry;
    std::shared_ptr<WriteMutex> m_writeMutex;  ///< Shared with other pools on the same file
    std::string m_path;                        ///< Registry key
    bool m_initialized = false;
    size_t m_total = 0;                        ///< Connections owned, idle or checked out
    size_t m_writeUsers = 0;                   ///< Connections holding or queued on m_writeMutex
    bool m_detachPending = false;              ///< destroy() left the detach to the last writer
    std::vector<std::string> m_settings;       ///< applyToAllConnections() history

    std::vector<std::unique_ptr<SQLiteConnection>> m_available;  ///< Idle connections
    std::deque<std::shared_ptr<Waiter>> m_waiters;               ///< FIFO acquire queue
    QueryListener m_listener;

    mutable std::mutex m_mutex;   ///< Protects everything above
    std::condition_variable m_cv;
};

/**
 * @class PooledConnection
 * @brief RAII guard that acquires on construction and releases on scope exit.
 */
class PooledConnection {
public:
    explicit PooledConnection(SQLiteConnectionPool& pool)
        : m_pool(pool), m_conn(pool.acquire()) {}

    ~PooledConnection() {
        if (m_conn) m_pool.release(std::move(m_conn));
    }

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    SQLiteConnection* operator->() const { return m_conn.get(); }
    SQLiteConnection& operator*() const { return *m_conn; }
    SQLiteConnection* get() const { return m_conn.get(); }

private:
    SQLiteConnectionPool& m_pool;
    std::unique_ptr<SQLiteConnection> m_conn;
};

}  // namespace sqltune
