#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "SQLiteConnectionPool.hpp"
#include "ErrorHandler.hpp"
#include <filesystem>
#include <fstream>
#include <thread>
#include <atomic>
#include <chrono>
#include <vector>

using namespace sqltune;
using namespace std::chrono_literals;
using ::testing::HasSubstr;

class ConnectionPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() / "sqltune_pool_test";
        std::filesystem::remove_all(tempDir_);
        std::filesystem::create_directories(tempDir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir_);
    }

    PoolConfig fileConfig(size_t poolSize = 2) const {
        PoolConfig config;
        config.database_path = (tempDir_ / "pool.db").string();
        config.pool_size = poolSize;
        return config;
    }

    static Value pragmaValue(SQLiteConnection& conn, const std::string& name) {
        QueryResult result = conn.executeQuery(CompiledQuery::raw("PRAGMA " + name));
        EXPECT_EQ(result.rows.size(), 1u);
        return result.rows.at(0).at(0);
    }

    template <typename Pred>
    static bool waitUntil(Pred pred) {
        for (int i = 0; i < 500; ++i) {
            if (pred()) return true;
            std::this_thread::sleep_for(2ms);
        }
        return false;
    }

    std::filesystem::path tempDir_;
    WriteMutexRegistry registry_;
};

// Initialization
TEST_F(ConnectionPoolTest, InitAppliesBaselinePragmas) {
    SQLiteConnectionPool pool(registry_);
    PoolConfig config = fileConfig();
    config.journal_size_limit = 1048576;
    pool.init(config);

    EXPECT_TRUE(pool.isInitialized());
    EXPECT_EQ(pool.totalCount(), 2u);
    EXPECT_EQ(pool.availableCount(), 2u);

    PooledConnection conn(pool);
    EXPECT_EQ(std::get<std::string>(pragmaValue(*conn, "journal_mode")), "wal");
    EXPECT_EQ(std::get<int64_t>(pragmaValue(*conn, "busy_timeout")), 5000);
    EXPECT_EQ(std::get<int64_t>(pragmaValue(*conn, "synchronous")), 1);
    EXPECT_EQ(std::get<int64_t>(pragmaValue(*conn, "temp_store")), 2);
    EXPECT_EQ(std::get<int64_t>(pragmaValue(*conn, "journal_size_limit")), 1048576);
}

TEST_F(ConnectionPoolTest, InMemoryPoolHasOneConnection) {
    SQLiteConnectionPool pool(registry_);
    PoolConfig config;
    config.pool_size = 4;
    pool.init(config);

    EXPECT_EQ(pool.totalCount(), 1u);
    EXPECT_EQ(pool.databasePath(), ":memory:");
    EXPECT_TRUE(pool.healthCheck());
}

TEST_F(ConnectionPoolTest, InitTwiceThrows) {
    SQLiteConnectionPool pool(registry_);
    pool.init(PoolConfig{});
    EXPECT_THROW(pool.init(PoolConfig{}), std::logic_error);
}

TEST_F(ConnectionPoolTest, InitFailsForUnopenablePath) {
    SQLiteConnectionPool pool(registry_);
    PoolConfig config;
    config.database_path = (tempDir_ / "missing" / "dir" / "x.db").string();

    EXPECT_THROW(pool.init(config), SQLiteException);
    EXPECT_FALSE(pool.isInitialized());
    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(ConnectionPoolTest, InitFailsWhenHookThrows) {
    SQLiteConnectionPool pool(registry_);
    int calls = 0;
    auto failOnSecond = [&calls](SQLiteConnection&) {
        if (++calls == 2) throw SQLiteException(SQLITE_ERROR, "setup failed");
    };

    EXPECT_THROW(pool.init(fileConfig(3), failOnSecond), SQLiteException);
    EXPECT_EQ(calls, 2);
    EXPECT_FALSE(pool.isInitialized());
    EXPECT_EQ(pool.totalCount(), 0u);
    EXPECT_EQ(registry_.size(), 0u);

    // Nothing left behind; a clean init works
    pool.init(fileConfig(3));
    EXPECT_EQ(pool.totalCount(), 3u);
}

TEST_F(ConnectionPoolTest, InitFailsWhenBaselinePragmaFails) {
    std::filesystem::path path = tempDir_ / "pool.db";
    {
        std::ofstream out(path, std::ios::binary);
        out << std::string(4096, 'x');
    }

    SQLiteConnectionPool pool(registry_);
    try {
        pool.init(fileConfig());
        FAIL() << "Expected SQLiteException";
    } catch (const SQLiteException& e) {
        EXPECT_THAT(e.what(), HasSubstr("journal_mode"));
        EXPECT_NE(e.errorCode(), SQLITE_OK);
    }
    EXPECT_FALSE(pool.isInitialized());
    EXPECT_EQ(registry_.size(), 0u);
    EXPECT_THROW(pool.acquire(), PoolUnavailableError);
}

TEST_F(ConnectionPoolTest, HookRunsForEveryConnection) {
    SQLiteConnectionPool pool(registry_);
    int calls = 0;
    pool.init(fileConfig(3), [&calls](SQLiteConnection& conn) {
        ++calls;
        EXPECT_TRUE(conn.execute("PRAGMA foreign_keys = ON"));
    });

    EXPECT_EQ(calls, 3);
    PooledConnection conn(pool);
    EXPECT_EQ(std::get<int64_t>(pragmaValue(*conn, "foreign_keys")), 1);
}

TEST_F(ConnectionPoolTest, PoolsOnSameFileShareWriteMutex) {
    SQLiteConnectionPool first(registry_);
    SQLiteConnectionPool second(registry_);
    first.init(fileConfig());
    second.init(fileConfig());

    EXPECT_EQ(first.databasePath(), second.databasePath());
    EXPECT_EQ(registry_.refCount(first.databasePath()), 2u);

    first.destroy();
    EXPECT_EQ(registry_.refCount(second.databasePath()), 1u);
    second.destroy();
    EXPECT_EQ(registry_.size(), 0u);
}

// Acquire and release
TEST_F(ConnectionPoolTest, AcquireBeforeInitThrows) {
    SQLiteConnectionPool pool(registry_);
    EXPECT_THROW(pool.acquire(), PoolUnavailableError);
    EXPECT_FALSE(pool.healthCheck());
}

TEST_F(ConnectionPoolTest, AcquireAfterDestroyThrows) {
    SQLiteConnectionPool pool(registry_);
    pool.init(PoolConfig{});
    pool.destroy();

    EXPECT_FALSE(pool.isInitialized());
    EXPECT_THROW(pool.acquire(), PoolUnavailableError);

    // Second destroy is a no-op
    pool.destroy();
}

TEST_F(ConnectionPoolTest, AcquireReleaseUpdatesCounts) {
    SQLiteConnectionPool pool(registry_);
    pool.init(fileConfig());

    auto a = pool.acquire();
    EXPECT_EQ(pool.availableCount(), 1u);
    auto b = pool.acquire();
    EXPECT_EQ(pool.availableCount(), 0u);
    EXPECT_EQ(pool.totalCount(), 2u);

    pool.release(std::move(a));
    pool.release(std::move(b));
    pool.release(nullptr);
    EXPECT_EQ(pool.availableCount(), 2u);
}

TEST_F(ConnectionPoolTest, WaitersServedInFifoOrder) {
    SQLiteConnectionPool pool(registry_);
    pool.init(fileConfig(2));

    auto a = pool.acquire();
    auto b = pool.acquire();

    std::mutex orderMutex;
    std::vector<int> order;
    std::vector<std::thread> threads;
    for (int i = 0; i < 3; ++i) {
        threads.emplace_back([&, i] {
            auto conn = pool.acquire();
            {
                std::lock_guard<std::mutex> guard(orderMutex);
                order.push_back(i);
            }
            pool.release(std::move(conn));
        });
        EXPECT_TRUE(waitUntil([&] { return pool.waitingCount() == static_cast<size_t>(i + 1); }));
    }

    pool.release(std::move(a));
    pool.release(std::move(b));
    for (auto& t : threads) t.join();

    EXPECT_EQ(order.size(), 3u);
    EXPECT_EQ(order.front(), 0);
    EXPECT_EQ(pool.waitingCount(), 0u);
    EXPECT_EQ(pool.availableCount(), 2u);
}

TEST_F(ConnectionPoolTest, DestroyFailsPendingWaiters) {
    SQLiteConnectionPool pool(registry_);
    pool.init(fileConfig(1));
    auto held = pool.acquire();

    std::atomic<bool> failed{false};
    std::thread waiter([&] {
        try {
            auto conn = pool.acquire();
            pool.release(std::move(conn));
        } catch (const PoolUnavailableError&) {
            failed = true;
        }
    });
    EXPECT_TRUE(waitUntil([&] { return pool.waitingCount() == 1; }));

    pool.destroy();
    waiter.join();
    EXPECT_TRUE(failed);

    // Connection checked out across destroy() is closed on release
    EXPECT_EQ(pool.totalCount(), 1u);
    pool.release(std::move(held));
    EXPECT_EQ(pool.totalCount(), 0u);
    EXPECT_EQ(pool.availableCount(), 0u);
}

// Per-connection settings
TEST_F(ConnectionPoolTest, SettingsReachIdleAndCheckedOutConnections) {
    SQLiteConnectionPool pool(registry_);
    EXPECT_THROW(pool.applyToAllConnections("PRAGMA foreign_keys = ON"), PoolUnavailableError);
    pool.init(fileConfig(2));

    auto held = pool.acquire();
    pool.applyToAllConnections("PRAGMA foreign_keys = ON");
    pool.applyToAllConnections("PRAGMA cache_size = -4000");

    // The held connection is only updated once it comes back
    EXPECT_EQ(std::get<int64_t>(pragmaValue(*held, "foreign_keys")), 0);
    {
        PooledConnection idle(pool);
        EXPECT_EQ(std::get<int64_t>(pragmaValue(*idle, "foreign_keys")), 1);
        EXPECT_EQ(std::get<int64_t>(pragmaValue(*idle, "cache_size")), -4000);
    }
    pool.release(std::move(held));

    auto a = pool.acquire();
    auto b = pool.acquire();
    for (SQLiteConnection* conn : {a.get(), b.get()}) {
        EXPECT_EQ(std::get<int64_t>(pragmaValue(*conn, "foreign_keys")), 1);
        EXPECT_EQ(std::get<int64_t>(pragmaValue(*conn, "cache_size")), -4000);
    }
    pool.release(std::move(a));
    pool.release(std::move(b));
}

TEST_F(ConnectionPoolTest, WaiterReceivesConnectionWithSettings) {
    SQLiteConnectionPool pool(registry_);
    pool.init(fileConfig(1));
    auto held = pool.acquire();

    std::atomic<int64_t> seen{-1};
    std::thread waiter([&] {
        PooledConnection conn(pool);
        seen = std::get<int64_t>(pragmaValue(*conn, "foreign_keys"));
    });
    EXPECT_TRUE(waitUntil([&] { return pool.waitingCount() == 1; }));

    pool.applyToAllConnections("PRAGMA foreign_keys = ON");
    pool.release(std::move(held));
    waiter.join();
    EXPECT_EQ(seen, 1);
}

// Transactions
TEST_F(ConnectionPoolTest, CommitPersistsAndReleasesMutex) {
    SQLiteConnectionPool pool(registry_);
    pool.init(fileConfig());
    auto mutex = registry_.find(pool.databasePath());
    ASSERT_NE(mutex, nullptr);

    PooledConnection conn(pool);
    pool.executeQuery(*conn, CompiledQuery::raw("CREATE TABLE t (id INTEGER PRIMARY KEY, v TEXT)"));

    pool.beginTransaction(*conn);
    EXPECT_TRUE(mutex->isLocked());
    EXPECT_TRUE(conn->holdsWriteMutex());
    EXPECT_TRUE(conn->inTransaction());

    QueryResult insert = pool.executeQuery(
        *conn, CompiledQuery{"INSERT INTO t (v) VALUES (?)", {std::string("a")}});
    EXPECT_EQ(insert.numAffectedRows, 1);
    EXPECT_EQ(insert.insertId, 1);

    pool.commitTransaction(*conn);
    EXPECT_FALSE(mutex->isLocked());
    EXPECT_FALSE(conn->holdsWriteMutex());
    EXPECT_FALSE(conn->inTransaction());

    QueryResult rows = pool.executeQuery(*conn, CompiledQuery::raw("SELECT v FROM t"));
    ASSERT_EQ(rows.rows.size(), 1u);
    EXPECT_EQ(std::get<std::string>(rows.rows[0][0]), "a");
}

TEST_F(ConnectionPoolTest, RollbackDiscardsChanges) {
    SQLiteConnectionPool pool(registry_);
    pool.init(fileConfig());

    PooledConnection conn(pool);
    pool.executeQuery(*conn, CompiledQuery::raw("CREATE TABLE t (id INTEGER)"));

    pool.beginTransaction(*conn);
    pool.executeQuery(*conn, CompiledQuery{"INSERT INTO t VALUES (?)", {int64_t{7}}});
    pool.rollbackTransaction(*conn);

    EXPECT_FALSE(conn->holdsWriteMutex());
    QueryResult rows = pool.executeQuery(*conn, CompiledQuery::raw("SELECT COUNT(*) FROM t"));
    EXPECT_EQ(std::get<int64_t>(rows.rows.at(0).at(0)), 0);
}

TEST_F(ConnectionPoolTest, SavepointsNestInsideTransaction) {
    SQLiteConnectionPool pool(registry_);
    pool.init(fileConfig());

    PooledConnection conn(pool);
    pool.executeQuery(*conn, CompiledQuery::raw("CREATE TABLE t (id INTEGER)"));

    pool.beginTransaction(*conn);
    pool.executeQuery(*conn, CompiledQuery{"INSERT INTO t VALUES (?)", {int64_t{1}}});
    pool.savepoint(*conn, "inner step");
    pool.executeQuery(*conn, CompiledQuery{"INSERT INTO t VALUES (?)", {int64_t{2}}});
    pool.rollbackToSavepoint(*conn, "inner step");
    pool.releaseSavepoint(*conn, "inner step");
    pool.commitTransaction(*conn);

    QueryResult rows = pool.executeQuery(*conn, CompiledQuery::raw("SELECT id FROM t"));
    ASSERT_EQ(rows.rows.size(), 1u);
    EXPECT_EQ(std::get<int64_t>(rows.rows[0][0]), 1);

    EXPECT_THROW(pool.releaseSavepoint(*conn, "never created"), SQLiteException);
}

TEST_F(ConnectionPoolTest, TransactionsAcrossPoolsAreSerialized) {
    SQLiteConnectionPool first(registry_);
    SQLiteConnectionPool second(registry_);
    first.init(fileConfig());
    second.init(fileConfig());

    {
        PooledConnection setup(first);
        first.executeQuery(*setup, CompiledQuery::raw("CREATE TABLE t (id INTEGER)"));
    }

    auto mutex = registry_.find(first.databasePath());
    ASSERT_NE(mutex, nullptr);

    PooledConnection a(first);
    first.beginTransaction(*a);

    std::atomic<bool> secondCommitted{false};
    std::thread other([&] {
        PooledConnection b(second);
        second.beginTransaction(*b);
        second.executeQuery(*b, CompiledQuery{"INSERT INTO t VALUES (?)", {int64_t{2}}});
        second.commitTransaction(*b);
        secondCommitted = true;
    });

    // The second writer queues on the shared mutex instead of hitting SQLITE_BUSY
    EXPECT_TRUE(waitUntil([&] { return mutex->waitingCount() == 1; }));
    EXPECT_FALSE(secondCommitted);

    first.executeQuery(*a, CompiledQuery{"INSERT INTO t VALUES (?)", {int64_t{1}}});
    first.commitTransaction(*a);
    other.join();

    EXPECT_TRUE(secondCommitted);
    QueryResult rows = first.executeQuery(*a, CompiledQuery::raw("SELECT id FROM t ORDER BY rowid"));
    ASSERT_EQ(rows.rows.size(), 2u);
    EXPECT_EQ(std::get<int64_t>(rows.rows[0][0]), 1);
    EXPECT_EQ(std::get<int64_t>(rows.rows[1][0]), 2);
}

TEST_F(ConnectionPoolTest, WriteOutsideTransactionWaitsForHolder) {
    SQLiteConnectionPool pool(registry_);
    pool.init(fileConfig(3));

    auto a = pool.acquire();
    auto b = pool.acquire();
    auto c = pool.acquire();
    pool.executeQuery(*a, CompiledQuery::raw("CREATE TABLE t (id INTEGER)"));
    auto mutex = registry_.find(pool.databasePath());

    pool.beginTransaction(*a);

    std::thread writer([&] {
        pool.executeQuery(*b, CompiledQuery{"INSERT INTO t VALUES (?)", {int64_t{5}}});
    });
    EXPECT_TRUE(waitUntil([&] { return mutex->waitingCount() == 1; }));

    // Reads don't need the mutex
    QueryResult count = pool.executeQuery(*c, CompiledQuery::raw("SELECT COUNT(*) FROM t"));
    EXPECT_EQ(std::get<int64_t>(count.rows.at(0).at(0)), 0);

    pool.commitTransaction(*a);
    writer.join();
    EXPECT_FALSE(mutex->isLocked());

    pool.release(std::move(a));
    pool.release(std::move(b));
    pool.release(std::move(c));
}

TEST_F(ConnectionPoolTest, ReleaseWhileHoldingMutexRollsBack) {
    SQLiteConnectionPool pool(registry_);
    pool.init(fileConfig());
    auto mutex = registry_.find(pool.databasePath());

    {
        PooledConnection conn(pool);
        pool.executeQuery(*conn, CompiledQuery::raw("CREATE TABLE t (id INTEGER)"));
        pool.beginTransaction(*conn);
        pool.executeQuery(*conn, CompiledQuery{"INSERT INTO t VALUES (?)", {int64_t{1}}});
        // Scope ends without commit
    }

    EXPECT_FALSE(mutex->isLocked());

    PooledConnection conn(pool);
    EXPECT_FALSE(conn->holdsWriteMutex());
    QueryResult rows = pool.executeQuery(*conn, CompiledQuery::raw("SELECT COUNT(*) FROM t"));
    EXPECT_EQ(std::get<int64_t>(rows.rows.at(0).at(0)), 0);
}

TEST_F(ConnectionPoolTest, DeferredConstraintFailsCommit) {
    SQLiteConnectionPool pool(registry_);
    pool.init(fileConfig(1), [](SQLiteConnection& conn) {
        ASSERT_TRUE(conn.execute("PRAGMA foreign_keys = ON"));
    });
    auto mutex = registry_.find(pool.databasePath());

    PooledConnection conn(pool);
    pool.executeQuery(*conn, CompiledQuery::raw("CREATE TABLE parent (id INTEGER PRIMARY KEY)"));
    pool.executeQuery(*conn, CompiledQuery::raw(
        "CREATE TABLE child (pid INTEGER REFERENCES parent(id) DEFERRABLE INITIALLY DEFERRED)"));

    pool.beginTransaction(*conn);
    pool.executeQuery(*conn, CompiledQuery{"INSERT INTO child VALUES (?)", {int64_t{99}}});
    try {
        pool.commitTransaction(*conn);
        FAIL() << "Expected SQLiteException";
    } catch (const SQLiteException& e) {
        EXPECT_TRUE(ErrorHandler::isConstraintViolation(e.errorCode()));
        EXPECT_THAT(e.what(), HasSubstr("Failed to commit transaction"));
    }

    EXPECT_FALSE(mutex->isLocked());
    EXPECT_FALSE(conn->holdsWriteMutex());
    EXPECT_FALSE(conn->inTransaction());
    QueryResult rows = pool.executeQuery(*conn, CompiledQuery::raw("SELECT COUNT(*) FROM child"));
    EXPECT_EQ(std::get<int64_t>(rows.rows.at(0).at(0)), 0);
}

TEST_F(ConnectionPoolTest, DestroyKeepsWriteMutexForOpenTransaction) {
    SQLiteConnectionPool first(registry_);
    first.init(fileConfig());
    const std::string path = first.databasePath();
    auto mutex = registry_.find(path);

    auto conn = first.acquire();
    first.executeQuery(*conn, CompiledQuery::raw("CREATE TABLE t (id INTEGER)"));
    first.beginTransaction(*conn);
    first.executeQuery(*conn, CompiledQuery{"INSERT INTO t VALUES (?)", {int64_t{1}}});

    first.destroy();
    EXPECT_EQ(registry_.find(path), mutex);
    EXPECT_THROW(first.init(fileConfig()), std::logic_error);

    // A new pool on the file queues behind the still-open transaction
    SQLiteConnectionPool second(registry_);
    second.init(fileConfig());
    EXPECT_EQ(registry_.find(path), mutex);
    EXPECT_EQ(registry_.refCount(path), 2u);

    std::atomic<bool> secondCommitted{false};
    std::thread other([&] {
        PooledConnection b(second);
        second.beginTransaction(*b);
        second.executeQuery(*b, CompiledQuery{"INSERT INTO t VALUES (?)", {int64_t{2}}});
        second.commitTransaction(*b);
        secondCommitted = true;
    });
    EXPECT_TRUE(waitUntil([&] { return mutex->waitingCount() == 1; }));
    EXPECT_FALSE(secondCommitted);

    first.commitTransaction(*conn);
    other.join();
    EXPECT_TRUE(secondCommitted);
    EXPECT_EQ(registry_.refCount(path), 1u);

    first.release(std::move(conn));
    EXPECT_EQ(first.totalCount(), 0u);

    PooledConnection check(second);
    QueryResult rows = second.executeQuery(*check, CompiledQuery::raw("SELECT id FROM t ORDER BY rowid"));
    ASSERT_EQ(rows.rows.size(), 2u);
    EXPECT_EQ(std::get<int64_t>(rows.rows[0][0]), 1);
    EXPECT_EQ(std::get<int64_t>(rows.rows[1][0]), 2);
}

TEST_F(ConnectionPoolTest, RealColumnsReadAsDouble) {
    SQLiteConnectionPool pool(registry_);
    pool.init(PoolConfig{});

    PooledConnection conn(pool);
    QueryResult rows = pool.executeQuery(*conn, CompiledQuery{"SELECT 2.5, ?", {0.25}});
    ASSERT_EQ(rows.rows.size(), 1u);
    EXPECT_DOUBLE_EQ(std::get<double>(rows.rows[0][0]), 2.5);
    EXPECT_DOUBLE_EQ(std::get<double>(rows.rows[0][1]), 0.25);
}

TEST_F(ConnectionPoolTest, FailedStatementThrowsWithContext) {
    SQLiteConnectionPool pool(registry_);
    pool.init(PoolConfig{});

    PooledConnection conn(pool);
    try {
        pool.executeQuery(*conn, CompiledQuery::raw("SELECT * FROM no_such_table"));
        FAIL() << "Expected SQLiteException";
    } catch (const SQLiteException& e) {
        EXPECT_THAT(e.what(), HasSubstr("no_such_table"));
    }
}

TEST_F(ConnectionPoolTest, ListenerReceivesExecutedStatements) {
    SQLiteConnectionPool pool(registry_);
    pool.init(PoolConfig{});

    std::vector<std::string> seen;
    pool.setQueryListener([&seen](const std::string& sql, double elapsedMs) {
        EXPECT_GE(elapsedMs, 0.0);
        seen.push_back(sql);
    });

    PooledConnection conn(pool);
    pool.executeQuery(*conn, CompiledQuery::raw("CREATE TABLE t (id INTEGER)"));
    pool.executeQuery(*conn, CompiledQuery::raw("SELECT id FROM t"));

    EXPECT_EQ(seen, (std::vector<std::string>{"CREATE TABLE t (id INTEGER)", "SELECT id FROM t"}));
}
