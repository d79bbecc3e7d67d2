#pragma once

/**
 * @file SQLiteAutoOptimizer.hpp
 * @brief PRAGMA-based inspection and tuning of an SQLite database.
 *
 * analyzeDatabase() takes a snapshot of the engine configuration,
 * optimizeDatabase() moves it towards an OptimizerConfig target and
 * reports what changed, and the advisory helpers produce human-readable
 * backup and indexing suggestions.
 */

#include "Config.hpp"
#include "SchemaManager.hpp"
#include "SQLiteAutoIndexer.hpp"
#include "SQLiteConnectionPool.hpp"
#include <string>
#include <vector>
#include <optional>
#include <mutex>
#include <cstdint>
#include <unordered_map>

namespace sqltune {

/**
 * @struct PerformanceMetrics
 * @brief Point-in-time engine configuration snapshot.
 *
 * A value that could not be read is left empty.
 */
struct PerformanceMetrics {
    std::optional<int64_t> pageCount;
    std::optional<int64_t> pageSize;
    std::optional<int64_t> freelistCount;
    std::optional<int64_t> schemaVersion;
    std::optional<int64_t> userVersion;
    std::optional<int64_t> applicationId;
    std::optional<int64_t> cacheSize;
    std::optional<int64_t> synchronous;   ///< 0=OFF 1=NORMAL 2=FULL 3=EXTRA
    std::optional<std::string> journalMode;  ///< Lowercase, as reported by SQLite
    std::optional<int64_t> autoVacuum;    ///< 0=NONE 1=FULL 2=INCREMENTAL
    std::optional<int64_t> tempStore;     ///< 0=DEFAULT 1=FILE 2=MEMORY
    std::optional<int64_t> foreignKeys;
    bool integrityCheck = false;          ///< PRAGMA integrity_check returned "ok"
};

/**
 * @struct OptimizationResult
 * @brief Outcome of one optimizeDatabase() call.
 */
struct OptimizationResult {
    std::vector<std::string> appliedOptimizations;  ///< Configuration changes confirmed by readback
    std::vector<std::string> recommendations;       ///< Advisory only, never applied
    std::vector<std::string> maintenance;           ///< ANALYZE / PRAGMA optimize runs
    Impact performanceImpact = Impact::Low;          ///< Impact of the last successful step
    std::vector<std::string> warnings;
};

/**
 * @class SQLiteAutoOptimizer
 * @brief Reads and tunes engine-level PRAGMA settings.
 *
 * Persistence of changes:
 * - journal_mode=WAL and auto_vacuum are stored in the database file.
 * - cache_size, foreign_keys, synchronous and temp_store are per
 *   connection. Each is verified on the pooled connection used for the
 *   call, then passed to SQLiteConnectionPool::applyToAllConnections()
 *   so every connection of the pool ends up with it. It is reported as
 *   applied once.
 *
 * Every change is read back, and only a change the engine actually made
 * is reported as applied. Ignored changes (WAL on an in-memory database,
 * auto_vacuum on a database that already has tables) become warnings, so
 * a second call with the same configuration applies nothing.
 *
 * Thread Safety:
 * - Safe to call from any thread; each call works on its own pooled
 *   connection. History access is locked.
 */
class SQLiteAutoOptimizer {
public:
    /**
     * @brief Construct an optimizer.
     * @param pool Pool supplying the connection PRAGMAs run on.
     * @param schema Catalog used for the per-table index check.
     */
    SQLiteAutoOptimizer(SQLiteConnectionPool& pool, SchemaManager& schema);

    /**
     * @brief Default tuning targets.
     */
    static OptimizerConfig getDefaultConfig() { return OptimizerConfig{}; }

    /**
     * @brief Snapshot the current engine configuration.
     * @return Metrics; individual values are empty when their read failed.
     * @throws SQLiteException if the integrity check cannot run.
     * @throws PoolUnavailableError if the pool is not usable.
     */
    PerformanceMetrics analyzeDatabase();

    /**
     * @brief Apply the configured tuning and collect advice.
     * @param config Targets and feature switches.
     * @return Applied changes, maintenance runs, advice and warnings.
     *
     * Never throws: a failure of the whole call is reported as an
     * "Optimization failed: ..." warning in the returned result.
     */
    OptimizationResult optimizeDatabase(const OptimizerConfig& config = getDefaultConfig());

    /**
     * @brief Latest successful optimization for a database file.
     * @param dbId Database file name, or "unknown" for in-memory databases.
     */
    std::optional<OptimizationResult> getOptimizationHistory(const std::string& dbId) const;

    void clearHistory();

    /**
     * @brief Backup advice based on journal mode and database size.
     * @throws SQLiteException if the database cannot be analyzed.
     */
    std::vector<std::string> getBackupRecommendations();

    /**
     * @brief Suggest indexes for columns filtered on by three or more queries.
     * @param queries Raw SQL texts; independent of any recorded patterns.
     */
    std::vector<std::string> suggestIndexOptimizations(const std::vector<std::string>& queries) const;

private:
    void applyPragmaOptimizations(SQLiteConnection& conn, const OptimizerConfig& config,
                                  const PerformanceMetrics& metrics, OptimizationResult& result);
    void applyPerformanceTuning(SQLiteConnection& conn, const OptimizerConfig& config,
                                const PerformanceMetrics& metrics, OptimizationResult& result);
    void generateRecommendations(const PerformanceMetrics& metrics, OptimizationResult& result);
    std::string databaseId();

    SQLiteConnectionPool& m_pool;   ///< Connection source
    SchemaManager& m_schema;        ///< Table and index catalog
    std::unordered_map<std::string, OptimizationResult> m_history;  ///< Keyed by database file
    mutable std::mutex m_mutex;     ///< Protects m_history
};

}  // namespace sqltune
