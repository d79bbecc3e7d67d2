/**
 * @file SQLiteAutoOptimizer.cpp
 * @brief Implementation of PRAGMA inspection and tuning.
 *
 * PRAGMA setters run and are verified on the borrowed connection. The
 * per-connection ones are then handed to the pool for its other
 * connections. ANALYZE and PRAGMA optimize write statistics tables and
 * therefore go through the pool so they are serialized with other writers.
 */

#include "SQLiteAutoOptimizer.hpp"
#include "SqlHeuristics.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <utility>

namespace sqltune {

namespace {

enum class StepOutcome {
    Applied,
    Ignored,
    Failed
};

std::optional<int64_t> readIntPragma(SQLiteConnection& conn, const std::string& name) {
    SQLiteResultSet rs(conn.prepare("PRAGMA " + name));
    if (!rs || !rs.step() || rs.isNull(0)) {
        spdlog::debug("Failed to get PRAGMA {}: {}", name, conn.lastError());
        return std::nullopt;
    }
    return rs.getInt64(0);
}

std::optional<std::string> readTextPragma(SQLiteConnection& conn, const std::string& name) {
    SQLiteResultSet rs(conn.prepare("PRAGMA " + name));
    if (!rs || !rs.step() || rs.isNull(0)) {
        spdlog::debug("Failed to get PRAGMA {}: {}", name, conn.lastError());
        return std::nullopt;
    }
    std::string value = rs.getString(0);
    std::transform(value.begin(), value.end(), value.begin(), ::tolower);
    return value;
}

// Run a PRAGMA setter and confirm the engine now reports 'expected'
template <typename T, typename ReadFn>
StepOutcome applyPragma(SQLiteConnection& conn, const std::string& sql, ReadFn read,
                        const T& expected) {
    if (!conn.execute(sql)) {
        spdlog::warn("{} failed: {}", sql, conn.lastError());
        return StepOutcome::Failed;
    }
    auto actual = read();
    if (!actual || *actual != expected) {
        spdlog::warn("{} had no effect", sql);
        return StepOutcome::Ignored;
    }
    return StepOutcome::Applied;
}

void record(OptimizationResult& result, StepOutcome outcome, std::string applied, Impact impact,
            std::string failed, std::string ignored) {
    switch (outcome) {
        case StepOutcome::Applied:
            result.appliedOptimizations.push_back(std::move(applied));
            result.performanceImpact = impact;
            break;
        case StepOutcome::Failed:
            result.warnings.push_back(std::move(failed));
            break;
        case StepOutcome::Ignored:
            result.warnings.push_back(std::move(ignored));
            break;
    }
}

// Copy a verified per-connection setting to the rest of the pool
void shareSetting(SQLiteConnectionPool& pool, StepOutcome outcome, const std::string& sql,
                  OptimizationResult& result) {
    if (outcome != StepOutcome::Applied) return;
    try {
        pool.applyToAllConnections(sql);
    } catch (const SQLiteException& e) {
        spdlog::warn("{} not applied to every pooled connection: {}", sql, e.what());
        result.warnings.push_back(sql + " was not applied to every pooled connection");
    }
}

}  // namespace

SQLiteAutoOptimizer::SQLiteAutoOptimizer(SQLiteConnectionPool& pool, SchemaManager& schema)
    : m_pool(pool), m_schema(schema) {}

// ============================================================================
// Analysis
// ============================================================================

PerformanceMetrics SQLiteAutoOptimizer::analyzeDatabase() {
    PerformanceMetrics metrics;
    PooledConnection conn(m_pool);

    metrics.pageCount = readIntPragma(*conn, "page_count");
    metrics.pageSize = readIntPragma(*conn, "page_size");
    metrics.freelistCount = readIntPragma(*conn, "freelist_count");
    metrics.schemaVersion = readIntPragma(*conn, "schema_version");
    metrics.userVersion = readIntPragma(*conn, "user_version");
    metrics.applicationId = readIntPragma(*conn, "application_id");
    metrics.cacheSize = readIntPragma(*conn, "cache_size");
    metrics.synchronous = readIntPragma(*conn, "synchronous");
    metrics.journalMode = readTextPragma(*conn, "journal_mode");
    metrics.autoVacuum = readIntPragma(*conn, "auto_vacuum");
    metrics.tempStore = readIntPragma(*conn, "temp_store");
    metrics.foreignKeys = readIntPragma(*conn, "foreign_keys");

    SQLiteResultSet rs(conn->prepare("PRAGMA integrity_check"));
    if (!rs) {
        throw SQLiteException(conn->errorCode(), "Integrity check failed to run: " + conn->lastError());
    }
    std::vector<std::string> rows;
    while (rs.step()) {
        rows.push_back(rs.getString(0));
    }
    if (rs.lastResult() != SQLITE_DONE) {
        throw SQLiteException(conn->get(), "Integrity check failed to run");
    }
    metrics.integrityCheck = rows.size() == 1 && rows.front() == "ok";

    return metrics;
}

// ============================================================================
// Optimization
// ============================================================================

void SQLiteAutoOptimizer::applyPragmaOptimizations(SQLiteConnection& conn,
                                                   const OptimizerConfig& config,
                                                   const PerformanceMetrics& metrics,
                                                   OptimizationResult& result) {
    auto readInt = [&conn](const char* name) {
        return [&conn, name] { return readIntPragma(conn, name); };
    };

    if (config.journal_mode == JournalMode::Wal && metrics.journalMode.value_or("") != "wal") {
        auto outcome = applyPragma(conn, "PRAGMA journal_mode = WAL",
                                   [&conn] { return readTextPragma(conn, "journal_mode"); },
                                   std::string("wal"));
        record(result, outcome, "Enabled WAL mode for better concurrency", Impact::High,
               "Failed to enable WAL mode", "WAL mode is not supported for this database");
    }

    if (std::llabs(metrics.cacheSize.value_or(0)) < std::llabs(config.cache_size)) {
        std::string value = std::to_string(config.cache_size);
        std::string sql = "PRAGMA cache_size = " + value;
        auto outcome = applyPragma(conn, sql, readInt("cache_size"), config.cache_size);
        shareSetting(m_pool, outcome, sql, result);
        record(result, outcome, "Set cache size to " + value, Impact::Medium,
               "Failed to set cache size", "Cache size change to " + value + " was not applied");
    }

    if (metrics.foreignKeys && *metrics.foreignKeys == 0) {
        const std::string sql = "PRAGMA foreign_keys = ON";
        auto outcome = applyPragma(conn, sql, readInt("foreign_keys"), int64_t{1});
        shareSetting(m_pool, outcome, sql, result);
        record(result, outcome, "Enabled foreign key constraints", Impact::Low,
               "Failed to enable foreign keys",
               "Foreign key enforcement could not be enabled (open transaction?)");
    }

    const auto sync = static_cast<int64_t>(config.synchronous);
    if (!metrics.synchronous || *metrics.synchronous != sync) {
        std::string name = toString(config.synchronous);
        std::string sql = "PRAGMA synchronous = " + name;
        auto outcome = applyPragma(conn, sql, readInt("synchronous"), sync);
        shareSetting(m_pool, outcome, sql, result);
        record(result, outcome, "Set synchronous mode to " + name, Impact::Medium,
               "Failed to set synchronous mode",
               "Synchronous mode change to " + name + " was not applied");
    }

    const auto temp = static_cast<int64_t>(config.temp_store);
    if (!metrics.tempStore || *metrics.tempStore != temp) {
        std::string name = toString(config.temp_store);
        std::string sql = "PRAGMA temp_store = " + name;
        auto outcome = applyPragma(conn, sql, readInt("temp_store"), temp);
        shareSetting(m_pool, outcome, sql, result);
        record(result, outcome, "Set temp store to " + name, Impact::Low,
               "Failed to set temp store", "Temp store change to " + name + " was not applied");
    }
}

void SQLiteAutoOptimizer::applyPerformanceTuning(SQLiteConnection& conn,
                                                 const OptimizerConfig& config,
                                                 const PerformanceMetrics& metrics,
                                                 OptimizationResult& result) {
    try {
        m_pool.executeQuery(conn, CompiledQuery::raw("ANALYZE"));
        result.maintenance.push_back("Ran ANALYZE for query optimization");
        result.performanceImpact = Impact::Medium;
    } catch (const SQLiteException& e) {
        spdlog::warn("ANALYZE failed: {}", e.what());
        result.warnings.push_back("Failed to run ANALYZE");
    }

    // Not available on engines older than 3.18
    try {
        m_pool.executeQuery(conn, CompiledQuery::raw("PRAGMA optimize"));
        result.maintenance.push_back("Ran PRAGMA optimize for automatic tuning");
        result.performanceImpact = Impact::Low;
    } catch (const SQLiteException& e) {
        spdlog::debug("PRAGMA optimize not available: {}", e.what());
    }

    const auto vacuum = static_cast<int64_t>(config.auto_vacuum);
    if (!metrics.autoVacuum || *metrics.autoVacuum != vacuum) {
        std::string name = toString(config.auto_vacuum);
        auto outcome = applyPragma(conn, "PRAGMA auto_vacuum = " + name,
                                   [&conn] { return readIntPragma(conn, "auto_vacuum"); }, vacuum);
        record(result, outcome, "Set auto vacuum to " + name, Impact::Medium,
               "Failed to set auto vacuum mode",
               "Auto vacuum change to " + name +
                   " requires VACUUM on a database that already has tables");
    }
}

void SQLiteAutoOptimizer::generateRecommendations(const PerformanceMetrics& metrics,
                                                  OptimizationResult& result) {
    if (metrics.freelistCount && *metrics.freelistCount > 100) {
        result.recommendations.push_back("High fragmentation detected (" +
                                         std::to_string(*metrics.freelistCount) +
                                         " free pages). Consider running VACUUM to reclaim space.");
    }

    if (!metrics.integrityCheck) {
        result.recommendations.push_back(
            "Database integrity check failed. Run PRAGMA integrity_check for details.");
    }

    try {
        for (const auto& table : m_schema.getTables()) {
            auto indexes = m_schema.getIndexes(table);
            if (!indexes) {
                spdlog::debug("Skipping index check for '{}'", table);
                continue;
            }
            if (indexes->empty()) {
                result.recommendations.push_back(
                    "Table '" + table +
                    "' has no indexes. Consider adding indexes for frequently queried columns.");
            }
        }
    } catch (const std::exception& e) {
        spdlog::debug("Failed to get table list: {}", e.what());
    }

    if (std::llabs(metrics.cacheSize.value_or(0)) < 32000) {
        result.recommendations.push_back(
            "Consider increasing cache_size for better performance with larger databases.");
    }

    if (metrics.journalMode.value_or("") != "wal") {
        result.recommendations.push_back(
            "Consider enabling WAL mode for better concurrent read performance.");
    }
}

std::string SQLiteAutoOptimizer::databaseId() {
    std::string id = m_schema.getDatabaseFile().value_or("");
    return id.empty() ? "unknown" : id;
}

OptimizationResult SQLiteAutoOptimizer::optimizeDatabase(const OptimizerConfig& config) {
    ErrorContext ctx("database optimization");
    OptimizationResult result;

    try {
        PerformanceMetrics metrics = analyzeDatabase();

        {
            // Released before the catalog is consulted; a one-connection
            // pool would otherwise block on itself.
            PooledConnection conn(m_pool);
            if (config.enable_auto_pragma) {
                applyPragmaOptimizations(*conn, config, metrics, result);
            }
            if (config.enable_performance_tuning) {
                applyPerformanceTuning(*conn, config, metrics, result);
            }
        }

        generateRecommendations(metrics, result);

        std::string dbId = databaseId();
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_history[dbId] = result;
        }

        spdlog::info("Applied {} SQLite optimizations", result.appliedOptimizations.size());
    } catch (const std::exception& e) {
        spdlog::error("{} failed: {}", ErrorContext::current(), e.what());
        result.warnings.push_back(std::string("Optimization failed: ") + e.what());
    }

    return result;
}

// ============================================================================
// History
// ============================================================================

std::optional<OptimizationResult> SQLiteAutoOptimizer::getOptimizationHistory(
    const std::string& dbId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_history.find(dbId);
    if (it == m_history.end()) return std::nullopt;
    return it->second;
}

void SQLiteAutoOptimizer::clearHistory() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_history.clear();
}

// ============================================================================
// Advisory Helpers
// ============================================================================

std::vector<std::string> SQLiteAutoOptimizer::getBackupRecommendations() {
    std::vector<std::string> recommendations;
    PerformanceMetrics metrics = analyzeDatabase();

    if (metrics.journalMode.value_or("") == "wal") {
        recommendations.push_back(
            "When using WAL mode, ensure to backup both the main database file and WAL file "
            "(-wal and -shm) for consistency.");
    }

    if (metrics.pageCount && metrics.pageSize &&
        *metrics.pageCount * *metrics.pageSize > int64_t{100} * 1024 * 1024) {
        recommendations.push_back(
            "For large databases, consider using SQLite backup API or .backup command for "
            "efficient backups.");
    }

    recommendations.push_back(
        "Perform backups during low-activity periods to minimize lock contention.");
    return recommendations;
}

std::vector<std::string> SQLiteAutoOptimizer::suggestIndexOptimizations(
    const std::vector<std::string>& queries) const {
    // Counts in first-seen column order
    std::vector<std::pair<std::string, size_t>> counts;
    for (const auto& query : queries) {
        for (const auto& column : heuristics::extractWhereColumns(query)) {
            auto it = std::find_if(counts.begin(), counts.end(),
                                   [&](const auto& entry) { return entry.first == column; });
            if (it == counts.end()) {
                counts.emplace_back(column, 1);
            } else {
                ++it->second;
            }
        }
    }

    std::vector<std::string> suggestions;
    for (const auto& [column, count] : counts) {
        if (count >= 3) {
            suggestions.push_back("Consider adding an index on '" + column + "' (used in " +
                                  std::to_string(count) + " queries)");
        }
    }
    return suggestions;
}

}  // namespace sqltune
