#pragma once

/**
 * @file SQLiteAutoIndexer.hpp
 * @brief Index advisor driven by observed query patterns.
 *
 * Observed SQL is folded into QueryPattern records (see
 * QueryPatternRecorder). analyzeAndRecommend() compares the hot patterns
 * against the indexes the schema catalog reports and produces ranked
 * CREATE INDEX suggestions, plus a list of existing indexes made redundant
 * by longer indexes with the same leading columns.
 */

#include "Config.hpp"
#include "QueryPatternRecorder.hpp"
#include "SchemaManager.hpp"
#include <string>
#include <vector>
#include <optional>
#include <mutex>
#include <unordered_map>

namespace sqltune {

enum class IndexKind {
    Single,
    Composite,
    Unique,
    Partial
};

enum class Priority {
    Low,
    Medium,
    High,
    Critical
};

enum class Impact {
    Low,
    Medium,
    High
};

std::string toString(IndexKind kind);
std::string toString(Priority priority);
std::string toString(Impact impact);

/**
 * @struct IndexRecommendation
 * @brief One suggested index with its ready-to-run DDL.
 */
struct IndexRecommendation {
    std::string table;
    std::vector<std::string> columns;
    IndexKind kind = IndexKind::Single;
    Priority priority = Priority::Low;
    std::string reason;
    Impact estimatedImpact = Impact::Low;
    std::string sql;                           ///< CREATE [UNIQUE] INDEX statement
    std::optional<std::string> existingIndex;  ///< Index this one replaces, if any
};

/**
 * @struct IndexAnalysisResult
 * @brief Output of one analyzeAndRecommend() call.
 */
struct IndexAnalysisResult {
    std::vector<IndexRecommendation> recommendations;  ///< Ranked, truncated
    std::vector<std::string> existingIndexes;          ///< Index names seen in the catalog
    std::vector<std::string> redundantIndexes;         ///< Longer indexes sharing a prefix
    std::vector<std::string> missingIndexes;           ///< Names of all suggested indexes
    Impact performanceImpact = Impact::Low;
    std::string summary;
};

/**
 * @class SQLiteAutoIndexer
 * @brief Turns query patterns into prioritized index recommendations.
 *
 * Recommendation rules:
 * - Only patterns with frequency >= min_frequency or an average time above
 *   slow_query_threshold_ms are considered, most frequent first.
 * - Each table contributes through its most frequent qualifying pattern
 *   only; later patterns on the same table are skipped.
 * - WHERE columns get single-column indexes ranked by frequency and
 *   latency, plus one composite index over the first three columns when a
 *   pattern filters on more than one.
 * - ORDER BY columns get medium/medium and JOIN columns high/high single
 *   column indexes.
 * - Columns already covered by an exactly matching index are skipped.
 *
 * Thread Safety:
 * - recordQuery() may be called from any thread. analyzeAndRecommend()
 *   works on a snapshot of the recorded patterns.
 *
 * @see QueryPatternRecorder for pattern normalization
 */
class SQLiteAutoIndexer {
public:
    /**
     * @brief Construct an index advisor.
     * @param schema Catalog used to list tables and existing indexes.
     */
    explicit SQLiteAutoIndexer(SchemaManager& schema);

    /**
     * @brief Record one executed statement.
     * @param sql SQL text as executed.
     * @param executionTimeMs Wall-clock duration of the statement.
     * @param table Table name, when the caller knows it.
     */
    void recordQuery(const std::string& sql, double executionTimeMs,
                     const std::optional<std::string>& table = std::nullopt);

    /**
     * @brief Produce recommendations from the patterns recorded so far.
     * @param options Thresholds and result limit.
     * @return Ranked recommendations and redundancy report. Also stored as
     *         the latest analysis for the current database file.
     * @throws SQLiteException if the catalog cannot list tables.
     *
     * A table whose index lookup fails is treated as having no indexes.
     */
    IndexAnalysisResult analyzeAndRecommend(const IndexAnalysisOptions& options = {});

    /**
     * @brief Latest analysis for a database.
     * @param dbId Database file name, or "unknown" for in-memory databases.
     */
    std::optional<IndexAnalysisResult> getAnalysisHistory(const std::string& dbId) const;

    /**
     * @brief Forget all patterns and stored analyses.
     */
    void clearAnalysisData();

    /**
     * @brief Aggregate statistics over the recorded patterns.
     */
    QueryPatternStats getQueryPatternStats() const;

    const QueryPatternRecorder& recorder() const { return m_recorder; }

private:
    using TableIndexes = std::unordered_map<std::string, std::vector<IndexInfo>>;

    void addWhereRecommendations(const QueryPattern& pattern, const TableIndexes& existing,
                                 std::vector<IndexRecommendation>& out) const;
    void addSingleColumnRecommendations(const QueryPattern& pattern,
                                        const std::vector<std::string>& columns,
                                        Priority priority, Impact impact,
                                        const std::string& reason, const TableIndexes& existing,
                                        std::vector<IndexRecommendation>& out) const;

    SchemaManager& m_schema;                   ///< Table and index catalog
    QueryPatternRecorder m_recorder;           ///< Observed query shapes
    std::unordered_map<std::string, IndexAnalysisResult> m_history;  ///< Keyed by database file
    mutable std::mutex m_mutex;                ///< Protects m_history
};

}  // namespace sqltune
