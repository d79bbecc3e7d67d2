/**
 * @file SQLiteAutoIndexer.cpp
 * @brief Implementation of the query-pattern index advisor.
 */

#include "SQLiteAutoIndexer.hpp"
#include "SqlHeuristics.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace sqltune {

// ============================================================================
// Enum Names
// ============================================================================

std::string toString(IndexKind kind) {
    switch (kind) {
        case IndexKind::Single: return "single";
        case IndexKind::Composite: return "composite";
        case IndexKind::Unique: return "unique";
        case IndexKind::Partial: return "partial";
    }
    return "single";
}

std::string toString(Priority priority) {
    switch (priority) {
        case Priority::Low: return "low";
        case Priority::Medium: return "medium";
        case Priority::High: return "high";
        case Priority::Critical: return "critical";
    }
    return "low";
}

std::string toString(Impact impact) {
    switch (impact) {
        case Impact::Low: return "low";
        case Impact::Medium: return "medium";
        case Impact::High: return "high";
    }
    return "low";
}

namespace {

// ============================================================================
// Scoring and Naming Helpers
// ============================================================================

Priority wherePriority(const QueryPattern& pattern) {
    if (pattern.averageExecutionTime > 5000) return Priority::Critical;
    if (pattern.frequency > 20) return Priority::High;
    if (pattern.frequency > 10) return Priority::Medium;
    return Priority::Low;
}

Impact estimateImpact(const QueryPattern& pattern) {
    if (pattern.averageExecutionTime > 2000) return Impact::High;
    if (pattern.frequency > 15) return Impact::High;
    if (pattern.averageExecutionTime > 500) return Impact::Medium;
    return Impact::Low;
}

int priorityWeight(Priority p) {
    switch (p) {
        case Priority::Critical: return 4;
        case Priority::High: return 3;
        case Priority::Medium: return 2;
        case Priority::Low: return 1;
    }
    return 1;
}

int impactWeight(Impact i) {
    switch (i) {
        case Impact::High: return 3;
        case Impact::Medium: return 2;
        case Impact::Low: return 1;
    }
    return 1;
}

int score(const IndexRecommendation& rec) {
    return priorityWeight(rec.priority) * impactWeight(rec.estimatedImpact);
}

std::string indexName(const std::string& table, const std::vector<std::string>& columns) {
    std::string suffix = columns.size() == 1 ? columns.front()
                                             : std::to_string(columns.size()) + "cols";
    return "idx_" + table + "_" + suffix;
}

std::string indexSql(const std::string& table, const std::vector<std::string>& columns,
                     IndexKind kind) {
    std::string sql = kind == IndexKind::Unique ? "CREATE UNIQUE INDEX " : "CREATE INDEX ";
    sql += heuristics::quoteIdentifier(indexName(table, columns));
    sql += " ON " + heuristics::quoteIdentifier(table) + " (";
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) sql += ", ";
        sql += heuristics::quoteIdentifier(columns[i]);
    }
    sql += ")";
    return sql;
}

// Strictly shorter and equal on every position of 'shorter'
bool isPrefix(const std::vector<std::string>& shorter, const std::vector<std::string>& longer) {
    if (shorter.size() >= longer.size()) return false;
    return std::equal(shorter.begin(), shorter.end(), longer.begin());
}

std::string joinColumns(const std::vector<std::string>& columns) {
    std::string out;
    for (const auto& c : columns) {
        if (!out.empty()) out += ",";
        out += c;
    }
    return out;
}

}  // namespace

// ============================================================================
// Construction and Recording
// ============================================================================

SQLiteAutoIndexer::SQLiteAutoIndexer(SchemaManager& schema) : m_schema(schema) {}

void SQLiteAutoIndexer::recordQuery(const std::string& sql, double executionTimeMs,
                                    const std::optional<std::string>& table) {
    m_recorder.recordQuery(sql, executionTimeMs, table);
}

// ============================================================================
// Recommendation Generation
// ============================================================================

namespace {

std::optional<std::string> findExisting(
    const std::unordered_map<std::string, std::vector<IndexInfo>>& existing,
    const std::string& table, const std::vector<std::string>& columns) {
    auto it = existing.find(table);
    if (it == existing.end()) return std::nullopt;
    for (const auto& idx : it->second) {
        if (idx.columns == columns) return idx.name;
    }
    return std::nullopt;
}

}  // namespace

void SQLiteAutoIndexer::addSingleColumnRecommendations(
    const QueryPattern& pattern, const std::vector<std::string>& columns, Priority priority,
    Impact impact, const std::string& reason, const TableIndexes& existing,
    std::vector<IndexRecommendation>& out) const {
    for (const auto& column : columns) {
        if (findExisting(existing, pattern.table, {column})) continue;

        IndexRecommendation rec;
        rec.table = pattern.table;
        rec.columns = {column};
        rec.kind = IndexKind::Single;
        rec.priority = priority;
        rec.estimatedImpact = impact;
        rec.reason = reason;
        rec.sql = indexSql(rec.table, rec.columns, rec.kind);
        out.push_back(std::move(rec));
    }
}

void SQLiteAutoIndexer::addWhereRecommendations(const QueryPattern& pattern,
                                                const TableIndexes& existing,
                                                std::vector<IndexRecommendation>& out) const {
    std::string reason = "Frequently queried column (" + std::to_string(pattern.frequency) +
                         " times, avg " +
                         std::to_string(std::llround(pattern.averageExecutionTime)) + "ms)";
    addSingleColumnRecommendations(pattern, pattern.whereColumns, wherePriority(pattern),
                                   estimateImpact(pattern), reason, existing, out);

    if (pattern.whereColumns.size() > 1) {
        size_t n = std::min<size_t>(pattern.whereColumns.size(), 3);
        std::vector<std::string> columns(pattern.whereColumns.begin(),
                                         pattern.whereColumns.begin() + static_cast<std::ptrdiff_t>(n));
        if (!findExisting(existing, pattern.table, columns)) {
            IndexRecommendation rec;
            rec.table = pattern.table;
            rec.columns = std::move(columns);
            rec.kind = IndexKind::Composite;
            rec.priority = Priority::High;
            rec.estimatedImpact = Impact::High;
            rec.reason = "Composite index for multiple WHERE columns (" +
                         std::to_string(pattern.frequency) + " times)";
            rec.sql = indexSql(rec.table, rec.columns, rec.kind);
            out.push_back(std::move(rec));
        }
    }
}

IndexAnalysisResult SQLiteAutoIndexer::analyzeAndRecommend(const IndexAnalysisOptions& options) {
    ErrorContext ctx("index analysis");
    try {
        IndexAnalysisResult result;

        // Existing indexes, per table in catalog order
        std::vector<std::string> tables = m_schema.getTables();
        TableIndexes existing;
        for (const auto& table : tables) {
            auto indexes = m_schema.getIndexes(table);
            if (!indexes) {
                spdlog::warn("Could not load indexes for table '{}'; assuming none", table);
                existing[table] = {};
                continue;
            }
            for (const auto& idx : *indexes) {
                result.existingIndexes.push_back(idx.name);
            }
            existing[table] = std::move(*indexes);
        }

        // Qualifying patterns, most frequent first
        std::vector<QueryPattern> patterns = m_recorder.patterns();
        patterns.erase(std::remove_if(patterns.begin(), patterns.end(),
                                      [&](const QueryPattern& p) {
                                          return p.frequency < options.min_frequency &&
                                                 !(p.averageExecutionTime >
                                                   options.slow_query_threshold_ms);
                                      }),
                       patterns.end());
        std::stable_sort(patterns.begin(), patterns.end(),
                         [](const QueryPattern& a, const QueryPattern& b) {
                             return a.frequency > b.frequency;
                         });

        std::vector<IndexRecommendation> recommendations;
        std::unordered_set<std::string> processedTables;
        for (const auto& pattern : patterns) {
            if (pattern.table == heuristics::kUnknownTable) {
                spdlog::debug("Skipping pattern without a table: {}", pattern.query);
                continue;
            }
            if (!processedTables.insert(pattern.table).second) continue;

            addWhereRecommendations(pattern, existing, recommendations);
            addSingleColumnRecommendations(
                pattern, pattern.orderByColumns, Priority::Medium, Impact::Medium,
                "Frequently ordered by column (" + std::to_string(pattern.frequency) + " times)",
                existing, recommendations);
            addSingleColumnRecommendations(
                pattern, pattern.joinColumns, Priority::High, Impact::High,
                "Foreign key column used in joins (" + std::to_string(pattern.frequency) +
                    " times)",
                existing, recommendations);
        }

        // First occurrence of each (table, columns) wins
        std::unordered_set<std::string> seen;
        recommendations.erase(
            std::remove_if(recommendations.begin(), recommendations.end(),
                           [&](const IndexRecommendation& rec) {
                               return !seen.insert(rec.table + ":" + joinColumns(rec.columns)).second;
                           }),
            recommendations.end());

        // Redundant: the longer of two indexes where one is a prefix of the other
        for (const auto& table : tables) {
            const auto& indexes = existing[table];
            for (size_t i = 0; i < indexes.size(); ++i) {
                for (size_t j = i + 1; j < indexes.size(); ++j) {
                    const std::string* flagged = nullptr;
                    if (isPrefix(indexes[i].columns, indexes[j].columns)) {
                        flagged = &indexes[j].name;
                    } else if (isPrefix(indexes[j].columns, indexes[i].columns)) {
                        flagged = &indexes[i].name;
                    }
                    if (flagged && std::find(result.redundantIndexes.begin(),
                                             result.redundantIndexes.end(),
                                             *flagged) == result.redundantIndexes.end()) {
                        result.redundantIndexes.push_back(*flagged);
                    }
                }
            }
        }

        // Names of every suggested index, before truncation
        for (const auto& rec : recommendations) {
            std::string name = indexName(rec.table, rec.columns);
            if (std::find(result.existingIndexes.begin(), result.existingIndexes.end(), name) ==
                result.existingIndexes.end()) {
                result.missingIndexes.push_back(std::move(name));
            }
        }

        std::stable_sort(recommendations.begin(), recommendations.end(),
                         [](const IndexRecommendation& a, const IndexRecommendation& b) {
                             return score(a) > score(b);
                         });
        if (recommendations.size() > options.max_recommendations) {
            recommendations.resize(options.max_recommendations);
        }

        size_t highImpact = 0;
        size_t mediumImpact = 0;
        size_t critical = 0;
        size_t highPriority = 0;
        for (const auto& rec : recommendations) {
            if (rec.estimatedImpact == Impact::High) ++highImpact;
            if (rec.estimatedImpact == Impact::Medium) ++mediumImpact;
            if (rec.priority == Priority::Critical) ++critical;
            if (rec.priority == Priority::High) ++highPriority;
        }

        if (highImpact > 3) {
            result.performanceImpact = Impact::High;
        } else if (highImpact > 0 || mediumImpact > 5) {
            result.performanceImpact = Impact::Medium;
        } else {
            result.performanceImpact = Impact::Low;
        }

        result.summary = "Found " + std::to_string(recommendations.size()) + " index recommendations";
        if (critical > 0) result.summary += ", " + std::to_string(critical) + " critical";
        if (highPriority > 0) result.summary += ", " + std::to_string(highPriority) + " high priority";
        if (!result.redundantIndexes.empty()) {
            result.summary += ". " + std::to_string(result.redundantIndexes.size()) +
                              " redundant indexes identified for removal";
        }

        result.recommendations = std::move(recommendations);

        std::string dbId = m_schema.getDatabaseFile().value_or("");
        if (dbId.empty()) dbId = "unknown";
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_history[dbId] = result;
        }

        spdlog::info("Generated {} index recommendations", result.recommendations.size());
        return result;
    } catch (const std::exception& e) {
        spdlog::error("{} failed: {}", ErrorContext::current(), e.what());
        throw;
    }
}

// ============================================================================
// History and Statistics
// ============================================================================

std::optional<IndexAnalysisResult> SQLiteAutoIndexer::getAnalysisHistory(const std::string& dbId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_history.find(dbId);
    if (it == m_history.end()) return std::nullopt;
    return it->second;
}

void SQLiteAutoIndexer::clearAnalysisData() {
    m_recorder.clear();
    std::lock_guard<std::mutex> lock(m_mutex);
    m_history.clear();
}

QueryPatternStats SQLiteAutoIndexer::getQueryPatternStats() const {
    return m_recorder.stats(1000.0);
}

}  // namespace sqltune
