#include "QueryPatternRecorder.hpp"
#include "SqlHeuristics.hpp"
#include <spdlog/spdlog.h>

namespace sqltune {

void QueryPatternRecorder::recordQuery(const std::string& sql, double executionTimeMs,
                                       const std::optional<std::string>& table) {
    std::string key = heuristics::normalizeQuery(sql);
    auto now = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_patterns.find(key);
    if (it != m_patterns.end()) {
        QueryPattern& pattern = it->second;
        ++pattern.frequency;
        pattern.lastExecuted = now;
        double n = static_cast<double>(pattern.frequency);
        pattern.averageExecutionTime =
            (pattern.averageExecutionTime * (n - 1.0) + executionTimeMs) / n;
        return;
    }

    QueryPattern pattern;
    pattern.query = key;
    pattern.frequency = 1;
    pattern.table = (table && !table->empty()) ? *table : heuristics::extractTableName(sql);
    pattern.whereColumns = heuristics::extractWhereColumns(sql);
    pattern.orderByColumns = heuristics::extractOrderByColumns(sql);
    pattern.joinColumns = heuristics::extractJoinColumns(sql);
    pattern.lastExecuted = now;
    pattern.averageExecutionTime = executionTimeMs;

    spdlog::debug("New query pattern on '{}': {}", pattern.table, key);
    m_order.push_back(key);
    m_patterns.emplace(key, std::move(pattern));
}

std::vector<QueryPattern> QueryPatternRecorder::patterns() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<QueryPattern> result;
    result.reserve(m_order.size());
    for (const auto& key : m_order) {
        result.push_back(m_patterns.at(key));
    }
    return result;
}

std::optional<QueryPattern> QueryPatternRecorder::find(const std::string& normalizedQuery) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_patterns.find(normalizedQuery);
    if (it == m_patterns.end()) return std::nullopt;
    return it->second;
}

QueryPatternStats QueryPatternRecorder::stats(double slowQueryThresholdMs) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    QueryPatternStats stats;
    stats.totalPatterns = m_patterns.size();
    for (const auto& [key, pattern] : m_patterns) {
        stats.totalQueries += pattern.frequency;
        if (pattern.averageExecutionTime > slowQueryThresholdMs) ++stats.slowQueries;
    }
    if (stats.totalPatterns > 0) {
        stats.averageFrequency =
            static_cast<double>(stats.totalQueries) / static_cast<double>(stats.totalPatterns);
    }
    return stats;
}

size_t QueryPatternRecorder::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_patterns.size();
}

void QueryPatternRecorder::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_patterns.clear();
    m_order.clear();
}

}  // namespace sqltune
