#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <mutex>
#include <optional>
#include <cstdint>
#include <unordered_map>

namespace sqltune {

// Aggregated statistics for one normalized query shape
struct QueryPattern {
    std::string query;  // normalized text, also the map key
    uint64_t frequency = 0;
    std::string table;
    std::vector<std::string> whereColumns;
    std::vector<std::string> orderByColumns;
    std::vector<std::string> joinColumns;
    std::chrono::system_clock::time_point lastExecuted;
    double averageExecutionTime = 0.0;  // ms
};

struct QueryPatternStats {
    size_t totalPatterns = 0;
    uint64_t totalQueries = 0;
    double averageFrequency = 0.0;
    size_t slowQueries = 0;  // patterns whose average exceeds the threshold
};

// Thread-safe store of observed query patterns. The pool's query listener
// may call recordQuery() from any thread.
class QueryPatternRecorder {
public:
    QueryPatternRecorder() = default;

    // Non-copyable
    QueryPatternRecorder(const QueryPatternRecorder&) = delete;
    QueryPatternRecorder& operator=(const QueryPatternRecorder&) = delete;

    // Column extraction runs on the original text the first time a shape is
    // seen; later executions only update frequency and timing.
    void recordQuery(const std::string& sql, double executionTimeMs,
                     const std::optional<std::string>& table = std::nullopt);

    // Snapshot in first-recorded order
    std::vector<QueryPattern> patterns() const;

    std::optional<QueryPattern> find(const std::string& normalizedQuery) const;

    QueryPatternStats stats(double slowQueryThresholdMs = 1000.0) const;

    size_t size() const;
    void clear();

private:
    std::unordered_map<std::string, QueryPattern> m_patterns;
    std::vector<std::string> m_order;  // keys in first-recorded order
    mutable std::mutex m_mutex;
};

}  // namespace sqltune
