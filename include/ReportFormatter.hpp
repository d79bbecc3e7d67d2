#pragma once

#include "SQLiteAutoIndexer.hpp"
#include "SQLiteAutoOptimizer.hpp"
#include "QueryPatternRecorder.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sqltune {

using json = nlohmann::json;

struct JSONOptions {
    bool pretty = true;
    int indent = 2;
};

// JSON rendering of advisor and optimizer results
class ReportFormatter {
public:
    static json toJson(const IndexRecommendation& rec);
    static json toJson(const IndexAnalysisResult& result);
    static json toJson(const OptimizationResult& result);
    static json toJson(const PerformanceMetrics& metrics);  // unread values become null
    static json toJson(const QueryPatternStats& stats);
    static json toJson(const std::vector<std::string>& lines);

    static std::string dump(const json& value, const JSONOptions& options = JSONOptions{});
};

}  // namespace sqltune
