#include "ReportFormatter.hpp"

namespace sqltune {

namespace {

template <typename T>
json optionalToJson(const std::optional<T>& value) {
    if (value.has_value()) return json(value.value());
    return json(nullptr);
}

}  // namespace

json ReportFormatter::toJson(const IndexRecommendation& rec) {
    json obj = json::object();
    obj["table"] = rec.table;
    obj["columns"] = rec.columns;
    obj["type"] = toString(rec.kind);
    obj["priority"] = toString(rec.priority);
    obj["reason"] = rec.reason;
    obj["estimatedImpact"] = toString(rec.estimatedImpact);
    obj["sql"] = rec.sql;
    if (rec.existingIndex) {
        obj["existingIndex"] = *rec.existingIndex;
    }
    return obj;
}

json ReportFormatter::toJson(const IndexAnalysisResult& result) {
    json recs = json::array();
    for (const auto& rec : result.recommendations) {
        recs.push_back(toJson(rec));
    }

    json obj = json::object();
    obj["recommendations"] = std::move(recs);
    obj["existingIndexes"] = result.existingIndexes;
    obj["redundantIndexes"] = result.redundantIndexes;
    obj["missingIndexes"] = result.missingIndexes;
    obj["performanceImpact"] = toString(result.performanceImpact);
    obj["summary"] = result.summary;
    return obj;
}

json ReportFormatter::toJson(const OptimizationResult& result) {
    json obj = json::object();
    obj["appliedOptimizations"] = result.appliedOptimizations;
    obj["maintenance"] = result.maintenance;
    obj["recommendations"] = result.recommendations;
    obj["performanceImpact"] = toString(result.performanceImpact);
    obj["warnings"] = result.warnings;
    return obj;
}

json ReportFormatter::toJson(const PerformanceMetrics& metrics) {
    json obj = json::object();
    obj["pageCount"] = optionalToJson(metrics.pageCount);
    obj["pageSize"] = optionalToJson(metrics.pageSize);
    obj["freelistCount"] = optionalToJson(metrics.freelistCount);
    obj["schemaVersion"] = optionalToJson(metrics.schemaVersion);
    obj["userVersion"] = optionalToJson(metrics.userVersion);
    obj["applicationId"] = optionalToJson(metrics.applicationId);
    obj["cacheSize"] = optionalToJson(metrics.cacheSize);
    obj["synchronous"] = optionalToJson(metrics.synchronous);
    obj["journalMode"] = optionalToJson(metrics.journalMode);
    obj["autoVacuum"] = optionalToJson(metrics.autoVacuum);
    obj["tempStore"] = optionalToJson(metrics.tempStore);
    obj["foreignKeys"] = optionalToJson(metrics.foreignKeys);
    obj["integrityCheck"] = metrics.integrityCheck;
    return obj;
}

json ReportFormatter::toJson(const QueryPatternStats& stats) {
    json obj = json::object();
    obj["totalPatterns"] = stats.totalPatterns;
    obj["totalQueries"] = stats.totalQueries;
    obj["averageFrequency"] = stats.averageFrequency;
    obj["slowQueries"] = stats.slowQueries;
    return obj;
}

json ReportFormatter::toJson(const std::vector<std::string>& lines) {
    return json(lines);
}

std::string ReportFormatter::dump(const json& value, const JSONOptions& options) {
    return options.pretty ? value.dump(options.indent) : value.dump();
}

}  // namespace sqltune
