#include "Config.hpp"
#include "ErrorHandler.hpp"
#include "ReportFormatter.hpp"
#include "SQLiteConnectionPool.hpp"
#include "SQLiteSchemaManager.hpp"
#include "SQLiteAutoIndexer.hpp"
#include "SQLiteAutoOptimizer.hpp"
#include "WriteMutexRegistry.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <fstream>
#include <stdexcept>
#include <iostream>
#include <vector>

using namespace sqltune;

namespace {

void setupLogging(bool debug, const std::string& logFile) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Reports go to stdout, so log lines go to stderr
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(debug ? spdlog::level::debug : spdlog::level::info);
        sinks.push_back(console_sink);

        if (!logFile.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, false);
                file_sink->set_level(debug ? spdlog::level::debug : spdlog::level::info);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "Cannot open log file " << logFile << ": " << ex.what() << std::endl;
            }
        }

        auto logger = std::make_shared<spdlog::logger>("sqltune", sinks.begin(), sinks.end());
        logger->set_level(debug ? spdlog::level::debug : spdlog::level::info);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

// Each line is "<ms>\t<sql>" or just "<sql>" (recorded as 0 ms)
size_t loadQueryLog(const std::string& path, SQLiteAutoIndexer& indexer) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open query log: " + path);
    }

    size_t count = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty() || line[0] == '#') continue;

        double ms = 0.0;
        std::string sql = line;
        auto tab = line.find('\t');
        if (tab != std::string::npos) {
            try {
                ms = std::stod(line.substr(0, tab));
                sql = line.substr(tab + 1);
            } catch (const std::logic_error&) {
                spdlog::debug("No timing on query log line {}", count + 1);
            }
        }
        if (sql.empty()) continue;

        indexer.recordQuery(sql, ms);
        ++count;
    }
    return count;
}

int runAnalyze(const Config& config, SQLiteConnectionPool& pool, SQLiteAutoIndexer& indexer,
               const JSONOptions& options) {
    size_t loaded = loadQueryLog(config.query_log, indexer);
    spdlog::info("Loaded {} queries from {}", loaded, config.query_log);

    IndexAnalysisResult result = indexer.analyzeAndRecommend(config.indexer);

    json report = ReportFormatter::toJson(result);
    report["stats"] = ReportFormatter::toJson(indexer.getQueryPatternStats());

    if (config.apply_indexes) {
        json applied = json::array();
        PooledConnection conn(pool);
        for (const auto& rec : result.recommendations) {
            try {
                pool.executeQuery(*conn, CompiledQuery::raw(rec.sql));
                applied.push_back(rec.sql);
                spdlog::info("Created index: {}", rec.sql);
            } catch (const SQLiteException& e) {
                spdlog::error("Failed to create index ({}): {}", rec.sql, e.what());
            }
        }
        report["applied"] = std::move(applied);
    }

    std::cout << ReportFormatter::dump(report, options) << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse configuration
    Config config;
    try {
        config = Config::parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    // Setup logging
    setupLogging(config.logging.debug, config.logging.log_file);

    // Validate configuration
    if (!config.validate()) {
        return 1;
    }

    JSONOptions options;
    options.pretty = config.pretty_json;

    WriteMutexRegistry registry;
    SQLiteConnectionPool pool(registry);

    try {
        pool.init(config.pool);

        SQLiteSchemaManager schema(pool);
        SQLiteAutoOptimizer optimizer(pool, schema);
        SQLiteAutoIndexer indexer(schema);

        spdlog::debug("Running '{}' on {}", config.command, pool.databasePath());

        int rc = 0;
        if (config.command == "metrics") {
            std::cout << ReportFormatter::dump(ReportFormatter::toJson(optimizer.analyzeDatabase()),
                                               options)
                      << std::endl;
        } else if (config.command == "optimize") {
            OptimizationResult result = optimizer.optimizeDatabase(config.optimizer);
            json report = ReportFormatter::toJson(result);
            if (config.optimizer.enable_backup_recommendations) {
                report["backupRecommendations"] =
                    ReportFormatter::toJson(optimizer.getBackupRecommendations());
            }
            std::cout << ReportFormatter::dump(report, options) << std::endl;
        } else if (config.command == "backup-advice") {
            std::cout << ReportFormatter::dump(
                             ReportFormatter::toJson(optimizer.getBackupRecommendations()), options)
                      << std::endl;
        } else if (config.command == "analyze") {
            rc = runAnalyze(config, pool, indexer, options);
        }

        pool.destroy();
        return rc;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
}
