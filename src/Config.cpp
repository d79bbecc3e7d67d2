#include "Config.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <cstdlib>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace sqltune {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

bool parseBool(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
}

}  // namespace

// ============================================================================
// Enumeration names
// ============================================================================

std::string toString(AutoVacuumMode mode) {
    switch (mode) {
        case AutoVacuumMode::None: return "NONE";
        case AutoVacuumMode::Full: return "FULL";
        case AutoVacuumMode::Incremental: return "INCREMENTAL";
    }
    return "NONE";
}

std::string toString(JournalMode mode) {
    switch (mode) {
        case JournalMode::Delete: return "DELETE";
        case JournalMode::Truncate: return "TRUNCATE";
        case JournalMode::Persist: return "PERSIST";
        case JournalMode::Memory: return "MEMORY";
        case JournalMode::Wal: return "WAL";
        case JournalMode::Off: return "OFF";
    }
    return "DELETE";
}

std::string toString(SynchronousMode mode) {
    switch (mode) {
        case SynchronousMode::Off: return "OFF";
        case SynchronousMode::Normal: return "NORMAL";
        case SynchronousMode::Full: return "FULL";
        case SynchronousMode::Extra: return "EXTRA";
    }
    return "FULL";
}

std::string toString(TempStoreMode mode) {
    switch (mode) {
        case TempStoreMode::Default: return "DEFAULT";
        case TempStoreMode::File: return "FILE";
        case TempStoreMode::Memory: return "MEMORY";
    }
    return "DEFAULT";
}

AutoVacuumMode parseAutoVacuumMode(const std::string& value) {
    std::string upper = toUpper(trim(value));
    if (upper == "NONE" || upper == "0") return AutoVacuumMode::None;
    if (upper == "FULL" || upper == "1") return AutoVacuumMode::Full;
    if (upper == "INCREMENTAL" || upper == "2") return AutoVacuumMode::Incremental;
    throw std::invalid_argument("Unknown auto_vacuum mode: " + value);
}

JournalMode parseJournalMode(const std::string& value) {
    std::string upper = toUpper(trim(value));
    if (upper == "DELETE") return JournalMode::Delete;
    if (upper == "TRUNCATE") return JournalMode::Truncate;
    if (upper == "PERSIST") return JournalMode::Persist;
    if (upper == "MEMORY") return JournalMode::Memory;
    if (upper == "WAL") return JournalMode::Wal;
    if (upper == "OFF") return JournalMode::Off;
    throw std::invalid_argument("Unknown journal mode: " + value);
}

SynchronousMode parseSynchronousMode(const std::string& value) {
    std::string upper = toUpper(trim(value));
    if (upper == "OFF" || upper == "0") return SynchronousMode::Off;
    if (upper == "NORMAL" || upper == "1") return SynchronousMode::Normal;
    if (upper == "FULL" || upper == "2") return SynchronousMode::Full;
    if (upper == "EXTRA" || upper == "3") return SynchronousMode::Extra;
    throw std::invalid_argument("Unknown synchronous mode: " + value);
}

TempStoreMode parseTempStoreMode(const std::string& value) {
    std::string upper = toUpper(trim(value));
    if (upper == "DEFAULT" || upper == "0") return TempStoreMode::Default;
    if (upper == "FILE" || upper == "1") return TempStoreMode::File;
    if (upper == "MEMORY" || upper == "2") return TempStoreMode::Memory;
    throw std::invalid_argument("Unknown temp_store mode: " + value);
}

// ============================================================================
// Configuration file
// ============================================================================

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;
    std::string current_section;

    while (std::getline(file, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.size() - 2);
            continue;
        }

        // Key-value pair
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        if (current_section == "pool") {
            if (key == "database") config.pool.database_path = value;
            else if (key == "pool_size")
                config.pool.pool_size = static_cast<size_t>(std::stoul(value));
            else if (key == "busy_timeout")
                config.pool.busy_timeout = std::chrono::milliseconds(std::stoll(value));
            else if (key == "journal_mode")
                config.pool.journal_mode = parseJournalMode(value);
            else if (key == "synchronous")
                config.pool.synchronous = parseSynchronousMode(value);
            else if (key == "journal_size_limit")
                config.pool.journal_size_limit = std::stoll(value);
            else if (key == "temp_store")
                config.pool.temp_store = parseTempStoreMode(value);
        }
        else if (current_section == "indexer") {
            if (key == "min_frequency")
                config.indexer.min_frequency = std::stoull(value);
            else if (key == "slow_query_threshold")
                config.indexer.slow_query_threshold_ms = std::stod(value);
            else if (key == "include_partial_indexes")
                config.indexer.include_partial_indexes = parseBool(value);
            else if (key == "max_recommendations")
                config.indexer.max_recommendations = static_cast<size_t>(std::stoul(value));
        }
        else if (current_section == "optimizer") {
            if (key == "enable_auto_pragma")
                config.optimizer.enable_auto_pragma = parseBool(value);
            else if (key == "enable_auto_indexing")
                config.optimizer.enable_auto_indexing = parseBool(value);
            else if (key == "enable_performance_tuning")
                config.optimizer.enable_performance_tuning = parseBool(value);
            else if (key == "enable_backup_recommendations")
                config.optimizer.enable_backup_recommendations = parseBool(value);
            else if (key == "slow_query_threshold")
                config.optimizer.slow_query_threshold_ms = std::stod(value);
            else if (key == "auto_vacuum")
                config.optimizer.auto_vacuum = parseAutoVacuumMode(value);
            else if (key == "journal_mode")
                config.optimizer.journal_mode = parseJournalMode(value);
            else if (key == "synchronous")
                config.optimizer.synchronous = parseSynchronousMode(value);
            else if (key == "cache_size")
                config.optimizer.cache_size = std::stoll(value);
            else if (key == "temp_store")
                config.optimizer.temp_store = parseTempStoreMode(value);
        }
        else if (current_section == "logging") {
            if (key == "debug") config.logging.debug = parseBool(value);
            else if (key == "file") config.logging.log_file = value;
        }
    }

    return config;
}

// ============================================================================
// Command line
// ============================================================================

Config Config::parseArgs(int argc, char* argv[]) {
    CLI::App app{"sqltune - SQLite connection tuning and index advisor"};
    app.require_subcommand(1);

    std::string config_file;
    std::string database;
    size_t pool_size = 1;
    bool debug = false;
    std::string log_file;
    bool compact = false;

    app.add_option("-c,--config", config_file, "Path to configuration file");
    auto* database_opt = app.add_option("-D,--database", database, "SQLite database file");
    auto* pool_size_opt = app.add_option("--pool-size", pool_size, "Number of pooled connections");
    auto* debug_opt = app.add_flag("-d,--debug", debug, "Enable debug output");
    auto* log_file_opt = app.add_option("--log-file", log_file, "Also write logs to this file");
    app.add_flag("--compact", compact, "Print compact instead of pretty JSON");

    auto* metrics_cmd = app.add_subcommand("metrics", "Print a configuration and health snapshot");
    auto* backup_cmd = app.add_subcommand("backup-advice", "Print backup recommendations");

    // optimize
    auto* optimize_cmd = app.add_subcommand("optimize", "Apply PRAGMA and maintenance tuning");
    bool no_pragma = false;
    bool no_tuning = false;
    int64_t cache_size = 0;
    std::string journal_mode;
    std::string synchronous;
    std::string temp_store;
    std::string auto_vacuum;
    optimize_cmd->add_flag("--no-pragma", no_pragma, "Do not change PRAGMA settings");
    optimize_cmd->add_flag("--no-tuning", no_tuning, "Skip ANALYZE, optimize and auto_vacuum");
    auto* cache_size_opt = optimize_cmd->add_option("--cache-size", cache_size,
                                                    "Target cache_size (negative = KiB)");
    auto* journal_opt = optimize_cmd->add_option("--journal-mode", journal_mode, "Target journal mode");
    auto* sync_opt = optimize_cmd->add_option("--synchronous", synchronous, "Target synchronous mode");
    auto* temp_opt = optimize_cmd->add_option("--temp-store", temp_store, "Target temp_store mode");
    auto* vacuum_opt = optimize_cmd->add_option("--auto-vacuum", auto_vacuum, "Target auto_vacuum mode");

    // analyze
    auto* analyze_cmd = app.add_subcommand("analyze", "Recommend indexes from a query log");
    std::string query_log;
    uint64_t min_frequency = 3;
    double slow_threshold = 1000.0;
    size_t max_recommendations = 20;
    bool apply = false;
    analyze_cmd->add_option("-q,--queries", query_log,
                            "Query log: one '<ms>\\t<sql>' or bare SQL statement per line")
        ->required();
    auto* min_freq_opt = analyze_cmd->add_option("--min-frequency", min_frequency,
                                                 "Minimum pattern frequency");
    auto* slow_opt = analyze_cmd->add_option("--slow-threshold", slow_threshold,
                                             "Slow query threshold in milliseconds");
    auto* max_opt = analyze_cmd->add_option("--max-recommendations", max_recommendations,
                                            "Maximum number of recommendations");
    analyze_cmd->add_flag("--apply", apply, "Create the recommended indexes");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    // Command line values override the configuration file
    Config config;
    if (!config_file.empty()) {
        auto file_config = loadFromFile(config_file);
        if (file_config) {
            config = *file_config;
        } else {
            spdlog::warn("Could not load config file: {}", config_file);
        }
    }

    if (database_opt->count() > 0) config.pool.database_path = database;
    if (pool_size_opt->count() > 0) config.pool.pool_size = pool_size;
    if (debug_opt->count() > 0) config.logging.debug = debug;
    if (log_file_opt->count() > 0) config.logging.log_file = log_file;
    config.pretty_json = !compact;

    if (*metrics_cmd) {
        config.command = "metrics";
    } else if (*backup_cmd) {
        config.command = "backup-advice";
    } else if (*optimize_cmd) {
        config.command = "optimize";
        if (no_pragma) config.optimizer.enable_auto_pragma = false;
        if (no_tuning) config.optimizer.enable_performance_tuning = false;
        if (cache_size_opt->count() > 0) config.optimizer.cache_size = cache_size;
        if (journal_opt->count() > 0) config.optimizer.journal_mode = parseJournalMode(journal_mode);
        if (sync_opt->count() > 0) config.optimizer.synchronous = parseSynchronousMode(synchronous);
        if (temp_opt->count() > 0) config.optimizer.temp_store = parseTempStoreMode(temp_store);
        if (vacuum_opt->count() > 0) config.optimizer.auto_vacuum = parseAutoVacuumMode(auto_vacuum);
    } else if (*analyze_cmd) {
        config.command = "analyze";
        config.query_log = query_log;
        config.apply_indexes = apply;
        if (min_freq_opt->count() > 0) config.indexer.min_frequency = min_frequency;
        if (slow_opt->count() > 0) config.indexer.slow_query_threshold_ms = slow_threshold;
        if (max_opt->count() > 0) config.indexer.max_recommendations = max_recommendations;
    }

    return config;
}

bool Config::validate() const {
    if (pool.database_path.empty()) {
        spdlog::error("Database path is required (use -D option)");
        return false;
    }

    if (pool.pool_size == 0) {
        spdlog::error("Pool size must be at least 1");
        return false;
    }

    if (indexer.max_recommendations == 0) {
        spdlog::error("max_recommendations must be at least 1");
        return false;
    }

    if (indexer.slow_query_threshold_ms < 0 || optimizer.slow_query_threshold_ms < 0) {
        spdlog::error("Slow query threshold cannot be negative");
        return false;
    }

    if (command == "analyze") {
        if (query_log.empty()) {
            spdlog::error("Query log is required for analyze");
            return false;
        }
        if (!std::filesystem::exists(query_log)) {
            spdlog::error("Query log not found: {}", query_log);
            return false;
        }
    }

    return true;
}

}  // namespace sqltune
