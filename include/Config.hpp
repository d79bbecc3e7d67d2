#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <filesystem>
#include <cstdint>

namespace sqltune {

enum class AutoVacuumMode {
    None = 0,
    Full = 1,
    Incremental = 2
};

enum class JournalMode {
    Delete,
    Truncate,
    Persist,
    Memory,
    Wal,
    Off
};

enum class SynchronousMode {
    Off = 0,
    Normal = 1,
    Full = 2,
    Extra = 3
};

enum class TempStoreMode {
    Default = 0,
    File = 1,
    Memory = 2
};

std::string toString(AutoVacuumMode mode);
std::string toString(JournalMode mode);
std::string toString(SynchronousMode mode);
std::string toString(TempStoreMode mode);

// Case-insensitive; throw std::invalid_argument on unknown names
AutoVacuumMode parseAutoVacuumMode(const std::string& value);
JournalMode parseJournalMode(const std::string& value);
SynchronousMode parseSynchronousMode(const std::string& value);
TempStoreMode parseTempStoreMode(const std::string& value);

struct PoolConfig {
    std::string database_path = ":memory:";
    size_t pool_size = 1;

    // Baseline PRAGMAs applied to every new connection
    std::chrono::milliseconds busy_timeout{5000};
    JournalMode journal_mode = JournalMode::Wal;
    SynchronousMode synchronous = SynchronousMode::Normal;
    int64_t journal_size_limit = 67108864;  // 64 MB
    TempStoreMode temp_store = TempStoreMode::Memory;
};

struct IndexAnalysisOptions {
    uint64_t min_frequency = 3;
    double slow_query_threshold_ms = 1000.0;
    bool include_partial_indexes = true;
    size_t max_recommendations = 20;
};

struct OptimizerConfig {
    bool enable_auto_pragma = true;
    bool enable_auto_indexing = true;  // reserved for the index advisor
    bool enable_performance_tuning = true;
    bool enable_backup_recommendations = true;
    double slow_query_threshold_ms = 1000.0;
    AutoVacuumMode auto_vacuum = AutoVacuumMode::Incremental;
    JournalMode journal_mode = JournalMode::Wal;
    SynchronousMode synchronous = SynchronousMode::Normal;
    int64_t cache_size = -64000;  // negative = KiB, i.e. 64 MB
    TempStoreMode temp_store = TempStoreMode::Memory;
};

struct LoggingConfig {
    bool debug = false;
    std::string log_file;
};

struct Config {
    PoolConfig pool;
    IndexAnalysisOptions indexer;
    OptimizerConfig optimizer;
    LoggingConfig logging;

    std::string command;     // metrics, optimize, analyze, backup-advice
    std::string query_log;   // input for "analyze"
    bool apply_indexes = false;
    bool pretty_json = true;

    // Load from file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Parse command line arguments
    static Config parseArgs(int argc, char* argv[]);

    // Validate configuration
    bool validate() const;
};

}  // namespace sqltune
