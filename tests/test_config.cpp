#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "Config.hpp"
#include <fstream>
#include <filesystem>
#include <stdexcept>

using namespace sqltune;
using namespace std::chrono_literals;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create temp directory for test files
        tempDir_ = std::filesystem::temp_directory_path() / "sqltune_config_test";
        std::filesystem::create_directories(tempDir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir_);
    }

    std::filesystem::path tempDir_;

    std::filesystem::path writeConfigFile(const std::string& filename, const std::string& content) {
        auto path = tempDir_ / filename;
        std::ofstream file(path);
        file << content;
        return path;
    }
};

// Default configuration tests
TEST_F(ConfigTest, DefaultPoolConfig) {
    PoolConfig config;

    EXPECT_EQ(config.database_path, ":memory:");
    EXPECT_EQ(config.pool_size, 1u);
    EXPECT_EQ(config.busy_timeout, 5000ms);
    EXPECT_EQ(config.journal_mode, JournalMode::Wal);
    EXPECT_EQ(config.synchronous, SynchronousMode::Normal);
    EXPECT_EQ(config.journal_size_limit, 67108864);
    EXPECT_EQ(config.temp_store, TempStoreMode::Memory);
}

TEST_F(ConfigTest, DefaultIndexAnalysisOptions) {
    IndexAnalysisOptions options;

    EXPECT_EQ(options.min_frequency, 3u);
    EXPECT_DOUBLE_EQ(options.slow_query_threshold_ms, 1000.0);
    EXPECT_TRUE(options.include_partial_indexes);
    EXPECT_EQ(options.max_recommendations, 20u);
}

TEST_F(ConfigTest, DefaultOptimizerConfig) {
    OptimizerConfig config;

    EXPECT_TRUE(config.enable_auto_pragma);
    EXPECT_TRUE(config.enable_auto_indexing);
    EXPECT_TRUE(config.enable_performance_tuning);
    EXPECT_TRUE(config.enable_backup_recommendations);
    EXPECT_DOUBLE_EQ(config.slow_query_threshold_ms, 1000.0);
    EXPECT_EQ(config.auto_vacuum, AutoVacuumMode::Incremental);
    EXPECT_EQ(config.journal_mode, JournalMode::Wal);
    EXPECT_EQ(config.synchronous, SynchronousMode::Normal);
    EXPECT_EQ(config.cache_size, -64000);
    EXPECT_EQ(config.temp_store, TempStoreMode::Memory);
}

// Enumeration names
TEST_F(ConfigTest, EnumNamesRoundTrip) {
    EXPECT_EQ(toString(SynchronousMode::Normal), "NORMAL");
    EXPECT_EQ(toString(TempStoreMode::Memory), "MEMORY");
    EXPECT_EQ(toString(AutoVacuumMode::Incremental), "INCREMENTAL");
    EXPECT_EQ(toString(JournalMode::Wal), "WAL");

    EXPECT_EQ(parseJournalMode("wal"), JournalMode::Wal);
    EXPECT_EQ(parseSynchronousMode("Full"), SynchronousMode::Full);
    EXPECT_EQ(parseSynchronousMode("3"), SynchronousMode::Extra);
    EXPECT_EQ(parseTempStoreMode("file"), TempStoreMode::File);
    EXPECT_EQ(parseAutoVacuumMode("none"), AutoVacuumMode::None);
}

TEST_F(ConfigTest, EnumOrdinalsMatchSQLite) {
    EXPECT_EQ(static_cast<int>(SynchronousMode::Off), 0);
    EXPECT_EQ(static_cast<int>(SynchronousMode::Extra), 3);
    EXPECT_EQ(static_cast<int>(TempStoreMode::Memory), 2);
    EXPECT_EQ(static_cast<int>(AutoVacuumMode::Incremental), 2);
}

TEST_F(ConfigTest, UnknownEnumNameThrows) {
    EXPECT_THROW(parseJournalMode("journaled"), std::invalid_argument);
    EXPECT_THROW(parseSynchronousMode("sometimes"), std::invalid_argument);
    EXPECT_THROW(parseTempStoreMode("disk"), std::invalid_argument);
    EXPECT_THROW(parseAutoVacuumMode("7"), std::invalid_argument);
}

// Config file loading tests
TEST_F(ConfigTest, LoadFromFileNonExistent) {
    auto config = Config::loadFromFile(tempDir_ / "nonexistent.conf");
    EXPECT_FALSE(config.has_value());
}

TEST_F(ConfigTest, LoadFromFileAllSections) {
    auto path = writeConfigFile("full.conf", R"(
# sqltune configuration
[pool]
database = "/var/lib/app/data.db"
pool_size = 4
busy_timeout = 2500
journal_mode = truncate
synchronous = FULL
journal_size_limit = 1048576
temp_store = file

[indexer]
min_frequency = 5
slow_query_threshold = 250.5
include_partial_indexes = no
max_recommendations = 7

[optimizer]
; tuning targets
enable_auto_pragma = false
enable_performance_tuning = off
cache_size = -32000
auto_vacuum = FULL
synchronous = extra

[logging]
debug = yes
file = /tmp/sqltune.log
)");

    auto config = Config::loadFromFile(path);
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->pool.database_path, "/var/lib/app/data.db");
    EXPECT_EQ(config->pool.pool_size, 4u);
    EXPECT_EQ(config->pool.busy_timeout, 2500ms);
    EXPECT_EQ(config->pool.journal_mode, JournalMode::Truncate);
    EXPECT_EQ(config->pool.synchronous, SynchronousMode::Full);
    EXPECT_EQ(config->pool.journal_size_limit, 1048576);
    EXPECT_EQ(config->pool.temp_store, TempStoreMode::File);

    EXPECT_EQ(config->indexer.min_frequency, 5u);
    EXPECT_DOUBLE_EQ(config->indexer.slow_query_threshold_ms, 250.5);
    EXPECT_FALSE(config->indexer.include_partial_indexes);
    EXPECT_EQ(config->indexer.max_recommendations, 7u);

    EXPECT_FALSE(config->optimizer.enable_auto_pragma);
    EXPECT_FALSE(config->optimizer.enable_performance_tuning);
    EXPECT_TRUE(config->optimizer.enable_backup_recommendations);
    EXPECT_EQ(config->optimizer.cache_size, -32000);
    EXPECT_EQ(config->optimizer.auto_vacuum, AutoVacuumMode::Full);
    EXPECT_EQ(config->optimizer.synchronous, SynchronousMode::Extra);

    EXPECT_TRUE(config->logging.debug);
    EXPECT_EQ(config->logging.log_file, "/tmp/sqltune.log");
}

TEST_F(ConfigTest, LoadFromFileKeepsDefaultsForMissingKeys) {
    auto path = writeConfigFile("partial.conf", "[pool]\ndatabase = app.db\n");

    auto config = Config::loadFromFile(path);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->pool.database_path, "app.db");
    EXPECT_EQ(config->pool.pool_size, 1u);
    EXPECT_EQ(config->indexer.min_frequency, 3u);
    EXPECT_EQ(config->optimizer.cache_size, -64000);
}

// Validation
TEST_F(ConfigTest, ValidateDefaults) {
    Config config;
    config.command = "metrics";
    EXPECT_TRUE(config.validate());
}

TEST_F(ConfigTest, ValidateRejectsZeroPoolSize) {
    Config config;
    config.pool.pool_size = 0;
    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, ValidateRejectsZeroRecommendations) {
    Config config;
    config.indexer.max_recommendations = 0;
    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, ValidateRejectsNegativeThreshold) {
    Config config;
    config.indexer.slow_query_threshold_ms = -1.0;
    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, ValidateAnalyzeNeedsExistingQueryLog) {
    Config config;
    config.command = "analyze";
    config.query_log = (tempDir_ / "missing.log").string();
    EXPECT_FALSE(config.validate());

    config.query_log = writeConfigFile("queries.log", "12\tSELECT 1\n").string();
    EXPECT_TRUE(config.validate());
}
