#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "QueryPatternRecorder.hpp"
#include <thread>
#include <vector>

using namespace sqltune;
using ::testing::ElementsAre;

class QueryPatternRecorderTest : public ::testing::Test {
protected:
    QueryPatternRecorder recorder_;
};

TEST_F(QueryPatternRecorderTest, NewPatternCapturesColumns) {
    recorder_.recordQuery(
        "SELECT * FROM orders o JOIN users u ON o.user_id = u.id "
        "WHERE o.status = 'open' ORDER BY o.created_at DESC",
        12.5);

    ASSERT_EQ(recorder_.size(), 1u);
    QueryPattern pattern = recorder_.patterns().front();
    EXPECT_EQ(pattern.frequency, 1u);
    EXPECT_EQ(pattern.table, "orders");
    EXPECT_THAT(pattern.whereColumns, ElementsAre("status"));
    EXPECT_THAT(pattern.orderByColumns, ElementsAre("created_at"));
    EXPECT_THAT(pattern.joinColumns, ElementsAre("user_id"));
    EXPECT_DOUBLE_EQ(pattern.averageExecutionTime, 12.5);
}

TEST_F(QueryPatternRecorderTest, EquivalentQueriesShareOnePattern) {
    recorder_.recordQuery("SELECT * FROM users WHERE id = 1", 10.0);
    recorder_.recordQuery("select *   from users where id = 2", 30.0);

    ASSERT_EQ(recorder_.size(), 1u);
    auto pattern = recorder_.find("select * from users where id = ?");
    ASSERT_TRUE(pattern.has_value());
    EXPECT_EQ(pattern->frequency, 2u);
    EXPECT_DOUBLE_EQ(pattern->averageExecutionTime, 20.0);
}

TEST_F(QueryPatternRecorderTest, RunningAverageOverManyExecutions) {
    recorder_.recordQuery("SELECT * FROM t WHERE a = ?", 100.0);
    recorder_.recordQuery("SELECT * FROM t WHERE a = ?", 200.0);
    recorder_.recordQuery("SELECT * FROM t WHERE a = ?", 600.0);

    auto pattern = recorder_.find("select * from t where a = ?");
    ASSERT_TRUE(pattern.has_value());
    EXPECT_EQ(pattern->frequency, 3u);
    EXPECT_DOUBLE_EQ(pattern->averageExecutionTime, 300.0);
}

TEST_F(QueryPatternRecorderTest, ExplicitTableOverridesExtraction) {
    recorder_.recordQuery("UPDATE accounts SET balance = ? WHERE id = ?", 1.0,
                          std::string("accounts"));
    recorder_.recordQuery("UPDATE ledger SET total = ? WHERE id = ?", 1.0);

    auto patterns = recorder_.patterns();
    ASSERT_EQ(patterns.size(), 2u);
    EXPECT_EQ(patterns[0].table, "accounts");
    EXPECT_EQ(patterns[1].table, "unknown");
}

TEST_F(QueryPatternRecorderTest, PatternsKeepFirstRecordedOrder) {
    recorder_.recordQuery("SELECT * FROM c", 1.0);
    recorder_.recordQuery("SELECT * FROM a", 1.0);
    recorder_.recordQuery("SELECT * FROM b", 1.0);
    recorder_.recordQuery("SELECT * FROM c", 1.0);

    auto patterns = recorder_.patterns();
    ASSERT_EQ(patterns.size(), 3u);
    EXPECT_EQ(patterns[0].table, "c");
    EXPECT_EQ(patterns[1].table, "a");
    EXPECT_EQ(patterns[2].table, "b");
}

TEST_F(QueryPatternRecorderTest, StatsCountSlowPatterns) {
    recorder_.recordQuery("SELECT * FROM a WHERE x = ?", 1500.0);
    recorder_.recordQuery("SELECT * FROM a WHERE x = ?", 1500.0);
    recorder_.recordQuery("SELECT * FROM b WHERE y = ?", 5.0);

    QueryPatternStats stats = recorder_.stats();
    EXPECT_EQ(stats.totalPatterns, 2u);
    EXPECT_EQ(stats.totalQueries, 3u);
    EXPECT_DOUBLE_EQ(stats.averageFrequency, 1.5);
    EXPECT_EQ(stats.slowQueries, 1u);

    EXPECT_EQ(recorder_.stats(1.0).slowQueries, 2u);
}

TEST_F(QueryPatternRecorderTest, EmptyStats) {
    QueryPatternStats stats = recorder_.stats();
    EXPECT_EQ(stats.totalPatterns, 0u);
    EXPECT_EQ(stats.totalQueries, 0u);
    EXPECT_DOUBLE_EQ(stats.averageFrequency, 0.0);
    EXPECT_FALSE(recorder_.find("select 1").has_value());
}

TEST_F(QueryPatternRecorderTest, ClearRemovesEverything) {
    recorder_.recordQuery("SELECT * FROM a", 1.0);
    recorder_.clear();
    EXPECT_EQ(recorder_.size(), 0u);
    EXPECT_TRUE(recorder_.patterns().empty());
}

TEST_F(QueryPatternRecorderTest, ConcurrentRecording) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this] {
            for (int i = 0; i < 250; ++i) {
                recorder_.recordQuery("SELECT * FROM events WHERE id = " + std::to_string(i), 1.0);
            }
        });
    }
    for (auto& t : threads) t.join();

    auto pattern = recorder_.find("select * from events where id = ?");
    ASSERT_TRUE(pattern.has_value());
    EXPECT_EQ(pattern->frequency, 1000u);
}
