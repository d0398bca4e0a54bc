/**
 * @file test_performance_monitor.cpp
 * @brief Unit tests for execution counters and metrics export.
 */

#include "telemetry/performance_monitor.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace hybrid_router;
using namespace std::chrono_literals;

class PerformanceMonitorTest : public ::testing::Test {
protected:
    Logger logger_{std::make_unique<NullSink>()};
    PerformanceMonitor monitor_{logger_, 3};
};

TEST_F(PerformanceMonitorTest, RecordsPerRouteLatency) {
    monitor_.record(Route::Local, "count_words", Tier::Simple, Duration{300}, true);
    monitor_.record(Route::Local, "count_words", Tier::Simple, Duration{100}, true);
    monitor_.record(Route::Local, "extract_keywords", Tier::Medium, Duration{500}, false,
                    ErrorKind::LocalTimeout, "deadline");

    auto snap = monitor_.snapshot();
    const auto& local = snap.route(Route::Local);
    EXPECT_EQ(local.count, 3u);
    EXPECT_EQ(local.success_count, 2u);
    EXPECT_EQ(local.failure_count, 1u);
    EXPECT_EQ(local.total_latency, Duration{900});
    EXPECT_EQ(local.min_latency, Duration{100});
    EXPECT_EQ(local.max_latency, Duration{500});
    EXPECT_EQ(local.average_latency(), Duration{300});
    EXPECT_NEAR(local.success_rate(), 2.0 / 3.0, 1e-9);

    EXPECT_EQ(snap.route(Route::Remote).count, 0u);
    EXPECT_EQ(snap.tier(Tier::Simple).count, 2u);
    EXPECT_EQ(snap.tier(Tier::Medium).errors, 1u);
    EXPECT_EQ(snap.tools.at("count_words").count, 2u);
    EXPECT_TRUE(snap.tools.at("count_words").last_execution.has_value());
    EXPECT_EQ(snap.errors_by_kind.at(ErrorKind::LocalTimeout), 1u);
}

TEST_F(PerformanceMonitorTest, CacheHitRate) {
    EXPECT_DOUBLE_EQ(monitor_.snapshot().cache_hit_rate(), 0.0);

    monitor_.record_cache(true);
    monitor_.record_cache(true);
    monitor_.record_cache(true);
    monitor_.record_cache(false);

    auto snap = monitor_.snapshot();
    EXPECT_EQ(snap.cache_hit_count, 3u);
    EXPECT_EQ(snap.cache_miss_count, 1u);
    EXPECT_DOUBLE_EQ(snap.cache_hit_rate(), 0.75);
}

TEST_F(PerformanceMonitorTest, JobOutcomesAndQueueGauge) {
    auto sync = std::chrono::system_clock::now();
    monitor_.record_job_outcome("build_graph", true);
    monitor_.record_job_outcome("build_graph", false, "gave up");
    monitor_.set_queue_state(4, sync);
    monitor_.set_queue_state(2, std::nullopt);

    auto snap = monitor_.snapshot();
    EXPECT_EQ(snap.jobs_completed, 1u);
    EXPECT_EQ(snap.jobs_failed, 1u);
    EXPECT_EQ(snap.queue_depth, 2u);
    ASSERT_TRUE(snap.last_sync_time.has_value());
    EXPECT_TRUE(*snap.last_sync_time == sync);
    EXPECT_EQ(snap.errors_by_kind.at(ErrorKind::QueueExhausted), 1u);
    ASSERT_EQ(snap.recent_errors.size(), 1u);
    EXPECT_EQ(snap.recent_errors[0].message, "gave up");
}

TEST_F(PerformanceMonitorTest, RecentErrorsAreBounded) {
    for (int i = 0; i < 5; ++i) {
        monitor_.record(Route::Remote, "build_graph", Tier::Complex, Duration{10}, false,
                        ErrorKind::RemoteUnreachable, "err" + std::to_string(i));
    }

    auto snap = monitor_.snapshot();
    ASSERT_EQ(snap.recent_errors.size(), 3u);
    EXPECT_EQ(snap.recent_errors.front().message, "err2");
    EXPECT_EQ(snap.recent_errors.back().message, "err4");
    EXPECT_EQ(snap.errors_by_kind.at(ErrorKind::RemoteUnreachable), 5u);
}

TEST_F(PerformanceMonitorTest, ResetKeepsQueueGauge) {
    monitor_.record(Route::Local, "count_words", Tier::Simple, Duration{10}, true);
    monitor_.record_cache(false);
    monitor_.set_queue_state(7, std::nullopt);

    monitor_.reset();

    auto snap = monitor_.snapshot();
    EXPECT_EQ(snap.route(Route::Local).count, 0u);
    EXPECT_EQ(snap.cache_miss_count, 0u);
    EXPECT_TRUE(snap.tools.empty());
    EXPECT_EQ(snap.queue_depth, 7u);
}

// ─────────────────────────────────────────────
// Export
// ─────────────────────────────────────────────

TEST_F(PerformanceMonitorTest, ParsesExportFormat) {
    ExportFormat format{};
    EXPECT_TRUE(parse_export_format("json", format));
    EXPECT_EQ(format, ExportFormat::Json);
    EXPECT_TRUE(parse_export_format("csv", format));
    EXPECT_EQ(format, ExportFormat::Csv);
    EXPECT_FALSE(parse_export_format("xml", format));
}

TEST_F(PerformanceMonitorTest, JsonExportCarriesAllSections) {
    monitor_.record(Route::Remote, "build_graph", Tier::Complex, Duration{1500}, true);
    monitor_.record_cache(true);
    monitor_.record_cache(false);

    auto text = monitor_.export_metrics(ExportFormat::Json);
    ASSERT_TRUE(text.has_value());
    auto doc = Json::parse(*text);

    EXPECT_EQ(doc["routes"]["remote"]["count"], 1);
    EXPECT_EQ(doc["routes"]["remote"]["avg_latency_us"], 1500);
    EXPECT_EQ(doc["routes"]["local"]["count"], 0);
    EXPECT_TRUE(doc["routes"].contains("cache"));
    EXPECT_TRUE(doc["routes"].contains("queue"));
    EXPECT_EQ(doc["cache"]["hits"], 1);
    EXPECT_DOUBLE_EQ(doc["cache"]["hit_rate"].get<double>(), 0.5);
    EXPECT_TRUE(doc["queue"]["last_sync_ms"].is_null());
    EXPECT_EQ(doc["tiers"]["complex"]["count"], 1);
    EXPECT_EQ(doc["tools"]["build_graph"]["count"], 1);
    EXPECT_TRUE(doc.contains("session_start_ms"));
}

TEST_F(PerformanceMonitorTest, CsvExportHasRouteRowsAndMetrics) {
    monitor_.record(Route::Local, "count_words", Tier::Simple, Duration{200}, true);
    monitor_.record(Route::Local, "count_words", Tier::Simple, Duration{400}, false,
                    ErrorKind::LocalExecutionFailed, "boom");

    auto text = monitor_.export_metrics(ExportFormat::Csv);
    ASSERT_TRUE(text.has_value());

    std::istringstream in(*text);
    std::string line;
    std::getline(in, line);
    EXPECT_EQ(line.rfind("section,name,count,", 0), 0u);
    std::getline(in, line);
    EXPECT_EQ(line, "route,local,2,1,1,600,200,400,300");

    EXPECT_NE(text->find("\nmetric,value\n"), std::string::npos);
    EXPECT_NE(text->find("tool,count_words,2,1,1,600"), std::string::npos);
    EXPECT_NE(text->find("errors.local_execution_failed,1"), std::string::npos);
    EXPECT_NE(text->find("last_sync_ms,\n"), std::string::npos);
}

TEST_F(PerformanceMonitorTest, JsonExportToleratesInvalidUtf8) {
    monitor_.record(Route::Local, "read_file", Tier::Simple, Duration{10}, false,
                    ErrorKind::LocalExecutionFailed, "bad file \xff\xfe name");

    auto text = monitor_.export_metrics(ExportFormat::Json);
    ASSERT_TRUE(text.has_value()) << text.error().message;
    auto doc = Json::parse(*text);
    ASSERT_EQ(doc["recent_errors"].size(), 1u);
    auto message = doc["recent_errors"][0]["message"].get<std::string>();
    EXPECT_EQ(message.rfind("bad file ", 0), 0u);
    EXPECT_NE(message.find("\xEF\xBF\xBD"), std::string::npos);  // U+FFFD
}

TEST_F(PerformanceMonitorTest, CsvQuotesAwkwardToolNames) {
    monitor_.record(Route::Local, "a,b", Tier::Simple, Duration{1}, true);
    auto text = snapshot_to_csv(monitor_.snapshot());
    EXPECT_NE(text.find("tool,\"a,b\",1"), std::string::npos);
}

// ─────────────────────────────────────────────
// Persistence
// ─────────────────────────────────────────────

class MonitorPersistenceTest : public PerformanceMonitorTest {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "hr_test_monitor";
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        monitor_.stop_persistence();
        std::filesystem::remove_all(dir_);
    }
};

TEST_F(MonitorPersistenceTest, PersistNowWritesJson) {
    monitor_.record(Route::Cache, "count_words", Tier::Simple, Duration{5}, true);
    auto path = dir_ / "nested" / "metrics.json";

    ASSERT_TRUE(monitor_.persist_now(path).has_value());
    EXPECT_FALSE(std::filesystem::exists(path.string() + ".tmp"));

    std::ifstream in(path);
    auto doc = Json::parse(in);
    EXPECT_EQ(doc["routes"]["cache"]["count"], 1);
}

TEST_F(MonitorPersistenceTest, StopPersistenceFlushesFinalCounters) {
    auto path = dir_ / "metrics.json";
    monitor_.start_persistence(path, 1h);
    monitor_.record(Route::Local, "count_words", Tier::Simple, Duration{5}, true);
    monitor_.stop_persistence();

    ASSERT_TRUE(std::filesystem::exists(path));
    std::ifstream in(path);
    auto doc = Json::parse(in);
    EXPECT_EQ(doc["routes"]["local"]["count"], 1);
}

TEST_F(MonitorPersistenceTest, InvalidUtf8ToolNameStillPersists) {
    auto path = dir_ / "metrics.json";
    monitor_.record(Route::Local, "tool\xc3", Tier::Simple, Duration{5}, false,
                    ErrorKind::LocalExecutionFailed, "\xff");

    ASSERT_TRUE(monitor_.persist_now(path).has_value());

    monitor_.start_persistence(path, 1h);
    monitor_.record(Route::Local, "tool\xc3", Tier::Simple, Duration{5}, true);
    monitor_.stop_persistence();

    std::ifstream in(path);
    auto doc = Json::parse(in);
    EXPECT_EQ(doc["routes"]["local"]["count"], 2);
    EXPECT_EQ(doc["tools"].size(), 1u);
}
