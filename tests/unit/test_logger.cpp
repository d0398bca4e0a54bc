/**
 * @file test_logger.cpp
 * @brief Unit tests for the NDJSON logger and its file sink.
 */

#include "core/logger.hpp"
#include "core/types.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

using namespace hybrid_router;

namespace {

/// Collects lines in memory; the vector outlives the logger that owns the sink.
class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::vector<std::string>& lines) : lines_(lines) {}
    void write(std::string_view json_line) override { lines_.emplace_back(json_line); }
    void flush() override {}

private:
    std::vector<std::string>& lines_;
};

std::vector<std::string> read_lines(const std::filesystem::path& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    for (std::string line; std::getline(in, line);) {
        lines.push_back(line);
    }
    return lines;
}

}  // namespace

// ─────────────────────────────────────────────
// Logger
// ─────────────────────────────────────────────

TEST(LoggerTest, WritesOneJsonObjectPerLine) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<CaptureSink>(lines));

    logger.info("router", "Cache hit");
    ASSERT_EQ(lines.size(), 1u);

    auto doc = Json::parse(lines[0]);
    EXPECT_EQ(doc["level"], "info");
    EXPECT_EQ(doc["component"], "router");
    EXPECT_EQ(doc["msg"], "Cache hit");
    auto ts = doc["ts"].get<std::string>();
    EXPECT_EQ(ts.size(), 24u);
    EXPECT_EQ(ts.back(), 'Z');
}

TEST(LoggerTest, OmitsEmptyComponent) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<CaptureSink>(lines));
    logger.warn("", "bare");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_FALSE(Json::parse(lines[0]).contains("component"));
}

TEST(LoggerTest, FiltersBelowMinimumLevel) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<CaptureSink>(lines), LogLevel::Warn);

    logger.debug("x", "d");
    logger.info("x", "i");
    logger.warn("x", "w");
    logger.error("x", "e");
    EXPECT_EQ(lines.size(), 2u);

    logger.set_level(LogLevel::Debug);
    logger.debug("x", "d");
    EXPECT_EQ(lines.size(), 3u);
    EXPECT_EQ(logger.level(), LogLevel::Debug);
}

TEST(LoggerTest, EscapesMessageText) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<CaptureSink>(lines));

    std::string message = "quote \" slash \\ newline \n tab \t bell \x07";
    logger.error("queue", message);

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].find('\n'), std::string::npos);
    EXPECT_EQ(Json::parse(lines[0])["msg"], message);
}

TEST(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_EQ(parse_log_level("info"), LogLevel::Info);
    EXPECT_EQ(parse_log_level("loud"), LogLevel::Info);
}

// ─────────────────────────────────────────────
// JsonFileSink
// ─────────────────────────────────────────────

class JsonFileSinkTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "hr_test_logs";
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }
};

TEST_F(JsonFileSinkTest, AppendsToActiveFile) {
    {
        JsonFileSink sink(dir_, "router");
        sink.write(R"({"msg":"one"})");
        sink.write(R"({"msg":"two"})");
        sink.flush();
        EXPECT_EQ(sink.current_path(), dir_ / "router.ndjson");
    }
    {
        JsonFileSink reopened(dir_, "router");
        reopened.write(R"({"msg":"three"})");
    }

    auto lines = read_lines(dir_ / "router.ndjson");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[2], R"({"msg":"three"})");
}

TEST_F(JsonFileSinkTest, RotatesAndKeepsMaxFiles) {
    JsonFileSink sink(dir_, "router", 50, 2);
    sink.set_max_file_size_bytes(10);

    // Each 17-byte line fills the active file, so every write after the
    // first rotates.
    for (int i = 0; i < 4; ++i) {
        sink.write(R"({"msg":"line-)" + std::to_string(i) + R"("})");
    }
    sink.flush();

    EXPECT_EQ(read_lines(dir_ / "router.ndjson"), std::vector<std::string>{R"({"msg":"line-3"})"});
    EXPECT_EQ(read_lines(dir_ / "router.1.ndjson"), std::vector<std::string>{R"({"msg":"line-2"})"});
    EXPECT_EQ(read_lines(dir_ / "router.2.ndjson"), std::vector<std::string>{R"({"msg":"line-1"})"});
    EXPECT_FALSE(std::filesystem::exists(dir_ / "router.3.ndjson"));
}

TEST_F(JsonFileSinkTest, LoggerWritesThroughFileSink) {
    {
        Logger logger(std::make_unique<JsonFileSink>(dir_, "app"));
        logger.info("main", "started");
        logger.flush();
    }
    auto lines = read_lines(dir_ / "app.ndjson");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(Json::parse(lines[0])["msg"], "started");
}
