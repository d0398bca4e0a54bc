/**
 * @file test_local_executor.cpp
 * @brief Unit tests for in-process tool execution.
 */

#include "executor/local_executor.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace hybrid_router;
using namespace std::chrono_literals;

class LocalExecutorTest : public ::testing::Test {
protected:
    std::atomic<bool> observed_stop_{false};
    Logger logger_{std::make_unique<NullSink>()};
    LocalExecutor executor_{2, logger_};

    void SetUp() override {
        executor_.register_tool("echo", [](const Json& params, std::stop_token) -> Result<Json> {
            return params;
        });
        executor_.register_tool("fail", [](const Json&, std::stop_token) -> Result<Json> {
            return Error{ErrorKind::LocalExecutionFailed, "refused"};
        });
        executor_.register_tool("throw", [](const Json&, std::stop_token) -> Result<Json> {
            throw std::runtime_error("kaboom");
        });
        executor_.register_tool("slow", [this](const Json&, std::stop_token stop) -> Result<Json> {
            auto deadline = std::chrono::steady_clock::now() + 5s;
            while (!stop.stop_requested() && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(1ms);
            }
            observed_stop_ = stop.stop_requested();
            return Json{{"finished", true}};
        });
    }
};

TEST_F(LocalExecutorTest, ReturnsToolResult) {
    auto r = executor_.invoke("echo", Json{{"x", 1}}, 1000ms);
    ASSERT_TRUE(r.has_value()) << r.error().message;
    EXPECT_EQ((*r)["x"], 1);
}

TEST_F(LocalExecutorTest, ZeroDeadlineWaitsForCompletion) {
    auto r = executor_.invoke("echo", Json{{"x", 2}}, 0ms);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ((*r)["x"], 2);
}

TEST_F(LocalExecutorTest, ToolErrorPassesThrough) {
    auto r = executor_.invoke("fail", Json::object(), 1000ms);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::LocalExecutionFailed);
    EXPECT_EQ(r.error().message, "refused");
}

TEST_F(LocalExecutorTest, ExceptionBecomesExecutionFailure) {
    auto r = executor_.invoke("throw", Json::object(), 1000ms);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::LocalExecutionFailed);
    EXPECT_NE(r.error().message.find("kaboom"), std::string::npos);
}

TEST_F(LocalExecutorTest, DeadlineTriggersTimeoutAndCancellation) {
    auto start = std::chrono::steady_clock::now();
    auto r = executor_.invoke("slow", Json::object(), 30ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::LocalTimeout);
    EXPECT_LT(elapsed, 2s);

    // The abandoned call observes its stop token and frees the worker.
    auto wait_until = std::chrono::steady_clock::now() + 2s;
    while (!observed_stop_ && std::chrono::steady_clock::now() < wait_until) {
        std::this_thread::sleep_for(1ms);
    }
    EXPECT_TRUE(observed_stop_);
}

TEST_F(LocalExecutorTest, MissingLocalImplementation) {
    auto r = executor_.invoke("absent", Json::object(), 100ms);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::LocalExecutionFailed);
}

TEST_F(LocalExecutorTest, InlineUnknownTool) {
    auto r = executor_.invoke_inline("absent", Json::object());
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::UnknownTool);

    auto ok = executor_.invoke_inline("echo", Json{{"y", true}});
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ((*ok)["y"], true);
}

TEST_F(LocalExecutorTest, Registry) {
    EXPECT_TRUE(executor_.has_tool("echo"));
    EXPECT_FALSE(executor_.has_tool("absent"));
    EXPECT_FALSE(executor_.register_tool("echo", [](const Json&, std::stop_token) -> Result<Json> {
        return Json::object();
    }));

    auto names = executor_.tool_names();
    ASSERT_EQ(names.size(), 4u);
    EXPECT_EQ(names.front(), "echo");
    EXPECT_EQ(names.back(), "throw");
}
