/**
 * @file test_builtin_tools.cpp
 * @brief Unit tests for the bundled text-analysis tools.
 */

#include "tools/builtin_tools.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <stop_token>

using namespace hybrid_router;

TEST(BuiltinToolsTest, ReadingTimeRoundsUp) {
    auto r = tools::calculate_reading_time(Json{{"text", "one two three"}, {"wpm", 2}}, {});
    ASSERT_TRUE(r.has_value()) << r.error().message;
    EXPECT_EQ((*r)["words"], 3);
    EXPECT_EQ((*r)["minutes"], 2);
    EXPECT_EQ((*r)["wpm"], 2);
}

TEST(BuiltinToolsTest, ReadingTimeDefaults) {
    auto r = tools::calculate_reading_time(Json{{"text", "short note"}}, {});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ((*r)["minutes"], 1);
    EXPECT_EQ((*r)["wpm"], 200);

    auto empty = tools::calculate_reading_time(Json{{"text", ""}}, {});
    ASSERT_TRUE(empty.has_value());
    EXPECT_EQ((*empty)["minutes"], 0);
}

TEST(BuiltinToolsTest, ReadingTimeRejectsBadInput) {
    auto missing = tools::calculate_reading_time(Json::object(), {});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().kind, ErrorKind::InvalidParameters);

    EXPECT_FALSE(tools::calculate_reading_time(Json{{"text", "a"}, {"wpm", 0}}, {}).has_value());
    EXPECT_FALSE(tools::calculate_reading_time(Json{{"text", "a"}, {"wpm", "fast"}}, {}).has_value());
    EXPECT_FALSE(tools::calculate_reading_time(Json{{"text", 42}}, {}).has_value());
}

TEST(BuiltinToolsTest, CountWords) {
    auto r = tools::count_words(Json{{"text", "Hello, world!\nIt's a test."}}, {});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ((*r)["words"], 5);
    EXPECT_EQ((*r)["characters"], 26);
    EXPECT_EQ((*r)["lines"], 2);

    auto empty = tools::count_words(Json{{"text", ""}}, {});
    ASSERT_TRUE(empty.has_value());
    EXPECT_EQ((*empty)["words"], 0);
    EXPECT_EQ((*empty)["lines"], 0);
}

TEST(BuiltinToolsTest, ExtractKeywordsRanksByFrequency) {
    Json params{
        {"text", "Router routes tools. The router caches results; routing tools is what the router does."},
        {"top_n", 2}
    };
    auto r = tools::extract_keywords(params, {});
    ASSERT_TRUE(r.has_value());

    const auto& keywords = (*r)["keywords"];
    ASSERT_EQ(keywords.size(), 2u);
    EXPECT_EQ(keywords[0]["word"], "router");
    EXPECT_EQ(keywords[0]["count"], 3);
    EXPECT_EQ(keywords[1]["word"], "tools");
    EXPECT_EQ(keywords[1]["count"], 2);
}

TEST(BuiltinToolsTest, ExtractKeywordsSkipsShortAndStopWords) {
    auto r = tools::extract_keywords(Json{{"text", "this that with and the a an"}}, {});
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE((*r)["keywords"].empty());
}

TEST(BuiltinToolsTest, ExtractKeywordsHonoursCancellation) {
    std::string text;
    for (int i = 0; i < 10000; ++i) text += "keyword ";

    std::stop_source source;
    source.request_stop();
    auto r = tools::extract_keywords(Json{{"text", text}}, source.get_token());
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::LocalTimeout);
}

TEST(BuiltinToolsTest, BuildGraphComputesDegreeAndComponents) {
    Json edges = Json::array({
        Json::array({"a", "b"}),
        Json::array({"b", "c"}),
        Json::array({"x", "y"})
    });
    auto r = tools::build_graph(Json{{"edges", edges}}, {});
    ASSERT_TRUE(r.has_value());

    EXPECT_EQ((*r)["nodes"], Json::array({"a", "b", "c", "x", "y"}));
    EXPECT_EQ((*r)["edge_count"], 3);
    EXPECT_EQ((*r)["degree"]["b"], 2);
    EXPECT_EQ((*r)["degree"]["y"], 1);
    EXPECT_EQ((*r)["components"], 2);
}

TEST(BuiltinToolsTest, BuildGraphRejectsMalformedEdges) {
    EXPECT_FALSE(tools::build_graph(Json::object(), {}).has_value());
    EXPECT_FALSE(tools::build_graph(Json{{"edges", Json::array({Json::array({"a"})})}}, {}).has_value());
    EXPECT_FALSE(tools::build_graph(Json{{"edges", Json::array({Json::array({1, 2})})}}, {}).has_value());

    auto empty = tools::build_graph(Json{{"edges", Json::array()}}, {});
    ASSERT_TRUE(empty.has_value());
    EXPECT_EQ((*empty)["components"], 0);
}

TEST(BuiltinToolsTest, RegistrationRespectsConfiguredTiers) {
    Logger logger(std::make_unique<NullSink>());
    LocalExecutor executor(1, logger);
    Classifier classifier;
    classifier.register_tool("extract_keywords", Tier::Complex);

    tools::register_builtin_tools(executor, &classifier);

    EXPECT_TRUE(executor.has_tool("count_words"));
    EXPECT_TRUE(executor.has_tool("build_graph"));
    EXPECT_EQ(classifier.lookup("calculate_reading_time")->tier, Tier::Simple);
    EXPECT_EQ(classifier.lookup("build_graph")->tier, Tier::Complex);
    EXPECT_EQ(classifier.lookup("extract_keywords")->tier, Tier::Complex);
    EXPECT_EQ(classifier.lookup("count_words")->required_parameters,
              std::vector<std::string>{"text"});
}
