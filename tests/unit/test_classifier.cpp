/**
 * @file test_classifier.cpp
 * @brief Unit tests for the tool classifier.
 */

#include "classifier/classifier.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>

using namespace hybrid_router;
using namespace std::chrono_literals;

TEST(ClassifierTest, UnknownToolNotFound) {
    Classifier classifier;
    EXPECT_FALSE(classifier.lookup("nope").has_value());
    EXPECT_EQ(classifier.size(), 0u);
}

TEST(ClassifierTest, TierDefaultsFillDescriptor) {
    Classifier classifier;
    classifier.register_tool("keywords", Tier::Medium, {"text"});

    auto desc = classifier.lookup("keywords");
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(desc->tier, Tier::Medium);
    EXPECT_EQ(desc->local_timeout, 2000ms);
    EXPECT_EQ(desc->cache_ttl, 1800s);
    ASSERT_EQ(desc->required_parameters.size(), 1u);
    EXPECT_EQ(desc->required_parameters[0], "text");
}

TEST(ClassifierTest, ExplicitFieldsWin) {
    Classifier classifier;
    classifier.register_tool(ToolDescriptor{
        .name = "slow",
        .tier = Tier::Medium,
        .local_timeout = 50ms,
        .cache_ttl = 10s
    });

    auto desc = classifier.lookup("slow");
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(desc->local_timeout, 50ms);
    EXPECT_EQ(desc->cache_ttl, 10s);
}

TEST(ClassifierTest, DuplicateReplaces) {
    Classifier classifier;
    EXPECT_TRUE(classifier.register_tool("tool", Tier::Simple));
    EXPECT_FALSE(classifier.register_tool("tool", Tier::Complex));

    EXPECT_EQ(classifier.size(), 1u);
    EXPECT_EQ(classifier.lookup("tool")->tier, Tier::Complex);
}

TEST(ClassifierTest, CustomTierTable) {
    TierTableConfig tiers;
    tiers.complex.priority = 3;
    tiers.complex.cache_ttl_s = 60;

    Classifier classifier(tiers);
    classifier.register_tool("graph", Tier::Complex);

    EXPECT_EQ(classifier.priority_for(Tier::Complex), 3);
    EXPECT_EQ(classifier.priority_for(Tier::Simple), 10);
    EXPECT_EQ(classifier.lookup("graph")->cache_ttl, 60s);
}

TEST(ClassifierTest, LoadFromConfigTable) {
    Logger logger(std::make_unique<NullSink>());
    Classifier classifier;
    classifier.load({{"b_tool", Tier::Complex}, {"a_tool", Tier::Simple}}, &logger);

    auto tools = classifier.tools();
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].name, "a_tool");
    EXPECT_EQ(tools[0].tier, Tier::Simple);
    EXPECT_EQ(tools[1].name, "b_tool");
    EXPECT_EQ(tools[1].tier, Tier::Complex);
}

TEST(ClassifierTest, PolicyTable) {
    Classifier classifier;
    auto simple = classifier.policy(Tier::Simple);
    EXPECT_EQ(simple.local_timeout, 0ms);
    EXPECT_EQ(simple.cache_ttl, 3600s);
    EXPECT_EQ(simple.priority, 10);

    auto complex = classifier.policy(Tier::Complex);
    EXPECT_EQ(complex.cache_ttl, 7200s);
    EXPECT_EQ(complex.priority, 1);
}
