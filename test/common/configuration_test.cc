#include <gtest/gtest.h>
#include "../../src/common/configuration.h"

#include <cstdlib>

using namespace Statfan;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Configuration::getInstance().reset();
    }

    void TearDown() override {
        unsetenv("STATFAN_DISPATCH_MAX_RETRIES");
        Configuration::getInstance().reset();
    }
};

TEST_F(ConfigurationTest, DefaultsAreValid) {
    const Configuration& config = GetConfig();
    EXPECT_TRUE(config.validate());
    EXPECT_EQ(config.getMaxRetries(), 1);
    EXPECT_EQ(config.getMaxInFlight(), 16);
    EXPECT_EQ(config.getRenderLevel(), "indices");
    EXPECT_EQ(config.getRenderFormat(), "yaml");
    EXPECT_EQ(config.getStreamLimits().max_collection_size, 1UL << 20);
}

TEST_F(ConfigurationTest, LoadFromString) {
    Configuration& config = Configuration::getInstance();
    ASSERT_TRUE(config.loadFromString(R"(
statfan:
  dispatch:
    max_retries: 3
    max_in_flight: 4
  render:
    level: shards
    format: flow
  codec:
    max_bytes_length: 4096
)"));

    EXPECT_EQ(config.getMaxRetries(), 3);
    EXPECT_EQ(config.getMaxInFlight(), 4);
    EXPECT_EQ(config.getRenderLevel(), "shards");
    EXPECT_EQ(config.getRenderFormat(), "flow");
    EXPECT_EQ(config.getStreamLimits().max_bytes_length, 4096u);
    // Untouched keys keep their defaults.
    EXPECT_EQ(config.getStreamLimits().max_collection_size, 1UL << 20);
}

TEST_F(ConfigurationTest, InvalidValuesAreReported) {
    Configuration& config = Configuration::getInstance();
    EXPECT_FALSE(config.loadFromString(R"(
statfan:
  dispatch:
    max_in_flight: 0
  render:
    level: nodes
)"));

    auto errors = config.getValidationErrors();
    EXPECT_EQ(errors.size(), 2u);
}

TEST_F(ConfigurationTest, MalformedYamlFails) {
    EXPECT_FALSE(Configuration::getInstance().loadFromString("statfan: [unclosed"));
}

TEST_F(ConfigurationTest, MissingFileFails) {
    EXPECT_FALSE(Configuration::getInstance().loadFromFile("/nonexistent/statfan.yaml"));
}

TEST_F(ConfigurationTest, EnvironmentOverridesFile) {
    Configuration& config = Configuration::getInstance();
    ASSERT_TRUE(config.loadFromString("statfan: {dispatch: {max_retries: 2}}"));
    setenv("STATFAN_DISPATCH_MAX_RETRIES", "5", 1);
    EXPECT_EQ(config.getMaxRetries(), 5);
}

TEST_F(ConfigurationTest, ResetRestoresDefaults) {
    Configuration& config = Configuration::getInstance();
    ASSERT_TRUE(config.loadFromString("statfan: {render: {level: cluster}}"));
    EXPECT_EQ(config.getRenderLevel(), "cluster");
    config.reset();
    EXPECT_EQ(config.getRenderLevel(), "indices");
}
