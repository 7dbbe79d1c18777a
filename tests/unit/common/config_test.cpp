/// @file config_test.cpp
/// @brief Tests for tokenledger configuration management

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>

#include "common/config.h"

namespace tokenledger {
namespace {

TEST(ConfigTest, LoadFromString) {
    const std::string yaml_content = R"(
pricing:
  offline: false
  url: https://prices.example.com/catalog.json
  connection_timeout_seconds: 15
  snapshot_paths:
    - /opt/tokenledger/pricing_snapshot.json
    - /var/lib/tokenledger/pricing_snapshot.json
logging:
  level: debug
)";

    auto result = Config::LoadFromString(yaml_content);
    ASSERT_TRUE(result.ok()) << result.status().message();

    Config config = std::move(*result);

    EXPECT_FALSE(config.GetBool("pricing.offline", true));
    EXPECT_EQ(config.GetString("pricing.url"), "https://prices.example.com/catalog.json");
    EXPECT_EQ(config.GetInt("pricing.connection_timeout_seconds"), 15);
    EXPECT_EQ(config.GetString("logging.level"), "debug");

    auto paths = config.GetStringList("pricing.snapshot_paths");
    ASSERT_EQ(paths.size(), 2);
    EXPECT_EQ(paths[0], "/opt/tokenledger/pricing_snapshot.json");
    EXPECT_EQ(paths[1], "/var/lib/tokenledger/pricing_snapshot.json");
    EXPECT_TRUE(config.IsList("pricing.snapshot_paths"));
    EXPECT_FALSE(config.IsList("pricing.url"));
}

TEST(ConfigTest, DefaultValues) {
    Config config;

    EXPECT_EQ(config.GetString("nonexistent.key", "default"), "default");
    EXPECT_EQ(config.GetInt("nonexistent.key", 42), 42);
    EXPECT_EQ(config.GetDouble("nonexistent.key", 3.14), 3.14);
    EXPECT_EQ(config.GetBool("nonexistent.key", true), true);
    EXPECT_TRUE(config.GetStringList("nonexistent.key").empty());
}

TEST(ConfigTest, WrongTypeFallsBackToDefault) {
    auto result = Config::LoadFromString("pricing:\n  tier_threshold: lots\n");
    ASSERT_TRUE(result.ok());

    EXPECT_EQ(result->GetInt("pricing.tier_threshold", 200000), 200000);
    EXPECT_EQ(result->GetString("pricing", "fallback"), "fallback");
}

TEST(ConfigTest, SetValues) {
    Config config;

    config.Set("test.string", std::string("value"));
    config.Set("test.int", static_cast<int64_t>(123));
    config.Set("test.bool", true);
    config.Set("test.list", std::vector<std::string>{"a", "b"});

    EXPECT_EQ(config.GetString("test.string"), "value");
    EXPECT_EQ(config.GetInt("test.int"), 123);
    EXPECT_EQ(config.GetBool("test.bool"), true);
    EXPECT_EQ(config.GetStringList("test.list"), (std::vector<std::string>{"a", "b"}));
}

TEST(ConfigTest, SetDoesNotDisturbSiblings) {
    auto result = Config::LoadFromString("pricing:\n  url: a\n  offline: false\n");
    ASSERT_TRUE(result.ok());
    Config config = std::move(*result);

    config.Set("pricing.offline", true);
    config.Set("logging.level", std::string("error"));

    EXPECT_EQ(config.GetString("pricing.url"), "a");
    EXPECT_TRUE(config.GetBool("pricing.offline"));
    EXPECT_EQ(config.GetString("logging.level"), "error");
}

TEST(ConfigTest, LookupsDoNotModifyConfig) {
    auto result = Config::LoadFromString("pricing:\n  url: a\n  format: litellm\n");
    ASSERT_TRUE(result.ok());
    Config config = std::move(*result);

    EXPECT_EQ(config.GetString("pricing.url"), "a");
    EXPECT_EQ(config.GetString("pricing.format"), "litellm");
    EXPECT_FALSE(config.HasKey("pricing.url.deeper"));
    EXPECT_EQ(config.GetString("pricing.url"), "a");
}

TEST(ConfigTest, HasKey) {
    const std::string yaml_content = R"(
existing:
  key: value
)";

    auto result = Config::LoadFromString(yaml_content);
    ASSERT_TRUE(result.ok());

    Config config = std::move(*result);

    EXPECT_TRUE(config.HasKey("existing.key"));
    EXPECT_FALSE(config.HasKey("nonexistent.key"));
    EXPECT_FALSE(config.HasKey("existing.missing"));
}

TEST(ConfigTest, MergeConfigs) {
    const std::string base_yaml = R"(
key1: value1
nested:
  a: 1
  b: 2
)";

    const std::string overlay_yaml = R"(
key2: value2
nested:
  b: 20
  c: 3
)";

    auto base_result = Config::LoadFromString(base_yaml);
    auto overlay_result = Config::LoadFromString(overlay_yaml);
    ASSERT_TRUE(base_result.ok());
    ASSERT_TRUE(overlay_result.ok());

    Config base = std::move(*base_result);
    Config overlay = std::move(*overlay_result);

    base.Merge(overlay);

    EXPECT_EQ(base.GetString("key1"), "value1");
    EXPECT_EQ(base.GetString("key2"), "value2");
    EXPECT_EQ(base.GetInt("nested.a"), 1);
    EXPECT_EQ(base.GetInt("nested.b"), 20);  // Overwritten
    EXPECT_EQ(base.GetInt("nested.c"), 3);   // Added
}

TEST(ConfigTest, MergeIntoEmptyConfig) {
    auto overlay = Config::LoadFromString("pricing:\n  offline: true\n");
    ASSERT_TRUE(overlay.ok());

    Config config;
    config.Merge(*overlay);
    EXPECT_TRUE(config.GetBool("pricing.offline"));
}

TEST(ConfigTest, InvalidYaml) {
    const std::string invalid_yaml = "{ invalid yaml [";

    auto result = Config::LoadFromString(invalid_yaml);
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(absl::IsInvalidArgument(result.status()));
}

TEST(ConfigTest, MissingFileIsNotFound) {
    auto result = Config::LoadFromFile("/nonexistent/tokenledger.yaml");
    EXPECT_TRUE(absl::IsNotFound(result.status()));
}

// ============================================================================
// Environment overrides
// ============================================================================

class ConfigEnvironmentTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const char* name : {"TLTEST_OFFLINE", "TLTEST_PRICING_URL", "TLTEST_PRICING_FORMAT",
                                 "TLTEST_PRICING_SNAPSHOT", "TLTEST_LOG_LEVEL"}) {
            unsetenv(name);
        }
        if (!file_.empty()) {
            std::error_code ec;
            std::filesystem::remove(file_, ec);
        }
    }

    std::filesystem::path WriteFile(const std::string& contents) {
        file_ = std::filesystem::temp_directory_path() /
                ("tokenledger_config_" + std::to_string(std::random_device{}()) + ".yaml");
        std::ofstream out(file_);
        out << contents;
        return file_;
    }

    std::filesystem::path file_;
};

TEST_F(ConfigEnvironmentTest, ReadsPrefixedVariables) {
    setenv("TLTEST_OFFLINE", "TRUE", 1);
    setenv("TLTEST_PRICING_URL", "https://mirror.example.com/prices.json", 1);
    setenv("TLTEST_PRICING_FORMAT", "models_dev", 1);
    setenv("TLTEST_PRICING_SNAPSHOT", "/a/snapshot.json::/b/snapshot.json", 1);
    setenv("TLTEST_LOG_LEVEL", "debug", 1);

    Config config = Config::LoadFromEnvironment("TLTEST_");

    EXPECT_TRUE(config.GetBool("pricing.offline"));
    EXPECT_EQ(config.GetString("pricing.url"), "https://mirror.example.com/prices.json");
    EXPECT_EQ(config.GetString("pricing.format"), "models_dev");
    EXPECT_EQ(config.GetStringList("pricing.snapshot_paths"),
              (std::vector<std::string>{"/a/snapshot.json", "/b/snapshot.json"}));
    EXPECT_EQ(config.GetString("logging.level"), "debug");
}

TEST_F(ConfigEnvironmentTest, UnsetVariablesLeaveConfigEmpty) {
    Config config = Config::LoadFromEnvironment("TLTEST_");
    EXPECT_FALSE(config.HasKey("pricing.offline"));
    EXPECT_FALSE(config.HasKey("logging.level"));
}

TEST_F(ConfigEnvironmentTest, EnvironmentOverridesFile) {
    auto path = WriteFile(R"(
pricing:
  offline: false
  url: https://file.example.com/prices.json
logging:
  level: info
)");
    setenv("TLTEST_OFFLINE", "1", 1);

    auto config = Config::LoadWithEnv(path, "TLTEST_");
    ASSERT_TRUE(config.ok()) << config.status();
    EXPECT_TRUE(config->GetBool("pricing.offline"));
    EXPECT_EQ(config->GetString("pricing.url"), "https://file.example.com/prices.json");
    EXPECT_EQ(config->GetString("logging.level"), "info");
}

TEST_F(ConfigEnvironmentTest, LoadWithEnvWithoutFile) {
    setenv("TLTEST_LOG_LEVEL", "error", 1);

    auto config = Config::LoadWithEnv(std::nullopt, "TLTEST_");
    ASSERT_TRUE(config.ok());
    EXPECT_EQ(config->GetString("logging.level"), "error");
}

TEST_F(ConfigEnvironmentTest, LoadWithEnvPropagatesMissingFile) {
    auto config = Config::LoadWithEnv(std::filesystem::path("/nonexistent/config.yaml"),
                                      "TLTEST_");
    EXPECT_TRUE(absl::IsNotFound(config.status()));
}

}  // namespace
}  // namespace tokenledger
