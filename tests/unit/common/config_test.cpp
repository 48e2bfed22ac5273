/// @file config_test.cpp
/// @brief Tests for PromptGuard configuration management

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include "common/config.h"
#include "common/error.h"

namespace promptguard {
namespace {

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        setenv(name, value, 1);
    }
    ~ScopedEnv() { unsetenv(name_); }

private:
    const char* name_;
};

TEST(ConfigTest, LoadFromString) {
    const std::string yaml_content = R"(
security:
  thresholds:
    low: 0.3
    medium: 0.6
    high: 0.9
  detector:
    max_context_tokens: 4096
  sanitizer:
    patterns:
      - "ignore previous"
      - "system:"
logging:
  level: debug
)";

    auto result = Config::LoadFromString(yaml_content);
    ASSERT_TRUE(result.ok()) << result.status().message();

    Config config = std::move(*result);

    EXPECT_DOUBLE_EQ(config.GetDouble("security.thresholds.low"), 0.3);
    EXPECT_DOUBLE_EQ(config.GetDouble("security.thresholds.high"), 0.9);
    EXPECT_EQ(config.GetInt("security.detector.max_context_tokens"), 4096);
    EXPECT_EQ(config.GetString("logging.level"), "debug");

    auto patterns = config.GetStringList("security.sanitizer.patterns");
    ASSERT_EQ(patterns.size(), 2);
    EXPECT_EQ(patterns[0], "ignore previous");
    EXPECT_EQ(patterns[1], "system:");
}

TEST(ConfigTest, DefaultValues) {
    Config config;

    EXPECT_EQ(config.GetString("nonexistent.key", "default"), "default");
    EXPECT_EQ(config.GetInt("nonexistent.key", 42), 42);
    EXPECT_EQ(config.GetDouble("nonexistent.key", 3.14), 3.14);
    EXPECT_EQ(config.GetBool("nonexistent.key", true), true);
}

TEST(ConfigTest, SetValues) {
    Config config;

    config.Set("test.string", std::string("value"));
    config.Set("test.int", static_cast<int64_t>(123));
    config.Set("test.bool", true);
    config.Set("test.double", 0.85);

    EXPECT_EQ(config.GetString("test.string"), "value");
    EXPECT_EQ(config.GetInt("test.int"), 123);
    EXPECT_EQ(config.GetBool("test.bool"), true);
    EXPECT_DOUBLE_EQ(config.GetDouble("test.double"), 0.85);
}

TEST(ConfigTest, HasKey) {
    const std::string yaml_content = R"(
security:
  batch:
    high_confidence_threshold: 0.9
)";

    auto result = Config::LoadFromString(yaml_content);
    ASSERT_TRUE(result.ok());

    Config config = std::move(*result);

    EXPECT_TRUE(config.HasKey("security.batch.high_confidence_threshold"));
    EXPECT_FALSE(config.HasKey("security.batch.missing"));
    EXPECT_FALSE(config.HasKey("security.batch.high_confidence_threshold.deeper"));
}

TEST(ConfigTest, LookupDoesNotInsertKeys) {
    Config config;
    config.Set("security.thresholds.low", 0.2);

    EXPECT_FALSE(config.HasKey("security.thresholds.high"));
    EXPECT_FALSE(config.HasKey("security.thresholds.high"));
    EXPECT_EQ(config.GetNode()["security"]["thresholds"].size(), 1);
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

TEST(ConfigTest, InvalidYaml) {
    const std::string invalid_yaml = "{ invalid yaml [";

    auto result = Config::LoadFromString(invalid_yaml);
    EXPECT_FALSE(result.ok());
}

TEST(ConfigTest, ReadDoubleRejectsMalformedValue) {
    auto result = Config::LoadFromString("security:\n  thresholds:\n    low: abc\n");
    ASSERT_TRUE(result.ok());

    auto value = result->ReadDouble("security.thresholds.low", 0.25);
    EXPECT_FALSE(value.ok());
    EXPECT_EQ(value.status().code(), absl::StatusCode::kFailedPrecondition);

    // The lenient accessor falls back to the default
    EXPECT_DOUBLE_EQ(result->GetDouble("security.thresholds.low", 0.25), 0.25);
}

TEST(ConfigTest, ReadIntAcceptsWholeDoubles) {
    Config config;
    config.Set("security.sanitizer.max_input_length", 5000.0);
    config.Set("security.detector.max_context_tokens", 10.5);

    auto whole = config.ReadInt("security.sanitizer.max_input_length", 0);
    ASSERT_TRUE(whole.ok());
    EXPECT_EQ(*whole, 5000);

    EXPECT_FALSE(config.ReadInt("security.detector.max_context_tokens", 0).ok());
}

TEST(ConfigTest, LoadFromEnvironment) {
    ScopedEnv low("PGTEST_THRESHOLD_LOW", "0.3");
    ScopedEnv policy("PGTEST_POLICY_TEMPLATE", "Stay on topic.");
    ScopedEnv level("PGTEST_LOG_LEVEL", "debug");

    auto result = Config::LoadFromEnvironment("PGTEST_");
    ASSERT_TRUE(result.ok()) << result.status().message();

    EXPECT_DOUBLE_EQ(result->GetDouble("security.thresholds.low"), 0.3);
    EXPECT_EQ(result->GetString("security.sanitizer.policy_template"), "Stay on topic.");
    EXPECT_EQ(result->GetString("logging.level"), "debug");
    EXPECT_FALSE(result->HasKey("security.thresholds.high"));
}

TEST(ConfigTest, LoadFromEnvironmentRejectsBadNumber) {
    ScopedEnv high("PGTEST_THRESHOLD_HIGH", "very-high");

    auto result = Config::LoadFromEnvironment("PGTEST_");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), ToAbslCode(ErrorCode::kConfigurationError));
}

TEST(ConfigTest, LoadConfigMissingFile) {
    auto result = LoadConfig(std::filesystem::path("/nonexistent/promptguard.yaml"));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), absl::StatusCode::kNotFound);
}

TEST(ConfigTest, EnvironmentOverridesFile) {
    const std::filesystem::path path =
        std::filesystem::temp_directory_path() / "promptguard_config_test.yaml";
    {
        std::ofstream out(path);
        out << "security:\n  thresholds:\n    low: 0.2\n    high: 0.8\n";
    }
    ScopedEnv low("PGTEST_THRESHOLD_LOW", "0.4");

    auto result = LoadConfig(path, "PGTEST_");
    std::filesystem::remove(path);
    ASSERT_TRUE(result.ok()) << result.status().message();

    EXPECT_DOUBLE_EQ(result->GetDouble("security.thresholds.low"), 0.4);
    EXPECT_DOUBLE_EQ(result->GetDouble("security.thresholds.high"), 0.8);
}

}  // namespace
}  // namespace promptguard
