#pragma once

/// @file config.h
/// @brief PromptGuard configuration management

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <yaml-cpp/yaml.h>

namespace promptguard {

/// @brief Configuration value that can hold different types
using ConfigValue = std::variant<
    bool,
    int64_t,
    double,
    std::string,
    std::vector<std::string>
>;

/// @brief Configuration manager for loading and accessing configuration
class Config {
public:
    /// @brief Default constructor creates empty configuration
    Config() = default;

    /// @brief Load configuration from a YAML file
    static absl::StatusOr<Config> LoadFromFile(const std::filesystem::path& path);

    /// @brief Load configuration from a YAML string
    static absl::StatusOr<Config> LoadFromString(std::string_view yaml_content);

    /// @brief Load configuration from environment variables with a prefix
    /// @param prefix Environment variable prefix (e.g., "PROMPTGUARD_")
    /// @return Configuration, or an error when a numeric variable does not parse
    static absl::StatusOr<Config> LoadFromEnvironment(std::string_view prefix = "PROMPTGUARD_");

    /// @brief Merge another configuration into this one (other takes precedence)
    void Merge(const Config& other);

    /// @brief Get a string value
    /// @param key Configuration key (supports dot notation, e.g., "security.thresholds.low")
    /// @param default_value Default value if key not found
    std::string GetString(std::string_view key, std::string_view default_value = "") const;

    /// @brief Get an integer value, or the default if missing or not an integer
    int64_t GetInt(std::string_view key, int64_t default_value = 0) const;

    /// @brief Get a double value, or the default if missing or not a number
    double GetDouble(std::string_view key, double default_value = 0.0) const;

    /// @brief Get a boolean value, or the default if missing or not a boolean
    bool GetBool(std::string_view key, bool default_value = false) const;

    /// @brief Get a double value; a present but malformed value is an error
    absl::StatusOr<double> ReadDouble(std::string_view key, double default_value) const;

    /// @brief Get an integer value; a present but malformed value is an error
    absl::StatusOr<int64_t> ReadInt(std::string_view key, int64_t default_value) const;

    /// @brief Get a list of strings
    std::vector<std::string> GetStringList(std::string_view key) const;

    /// @brief Check if a key exists
    bool HasKey(std::string_view key) const;

    /// @brief Set a configuration value
    void Set(std::string_view key, ConfigValue value);

    /// @brief Get the underlying YAML node for advanced access
    const YAML::Node& GetNode() const { return root_; }

private:
    YAML::Node root_;

    /// @brief Navigate to a nested node using dot notation
    std::optional<YAML::Node> GetNestedNode(std::string_view key) const;
};

/// @brief Load a file (optional) and overlay the environment on top of it
absl::StatusOr<Config> LoadConfig(
    const std::optional<std::filesystem::path>& config_path = std::nullopt,
    std::string_view env_prefix = "PROMPTGUARD_");

}  // namespace promptguard
