#include "config.h"

#include <cstdlib>
#include <functional>
#include <type_traits>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include "error.h"

namespace promptguard {

namespace {

/// Environment variable suffix -> dotted configuration key
struct EnvBinding {
    const char* suffix;
    const char* key;
    bool numeric;
};

constexpr EnvBinding kEnvBindings[] = {
    {"THRESHOLD_LOW", "security.thresholds.low", true},
    {"THRESHOLD_MEDIUM", "security.thresholds.medium", true},
    {"THRESHOLD_HIGH", "security.thresholds.high", true},
    {"HIGH_CONFIDENCE_THRESHOLD", "security.batch.high_confidence_threshold", true},
    {"DETECTION_THRESHOLD", "security.detector.detection_threshold", true},
    {"SANITIZER_MAX_INPUT_LENGTH", "security.sanitizer.max_input_length", true},
    {"POLICY_TEMPLATE", "security.sanitizer.policy_template", false},
    {"LOG_LEVEL", "logging.level", false},
    {"LOG_FILE", "logging.file", false},
};

}  // namespace

absl::StatusOr<Config> Config::LoadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return absl::NotFoundError(
            absl::StrCat("Configuration file not found: ", path.string()));
    }

    try {
        Config config;
        config.root_ = YAML::LoadFile(path.string());
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML configuration: ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromString(std::string_view yaml_content) {
    try {
        Config config;
        config.root_ = YAML::Load(std::string(yaml_content));
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML content: ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromEnvironment(std::string_view prefix) {
    Config config;

    for (const auto& binding : kEnvBindings) {
        const std::string name = absl::StrCat(absl::string_view(prefix.data(), prefix.size()), binding.suffix);
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            continue;
        }

        if (!binding.numeric) {
            config.Set(binding.key, std::string(value));
            continue;
        }

        double parsed = 0.0;
        if (!absl::SimpleAtod(value, &parsed)) {
            return MakeError(ErrorCode::kConfigurationError,
                             absl::StrCat("Environment variable ", name,
                                          " is not a number"));
        }
        config.Set(binding.key, parsed);
    }

    return config;
}

void Config::Merge(const Config& other) {
    // Deep merge YAML nodes
    std::function<void(YAML::Node&, const YAML::Node&)> merge_nodes;
    merge_nodes = [&merge_nodes](YAML::Node& base, const YAML::Node& overlay) {
        if (overlay.IsMap()) {
            for (const auto& kv : overlay) {
                const std::string key = kv.first.as<std::string>();
                if (base[key] && base[key].IsMap() && kv.second.IsMap()) {
                    YAML::Node base_child = base[key];
                    merge_nodes(base_child, kv.second);
                } else {
                    base[key] = kv.second;
                }
            }
        }
    };

    merge_nodes(root_, other.root_);
}

std::optional<YAML::Node> Config::GetNestedNode(std::string_view key) const {
    std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');
    YAML::Node current = root_;

    for (const auto& part : parts) {
        if (!current || !current.IsMap()) {
            return std::nullopt;
        }
        // Const lookup never inserts; reset() rebinds instead of assigning
        const YAML::Node& parent = current;
        YAML::Node child = parent[part];
        current.reset(child);
    }

    if (!current || current.IsNull()) {
        return std::nullopt;
    }

    return current;
}

std::string Config::GetString(std::string_view key, std::string_view default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        return node->as<std::string>();
    }
    return std::string(default_value);
}

int64_t Config::GetInt(std::string_view key, int64_t default_value) const {
    auto value = ReadInt(key, default_value);
    return value.ok() ? *value : default_value;
}

double Config::GetDouble(std::string_view key, double default_value) const {
    auto value = ReadDouble(key, default_value);
    return value.ok() ? *value : default_value;
}

bool Config::GetBool(std::string_view key, bool default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<bool>();
        } catch (const YAML::Exception&) {
            return default_value;
        }
    }
    return default_value;
}

absl::StatusOr<double> Config::ReadDouble(std::string_view key, double default_value) const {
    auto node = GetNestedNode(key);
    if (!node) {
        return default_value;
    }
    if (!node->IsScalar()) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat("Configuration key ", absl::string_view(key.data(), key.size()), " is not a scalar"));
    }
    try {
        return node->as<double>();
    } catch (const YAML::Exception&) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat("Configuration key ", absl::string_view(key.data(), key.size()), " is not a number"));
    }
}

absl::StatusOr<int64_t> Config::ReadInt(std::string_view key, int64_t default_value) const {
    auto node = GetNestedNode(key);
    if (!node) {
        return default_value;
    }
    if (!node->IsScalar()) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat("Configuration key ", absl::string_view(key.data(), key.size()), " is not a scalar"));
    }
    try {
        return node->as<int64_t>();
    } catch (const YAML::Exception&) {
        // Environment overlays store numbers as doubles
        try {
            const double value = node->as<double>();
            if (value == static_cast<double>(static_cast<int64_t>(value))) {
                return static_cast<int64_t>(value);
            }
        } catch (const YAML::Exception&) {
        }
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat("Configuration key ", absl::string_view(key.data(), key.size()), " is not an integer"));
    }
}

std::vector<std::string> Config::GetStringList(std::string_view key) const {
    std::vector<std::string> result;
    auto node = GetNestedNode(key);
    if (node && node->IsSequence()) {
        for (const auto& item : *node) {
            if (item.IsScalar()) {
                result.push_back(item.as<std::string>());
            }
        }
    }
    return result;
}

bool Config::HasKey(std::string_view key) const {
    return GetNestedNode(key).has_value();
}

void Config::Set(std::string_view key, ConfigValue value) {
    std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');

    YAML::Node current = root_;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        if (!current[parts[i]] || !current[parts[i]].IsMap()) {
            current[parts[i]] = YAML::Node(YAML::NodeType::Map);
        }
        current.reset(current[parts[i]]);
    }

    std::visit([&](auto&& val) {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            YAML::Node seq(YAML::NodeType::Sequence);
            for (const auto& item : val) {
                seq.push_back(item);
            }
            current[parts.back()] = seq;
        } else {
            current[parts.back()] = val;
        }
    }, value);
}

absl::StatusOr<Config> LoadConfig(
    const std::optional<std::filesystem::path>& config_path,
    std::string_view env_prefix) {
    Config config;

    if (config_path.has_value()) {
        auto file_config = Config::LoadFromFile(*config_path);
        if (!file_config.ok()) {
            return file_config.status();
        }
        config.Merge(*file_config);
    }

    // Environment variables take precedence over the file
    auto env_config = Config::LoadFromEnvironment(env_prefix);
    if (!env_config.ok()) {
        return env_config.status();
    }
    config.Merge(*env_config);

    return config;
}

}  // namespace promptguard
