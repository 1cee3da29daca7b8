#ifndef STATFAN_CONFIGURATION_H_
#define STATFAN_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

#include "stream.h"

namespace YAML {
class Node;
}

namespace Statfan {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct StatfanConfig {
    // Shard fan-out
    struct Dispatch {
        // Extra attempts for a shard whose first attempt failed.
        ConfigValue<int> max_retries{1, "STATFAN_DISPATCH_MAX_RETRIES"};
        // Shard calls in flight at once per attempt.
        ConfigValue<int> max_in_flight{16, "STATFAN_DISPATCH_MAX_IN_FLIGHT"};
    } dispatch;

    // Document rendering defaults
    struct Render {
        ConfigValue<std::string> level{"indices", "STATFAN_RENDER_LEVEL"};
        ConfigValue<std::string> format{"yaml", "STATFAN_RENDER_FORMAT"};
    } render;

    // Binary decode bounds
    struct Codec {
        ConfigValue<size_t> max_bytes_length{100UL * 1024 * 1024, "STATFAN_CODEC_MAX_BYTES"};
        ConfigValue<size_t> max_collection_size{1UL << 20, "STATFAN_CODEC_MAX_COLLECTION"};
    } codec;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const StatfanConfig& config() const { return config_; }
    StatfanConfig& config() { return config_; }

    // Helper methods for common access patterns
    int getMaxRetries() const { return config_.dispatch.max_retries.get(); }
    int getMaxInFlight() const { return config_.dispatch.max_in_flight.get(); }
    std::string getRenderLevel() const { return config_.render.level.get(); }
    std::string getRenderFormat() const { return config_.render.format.get(); }
    StreamLimits getStreamLimits() const {
        StreamLimits limits;
        limits.max_bytes_length = config_.codec.max_bytes_length.get();
        limits.max_collection_size = config_.codec.max_collection_size.get();
        return limits;
    }

    // Back to built-in defaults; tests use this between cases.
    void reset() { config_ = StatfanConfig(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    StatfanConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& yaml);
    bool validateConfig();
};

// Global accessor
const Configuration& GetConfig();

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

} // namespace Statfan

#endif // STATFAN_CONFIGURATION_H_
