#include "configuration.h"
#include "document.h"
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "../stats/indices_stats_response.h"

namespace Statfan {

// Global function to get configuration instance
const Configuration& GetConfig() {
    return Configuration::getInstance();
}

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoull(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["statfan"]) {
        LOG(WARNING) << "Configuration has no top-level 'statfan' section, keeping defaults";
        return;
    }
    auto root = yaml["statfan"];

    // Dispatch
    if (root["dispatch"]) {
        auto dispatch = root["dispatch"];
        if (dispatch["max_retries"]) config_.dispatch.max_retries.set(dispatch["max_retries"].as<int>());
        if (dispatch["max_in_flight"]) config_.dispatch.max_in_flight.set(dispatch["max_in_flight"].as<int>());
    }

    // Render
    if (root["render"]) {
        auto render = root["render"];
        if (render["level"]) config_.render.level.set(render["level"].as<std::string>());
        if (render["format"]) config_.render.format.set(render["format"].as<std::string>());
    }

    // Codec
    if (root["codec"]) {
        auto codec = root["codec"];
        if (codec["max_bytes_length"]) config_.codec.max_bytes_length.set(codec["max_bytes_length"].as<size_t>());
        if (codec["max_collection_size"]) config_.codec.max_collection_size.set(codec["max_collection_size"].as<size_t>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        applyYAML(yaml);
        return validateConfig();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        applyYAML(yaml);
        return validateConfig();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.dispatch.max_retries.get() < 0) {
        validation_errors_.push_back("Dispatch max_retries cannot be negative");
    }

    if (config_.dispatch.max_in_flight.get() < 1) {
        validation_errors_.push_back("Dispatch max_in_flight must be at least 1");
    }

    if (!ParseStatsLevel(config_.render.level.get())) {
        validation_errors_.push_back("Render level must be one of cluster, indices, shards");
    }

    if (!ParseDocumentFormat(config_.render.format.get())) {
        validation_errors_.push_back("Render format must be yaml or flow");
    }

    if (config_.codec.max_bytes_length.get() == 0) {
        validation_errors_.push_back("Codec max_bytes_length must be positive");
    }

    if (config_.codec.max_collection_size.get() == 0) {
        validation_errors_.push_back("Codec max_collection_size must be positive");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

bool Configuration::validateConfig() {
    bool valid = validate();
    for (const auto& error : validation_errors_) {
        LOG(ERROR) << "Invalid configuration: " << error;
    }
    return valid;
}

} // namespace Statfan
