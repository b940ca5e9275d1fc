#include "configuration.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Collector {

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
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::parseYAML(const YAML::Node& yaml) {
    if (!yaml["collector"]) {
        LOG(WARNING) << "Configuration has no top-level \"collector\" key, using defaults";
        return;
    }
    auto root = yaml["collector"];

    // Server
    if (root["server"]) {
        auto server = root["server"];
        if (server["section_name"]) config_.server.section_name.set(server["section_name"].as<std::string>());
        if (server["api_key"]) config_.server.api_key.set(server["api_key"].as<std::string>());
        if (server["api_base_url"]) config_.server.api_base_url.set(server["api_base_url"].as<std::string>());
        if (server["system_id"]) config_.server.system_id.set(server["system_id"].as<std::string>());
    }

    // Logs
    if (root["logs"]) {
        auto logs = root["logs"];
        if (logs["location"]) config_.logs.location.set(logs["location"].as<std::string>());
        if (logs["readiness_window_ms"]) config_.logs.readiness_window_ms.set(logs["readiness_window_ms"].as<int>());
        if (logs["poll_interval_ms"]) config_.logs.poll_interval_ms.set(logs["poll_interval_ms"].as<int>());
        if (logs["tmp_dir"]) config_.logs.tmp_dir.set(logs["tmp_dir"].as<std::string>());
        if (logs["test_timeout_ms"]) config_.logs.test_timeout_ms.set(logs["test_timeout_ms"].as<int>());
    }

    // Collection
    if (root["collection"]) {
        auto collection = root["collection"];
        if (collection["collect_logs"]) config_.collection.collect_logs.set(collection["collect_logs"].as<bool>());
        if (collection["submit_collected_data"]) config_.collection.submit_collected_data.set(collection["submit_collected_data"].as<bool>());
        if (collection["debug_logs"]) config_.collection.debug_logs.set(collection["debug_logs"].as<bool>());
        if (collection["test_run"]) config_.collection.test_run.set(collection["test_run"].as<bool>());
        if (collection["force_empty_grant"]) config_.collection.force_empty_grant.set(collection["force_empty_grant"].as<bool>());
        if (collection["application_name"]) config_.collection.application_name.set(collection["application_name"].as<std::string>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        parseYAML(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        parseYAML(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.server.section_name.get().empty()) {
        validation_errors_.push_back("Server section name must not be empty");
    }

    if (config_.server.api_base_url.get().empty() && !config_.collection.force_empty_grant.get()) {
        validation_errors_.push_back("API base URL is required unless force_empty_grant is set");
    }

    // Quiescence window and polling
    if (config_.logs.readiness_window_ms.get() < 0) {
        validation_errors_.push_back("Log readiness window cannot be negative");
    }

    if (config_.logs.poll_interval_ms.get() < 1) {
        validation_errors_.push_back("Log poll interval must be at least 1ms");
    }

    if (config_.logs.test_timeout_ms.get() < 1) {
        validation_errors_.push_back("Log test timeout must be at least 1ms");
    }

    if (config_.collection.debug_logs.get() && config_.collection.test_run.get()) {
        LOG(WARNING) << "Both debug_logs and test_run are set, debug output takes precedence";
    }

    for (const auto& err : validation_errors_) {
        LOG(ERROR) << "Invalid configuration: " << err;
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Collector
