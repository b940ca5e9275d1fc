#ifndef COLLECTOR_CONFIGURATION_H_
#define COLLECTOR_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace YAML {
class Node;
}

namespace Collector {

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
struct CollectorConfig {
    // Database server this agent is attached to
    struct Server {
        // Also the identity a test run looks for in the collector-identify marker
        ConfigValue<std::string> section_name{"default", "COLLECTOR_SECTION_NAME"};
        ConfigValue<std::string> api_key{"", "COLLECTOR_API_KEY"};
        // gRPC target of the control plane
        ConfigValue<std::string> api_base_url{"localhost:50070", "COLLECTOR_API_BASE_URL"};
        ConfigValue<std::string> system_id{"", "COLLECTOR_SYSTEM_ID"};
    } server;

    struct Logs {
        ConfigValue<std::string> location{"", "COLLECTOR_LOG_LOCATION"};
        // Lines younger than this stay in the backlog so follow-on lines can join them
        ConfigValue<int> readiness_window_ms{3000, "COLLECTOR_LOG_READINESS_WINDOW_MS"};
        ConfigValue<int> poll_interval_ms{1000, "COLLECTOR_LOG_POLL_INTERVAL_MS"};
        // Empty selects TMPDIR or /tmp
        ConfigValue<std::string> tmp_dir{"", "COLLECTOR_LOG_TMP_DIR"};
        ConfigValue<int> test_timeout_ms{10000, "COLLECTOR_LOG_TEST_TIMEOUT_MS"};
    } logs;

    // Defaults for CollectionOpts, CLI flags override them
    struct Collection {
        ConfigValue<bool> collect_logs{true, "COLLECTOR_COLLECT_LOGS"};
        ConfigValue<bool> submit_collected_data{true, "COLLECTOR_SUBMIT_COLLECTED_DATA"};
        ConfigValue<bool> debug_logs{false, "COLLECTOR_DEBUG_LOGS"};
        ConfigValue<bool> test_run{false, "COLLECTOR_TEST_RUN"};
        ConfigValue<bool> force_empty_grant{false, "COLLECTOR_FORCE_EMPTY_GRANT"};
        ConfigValue<std::string> application_name{"collector", "COLLECTOR_APPLICATION_NAME"};
    } collection;
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
    const CollectorConfig& config() const { return config_; }
    CollectorConfig& config() { return config_; }

    // Back to compiled-in defaults
    void reset() { config_ = CollectorConfig{}; validation_errors_.clear(); }

    // Helper methods for common access patterns
    std::string getSectionName() const { return config_.server.section_name.get(); }
    int getReadinessWindowMs() const { return config_.logs.readiness_window_ms.get(); }
    int getPollIntervalMs() const { return config_.logs.poll_interval_ms.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    CollectorConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void parseYAML(const YAML::Node& yaml);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Collector

#endif // COLLECTOR_CONFIGURATION_H_
