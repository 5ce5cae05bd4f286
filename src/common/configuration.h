#ifndef MESHWORK_CONFIGURATION_H_
#define MESHWORK_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace YAML {
class Node;
}

namespace Meshwork {

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
struct MeshworkConfig {
    struct Reactor {
        ConfigValue<int> cycle_interval_ms{50, "MESHWORK_CYCLE_INTERVAL_MS"};
        ConfigValue<int> worker_threads{8, "MESHWORK_WORKER_THREADS"};
        // Deadline applied to units that do not declare their own.
        ConfigValue<int> default_deadline_ms{5000, "MESHWORK_DEFAULT_DEADLINE_MS"};
        // Consecutive timeouts after which a unit is disabled.
        ConfigValue<int> timeout_disable_streak{3, "MESHWORK_TIMEOUT_DISABLE_STREAK"};
        ConfigValue<int> max_admissions_per_cycle{1000, "MESHWORK_MAX_ADMISSIONS_PER_CYCLE"};
        ConfigValue<int> max_units_per_cycle{20000, "MESHWORK_MAX_UNITS_PER_CYCLE"};
    } reactor;

    struct Mutex {
        // Cycles a queued entry waits before its priority starts to age.
        ConfigValue<int> starvation_threshold_cycles{3, "MESHWORK_STARVATION_THRESHOLD_CYCLES"};
        ConfigValue<int> boost_per_cycle{1, "MESHWORK_BOOST_PER_CYCLE"};
    } mutex;

    struct Throttle {
        ConfigValue<int> sample_interval_ms{100, "MESHWORK_THROTTLE_SAMPLE_INTERVAL_MS"};
        ConfigValue<double> throttle_threshold{0.8, "MESHWORK_THROTTLE_THRESHOLD"};
        ConfigValue<double> emergency_threshold{0.95, "MESHWORK_EMERGENCY_THRESHOLD"};
        // Mutations per second that count as full (1.0) pressure.
        ConfigValue<int> max_mutation_rate{10000, "MESHWORK_MAX_MUTATION_RATE"};
    } throttle;

    struct Trace {
        ConfigValue<size_t> buffer_capacity{8192, "MESHWORK_TRACE_BUFFER_CAPACITY"};
        // Records held while the sink is unavailable.
        ConfigValue<size_t> retry_capacity{1024, "MESHWORK_TRACE_RETRY_CAPACITY"};
        ConfigValue<size_t> history_size{10000, "MESHWORK_TRACE_HISTORY_SIZE"};
        ConfigValue<int> retention_s{24 * 3600, "MESHWORK_TRACE_RETENTION_S"};
        ConfigValue<std::string> sink_path{"", "MESHWORK_TRACE_SINK_PATH"};
    } trace;

    struct Acl {
        ConfigValue<std::string> manifest_path{"", "MESHWORK_ACL_MANIFEST"};
        ConfigValue<std::string> default_policy{"deny", "MESHWORK_ACL_DEFAULT_POLICY"};
    } acl;

    struct Safety {
        ConfigValue<size_t> max_value_bytes{1UL << 20, "MESHWORK_MAX_VALUE_BYTES"};
        ConfigValue<size_t> max_snapshot_keys{100000, "MESHWORK_MAX_SNAPSHOT_KEYS"};
    } safety;

    struct Service {
        ConfigValue<std::string> listen_address{"0.0.0.0:50061", "MESHWORK_LISTEN_ADDRESS"};
    } service;
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

    // Override with command line arguments
    void overrideFromCommandLine(int argc, char* argv[]);

    const MeshworkConfig& config() const { return config_; }
    MeshworkConfig& config() { return config_; }

    // Restore every value to its compiled-in default
    void reset() { config_ = MeshworkConfig{}; }

    int getCycleIntervalMs() const { return config_.reactor.cycle_interval_ms.get(); }
    int getWorkerThreads() const { return config_.reactor.worker_threads.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    MeshworkConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& root);
};

const Configuration& GetConfig();

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Meshwork

#endif // MESHWORK_CONFIGURATION_H_
