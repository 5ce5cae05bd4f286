#include "configuration.h"
#include <algorithm>
#include <cstdlib>
#include <getopt.h>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Meshwork {

namespace {

template<typename T>
void SetIfPresent(const YAML::Node& section, const char* key, ConfigValue<T>& value) {
    if (section[key]) value.set(section[key].as<T>());
}

} // namespace

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
std::optional<double> ConfigValue<double>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stod(env_val);
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
        std::transform(val.begin(), val.end(), val.begin(), ::tolower);
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

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["meshwork"]) {
        LOG(WARNING) << "Configuration has no 'meshwork' root; keeping defaults";
        return;
    }
    auto root = yaml["meshwork"];

    if (root["reactor"]) {
        auto reactor = root["reactor"];
        SetIfPresent(reactor, "cycle_interval_ms", config_.reactor.cycle_interval_ms);
        SetIfPresent(reactor, "worker_threads", config_.reactor.worker_threads);
        SetIfPresent(reactor, "default_deadline_ms", config_.reactor.default_deadline_ms);
        SetIfPresent(reactor, "timeout_disable_streak", config_.reactor.timeout_disable_streak);
        SetIfPresent(reactor, "max_admissions_per_cycle", config_.reactor.max_admissions_per_cycle);
        SetIfPresent(reactor, "max_units_per_cycle", config_.reactor.max_units_per_cycle);
    }

    if (root["mutex"]) {
        auto mutex = root["mutex"];
        SetIfPresent(mutex, "starvation_threshold_cycles", config_.mutex.starvation_threshold_cycles);
        SetIfPresent(mutex, "boost_per_cycle", config_.mutex.boost_per_cycle);
    }

    if (root["throttle"]) {
        auto throttle = root["throttle"];
        SetIfPresent(throttle, "sample_interval_ms", config_.throttle.sample_interval_ms);
        SetIfPresent(throttle, "throttle_threshold", config_.throttle.throttle_threshold);
        SetIfPresent(throttle, "emergency_threshold", config_.throttle.emergency_threshold);
        SetIfPresent(throttle, "max_mutation_rate", config_.throttle.max_mutation_rate);
    }

    if (root["trace"]) {
        auto trace = root["trace"];
        SetIfPresent(trace, "buffer_capacity", config_.trace.buffer_capacity);
        SetIfPresent(trace, "retry_capacity", config_.trace.retry_capacity);
        SetIfPresent(trace, "history_size", config_.trace.history_size);
        SetIfPresent(trace, "retention_s", config_.trace.retention_s);
        SetIfPresent(trace, "sink_path", config_.trace.sink_path);
    }

    if (root["acl"]) {
        auto acl = root["acl"];
        SetIfPresent(acl, "manifest_path", config_.acl.manifest_path);
        SetIfPresent(acl, "default_policy", config_.acl.default_policy);
    }

    if (root["safety"]) {
        auto safety = root["safety"];
        SetIfPresent(safety, "max_value_bytes", config_.safety.max_value_bytes);
        SetIfPresent(safety, "max_snapshot_keys", config_.safety.max_snapshot_keys);
    }

    if (root["service"]) {
        SetIfPresent(root["service"], "listen_address", config_.service.listen_address);
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        applyYAML(yaml);
        if (!validate()) {
            for (const auto& err : validation_errors_) {
                LOG(ERROR) << "Invalid configuration in " << filename << ": " << err;
            }
            return false;
        }
        LOG(INFO) << "Loaded configuration from " << filename;
        return true;
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file: " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        applyYAML(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::overrideFromCommandLine(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"cycle_interval_ms", required_argument, 0, 'i'},
        {"worker_threads", required_argument, 0, 'w'},
        {"listen", required_argument, 0, 'a'},
        {"trace_sink", required_argument, 0, 's'},
        // Accept flags handled by the daemon's own parser
        {"config", required_argument, 0, 0},
        {"acl", required_argument, 0, 0},
        {"log_level", required_argument, 0, 0},
        {0, 0, 0, 0}
    };

    int option_index = 0;
    int c;
    // Suppress getopt_long default error messages for unknown options
    opterr = 0;
    optind = 1;

    while ((c = getopt_long(argc, argv, "i:w:a:s:", long_options, &option_index)) != -1) {
        switch (c) {
            case 'i':
                config_.reactor.cycle_interval_ms.set(std::stoi(optarg));
                break;
            case 'w':
                config_.reactor.worker_threads.set(std::stoi(optarg));
                break;
            case 'a':
                config_.service.listen_address.set(optarg);
                break;
            case 's':
                config_.trace.sink_path.set(optarg);
                break;
            default:
                break;
        }
    }
    optind = 1;
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.reactor.cycle_interval_ms.get() < 1) {
        validation_errors_.push_back("Cycle interval must be at least 1ms");
    }
    if (config_.reactor.worker_threads.get() < 1) {
        validation_errors_.push_back("Worker threads must be at least 1");
    }
    if (config_.reactor.default_deadline_ms.get() < 1) {
        validation_errors_.push_back("Default deadline must be at least 1ms");
    }
    if (config_.reactor.timeout_disable_streak.get() < 1) {
        validation_errors_.push_back("Timeout disable streak must be at least 1");
    }
    if (config_.reactor.max_admissions_per_cycle.get() < 1) {
        validation_errors_.push_back("Max admissions per cycle must be at least 1");
    }

    if (config_.mutex.starvation_threshold_cycles.get() < 0) {
        validation_errors_.push_back("Starvation threshold cannot be negative");
    }
    if (config_.mutex.boost_per_cycle.get() < 1) {
        validation_errors_.push_back("Priority boost per cycle must be at least 1");
    }

    double throttle = config_.throttle.throttle_threshold.get();
    double emergency = config_.throttle.emergency_threshold.get();
    if (throttle < 0.0 || throttle > 1.0) {
        validation_errors_.push_back("Throttle threshold must be between 0.0 and 1.0");
    }
    if (emergency < 0.0 || emergency > 1.0) {
        validation_errors_.push_back("Emergency threshold must be between 0.0 and 1.0");
    }
    if (emergency < throttle) {
        validation_errors_.push_back("Emergency threshold cannot be below throttle threshold");
    }
    if (config_.throttle.sample_interval_ms.get() < 1) {
        validation_errors_.push_back("Throttle sample interval must be at least 1ms");
    }
    if (config_.throttle.max_mutation_rate.get() < 1) {
        validation_errors_.push_back("Max mutation rate must be at least 1");
    }

    if (config_.trace.buffer_capacity.get() < 2) {
        validation_errors_.push_back("Trace buffer capacity must be at least 2");
    }
    if (config_.trace.retention_s.get() < 1) {
        validation_errors_.push_back("Trace retention must be at least 1s");
    }

    const std::string policy = config_.acl.default_policy.get();
    if (policy != "deny" && policy != "allow") {
        validation_errors_.push_back("ACL default policy must be 'deny' or 'allow'");
    }

    if (config_.safety.max_value_bytes.get() < 1) {
        validation_errors_.push_back("Max value size must be at least 1 byte");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Meshwork
