#ifndef WIPFLOW_CONFIGURATION_H_
#define WIPFLOW_CONFIGURATION_H_

#include <array>
#include <string>
#include <memory>
#include <optional>
#include <vector>
#include <cstdint>

#include "common/config.h"

namespace YAML {
class Node;
}

namespace Wipflow {

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
 * Per-stage optimizer selection as written in YAML
 */
struct OptimizerEntry {
    std::string kind;       // "none", "process" or "grpc"
    std::string command;    // process: shell command
    std::string endpoint;   // grpc: host:port
    int timeout_ms = 0;     // 0 keeps the scheduler default
    std::string label;
};

/**
 * Per-factory overrides applied through QueueManager::UpdateConfig
 */
struct FactoryEntry {
    std::string id;
    std::array<std::optional<int>, 3> release_minutes;   // indexed by Stage
    std::array<std::optional<OptimizerEntry>, 3> optimizer;
};

/**
 * Main configuration structure
 */
struct WipflowConfig {
    struct Scheduler {
        // Release wait applied to factories without explicit config; 0 releases immediately.
        ConfigValue<int> pap_release_minutes{0, "WIPFLOW_PAP_RELEASE_MINUTES"};
        ConfigValue<int> pip_release_minutes{0, "WIPFLOW_PIP_RELEASE_MINUTES"};
        ConfigValue<int> pipo_release_minutes{0, "WIPFLOW_PIPO_RELEASE_MINUTES"};
        ConfigValue<int> optimizer_timeout_ms{static_cast<int>(kDefaultOptimizerTimeoutMs), "WIPFLOW_OPTIMIZER_TIMEOUT_MS"};
    } scheduler;

    struct BatchPolicy {
        ConfigValue<int> q_min{kDefaultBatchQMin, "WIPFLOW_BATCH_QMIN"};
        ConfigValue<int> q_max{kDefaultBatchQMax, "WIPFLOW_BATCH_QMAX"};
        ConfigValue<int> horizon_minutes{static_cast<int>(kDefaultHorizonMinutes), "WIPFLOW_BATCH_HORIZON_MINUTES"};
        ConfigValue<int> interval_minutes{static_cast<int>(kDefaultSchedIntervalMinutes), "WIPFLOW_SCHED_INTERVAL_MINUTES"};
        ConfigValue<int> poisson_lambda{kDefaultPoissonLambda, "WIPFLOW_POISSON_LAMBDA"};
    } batch_policy;

    // Default optimizer for factories that do not name one
    struct Optimizer {
        ConfigValue<std::string> kind{"none", "WIPFLOW_OPTIMIZER_KIND"};
        ConfigValue<std::string> pap_command{"", "WIPFLOW_OPTIMIZER_PAP_COMMAND"};
        ConfigValue<std::string> pip_command{"", "WIPFLOW_OPTIMIZER_PIP_COMMAND"};
        ConfigValue<std::string> pipo_command{"", "WIPFLOW_OPTIMIZER_PIPO_COMMAND"};
        ConfigValue<std::string> endpoint{"127.0.0.1:50061", "WIPFLOW_OPTIMIZER_ENDPOINT"};
    } optimizer;

    struct Log {
        // Empty keeps scheduling log entries in memory only.
        ConfigValue<std::string> scheduling_log_path{"", "WIPFLOW_SCHEDULING_LOG"};
        ConfigValue<size_t> queue_capacity{kDefaultSchedulingLogQueueCapacity, "WIPFLOW_SCHEDULING_LOG_CAPACITY"};
    } log;

    struct Clock {
        // RFC3339 instant of sim minute 0, e.g. 2025-01-06T06:00:00Z. Empty disables calendar mapping.
        ConfigValue<std::string> sim_epoch{"", "WIPFLOW_SIM_EPOCH"};
    } clock;

    std::vector<FactoryEntry> factories;
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
    const WipflowConfig& config() const { return config_; }
    WipflowConfig& config() { return config_; }

    // Back to compiled-in defaults
    void reset() { config_ = WipflowConfig{}; validation_errors_.clear(); }

    // Helper methods for common access patterns
    int getReleaseMinutes(int stage_index) const;
    int getOptimizerTimeoutMs() const { return config_.scheduler.optimizer_timeout_ms.get(); }
    const std::vector<FactoryEntry>& getFactories() const { return config_.factories; }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    WipflowConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void parseRoot(const YAML::Node& root);
    bool validateConfig();
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Wipflow

#endif // WIPFLOW_CONFIGURATION_H_
