#include "configuration.h"
#include <algorithm>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Wipflow {

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

namespace {

const char* const kStageKeys[3] = {"pap", "pip", "pipo"};

OptimizerEntry ParseOptimizerEntry(const YAML::Node& node) {
    OptimizerEntry entry;
    if (node["kind"]) entry.kind = node["kind"].as<std::string>();
    if (node["command"]) entry.command = node["command"].as<std::string>();
    if (node["endpoint"]) entry.endpoint = node["endpoint"].as<std::string>();
    if (node["timeout_ms"]) entry.timeout_ms = node["timeout_ms"].as<int>();
    if (node["label"]) entry.label = node["label"].as<std::string>();
    return entry;
}

} // namespace

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::parseRoot(const YAML::Node& yaml) {
    if (!yaml["wipflow"]) {
        LOG(WARNING) << "Configuration has no top-level 'wipflow' section, keeping defaults";
        return;
    }
    auto root = yaml["wipflow"];

    // Scheduler
    if (root["scheduler"]) {
        auto scheduler = root["scheduler"];
        if (scheduler["release_minutes"]) {
            auto minutes = scheduler["release_minutes"];
            if (minutes["pap"]) config_.scheduler.pap_release_minutes.set(minutes["pap"].as<int>());
            if (minutes["pip"]) config_.scheduler.pip_release_minutes.set(minutes["pip"].as<int>());
            if (minutes["pipo"]) config_.scheduler.pipo_release_minutes.set(minutes["pipo"].as<int>());
        }
        if (scheduler["optimizer_timeout_ms"]) config_.scheduler.optimizer_timeout_ms.set(scheduler["optimizer_timeout_ms"].as<int>());
    }

    // Batch policy forwarded to optimizers
    if (root["batch_policy"]) {
        auto policy = root["batch_policy"];
        if (policy["q_min"]) config_.batch_policy.q_min.set(policy["q_min"].as<int>());
        if (policy["q_max"]) config_.batch_policy.q_max.set(policy["q_max"].as<int>());
        if (policy["horizon_minutes"]) config_.batch_policy.horizon_minutes.set(policy["horizon_minutes"].as<int>());
        if (policy["interval_minutes"]) config_.batch_policy.interval_minutes.set(policy["interval_minutes"].as<int>());
        if (policy["poisson_lambda"]) config_.batch_policy.poisson_lambda.set(policy["poisson_lambda"].as<int>());
    }

    // Optimizer
    if (root["optimizer"]) {
        auto optimizer = root["optimizer"];
        if (optimizer["kind"]) config_.optimizer.kind.set(optimizer["kind"].as<std::string>());
        if (optimizer["pap_command"]) config_.optimizer.pap_command.set(optimizer["pap_command"].as<std::string>());
        if (optimizer["pip_command"]) config_.optimizer.pip_command.set(optimizer["pip_command"].as<std::string>());
        if (optimizer["pipo_command"]) config_.optimizer.pipo_command.set(optimizer["pipo_command"].as<std::string>());
        if (optimizer["endpoint"]) config_.optimizer.endpoint.set(optimizer["endpoint"].as<std::string>());
    }

    // Log
    if (root["log"]) {
        auto log = root["log"];
        if (log["scheduling_log_path"]) config_.log.scheduling_log_path.set(log["scheduling_log_path"].as<std::string>());
        if (log["queue_capacity"]) config_.log.queue_capacity.set(log["queue_capacity"].as<size_t>());
    }

    // Clock
    if (root["clock"]) {
        auto clock = root["clock"];
        if (clock["sim_epoch"]) config_.clock.sim_epoch.set(clock["sim_epoch"].as<std::string>());
    }

    // Factories
    if (root["factories"]) {
        config_.factories.clear();
        for (const auto& node : root["factories"]) {
            FactoryEntry factory;
            factory.id = node["id"].as<std::string>();
            if (node["release_minutes"]) {
                auto minutes = node["release_minutes"];
                for (int i = 0; i < 3; ++i) {
                    if (minutes[kStageKeys[i]]) factory.release_minutes[i] = minutes[kStageKeys[i]].as<int>();
                }
            }
            if (node["optimizer"]) {
                auto optimizer = node["optimizer"];
                for (int i = 0; i < 3; ++i) {
                    if (optimizer[kStageKeys[i]]) factory.optimizer[i] = ParseOptimizerEntry(optimizer[kStageKeys[i]]);
                }
            }
            config_.factories.push_back(std::move(factory));
        }
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        parseRoot(yaml);
        return validateConfig();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file: " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        parseRoot(yaml);
        return validateConfig();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

int Configuration::getReleaseMinutes(int stage_index) const {
    switch (stage_index) {
        case 0: return config_.scheduler.pap_release_minutes.get();
        case 1: return config_.scheduler.pip_release_minutes.get();
        case 2: return config_.scheduler.pipo_release_minutes.get();
        default:
            LOG(ERROR) << "Unknown stage index " << stage_index;
            return 0;
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    for (int i = 0; i < 3; ++i) {
        if (getReleaseMinutes(i) < 0) {
            validation_errors_.push_back(std::string("Release minutes for ") + kStageKeys[i] + " must not be negative");
        }
    }

    if (config_.scheduler.optimizer_timeout_ms.get() <= 0) {
        validation_errors_.push_back("Optimizer timeout must be positive");
    }

    if (config_.batch_policy.q_min.get() < 1) {
        validation_errors_.push_back("Batch q_min must be at least 1");
    }

    if (config_.batch_policy.q_max.get() < config_.batch_policy.q_min.get()) {
        validation_errors_.push_back("Batch q_max cannot be smaller than q_min");
    }

    const std::string kind = config_.optimizer.kind.get();
    if (kind != "none" && kind != "process" && kind != "grpc") {
        validation_errors_.push_back("Optimizer kind must be one of none, process, grpc");
    }

    if (config_.log.queue_capacity.get() < 1) {
        validation_errors_.push_back("Scheduling log queue capacity must be at least 1");
    }

    for (const auto& factory : config_.factories) {
        if (factory.id.empty()) {
            validation_errors_.push_back("Factory entries need an id");
        }
        for (int i = 0; i < 3; ++i) {
            if (factory.release_minutes[i] && *factory.release_minutes[i] < 0) {
                validation_errors_.push_back("Factory " + factory.id + ": release minutes for " +
                        kStageKeys[i] + " must not be negative");
            }
            if (factory.optimizer[i]) {
                const auto& opt = *factory.optimizer[i];
                if (opt.kind == "process" && opt.command.empty()) {
                    validation_errors_.push_back("Factory " + factory.id + ": process optimizer for " +
                            kStageKeys[i] + " needs a command");
                }
                if (opt.kind != "none" && opt.kind != "process" && opt.kind != "grpc") {
                    validation_errors_.push_back("Factory " + factory.id + ": unknown optimizer kind " + opt.kind);
                }
            }
        }
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

bool Configuration::validateConfig() {
    return validate();
}

} // namespace Wipflow
