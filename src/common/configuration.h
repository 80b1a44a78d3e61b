#ifndef LOCKSTEP_CONFIGURATION_H_
#define LOCKSTEP_CONFIGURATION_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"
#include "common/config.h"
#include "common/specs.h"
#include "common/types.h"

namespace YAML {
class Node;
}

namespace Lockstep {

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
 * Everything one orchestrator run is built from.
 *
 * Document layout (YAML, top-level key "lockstep"):
 *
 *   lockstep:
 *     run:          {max_steps, seed, proposal_workers, delegate_step_policy, delegate_timeout_ms}
 *     coordinator:  {policy, metric_weights, default_action, optimizer_tool}
 *     agents:       [{id, reference, params}]
 *     tools:        [{name, reference, params}]
 *     delegates:    [{name, reference, agent_ids, args, kwargs, seed,
 *                     fading_models: [{channel_id, type | reference, kwargs}],
 *                     mobility_models: [{agent_id, type | reference, kwargs}]}]
 */
struct LockstepConfig {
    struct Run {
        ConfigValue<int> max_steps{static_cast<int>(kDefaultMaxSteps), "LOCKSTEP_MAX_STEPS"};
        ConfigValue<size_t> seed{kDefaultSeed, "LOCKSTEP_SEED"};
        ConfigValue<int> proposal_workers{kDefaultProposalWorkers, "LOCKSTEP_PROPOSAL_WORKERS"};
        // abort | skip
        ConfigValue<std::string> delegate_step_policy{"abort", "LOCKSTEP_DELEGATE_STEP_POLICY"};
        ConfigValue<int> delegate_timeout_ms{static_cast<int>(kDefaultDelegateTimeoutMs),
                                             "LOCKSTEP_DELEGATE_TIMEOUT_MS"};
    } run;

    struct Coordinator {
        std::string policy = "max_utility";
        absl::btree_map<std::string, double> metric_weights;
        Action default_action{{kHoldActionKey, true}};
        std::string optimizer_tool;
    } coordinator;

    std::vector<AgentSpec> agents;
    std::vector<ToolSpec> tools;
    std::vector<DelegateSpec> delegates;
};

/**
 * Loads a LockstepConfig from a YAML document.
 *
 * Not a process-wide singleton: each run owns its Configuration, so two runs
 * in one process never share settings.
 */
class Configuration {
public:
    Configuration() = default;

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    const LockstepConfig& config() const { return config_; }
    LockstepConfig& config() { return config_; }

    // Helper methods for common access patterns
    int getMaxSteps() const { return config_.run.max_steps.get(); }
    uint64_t getSeed() const { return config_.run.seed.get(); }
    int getProposalWorkers() const { return config_.run.proposal_workers.get(); }

    // Message of the last failed load, empty after a successful one.
    const std::string& last_error() const { return last_error_; }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    bool load(const YAML::Node& document, const std::string& source);
    void parseRoot(const YAML::Node& root);

    LockstepConfig config_;
    std::string last_error_;
    mutable std::vector<std::string> validation_errors_;
};

/**
 * Converts a YAML scalar or numeric sequence into an Attribute. Quoted
 * scalars stay strings; unquoted ones are tried as integer, double, bool.
 *
 * @throws ConfigurationError for maps, mixed sequences and null nodes
 */
Attribute AttributeFromYaml(const YAML::Node& node, const std::string& where);
AttributeMap AttributeMapFromYaml(const YAML::Node& node, const std::string& where);

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Lockstep

#endif // LOCKSTEP_CONFIGURATION_H_
