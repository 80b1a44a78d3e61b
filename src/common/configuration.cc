#include "configuration.h"

#include <algorithm>
#include <cstdlib>

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"
#include "common/errors.h"

namespace Lockstep {

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

std::string RequireString(const YAML::Node& node, const char* key, const std::string& where) {
    if (!node[key] || !node[key].IsScalar()) {
        throw ConfigurationError(absl::StrCat(where, ": missing required key '", key, "'"));
    }
    return node[key].as<std::string>();
}

std::string OptionalString(const YAML::Node& node, const char* key) {
    return node[key] ? node[key].as<std::string>() : std::string();
}

std::vector<std::string> StringList(const YAML::Node& node, const std::string& where) {
    if (!node.IsSequence()) {
        throw ConfigurationError(absl::StrCat(where, " must be a list"));
    }
    std::vector<std::string> values;
    for (const auto& item : node) {
        values.push_back(item.as<std::string>());
    }
    return values;
}

ModelSpec ParseModelSpec(const YAML::Node& node, const char* target_key, const std::string& where) {
    if (!node.IsMap()) {
        throw ConfigurationError(absl::StrCat(where, " must be a mapping"));
    }
    ModelSpec spec;
    spec.target_id = RequireString(node, target_key, where);

    bool has_type = static_cast<bool>(node["type"]);
    bool has_reference = static_cast<bool>(node["reference"]);
    if (has_type == has_reference) {
        throw ConfigurationError(absl::StrCat(where, ": exactly one of 'type' or 'reference' is required"));
    }
    std::string name = has_type ? node["type"].as<std::string>() : node["reference"].as<std::string>();
    if (has_reference || IsQualifiedReference(name)) {
        spec.ref = QualifiedReference{name};
    } else {
        spec.ref = BuiltinAlias{name};
    }
    if (node["kwargs"]) {
        spec.parameters = AttributeMapFromYaml(node["kwargs"], absl::StrCat(where, ".kwargs"));
    }
    return spec;
}

std::vector<ModelSpec> ParseModelList(const YAML::Node& node, const char* target_key, const std::string& where) {
    std::vector<ModelSpec> specs;
    if (!node) {
        return specs;
    }
    if (!node.IsSequence()) {
        throw ConfigurationError(absl::StrCat(where, " must be a list"));
    }
    for (size_t i = 0; i < node.size(); ++i) {
        specs.push_back(ParseModelSpec(node[i], target_key, absl::StrCat(where, "[", i, "]")));
    }
    return specs;
}

DelegateSpec ParseDelegate(const YAML::Node& node, const std::string& where) {
    if (!node.IsMap()) {
        throw ConfigurationError(absl::StrCat(where, " must be a mapping"));
    }
    DelegateSpec spec;
    spec.name = RequireString(node, "name", where);
    spec.reference = RequireString(node, "reference", where);
    if (!node["agent_ids"]) {
        throw ConfigurationError(absl::StrCat(where, ": missing required key 'agent_ids'"));
    }
    spec.agent_ids = StringList(node["agent_ids"], absl::StrCat(where, ".agent_ids"));
    if (node["args"]) {
        if (!node["args"].IsSequence()) {
            throw ConfigurationError(absl::StrCat(where, ".args must be a list"));
        }
        for (size_t i = 0; i < node["args"].size(); ++i) {
            spec.constructor_args.push_back(
                AttributeFromYaml(node["args"][i], absl::StrCat(where, ".args[", i, "]")));
        }
    }
    if (node["kwargs"]) {
        spec.constructor_kwargs = AttributeMapFromYaml(node["kwargs"], absl::StrCat(where, ".kwargs"));
    }
    if (node["seed"]) {
        spec.seed = node["seed"].as<uint64_t>();
    }
    spec.fading_overrides = ParseModelList(node["fading_models"], "channel_id", absl::StrCat(where, ".fading_models"));
    spec.mobility_overrides = ParseModelList(node["mobility_models"], "agent_id", absl::StrCat(where, ".mobility_models"));
    return spec;
}

} // namespace

Attribute AttributeFromYaml(const YAML::Node& node, const std::string& where) {
    if (node.IsScalar()) {
        // "!" is the tag yaml-cpp gives quoted scalars.
        if (node.Tag() == "!") {
            return node.as<std::string>();
        }
        int64_t integer = 0;
        if (YAML::convert<int64_t>::decode(node, integer)) {
            return integer;
        }
        double number = 0.0;
        if (YAML::convert<double>::decode(node, number)) {
            return number;
        }
        bool flag = false;
        if (YAML::convert<bool>::decode(node, flag)) {
            return flag;
        }
        return node.as<std::string>();
    }
    if (node.IsSequence()) {
        std::vector<double> values;
        for (const auto& item : node) {
            double number = 0.0;
            if (!item.IsScalar() || !YAML::convert<double>::decode(item, number)) {
                throw ConfigurationError(absl::StrCat(where, ": lists may only hold numbers"));
            }
            values.push_back(number);
        }
        return values;
    }
    throw ConfigurationError(absl::StrCat(where, ": expected a scalar or a list of numbers"));
}

AttributeMap AttributeMapFromYaml(const YAML::Node& node, const std::string& where) {
    AttributeMap map;
    if (node.IsNull()) {
        return map;
    }
    if (!node.IsMap()) {
        throw ConfigurationError(absl::StrCat(where, " must be a mapping"));
    }
    for (const auto& entry : node) {
        std::string key = entry.first.as<std::string>();
        map[key] = AttributeFromYaml(entry.second, absl::StrCat(where, ".", key));
    }
    return map;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        return load(YAML::LoadFile(filename), filename);
    } catch (const YAML::Exception& e) {
        last_error_ = absl::StrCat("Failed to parse configuration file ", filename, ": ", e.what());
        LOG(ERROR) << last_error_;
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        return load(YAML::Load(yaml_content), "<string>");
    } catch (const YAML::Exception& e) {
        last_error_ = absl::StrCat("Failed to parse configuration string: ", e.what());
        LOG(ERROR) << last_error_;
        return false;
    }
}

bool Configuration::load(const YAML::Node& document, const std::string& source) {
    last_error_.clear();
    if (!document["lockstep"]) {
        last_error_ = absl::StrCat(source, ": missing top-level 'lockstep' key");
        LOG(ERROR) << last_error_;
        return false;
    }
    LockstepConfig parsed;
    std::swap(parsed, config_);
    try {
        parseRoot(document["lockstep"]);
    } catch (const ConfigurationError& e) {
        std::swap(parsed, config_);
        last_error_ = absl::StrCat(source, ": ", e.what());
        LOG(ERROR) << last_error_;
        return false;
    } catch (const YAML::Exception& e) {
        std::swap(parsed, config_);
        last_error_ = absl::StrCat(source, ": ", e.what());
        LOG(ERROR) << last_error_;
        return false;
    }
    if (!validate()) {
        // validation_errors_ keeps describing the rejected document
        std::swap(parsed, config_);
        last_error_ = absl::StrCat(source, ": ", validation_errors_.front());
        for (const std::string& error : validation_errors_) {
            LOG(ERROR) << "Invalid configuration: " << error;
        }
        return false;
    }
    return true;
}

void Configuration::parseRoot(const YAML::Node& root) {
    // Run
    if (root["run"]) {
        auto run = root["run"];
        if (run["max_steps"]) config_.run.max_steps.set(run["max_steps"].as<int>());
        if (run["seed"]) config_.run.seed.set(run["seed"].as<size_t>());
        if (run["proposal_workers"]) config_.run.proposal_workers.set(run["proposal_workers"].as<int>());
        if (run["delegate_step_policy"]) config_.run.delegate_step_policy.set(run["delegate_step_policy"].as<std::string>());
        if (run["delegate_timeout_ms"]) config_.run.delegate_timeout_ms.set(run["delegate_timeout_ms"].as<int>());
    }

    // Coordinator
    if (root["coordinator"]) {
        auto coordinator = root["coordinator"];
        if (coordinator["policy"]) config_.coordinator.policy = coordinator["policy"].as<std::string>();
        if (coordinator["optimizer_tool"]) config_.coordinator.optimizer_tool = coordinator["optimizer_tool"].as<std::string>();
        if (coordinator["default_action"]) {
            config_.coordinator.default_action =
                AttributeMapFromYaml(coordinator["default_action"], "coordinator.default_action");
        }
        if (coordinator["metric_weights"]) {
            for (const auto& entry : coordinator["metric_weights"]) {
                config_.coordinator.metric_weights[entry.first.as<std::string>()] = entry.second.as<double>();
            }
        }
    }

    // Agents
    if (root["agents"]) {
        auto agents = root["agents"];
        for (size_t i = 0; i < agents.size(); ++i) {
            std::string where = absl::StrCat("agents[", i, "]");
            AgentSpec spec;
            spec.id = RequireString(agents[i], "id", where);
            spec.reference = RequireString(agents[i], "reference", where);
            if (agents[i]["params"]) spec.params = AttributeMapFromYaml(agents[i]["params"], where + ".params");
            config_.agents.push_back(std::move(spec));
        }
    }

    // Tools
    if (root["tools"]) {
        auto tools = root["tools"];
        for (size_t i = 0; i < tools.size(); ++i) {
            std::string where = absl::StrCat("tools[", i, "]");
            ToolSpec spec;
            spec.name = RequireString(tools[i], "name", where);
            spec.reference = RequireString(tools[i], "reference", where);
            if (tools[i]["params"]) spec.params = AttributeMapFromYaml(tools[i]["params"], where + ".params");
            config_.tools.push_back(std::move(spec));
        }
    }

    // Delegates
    if (root["delegates"]) {
        auto delegates = root["delegates"];
        if (!delegates.IsSequence()) {
            throw ConfigurationError("delegates must be a list");
        }
        for (size_t i = 0; i < delegates.size(); ++i) {
            config_.delegates.push_back(ParseDelegate(delegates[i], absl::StrCat("delegates[", i, "]")));
        }
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.run.max_steps.get() < 0) {
        validation_errors_.push_back("run.max_steps must be >= 0");
    }
    if (config_.run.proposal_workers.get() < 1) {
        validation_errors_.push_back("run.proposal_workers must be at least 1");
    }
    if (config_.run.delegate_timeout_ms.get() < 0) {
        validation_errors_.push_back("run.delegate_timeout_ms must be >= 0");
    }
    std::string policy = config_.run.delegate_step_policy.get();
    if (policy != "abort" && policy != "skip") {
        validation_errors_.push_back("run.delegate_step_policy must be 'abort' or 'skip', got '" + policy + "'");
    }

    if (config_.delegates.empty()) {
        validation_errors_.push_back("at least one delegate is required");
    }

    absl::flat_hash_set<std::string> agent_ids;
    for (const AgentSpec& agent : config_.agents) {
        if (!agent_ids.insert(agent.id).second) {
            validation_errors_.push_back("duplicate agent id '" + agent.id + "'");
        }
    }
    absl::flat_hash_set<std::string> tool_names;
    for (const ToolSpec& tool : config_.tools) {
        if (!tool_names.insert(tool.name).second) {
            validation_errors_.push_back("duplicate tool name '" + tool.name + "'");
        }
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Lockstep
