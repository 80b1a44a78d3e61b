#include "builder.h"

#include <algorithm>

#include <glog/logging.h>

#include "absl/strings/str_cat.h"
#include "common/errors.h"
#include "coordinator/builtin_agents.h"
#include "environment/toy_radio_simulator.h"

namespace Lockstep {

namespace {

constexpr char kToyRadioReference[] = "lockstep.sims.ToyRadioSimulator";
constexpr char kToyRadioAlias[] = "toy_radio";
constexpr char kPowerControlReference[] = "lockstep.agents.PowerControlAgent";

template<typename Product, typename Factory, typename Spec>
std::shared_ptr<Product> Build(CapabilityRegistry& registry, const Spec& spec, const std::string& label) {
    auto factory = registry.Resolve<Factory>(spec.reference);
    std::shared_ptr<Product> product;
    try {
        product = (*factory)(spec);
    } catch (const ConfigurationError&) {
        throw;
    } catch (const std::exception& e) {
        throw ResolutionError(absl::StrCat(label, ": constructing '", spec.reference, "' failed: ", e.what()));
    }
    if (!product) {
        throw ResolutionError(absl::StrCat(label, ": factory '", spec.reference, "' returned null"));
    }
    return product;
}

} // namespace

void RegisterBuiltinCapabilities(CapabilityRegistry& registry) {
    auto toy_radio = std::make_shared<SimulatorFactory>(&ToyRadioSimulator::Create);
    for (const char* name : {kToyRadioReference, kToyRadioAlias}) {
        if (!registry.Contains(name)) {
            registry.RegisterInstance<SimulatorFactory>(name, CapabilityKind::kFactory, toy_radio);
        }
    }
    if (!registry.Contains(kPowerControlReference)) {
        RegisterBuiltinAgents(registry);
    }
}

void InstantiateAgents(const std::vector<AgentSpec>& specs, CapabilityRegistry& registry) {
    for (const AgentSpec& spec : specs) {
        if (spec.id.empty()) {
            throw ConfigurationError("Agent spec without an id");
        }
        auto agent = Build<IAgent, AgentFactory>(registry, spec, absl::StrCat("Agent '", spec.id, "'"));
        if (agent->Id() != spec.id) {
            throw ConfigurationError(absl::StrCat("Agent '", spec.id, "' built with id '", agent->Id(), "'"));
        }
        registry.RegisterInstance<IAgent>(spec.id, CapabilityKind::kAgent, agent);
        VLOG(1) << "[InstantiateAgents] " << spec.id << " <- " << spec.reference;
    }
}

void InstantiateTools(const std::vector<ToolSpec>& specs, CapabilityRegistry& registry) {
    for (const ToolSpec& spec : specs) {
        if (spec.name.empty()) {
            throw ConfigurationError("Tool spec without a name");
        }
        auto tool = Build<ITool, ToolFactory>(registry, spec, absl::StrCat("Tool '", spec.name, "'"));
        registry.RegisterInstance<ITool>(spec.name, CapabilityKind::kTool, tool);
        VLOG(1) << "[InstantiateTools] " << spec.name << " <- " << spec.reference;
    }
}

DelegateStepPolicy ParseDelegateStepPolicy(const std::string& name) {
    if (name == "abort") {
        return DelegateStepPolicy::kAbort;
    }
    if (name == "skip") {
        return DelegateStepPolicy::kSkip;
    }
    throw ConfigurationError(absl::StrCat("Unknown delegate step policy '", name, "'"));
}

CompositeOptions CompositeOptionsFrom(const LockstepConfig& config) {
    CompositeOptions options;
    options.step_policy = ParseDelegateStepPolicy(config.run.delegate_step_policy.get());
    options.delegate_timeout = std::chrono::milliseconds(config.run.delegate_timeout_ms.get());
    return options;
}

CoordinatorOptions CoordinatorOptionsFrom(const LockstepConfig& config) {
    CoordinatorOptions options;
    options.default_action = config.coordinator.default_action;
    options.proposal_workers = static_cast<size_t>(std::max(1, config.run.proposal_workers.get()));
    options.optimizer_tool = config.coordinator.optimizer_tool;
    return options;
}

} // namespace Lockstep
