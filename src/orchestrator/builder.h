#pragma once

#include <vector>

#include "common/configuration.h"
#include "common/specs.h"
#include "coordinator/coordinator.h"
#include "environment/composite_environment.h"
#include "registry/capability_registry.h"

namespace Lockstep {

// Built-in simulators, agents and tools. Names already present are left alone.
void RegisterBuiltinCapabilities(CapabilityRegistry& registry);

/**
 * Build every configured agent from its factory and register it under its id.
 *
 * @throws UnknownCapabilityError / ResolutionError for an unknown reference
 * @throws ResolutionError when a factory throws or returns null
 * @throws ConfigurationError when an id is already registered
 */
void InstantiateAgents(const std::vector<AgentSpec>& specs, CapabilityRegistry& registry);
void InstantiateTools(const std::vector<ToolSpec>& specs, CapabilityRegistry& registry);

// @throws ConfigurationError on an unknown step policy name
DelegateStepPolicy ParseDelegateStepPolicy(const std::string& name);

CompositeOptions CompositeOptionsFrom(const LockstepConfig& config);
CoordinatorOptions CoordinatorOptionsFrom(const LockstepConfig& config);

} // namespace Lockstep
