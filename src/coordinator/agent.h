#pragma once

#include <functional>
#include <memory>
#include <string>

#include "absl/status/statusor.h"
#include "common/specs.h"
#include "common/types.h"

namespace Lockstep {

/**
 * One agent's bid for a step: the action it wants committed, a scalar
 * utility estimate, and free-form metadata (ranking policies read
 * "estimate.<metric>" entries from it). Lives for one coordinator step.
 */
struct Proposal {
    AgentId agent_id;
    Action action;
    double utility = 0.0;
    AttributeMap metadata;
};

/**
 * Result of asking one agent for a proposal. Failures carry the cause as a
 * non-OK status so ranking never sees an exception.
 */
struct ProposalOutcome {
    AgentId agent_id;
    size_t registry_index = 0;
    absl::StatusOr<Proposal> proposal;
};

class IAgent {
public:
    virtual ~IAgent() = default;

    virtual const AgentId& Id() const = 0;

    // observation is this agent's slice of the merged transition; empty when
    // the agent is not owned by any delegate.
    // @throws ProposalError (or any std::exception) when no proposal can be made
    virtual Proposal Propose(const Observation& observation) = 0;

    // Merged transition after every environment step.
    virtual void Feedback(const Transition& transition) {}
};

// Registered under a reference (kFactory); builds one agent per AgentSpec.
using AgentFactory = std::function<std::shared_ptr<IAgent>(const AgentSpec& spec)>;

} // namespace Lockstep
