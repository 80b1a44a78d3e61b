#pragma once

#include <string>

#include "coordinator/agent.h"
#include "coordinator/tool.h"
#include "registry/capability_registry.h"

namespace Lockstep {

/**
 * Closed-loop transmit power controller.
 *
 * Params: target_snr_db (default 10), min_power (default 0.01),
 * max_power (default 10).
 *
 * Proposes the power that would move the observed snr_db onto the target and
 * bids the expected reduction of |snr - target| as its utility. Metadata
 * carries higher-is-better estimates for the weighted policy:
 * estimate.throughput (log2(1 + predicted SNR)), estimate.energy (negated
 * power) and estimate.latency (negated inverse throughput).
 */
class PowerControlAgent : public IAgent {
public:
    PowerControlAgent(AgentId id, const AttributeMap& params);

    const AgentId& Id() const override { return id_; }
    Proposal Propose(const Observation& observation) override;
    void Feedback(const Transition& transition) override;

    double target_snr_db() const { return target_snr_db_; }
    double cumulative_reward() const { return cumulative_reward_; }

private:
    AgentId id_;
    double target_snr_db_;
    double min_power_;
    double max_power_;
    double cumulative_reward_ = 0.0;
};

// Always bids the hold action at a fixed utility (param "utility", default 0).
class HoldAgent : public IAgent {
public:
    HoldAgent(AgentId id, const AttributeMap& params);

    const AgentId& Id() const override { return id_; }
    Proposal Propose(const Observation& observation) override;

private:
    AgentId id_;
    double utility_;
};

/**
 * Turns "utility.<agent>" arguments into "share.<agent>" softmax weights.
 * Param: temperature (> 0, default 1).
 */
class SoftmaxAllocatorTool : public ITool {
public:
    SoftmaxAllocatorTool(std::string name, const AttributeMap& params);

    const std::string& Name() const override { return name_; }
    AttributeMap Call(const AttributeMap& args) override;

private:
    std::string name_;
    double temperature_;
};

// Registers the agent and tool factories above under their qualified names and aliases.
void RegisterBuiltinAgents(CapabilityRegistry& registry);

} // namespace Lockstep
