#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"
#include "common/config.h"
#include "common/task_executor.h"
#include "common/types.h"
#include "coordinator/agent.h"
#include "coordinator/ranking_policy.h"
#include "coordinator/tool.h"
#include "registry/capability_registry.h"

namespace Lockstep {

struct CoordinatorOptions {
    // Dispatched to every required agent that was not committed.
    Action default_action{{kHoldActionKey, true}};
    // More than one collects proposals on a worker pool.
    size_t proposal_workers = kDefaultProposalWorkers;
    // Registered tool called with "utility.<agent>" entries after ranking.
    std::string optimizer_tool;
};

struct PlanTelemetry {
    std::string policy;
    absl::btree_map<AgentId, double> utilities;
    std::vector<ScoredCandidate> ranked;
    std::optional<AgentId> selected;
    double selected_score = 0.0;
    absl::btree_map<AgentId, std::string> excluded;
    AttributeMap optimizer;

    // Flat view for telemetry sinks.
    AttributeMap ToAttributes() const;
};

struct Plan {
    std::vector<AgentId> committed;
    ActionMap actions;
    PlanTelemetry telemetry;

    std::string Summary() const;
};

/**
 * Collects one proposal from every registered agent, ranks the successful
 * ones and commits the best.
 *
 * Agents are enumerated in registry order, which is also the tie-break order.
 * An agent that fails to propose is left out of ranking for that step only.
 * The winner's action is dispatched to the winner; every other required agent
 * gets the default action. A step without any successful proposal yields an
 * all-default plan.
 */
class Coordinator {
public:
    /**
     * @throws ResolutionError if a registered agent or the optimizer tool cannot be built
     * @throws ConfigurationError if an agent's Id() disagrees with its registry name
     */
    Coordinator(CapabilityRegistry& registry, std::unique_ptr<IRankingPolicy> policy,
                CoordinatorOptions options = {});
    ~Coordinator();

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    /**
     * @param latest            merged transition the agents observe
     * @param required_agents   agents whose delegate needs an action this step
     */
    Plan Step(const Transition& latest, const std::vector<AgentId>& required_agents);

    // Proposals in registry order; never throws for a failing agent.
    std::vector<ProposalOutcome> CollectProposals(const Transition& latest);

    // Rank and build the plan from already collected outcomes.
    Plan Commit(const std::vector<ProposalOutcome>& outcomes, const Transition& latest,
                const std::vector<AgentId>& required_agents);

    const std::vector<std::shared_ptr<IAgent>>& agents() const { return agents_; }
    const IRankingPolicy& policy() const { return *policy_; }
    const CoordinatorOptions& options() const { return options_; }

private:
    ProposalOutcome ProposeOne(size_t index, const Observation& observation) const;
    void RunOptimizer(PlanTelemetry& telemetry) const;

    std::unique_ptr<IRankingPolicy> policy_;
    CoordinatorOptions options_;
    std::vector<std::shared_ptr<IAgent>> agents_;
    std::shared_ptr<ITool> optimizer_;
    std::unique_ptr<TaskExecutor> executor_;
};

} // namespace Lockstep
