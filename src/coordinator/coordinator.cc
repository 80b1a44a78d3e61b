#include "coordinator.h"

#include <cmath>
#include <future>

#include <glog/logging.h>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "common/errors.h"

namespace Lockstep {

namespace {

constexpr char kUtilityPrefix[] = "utility.";

const Observation& SliceFor(const Transition& latest, const AgentId& agent_id) {
    static const Observation kEmpty;
    auto it = latest.observations.find(agent_id);
    return it == latest.observations.end() ? kEmpty : it->second;
}

} // namespace

AttributeMap PlanTelemetry::ToAttributes() const {
    AttributeMap out;
    out["policy"] = policy;
    out["selected"] = selected.value_or(std::string());
    out["selected_score"] = selected_score;
    for (const auto& [agent_id, utility] : utilities) {
        out[absl::StrCat(kUtilityPrefix, agent_id)] = utility;
    }
    std::vector<std::string> order;
    for (const ScoredCandidate& candidate : ranked) {
        order.push_back(candidate.agent_id);
    }
    out["ranked"] = absl::StrJoin(order, ",");
    for (const auto& [agent_id, cause] : excluded) {
        out[absl::StrCat("excluded.", agent_id)] = cause;
    }
    for (const auto& [key, value] : optimizer) {
        out[absl::StrCat("optimizer.", key)] = value;
    }
    return out;
}

std::string Plan::Summary() const {
    return absl::StrCat("committed=[", absl::StrJoin(committed, ","), "] actions=", actions.size(),
                        " excluded=", telemetry.excluded.size());
}

Coordinator::Coordinator(CapabilityRegistry& registry, std::unique_ptr<IRankingPolicy> policy,
                         CoordinatorOptions options)
    : policy_(std::move(policy)), options_(std::move(options)) {
    if (!policy_) {
        policy_ = std::make_unique<MaxUtilityPolicy>();
    }
    for (const std::string& name : registry.ListAgents()) {
        auto agent = registry.Resolve<IAgent>(name);
        if (agent->Id() != name) {
            throw ConfigurationError(absl::StrCat("Agent registered as '", name, "' reports id '",
                                                  agent->Id(), "'"));
        }
        agents_.push_back(std::move(agent));
    }
    if (!options_.optimizer_tool.empty()) {
        optimizer_ = registry.Resolve<ITool>(options_.optimizer_tool);
    }
    if (options_.proposal_workers > 1 && agents_.size() > 1) {
        executor_ = std::make_unique<TaskExecutor>(options_.proposal_workers);
    }
    LOG(INFO) << "Coordinator: " << agents_.size() << " agent(s), policy " << policy_->Name()
              << ", " << (executor_ ? options_.proposal_workers : 1) << " proposal worker(s)";
}

Coordinator::~Coordinator() {
    if (executor_) {
        executor_->Stop();
    }
}

ProposalOutcome Coordinator::ProposeOne(size_t index, const Observation& observation) const {
    IAgent& agent = *agents_[index];
    ProposalOutcome outcome{agent.Id(), index, absl::UnknownError("not proposed")};
    try {
        Proposal proposal = agent.Propose(observation);
        if (proposal.agent_id.empty()) {
            proposal.agent_id = agent.Id();
        }
        if (proposal.agent_id != agent.Id()) {
            outcome.proposal = absl::InvalidArgumentError(
                absl::StrCat("proposal names agent '", proposal.agent_id, "'"));
        } else if (!std::isfinite(proposal.utility)) {
            outcome.proposal = absl::InvalidArgumentError(absl::StrCat("utility is not finite: ", proposal.utility));
        } else {
            outcome.proposal = std::move(proposal);
        }
    } catch (const ProposalError& e) {
        outcome.proposal = absl::UnavailableError(e.what());
    } catch (const std::exception& e) {
        outcome.proposal = absl::InternalError(e.what());
    }
    return outcome;
}

std::vector<ProposalOutcome> Coordinator::CollectProposals(const Transition& latest) {
    std::vector<ProposalOutcome> outcomes;
    outcomes.reserve(agents_.size());

    if (!executor_) {
        for (size_t i = 0; i < agents_.size(); ++i) {
            outcomes.push_back(ProposeOne(i, SliceFor(latest, agents_[i]->Id())));
        }
        return outcomes;
    }

    std::vector<std::future<ProposalOutcome>> pending;
    pending.reserve(agents_.size());
    for (size_t i = 0; i < agents_.size(); ++i) {
        const Observation& slice = SliceFor(latest, agents_[i]->Id());
        pending.push_back(executor_->Submit([this, i, &slice]() { return ProposeOne(i, slice); }));
    }
    // Drained in submission order, which is registry order.
    for (auto& future : pending) {
        outcomes.push_back(future.get());
    }
    return outcomes;
}

Plan Coordinator::Commit(const std::vector<ProposalOutcome>& outcomes, const Transition& latest,
                         const std::vector<AgentId>& required_agents) {
    Plan plan;
    plan.telemetry.policy = policy_->Name();

    std::vector<Candidate> candidates;
    for (const ProposalOutcome& outcome : outcomes) {
        if (!outcome.proposal.ok()) {
            LOG(WARNING) << "Agent '" << outcome.agent_id << "' excluded from ranking: "
                         << outcome.proposal.status().message();
            plan.telemetry.excluded[outcome.agent_id] = std::string(outcome.proposal.status().message());
            continue;
        }
        plan.telemetry.utilities[outcome.agent_id] = outcome.proposal->utility;
        candidates.push_back({outcome.registry_index, &*outcome.proposal});
    }

    plan.telemetry.ranked = RankCandidates(*policy_, candidates);
    if (!plan.telemetry.ranked.empty()) {
        const ScoredCandidate& winner = plan.telemetry.ranked.front();
        plan.telemetry.selected = winner.agent_id;
        plan.telemetry.selected_score = winner.score;
        plan.committed.push_back(winner.agent_id);
        for (const Candidate& candidate : candidates) {
            if (candidate.registry_index == winner.registry_index) {
                plan.actions[winner.agent_id] = candidate.proposal->action;
                break;
            }
        }
    }

    absl::flat_hash_set<AgentId> known;
    for (const auto& agent : agents_) {
        known.insert(agent->Id());
    }
    for (const AgentId& agent_id : required_agents) {
        if (plan.actions.contains(agent_id)) {
            continue;
        }
        if (!known.contains(agent_id) && !latest.observations.contains(agent_id)) {
            continue;
        }
        plan.actions[agent_id] = options_.default_action;
    }

    if (optimizer_) {
        RunOptimizer(plan.telemetry);
    }
    VLOG(1) << "[Coordinator] " << plan.Summary() << " selected="
            << plan.telemetry.selected.value_or("<none>") << " score=" << plan.telemetry.selected_score;
    return plan;
}

Plan Coordinator::Step(const Transition& latest, const std::vector<AgentId>& required_agents) {
    return Commit(CollectProposals(latest), latest, required_agents);
}

void Coordinator::RunOptimizer(PlanTelemetry& telemetry) const {
    AttributeMap args;
    for (const auto& [agent_id, utility] : telemetry.utilities) {
        args[absl::StrCat(kUtilityPrefix, agent_id)] = utility;
    }
    try {
        telemetry.optimizer = optimizer_->Call(args);
    } catch (const std::exception& e) {
        LOG(WARNING) << "Optimizer tool '" << optimizer_->Name() << "' failed: " << e.what();
        telemetry.optimizer.clear();
        telemetry.optimizer["error"] = std::string(e.what());
    }
}

} // namespace Lockstep
