#pragma once

#include <memory>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"
#include "coordinator/agent.h"

namespace Lockstep {

struct Candidate {
    size_t registry_index = 0;
    const Proposal* proposal = nullptr;
};

struct ScoredCandidate {
    AgentId agent_id;
    size_t registry_index = 0;
    double score = 0.0;
};

/**
 * Scores one proposal. Ordering is done by RankCandidates so every policy
 * shares the same tie-break.
 */
class IRankingPolicy {
public:
    virtual ~IRankingPolicy() = default;

    virtual std::string Name() const = 0;
    virtual double Score(const Proposal& proposal) const = 0;
};

/**
 * Highest score first; equal scores resolve to the lower registry index.
 * The result depends only on the set of candidates, not on their order.
 */
std::vector<ScoredCandidate> RankCandidates(const IRankingPolicy& policy,
                                            const std::vector<Candidate>& candidates);

class MaxUtilityPolicy : public IRankingPolicy {
public:
    std::string Name() const override { return "max_utility"; }
    double Score(const Proposal& proposal) const override { return proposal.utility; }
};

/**
 * Scores a proposal by the weighted sum of its "estimate.<metric>" metadata.
 * Weights are normalized to sum to one; non-positive weights are dropped.
 * A metric missing from a proposal contributes zero.
 */
class WeightedMetricsPolicy : public IRankingPolicy {
public:
    // @throws ConfigurationError if no positive weight remains
    explicit WeightedMetricsPolicy(const absl::btree_map<std::string, double>& weights);

    std::string Name() const override { return "weighted_metrics"; }
    double Score(const Proposal& proposal) const override;

    const absl::btree_map<std::string, double>& weights() const { return weights_; }

private:
    absl::btree_map<std::string, double> weights_;
};

absl::btree_map<std::string, double> NormalizeWeights(const absl::btree_map<std::string, double>& weights);

// "max_utility" or "weighted_metrics"; @throws ConfigurationError otherwise
std::unique_ptr<IRankingPolicy> MakeRankingPolicy(const std::string& name,
                                                  const absl::btree_map<std::string, double>& weights);

} // namespace Lockstep
