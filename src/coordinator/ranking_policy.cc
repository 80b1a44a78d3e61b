#include "ranking_policy.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include "absl/strings/str_cat.h"
#include "common/errors.h"

namespace Lockstep {

namespace {

constexpr char kEstimatePrefix[] = "estimate.";

} // namespace

std::vector<ScoredCandidate> RankCandidates(const IRankingPolicy& policy,
                                            const std::vector<Candidate>& candidates) {
    std::vector<ScoredCandidate> ranked;
    ranked.reserve(candidates.size());
    for (const Candidate& candidate : candidates) {
        double score = policy.Score(*candidate.proposal);
        if (std::isnan(score)) {
            score = -std::numeric_limits<double>::infinity();
        }
        ranked.push_back({candidate.proposal->agent_id, candidate.registry_index, score});
    }
    std::sort(ranked.begin(), ranked.end(), [](const ScoredCandidate& a, const ScoredCandidate& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        return a.registry_index < b.registry_index;
    });
    return ranked;
}

absl::btree_map<std::string, double> NormalizeWeights(const absl::btree_map<std::string, double>& weights) {
    absl::btree_map<std::string, double> normalized;
    double total = 0.0;
    for (const auto& [metric, weight] : weights) {
        if (weight > 0.0 && std::isfinite(weight)) {
            normalized.emplace(metric, weight);
            total += weight;
        }
    }
    for (auto& [metric, weight] : normalized) {
        weight /= total;
    }
    return normalized;
}

WeightedMetricsPolicy::WeightedMetricsPolicy(const absl::btree_map<std::string, double>& weights)
    : weights_(NormalizeWeights(weights)) {
    if (weights_.empty()) {
        throw ConfigurationError("weighted_metrics policy needs at least one positive metric weight");
    }
}

double WeightedMetricsPolicy::Score(const Proposal& proposal) const {
    double score = 0.0;
    for (const auto& [metric, weight] : weights_) {
        score += weight * GetNumber(proposal.metadata, absl::StrCat(kEstimatePrefix, metric), 0.0);
    }
    return score;
}

std::unique_ptr<IRankingPolicy> MakeRankingPolicy(const std::string& name,
                                                  const absl::btree_map<std::string, double>& weights) {
    if (name.empty() || name == "max_utility") {
        return std::make_unique<MaxUtilityPolicy>();
    }
    if (name == "weighted_metrics") {
        return std::make_unique<WeightedMetricsPolicy>(weights);
    }
    throw UnknownCapabilityError(name);
}

} // namespace Lockstep
