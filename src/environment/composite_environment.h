#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "common/specs.h"
#include "common/types.h"
#include "environment/delegate_simulator.h"
#include "registry/build_context.h"

namespace Lockstep {

/**
 * What the composite does when a delegate's Step throws.
 *   kAbort  rethrow; the run aborts (default)
 *   kSkip   mark the delegate failed, hold its last transition, keep going
 * Deadline overruns are fatal under both policies.
 */
enum class DelegateStepPolicy {
    kAbort,
    kSkip,
};

const char* DelegateStepPolicyName(DelegateStepPolicy policy);

struct CompositeOptions {
    DelegateStepPolicy step_policy = DelegateStepPolicy::kAbort;
    std::chrono::milliseconds delegate_timeout{0};
};

/**
 * Fans one action bundle out to N delegates and merges what comes back.
 *
 * Delegates are stepped once per call in construction order. The merged
 * transition unions observations and rewards (agent ids are disjoint across
 * delegates), sets done as soon as any delegate is done, and files each
 * delegate's info payload under delegate_info[name] untouched. The composite's
 * own info carries the step counter as time_index.
 */
class CompositeEnvironment {
public:
    /**
     * @throws ConfigurationError on an empty delegate list or duplicate delegate names
     * @throws AgentIdCollisionError when two delegates claim the same agent id
     * @throws ResolutionError / ModelResolutionError from building a delegate
     */
    CompositeEnvironment(const std::vector<DelegateSpec>& specs, BuildContext& context,
                         CompositeOptions options = {});

    // Takes already-built delegates; the same disjointness rules apply.
    explicit CompositeEnvironment(std::vector<std::unique_ptr<DelegateSimulator>> delegates,
                                  CompositeOptions options = {});

    CompositeEnvironment(const CompositeEnvironment&) = delete;
    CompositeEnvironment& operator=(const CompositeEnvironment&) = delete;

    // Each delegate is reset with a seed derived from seed and its name.
    Transition Reset(std::optional<uint64_t> seed = std::nullopt);

    /**
     * @throws DelegateStepError under the abort policy
     * @throws DelegateTimeoutError under either policy
     */
    Transition Step(const ActionMap& actions);

    bool IsDone() const;

    // Every agent id in delegate order.
    std::vector<AgentId> AgentIds() const;
    // Agents whose delegate still accepts actions.
    std::vector<AgentId> ActiveAgentIds() const;

    size_t num_delegates() const { return delegates_.size(); }
    const DelegateSimulator& delegate(size_t index) const { return *delegates_[index]; }
    const DelegateSimulator* FindDelegate(const std::string& name) const;
    int64_t time_index() const { return time_index_; }
    const CompositeOptions& options() const { return options_; }

    /**
     * Fail-fast disjointness check over specs.
     *
     * @throws AgentIdCollisionError naming the agent and both delegates
     */
    static void CheckAgentIdsDisjoint(const std::vector<DelegateSpec>& specs);

private:
    void IndexOwners();
    std::vector<ActionMap> Partition(const ActionMap& actions) const;
    void MergeInto(Transition& merged, size_t index, const Transition& part) const;

    CompositeOptions options_;
    std::vector<std::unique_ptr<DelegateSimulator>> delegates_;
    absl::flat_hash_map<AgentId, size_t> owner_;
    int64_t time_index_ = 0;
};

} // namespace Lockstep
