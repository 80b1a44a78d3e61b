#include "composite_environment.h"

#include <glog/logging.h>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"
#include "common/errors.h"

namespace Lockstep {

namespace {

constexpr char kTimeIndexKey[] = "time_index";
constexpr char kFailedPrefix[] = "failed.";

std::vector<DelegateSpec> SpecsOf(const std::vector<std::unique_ptr<DelegateSimulator>>& delegates) {
    std::vector<DelegateSpec> specs;
    specs.reserve(delegates.size());
    for (const auto& delegate : delegates) {
        if (!delegate) {
            throw ConfigurationError("Composite environment given a null delegate");
        }
        DelegateSpec spec;
        spec.name = delegate->name();
        spec.agent_ids = delegate->agent_ids();
        specs.push_back(std::move(spec));
    }
    return specs;
}

} // namespace

const char* DelegateStepPolicyName(DelegateStepPolicy policy) {
    switch (policy) {
        case DelegateStepPolicy::kAbort:
            return "abort";
        case DelegateStepPolicy::kSkip:
            return "skip";
    }
    return "unknown";
}

void CompositeEnvironment::CheckAgentIdsDisjoint(const std::vector<DelegateSpec>& specs) {
    if (specs.empty()) {
        throw ConfigurationError("Composite environment needs at least one delegate");
    }
    absl::flat_hash_set<std::string> names;
    absl::flat_hash_map<AgentId, std::string> claimed;
    for (const DelegateSpec& spec : specs) {
        if (!names.insert(spec.name).second) {
            throw ConfigurationError(absl::StrCat("Duplicate delegate name '", spec.name, "'"));
        }
        for (const AgentId& agent_id : spec.agent_ids) {
            auto [it, inserted] = claimed.emplace(agent_id, spec.name);
            if (!inserted) {
                throw AgentIdCollisionError(agent_id, it->second, spec.name);
            }
        }
    }
}

CompositeEnvironment::CompositeEnvironment(const std::vector<DelegateSpec>& specs, BuildContext& context,
                                           CompositeOptions options)
    : options_(options) {
    // Collisions are reported before any simulator is constructed.
    CheckAgentIdsDisjoint(specs);

    DelegateOptions delegate_options;
    delegate_options.step_timeout = options_.delegate_timeout;
    delegates_.reserve(specs.size());
    for (const DelegateSpec& spec : specs) {
        delegates_.push_back(std::make_unique<DelegateSimulator>(spec, context, delegate_options));
    }
    IndexOwners();
    LOG(INFO) << "Composite environment ready: " << delegates_.size() << " delegate(s), "
              << owner_.size() << " agent(s), step policy " << DelegateStepPolicyName(options_.step_policy);
}

CompositeEnvironment::CompositeEnvironment(std::vector<std::unique_ptr<DelegateSimulator>> delegates,
                                           CompositeOptions options)
    : options_(options), delegates_(std::move(delegates)) {
    CheckAgentIdsDisjoint(SpecsOf(delegates_));
    IndexOwners();
}

void CompositeEnvironment::IndexOwners() {
    owner_.clear();
    for (size_t i = 0; i < delegates_.size(); ++i) {
        for (const AgentId& agent_id : delegates_[i]->agent_ids()) {
            owner_.emplace(agent_id, i);
        }
    }
}

Transition CompositeEnvironment::Reset(std::optional<uint64_t> seed) {
    time_index_ = 0;
    Transition merged;
    for (size_t i = 0; i < delegates_.size(); ++i) {
        std::optional<uint64_t> delegate_seed;
        if (seed.has_value()) {
            delegate_seed = DeriveSeed(*seed, delegates_[i]->name());
        }
        Transition part = delegates_[i]->Reset(delegate_seed);
        MergeInto(merged, i, part);
    }
    merged.info[kTimeIndexKey] = time_index_;
    return merged;
}

std::vector<ActionMap> CompositeEnvironment::Partition(const ActionMap& actions) const {
    std::vector<ActionMap> parts(delegates_.size());
    for (const auto& [agent_id, action] : actions) {
        auto it = owner_.find(agent_id);
        if (it == owner_.end()) {
            VLOG(1) << "[CompositeEnvironment] dropping action for agent '" << agent_id << "' owned by no delegate";
            continue;
        }
        parts[it->second].emplace(agent_id, action);
    }
    return parts;
}

Transition CompositeEnvironment::Step(const ActionMap& actions) {
    std::vector<ActionMap> parts = Partition(actions);
    Transition merged;

    for (size_t i = 0; i < delegates_.size(); ++i) {
        DelegateSimulator& delegate = *delegates_[i];
        VLOG(2) << "[CompositeEnvironment] t=" << time_index_ << " " << delegate.name() << " ("
                << DelegateStateName(delegate.state()) << ") <- " << parts[i].size() << " action(s)";
        Transition part;
        try {
            part = delegate.Step(parts[i], time_index_);
        } catch (const DelegateTimeoutError&) {
            throw;
        } catch (const DelegateStepError& e) {
            if (options_.step_policy == DelegateStepPolicy::kAbort) {
                throw;
            }
            LOG(WARNING) << "Skipping delegate '" << delegate.name() << "' for the rest of the run: " << e.what();
            delegate.MarkFailed(e.cause());
            part = delegate.last_transition();
        }
        MergeInto(merged, i, part);
    }

    size_t failed = 0;
    for (const auto& delegate : delegates_) {
        if (delegate->state() == DelegateState::kFailed) {
            ++failed;
            merged.info[absl::StrCat(kFailedPrefix, delegate->name())] = delegate->failure_cause();
        }
    }
    if (failed == delegates_.size()) {
        LOG(WARNING) << "Every delegate has failed; ending the episode";
        merged.done = true;
    }

    merged.info[kTimeIndexKey] = time_index_;
    ++time_index_;
    VLOG(3) << "[CompositeEnvironment] merged done=" << merged.done << " rewards=" << merged.rewards.size();
    return merged;
}

void CompositeEnvironment::MergeInto(Transition& merged, size_t index, const Transition& part) const {
    const DelegateSimulator& delegate = *delegates_[index];
    for (const auto& [agent_id, observation] : part.observations) {
        auto it = owner_.find(agent_id);
        if (it == owner_.end() || it->second != index) {
            LOG(WARNING) << "Delegate '" << delegate.name() << "' reported an observation for foreign agent '"
                         << agent_id << "'; ignored";
            continue;
        }
        merged.observations[agent_id] = observation;
    }
    for (const auto& [agent_id, reward] : part.rewards) {
        auto it = owner_.find(agent_id);
        if (it == owner_.end() || it->second != index) {
            LOG(WARNING) << "Delegate '" << delegate.name() << "' reported a reward for foreign agent '"
                         << agent_id << "'; ignored";
            continue;
        }
        merged.rewards[agent_id] = reward;
    }
    merged.done = merged.done || part.done;
    merged.delegate_info[delegate.name()] = part.info;
}

bool CompositeEnvironment::IsDone() const {
    for (const auto& delegate : delegates_) {
        if (delegate->IsDone()) {
            return true;
        }
    }
    return false;
}

std::vector<AgentId> CompositeEnvironment::AgentIds() const {
    std::vector<AgentId> ids;
    for (const auto& delegate : delegates_) {
        ids.insert(ids.end(), delegate->agent_ids().begin(), delegate->agent_ids().end());
    }
    return ids;
}

std::vector<AgentId> CompositeEnvironment::ActiveAgentIds() const {
    std::vector<AgentId> ids;
    for (const auto& delegate : delegates_) {
        if (delegate->AcceptsActions()) {
            ids.insert(ids.end(), delegate->agent_ids().begin(), delegate->agent_ids().end());
        }
    }
    return ids;
}

const DelegateSimulator* CompositeEnvironment::FindDelegate(const std::string& name) const {
    for (const auto& delegate : delegates_) {
        if (delegate->name() == name) {
            return delegate.get();
        }
    }
    return nullptr;
}

} // namespace Lockstep
