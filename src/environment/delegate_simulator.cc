#include "delegate_simulator.h"

#include <algorithm>
#include <future>
#include <thread>

#include <glog/logging.h>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"
#include "common/errors.h"
#include "models/model_resolver.h"

namespace Lockstep {

namespace {

void ValidateSpec(const DelegateSpec& spec) {
    if (spec.name.empty()) {
        throw ConfigurationError("Delegate spec without a name");
    }
    absl::flat_hash_set<AgentId> seen;
    for (const AgentId& agent_id : spec.agent_ids) {
        if (!seen.insert(agent_id).second) {
            throw AgentIdCollisionError(agent_id, spec.name, spec.name);
        }
    }
}

} // namespace

const char* DelegateStateName(DelegateState state) {
    switch (state) {
        case DelegateState::kActive:
            return "active";
        case DelegateState::kDone:
            return "done";
        case DelegateState::kHeld:
            return "held";
        case DelegateState::kFailed:
            return "failed";
    }
    return "unknown";
}

DelegateSimulator::DelegateSimulator(DelegateSpec spec, BuildContext& context, DelegateOptions options)
    : spec_(std::move(spec)), options_(options) {
    ValidateSpec(spec_);
    if (spec_.reference.empty()) {
        throw ConfigurationError(absl::StrCat("Delegate '", spec_.name, "' has no simulator reference"));
    }
    default_seed_ = spec_.seed.value_or(context.SeedFor(spec_.name));

    auto factory = context.registry().Resolve<SimulatorFactory>(spec_.reference);
    SimulatorArgs args{spec_.name, spec_.agent_ids, spec_.constructor_args, spec_.constructor_kwargs};
    std::unique_ptr<ISimulator> simulator;
    try {
        simulator = (*factory)(args);
    } catch (const ConfigurationError&) {
        throw;
    } catch (const std::exception& e) {
        throw ResolutionError(absl::StrCat("Delegate '", spec_.name, "': constructing '",
                                           spec_.reference, "' failed: ", e.what()));
    }
    if (!simulator) {
        throw ResolutionError(absl::StrCat("Delegate '", spec_.name, "': factory '",
                                           spec_.reference, "' returned null"));
    }
    simulator_ = std::move(simulator);

    InjectModelOverrides(context);
    VLOG(1) << "[DelegateSimulator] built '" << spec_.name << "' from " << spec_.reference
            << " with " << spec_.agent_ids.size() << " agent(s)";
}

DelegateSimulator::DelegateSimulator(DelegateSpec spec, std::shared_ptr<ISimulator> simulator,
                                     DelegateOptions options)
    : spec_(std::move(spec)), options_(options), simulator_(std::move(simulator)) {
    ValidateSpec(spec_);
    if (!simulator_) {
        throw ConfigurationError(absl::StrCat("Delegate '", spec_.name, "' has no simulator"));
    }
    default_seed_ = spec_.seed.value_or(DeriveSeed(0, spec_.name));
}

void DelegateSimulator::InjectModelOverrides(BuildContext& context) {
    ModelResolver resolver(context);

    auto fading = resolver.ResolveFadingOverrides(spec_.fading_overrides, default_seed_);
    for (auto& [channel_id, model] : fading) {
        VLOG(2) << "[DelegateSimulator] " << spec_.name << ": channel '" << channel_id
                << "' uses " << model.family();
        simulator_->RegisterFadingModel(channel_id, std::move(model));
    }

    auto mobility = resolver.ResolveMobilityOverrides(spec_.mobility_overrides, default_seed_);
    for (auto& [agent_id, model] : mobility) {
        if (std::find(spec_.agent_ids.begin(), spec_.agent_ids.end(), agent_id) == spec_.agent_ids.end()) {
            throw ConfigurationError(absl::StrCat("Delegate '", spec_.name, "': mobility override for '",
                                                  agent_id, "' which it does not own"));
        }
        VLOG(2) << "[DelegateSimulator] " << spec_.name << ": agent '" << agent_id
                << "' moves by " << model.family();
        simulator_->RegisterMobilityModel(agent_id, std::move(model));
    }
}

bool DelegateSimulator::StepPending() const {
    return overrun_.valid() && overrun_.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready;
}

Transition DelegateSimulator::Reset(std::optional<uint64_t> fallback_seed) {
    if (StepPending()) {
        throw DelegateStepError(spec_.name, -1, "previous step still running");
    }
    if (overrun_.valid()) {
        VLOG(1) << "[DelegateSimulator] " << spec_.name << ": overrun step finished, dropping its result";
        overrun_ = std::future<Transition>();
    }
    uint64_t seed = spec_.seed.has_value() ? *spec_.seed : fallback_seed.value_or(default_seed_);
    try {
        last_ = simulator_->Reset(seed);
    } catch (const std::exception& e) {
        throw DelegateStepError(spec_.name, -1, absl::StrCat("reset failed: ", e.what()));
    }
    steps_taken_ = 0;
    failure_cause_.clear();
    state_ = last_.done ? DelegateState::kDone : DelegateState::kActive;
    return last_;
}

Transition DelegateSimulator::Step(const ActionMap& actions, int64_t step_index) {
    switch (state_) {
        case DelegateState::kDone:
            state_ = DelegateState::kHeld;
            VLOG(1) << "[DelegateSimulator] " << spec_.name << " holding its final transition";
            return last_;
        case DelegateState::kHeld:
        case DelegateState::kFailed:
            return last_;
        case DelegateState::kActive:
            break;
    }

    ActionMap own = OwnActions(actions);
    Transition transition = options_.step_timeout.count() > 0
        ? StepWithDeadline(std::move(own), step_index)
        : StepInline(own, step_index);

    last_ = std::move(transition);
    ++steps_taken_;
    if (last_.done) {
        state_ = DelegateState::kDone;
        LOG(INFO) << "Delegate '" << spec_.name << "' finished after " << steps_taken_ << " step(s)";
    }
    return last_;
}

void DelegateSimulator::MarkFailed(const std::string& cause) {
    state_ = DelegateState::kFailed;
    failure_cause_ = cause;
}

ActionMap DelegateSimulator::OwnActions(const ActionMap& actions) const {
    ActionMap own;
    for (const AgentId& agent_id : spec_.agent_ids) {
        auto it = actions.find(agent_id);
        if (it != actions.end()) {
            own.emplace(it->first, it->second);
        }
    }
    return own;
}

Transition DelegateSimulator::StepInline(const ActionMap& actions, int64_t step_index) {
    try {
        return simulator_->Step(actions);
    } catch (const std::exception& e) {
        throw DelegateStepError(spec_.name, step_index, e.what());
    }
}

Transition DelegateSimulator::StepWithDeadline(ActionMap actions, int64_t step_index) {
    // The worker shares ownership of the simulator so an overrunning call
    // can outlive this wrapper without touching freed memory.
    auto simulator = simulator_;
    auto task = std::make_shared<std::packaged_task<Transition()>>(
        [simulator, actions = std::move(actions)]() { return simulator->Step(actions); });
    std::future<Transition> result = task->get_future();
    std::thread([task]() { (*task)(); }).detach();

    if (result.wait_for(options_.step_timeout) != std::future_status::ready) {
        overrun_ = std::move(result);
        MarkFailed("deadline exceeded");
        LOG(ERROR) << "Delegate '" << spec_.name << "' overran its " << options_.step_timeout.count()
                   << "ms deadline at step " << step_index;
        throw DelegateTimeoutError(spec_.name, step_index, options_.step_timeout.count());
    }
    try {
        return result.get();
    } catch (const std::exception& e) {
        throw DelegateStepError(spec_.name, step_index, e.what());
    }
}

} // namespace Lockstep
