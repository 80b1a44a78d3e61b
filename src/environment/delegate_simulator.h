#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/specs.h"
#include "common/types.h"
#include "environment/simulator.h"
#include "registry/build_context.h"

namespace Lockstep {

/**
 * Lifecycle of one delegate.
 *
 *   kActive  stepping normally
 *   kDone    the last Step reported done; the transition is held from here on
 *   kHeld    Step was called again after done and short-circuited
 *   kFailed  a step failed and the composite chose to skip this delegate
 */
enum class DelegateState {
    kActive,
    kDone,
    kHeld,
    kFailed,
};

const char* DelegateStateName(DelegateState state);

struct DelegateOptions {
    // Zero runs Step inline with no deadline.
    std::chrono::milliseconds step_timeout{0};
};

/**
 * Adapts one concrete simulator to the uniform step contract.
 *
 * The wrapper resolves the simulator factory named by DelegateSpec.reference,
 * injects the resolved fading/mobility overrides, and then adds nothing to the
 * simulator's own step ordering except an envelope: actions are narrowed to
 * the delegate's agents, and once the simulator reports done every further
 * Step returns the last transition unchanged without touching the simulator.
 */
class DelegateSimulator {
public:
    /**
     * @throws ConfigurationError family on an unknown reference, a failing
     *         constructor, or an invalid model override
     */
    DelegateSimulator(DelegateSpec spec, BuildContext& context, DelegateOptions options = {});

    // Wraps an already constructed simulator; overrides in spec are ignored.
    DelegateSimulator(DelegateSpec spec, std::shared_ptr<ISimulator> simulator,
                      DelegateOptions options = {});

    DelegateSimulator(const DelegateSimulator&) = delete;
    DelegateSimulator& operator=(const DelegateSimulator&) = delete;

    /**
     * Uses spec.seed when present, otherwise fallback_seed.
     *
     * @throws DelegateStepError if the simulator throws, or if a step that
     *         overran its deadline is still running inside the simulator
     */
    Transition Reset(std::optional<uint64_t> fallback_seed = std::nullopt);

    /**
     * Advance the wrapped simulator by one step.
     *
     * @throws DelegateStepError if the simulator throws
     * @throws DelegateTimeoutError if the call overruns the configured deadline
     */
    Transition Step(const ActionMap& actions, int64_t step_index);

    // Stop forwarding actions; the last transition is held from now on.
    void MarkFailed(const std::string& cause);

    bool IsDone() const { return state_ == DelegateState::kDone || state_ == DelegateState::kHeld; }
    bool AcceptsActions() const { return state_ == DelegateState::kActive; }
    DelegateState state() const { return state_; }

    const std::string& name() const { return spec_.name; }
    const std::vector<AgentId>& agent_ids() const { return spec_.agent_ids; }
    const Transition& last_transition() const { return last_; }
    int64_t steps_taken() const { return steps_taken_; }
    const std::string& failure_cause() const { return failure_cause_; }

    // True while a step abandoned at its deadline has not returned yet.
    bool StepPending() const;

private:
    void InjectModelOverrides(BuildContext& context);
    ActionMap OwnActions(const ActionMap& actions) const;
    Transition StepInline(const ActionMap& actions, int64_t step_index);
    Transition StepWithDeadline(ActionMap actions, int64_t step_index);

    DelegateSpec spec_;
    DelegateOptions options_;
    std::shared_ptr<ISimulator> simulator_;
    uint64_t default_seed_ = 0;

    DelegateState state_ = DelegateState::kActive;
    Transition last_;
    int64_t steps_taken_ = 0;
    std::string failure_cause_;
    // Result of the last overrunning step; the simulator is off limits until it is ready.
    std::future<Transition> overrun_;
};

} // namespace Lockstep
