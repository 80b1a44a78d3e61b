#include "orchestrator.h"

#include <glog/logging.h>

#include "absl/strings/str_cat.h"
#include "common/errors.h"
#include "orchestrator/builder.h"

namespace Lockstep {

namespace {

const char* KindOf(const ConfigurationError& e) {
	if (dynamic_cast<const InvalidModelParametersError*>(&e)) return "invalid-model-parameters";
	if (dynamic_cast<const ModelResolutionError*>(&e)) return "model-resolution";
	if (dynamic_cast<const AgentIdCollisionError*>(&e)) return "agent-id-collision";
	if (dynamic_cast<const UnknownCapabilityError*>(&e)) return "unknown-capability";
	if (dynamic_cast<const ResolutionError*>(&e)) return "resolution";
	return "configuration";
}

const char* KindOf(const DelegateStepError& e) {
	if (dynamic_cast<const DelegateTimeoutError*>(&e)) return "delegate-timeout";
	return "delegate-step";
}

} // namespace

const char* RunPhaseName(RunPhase phase) {
	switch (phase) {
		case RunPhase::kIdle:
			return "Idle";
		case RunPhase::kRunning:
			return "Running";
		case RunPhase::kCompleted:
			return "Completed";
		case RunPhase::kAborted:
			return "Aborted";
	}
	return "Unknown";
}

std::string RunStatus::ToString() const {
	std::string out = absl::StrCat(RunPhaseName(phase), " after ", steps_completed, " step(s)");
	if (!reason.empty()) {
		absl::StrAppend(&out, " (", reason, ")");
	}
	if (phase == RunPhase::kAborted) {
		absl::StrAppend(&out, " [", error_kind, "]");
		if (error_step.has_value()) {
			absl::StrAppend(&out, " at step ", *error_step);
		}
		absl::StrAppend(&out, ": ", error);
	}
	return out;
}

Orchestrator::Orchestrator(const LockstepConfig& config,
		std::unique_ptr<BuildContext> context,
		std::shared_ptr<ITelemetrySink> sink)
	: context_(std::move(context)),
	  sink_(std::move(sink)),
	  seed_(config.run.seed.get()),
	  configured_max_steps_(config.run.max_steps.get()) {
	if (!context_) {
		context_ = std::make_unique<BuildContext>(*seed_);
	} else {
		context_->set_base_seed(*seed_);
	}

	try {
		CapabilityRegistry& registry = context_->registry();
		RegisterBuiltinCapabilities(registry);
		InstantiateTools(config.tools, registry);
		InstantiateAgents(config.agents, registry);
		environment_ = std::make_unique<CompositeEnvironment>(config.delegates, *context_,
				CompositeOptionsFrom(config));
		coordinator_ = std::make_unique<Coordinator>(registry,
				MakeRankingPolicy(config.coordinator.policy, config.coordinator.metric_weights),
				CoordinatorOptionsFrom(config));
	} catch (const ConfigurationError& e) {
		environment_.reset();
		coordinator_.reset();
		Abort(KindOf(e), e.what(), std::nullopt);
	}
}

Orchestrator::Orchestrator(std::unique_ptr<CompositeEnvironment> environment,
		std::unique_ptr<Coordinator> coordinator,
		std::shared_ptr<ITelemetrySink> sink,
		std::optional<uint64_t> seed)
	: environment_(std::move(environment)),
	  coordinator_(std::move(coordinator)),
	  sink_(std::move(sink)),
	  seed_(seed) {
	if (!ready()) {
		Abort("configuration", "orchestrator needs an environment and a coordinator", std::nullopt);
	}
}

RunStatus Orchestrator::Run(int64_t max_steps) {
	if (!ready()) {
		LOG(ERROR) << "Run() on an orchestrator that failed to build: " << status_.error;
		return status_;
	}
	if (status_.phase != RunPhase::kIdle) {
		LOG(WARNING) << "Run() called while " << RunPhaseName(status_.phase) << "; call Reset() first";
		return status_;
	}
	if (max_steps < 0) {
		LOG(WARNING) << "Negative max_steps " << max_steps << " treated as 0";
		max_steps = 0;
	}

	status_.phase = RunPhase::kRunning;
	LOG(INFO) << "Run started: max_steps=" << max_steps << " delegates=" << environment_->num_delegates()
		<< " agents=" << coordinator_->agents().size();

	Transition latest;
	try {
		latest = environment_->Reset(seed_);
	} catch (const DelegateStepError& e) {
		Abort(KindOf(e), e.what(), std::nullopt);
		return status_;
	}
	for (size_t i = 0; i < environment_->num_delegates(); ++i) {
		state_.delegate_done[environment_->delegate(i).name()] = environment_->delegate(i).IsDone();
	}

	while (status_.phase == RunPhase::kRunning) {
		if (state_.step_index >= max_steps) {
			Complete(kReasonHorizonExhausted);
			break;
		}
		if (stop_requested_.load()) {
			Complete(kReasonCancelled);
			break;
		}

		const int64_t step = state_.step_index;
		Plan plan = coordinator_->Step(latest, environment_->ActiveAgentIds());

		Transition transition;
		try {
			transition = environment_->Step(plan.actions);
		} catch (const DelegateStepError& e) {
			LOG(ERROR) << "Step " << step << " failed: " << e.what();
			transition.done = true;
			transition.info["error"] = std::string(e.what());
			RecordTick(step, std::move(plan), std::move(transition));
			Abort(KindOf(e), e.what(), step);
			break;
		}

		DispatchFeedback(transition);
		latest = transition;
		RecordTick(step, std::move(plan), std::move(transition));
		if (latest.done) {
			Complete(kReasonDelegateDone);
		}
	}

	if (sink_) {
		sink_->Flush();
	}
	LOG(INFO) << "Run finished: " << status_.ToString();
	return status_;
}

void Orchestrator::RecordTick(int64_t step, Plan plan, Transition transition) {
	for (size_t i = 0; i < environment_->num_delegates(); ++i) {
		state_.delegate_done[environment_->delegate(i).name()] = environment_->delegate(i).IsDone();
	}

	TelemetryRecord record;
	record.step_index = step;
	record.plan_summary = plan.Summary();
	record.plan = plan.telemetry.ToAttributes();
	record.observations = transition.observations;
	record.rewards = transition.rewards;
	record.done = transition.done;
	record.metrics = metrics_.Compute(plan, transition);

	// History first, then the sink.
	state_.history.push_back(HistoryRecord{step, std::move(plan), std::move(transition)});
	state_.step_index = step + 1;

	if (sink_) {
		try {
			sink_->Record(record);
		} catch (const std::exception& e) {
			LOG(ERROR) << "Telemetry sink rejected step " << step << ": " << e.what();
		}
	}
}

void Orchestrator::DispatchFeedback(const Transition& transition) {
	for (const auto& agent : coordinator_->agents()) {
		try {
			agent->Feedback(transition);
		} catch (const std::exception& e) {
			LOG(WARNING) << "Agent '" << agent->Id() << "' feedback failed: " << e.what();
		}
	}
}

void Orchestrator::Complete(const char* reason) {
	status_.phase = RunPhase::kCompleted;
	status_.reason = reason;
	status_.steps_completed = state_.step_index;
}

void Orchestrator::Abort(const std::string& kind, const std::string& error, std::optional<int64_t> step) {
	status_.phase = RunPhase::kAborted;
	status_.error_kind = kind;
	status_.error = error;
	status_.error_step = step;
	status_.steps_completed = step.value_or(state_.step_index);
	LOG(ERROR) << "Run aborted [" << kind << "]: " << error;
}

void Orchestrator::Reset() {
	if (status_.phase == RunPhase::kRunning) {
		LOG(WARNING) << "Reset() ignored while a run is in progress";
		return;
	}
	state_ = RunState{};
	stop_requested_.store(false);
	if (ready()) {
		status_ = RunStatus{};
	}
}

} // namespace Lockstep
