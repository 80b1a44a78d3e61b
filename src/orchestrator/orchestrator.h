#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"
#include "common/configuration.h"
#include "common/types.h"
#include "coordinator/coordinator.h"
#include "environment/composite_environment.h"
#include "orchestrator/telemetry.h"
#include "registry/build_context.h"

namespace Lockstep {

enum class RunPhase {
	kIdle,
	kRunning,
	kCompleted,
	kAborted,
};

const char* RunPhaseName(RunPhase phase);

// Completion reasons reported in RunStatus::reason.
inline constexpr char kReasonHorizonExhausted[] = "horizon-exhausted";
inline constexpr char kReasonDelegateDone[] = "delegate-done";
inline constexpr char kReasonCancelled[] = "cancelled";

struct RunStatus {
	RunPhase phase = RunPhase::kIdle;
	std::string reason;
	int64_t steps_completed = 0;
	// Set when phase is kAborted
	std::string error;
	std::string error_kind;
	std::optional<int64_t> error_step;

	std::string ToString() const;
};

struct HistoryRecord {
	int64_t step = 0;
	Plan plan;
	Transition transition;
};

// Owned by the orchestrator; valid after a run ends or is cancelled until Reset().
struct RunState {
	int64_t step_index = 0;
	absl::btree_map<DelegateId, bool> delegate_done;
	std::vector<HistoryRecord> history;
};

/**
 * Top-level driver.
 *
 * Idle -> Running on Run(); Running -> Completed when the composite reports
 * done, the step budget is used up, or a stop was requested; Running ->
 * Aborted on a delegate step failure. A configuration error while building
 * leaves the orchestrator Aborted before any step runs.
 *
 * Each tick: the coordinator plans from the latest merged transition, the
 * plan's actions step the composite, agents receive feedback, the history
 * record is appended, and only then is the telemetry record emitted.
 */
class Orchestrator {
	public:
		/**
		 * Build everything a run needs from configuration. Never throws for a
		 * configuration problem; status() reports Aborted instead.
		 *
		 * @param context  pre-populated registry (custom agents, simulators);
		 *                 a fresh one is created when null
		 */
		explicit Orchestrator(const LockstepConfig& config,
				std::unique_ptr<BuildContext> context = nullptr,
				std::shared_ptr<ITelemetrySink> sink = nullptr);

		// Assemble from prebuilt parts; the caller keeps the build context alive.
		Orchestrator(std::unique_ptr<CompositeEnvironment> environment,
				std::unique_ptr<Coordinator> coordinator,
				std::shared_ptr<ITelemetrySink> sink = nullptr,
				std::optional<uint64_t> seed = std::nullopt);

		Orchestrator(const Orchestrator&) = delete;
		Orchestrator& operator=(const Orchestrator&) = delete;

		/**
		 * Drive the run until a terminal phase. Never throws for delegate or
		 * agent failures; they are reported through the returned status.
		 */
		RunStatus Run(int64_t max_steps);

		// Honored at the next tick boundary; never interrupts a delegate step.
		void RequestStop() { stop_requested_.store(true); }

		// Drop the history and return to Idle so Run can be called again.
		void Reset();

		bool ready() const { return environment_ != nullptr && coordinator_ != nullptr; }
		const RunState& state() const { return state_; }
		const RunStatus& status() const { return status_; }
		int64_t configured_max_steps() const { return configured_max_steps_; }

		MetricRegistry& metrics() { return metrics_; }
		const CompositeEnvironment& environment() const { return *environment_; }
		const Coordinator& coordinator() const { return *coordinator_; }

	private:
		void Complete(const char* reason);
		void Abort(const std::string& kind, const std::string& error, std::optional<int64_t> step);
		void RecordTick(int64_t step, Plan plan, Transition transition);
		void DispatchFeedback(const Transition& transition);

		std::unique_ptr<BuildContext> context_;
		std::unique_ptr<CompositeEnvironment> environment_;
		std::unique_ptr<Coordinator> coordinator_;
		std::shared_ptr<ITelemetrySink> sink_;
		MetricRegistry metrics_ = MetricRegistry::WithDefaults();
		std::optional<uint64_t> seed_;
		int64_t configured_max_steps_ = kDefaultMaxSteps;

		RunState state_;
		RunStatus status_;
		std::atomic<bool> stop_requested_{false};
};

} // namespace Lockstep
