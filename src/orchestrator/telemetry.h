#pragma once

#include <functional>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/synchronization/mutex.h"
#include "common/types.h"
#include "coordinator/coordinator.h"

namespace Lockstep {

/**
 * One record per orchestrator tick, handed to the external sink.
 */
struct TelemetryRecord {
    int64_t step_index = 0;
    std::string plan_summary;
    AttributeMap plan;
    absl::btree_map<AgentId, Observation> observations;
    absl::btree_map<AgentId, double> rewards;
    bool done = false;
    absl::btree_map<std::string, double> metrics;
};

class ITelemetrySink {
public:
    virtual ~ITelemetrySink() = default;

    virtual void Record(const TelemetryRecord& record) = 0;
    virtual void Flush() {}
};

// Keeps every record in memory; readable from other threads while a run is live.
class MemoryTelemetrySink : public ITelemetrySink {
public:
    void Record(const TelemetryRecord& record) override;

    std::vector<TelemetryRecord> records() const;
    size_t size() const;

private:
    mutable absl::Mutex mu_;
    std::vector<TelemetryRecord> records_ ABSL_GUARDED_BY(mu_);
};

// One INFO line per record.
class LoggingTelemetrySink : public ITelemetrySink {
public:
    void Record(const TelemetryRecord& record) override;
};

/**
 * Named KPIs computed from each step's plan and merged transition.
 *
 * Defaults:
 *   energy           sum of energy_cost over observations
 *   throughput       sum of snr_db over observations
 *   fairness         Jain's index over linear SNR
 *   handoff_success  committed agents / agents asked to propose
 */
class MetricRegistry {
public:
    using MetricFn = std::function<double(const Plan& plan, const Transition& transition)>;

    MetricRegistry() = default;

    static MetricRegistry WithDefaults();

    /**
     * @throws ConfigurationError if name is taken and overwrite is false
     */
    void Register(const std::string& name, MetricFn fn, bool overwrite = false);

    absl::btree_map<std::string, double> Compute(const Plan& plan, const Transition& transition) const;

    bool Contains(const std::string& name) const { return metrics_.contains(name); }
    std::vector<std::string> names() const;

private:
    absl::btree_map<std::string, MetricFn> metrics_;
};

} // namespace Lockstep
