#include "telemetry.h"

#include <cmath>

#include <glog/logging.h>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "common/errors.h"

namespace Lockstep {

namespace {

double SumOf(const Transition& transition, const std::string& key) {
    double total = 0.0;
    for (const auto& [agent_id, observation] : transition.observations) {
        total += GetNumber(observation, key, 0.0);
    }
    return total;
}

double JainFairness(const Plan& /*plan*/, const Transition& transition) {
    double sum = 0.0;
    double sum_sq = 0.0;
    size_t n = 0;
    for (const auto& [agent_id, observation] : transition.observations) {
        auto it = observation.find("snr_db");
        if (it == observation.end()) {
            continue;
        }
        auto snr_db = AsNumber(it->second);
        if (!snr_db.has_value()) {
            continue;
        }
        double linear = std::pow(10.0, *snr_db / 10.0);
        sum += linear;
        sum_sq += linear * linear;
        ++n;
    }
    if (n == 0 || sum_sq == 0.0) {
        return 0.0;
    }
    return (sum * sum) / (static_cast<double>(n) * sum_sq);
}

double HandoffSuccess(const Plan& plan, const Transition& /*transition*/) {
    size_t asked = plan.telemetry.utilities.size() + plan.telemetry.excluded.size();
    if (asked == 0) {
        return 0.0;
    }
    return static_cast<double>(plan.committed.size()) / static_cast<double>(asked);
}

} // namespace

void MemoryTelemetrySink::Record(const TelemetryRecord& record) {
    absl::MutexLock lock(&mu_);
    records_.push_back(record);
}

std::vector<TelemetryRecord> MemoryTelemetrySink::records() const {
    absl::MutexLock lock(&mu_);
    return records_;
}

size_t MemoryTelemetrySink::size() const {
    absl::MutexLock lock(&mu_);
    return records_.size();
}

void LoggingTelemetrySink::Record(const TelemetryRecord& record) {
    std::string rewards = absl::StrJoin(record.rewards, ",", absl::PairFormatter("="));
    std::string metrics = absl::StrJoin(record.metrics, ",", absl::PairFormatter("="));
    LOG(INFO) << "step=" << record.step_index << " " << record.plan_summary << " rewards={" << rewards
              << "} metrics={" << metrics << "} done=" << record.done;
}

MetricRegistry MetricRegistry::WithDefaults() {
    MetricRegistry registry;
    registry.Register("energy", [](const Plan&, const Transition& t) { return SumOf(t, "energy_cost"); });
    registry.Register("throughput", [](const Plan&, const Transition& t) { return SumOf(t, "snr_db"); });
    registry.Register("fairness", JainFairness);
    registry.Register("handoff_success", HandoffSuccess);
    return registry;
}

void MetricRegistry::Register(const std::string& name, MetricFn fn, bool overwrite) {
    if (name.empty() || !fn) {
        throw ConfigurationError("Metric needs a name and a callable");
    }
    if (!overwrite && metrics_.contains(name)) {
        throw ConfigurationError(absl::StrCat("Metric '", name, "' is already registered"));
    }
    metrics_[name] = std::move(fn);
}

absl::btree_map<std::string, double> MetricRegistry::Compute(const Plan& plan, const Transition& transition) const {
    absl::btree_map<std::string, double> values;
    for (const auto& [name, fn] : metrics_) {
        try {
            values[name] = fn(plan, transition);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Metric '" << name << "' failed: " << e.what();
            values[name] = std::nan("");
        }
    }
    return values;
}

std::vector<std::string> MetricRegistry::names() const {
    std::vector<std::string> out;
    for (const auto& [name, fn] : metrics_) {
        out.push_back(name);
    }
    return out;
}

} // namespace Lockstep
