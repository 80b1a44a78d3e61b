#pragma once

#include <memory>
#include <random>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"
#include "environment/simulator.h"

namespace Lockstep {

struct ToyRadioOptions {
    int64_t max_steps = 0;
    double time_step = 0.1;
    double base_snr_db = 15.0;
    double pathloss_exponent = 2.0;
    double initial_power = 1.0;
    double energy_weight = 0.1;

    /**
     * Build options from constructor kwargs. A positional int, when given,
     * is read as max_steps.
     *
     * @throws ConfigurationError on unknown keys, wrong types or a
     *         non-positive max_steps
     */
    static ToyRadioOptions FromArgs(const std::vector<Attribute>& args, const AttributeMap& kwargs);
};

/**
 * Small single-cell uplink model used as the built-in delegate.
 *
 * Every owned agent is a transmitter placed on the x axis and talking to a
 * receiver at the origin. Per step it applies power / delta_x / delta_y from
 * its action, lets an injected mobility model move it, and draws an SNR from
 * log-distance path loss plus the fading model registered for channel
 * <agent_id> (or channel "default"). The episode ends after max_steps steps.
 */
class ToyRadioSimulator : public ISimulator {
public:
    ToyRadioSimulator(std::vector<AgentId> agent_ids, ToyRadioOptions options);

    Transition Reset(std::optional<uint64_t> seed) override;
    Transition Step(const ActionMap& actions) override;
    void RegisterFadingModel(const std::string& channel_id, FadingModel model) override;
    void RegisterMobilityModel(const AgentId& agent_id, MobilityModel model) override;

    // SimulatorFactory entry point.
    static std::unique_ptr<ISimulator> Create(const SimulatorArgs& args);

    const ToyRadioOptions& options() const { return options_; }
    int64_t episode_step() const { return episode_step_; }

private:
    struct AgentState {
        Position position;
        double power = 0.0;
        double snr_db = 0.0;
        double energy_cost = 0.0;
    };

    void ApplyAction(AgentState& state, const Action& action) const;
    double ComputeSnr(const AgentId& agent_id, const AgentState& state, bool with_fading);
    Observation Observe(const AgentState& state) const;
    double Reward(const AgentState& state) const;
    Transition Snapshot(bool done) const;

    std::vector<AgentId> agent_ids_;
    ToyRadioOptions options_;
    absl::btree_map<std::string, FadingModel> fading_;
    absl::btree_map<AgentId, MobilityModel> mobility_;
    absl::btree_map<AgentId, AgentState> agents_;
    std::mt19937_64 rng_;
    int64_t episode_step_ = 0;
};

} // namespace Lockstep
