#include "toy_radio_simulator.h"

#include <algorithm>
#include <cmath>

#include <glog/logging.h>

#include "absl/strings/str_cat.h"
#include "common/config.h"
#include "common/errors.h"

namespace Lockstep {

namespace {

constexpr double kReferenceDistanceM = 10.0;
constexpr double kAgentSpacingM = 10.0;
constexpr double kMinPower = 1e-6;

double KwargNumber(const AttributeMap& kwargs, const std::string& key, double fallback) {
    auto it = kwargs.find(key);
    if (it == kwargs.end()) {
        return fallback;
    }
    auto number = AsNumber(it->second);
    if (!number.has_value() || std::holds_alternative<bool>(it->second) || !std::isfinite(*number)) {
        throw ConfigurationError(absl::StrCat("toy_radio: '", key, "' must be a finite number"));
    }
    return *number;
}

int64_t KwargInt(const Attribute& value, const std::string& key) {
    const auto* i = std::get_if<int64_t>(&value);
    if (i == nullptr) {
        throw ConfigurationError(absl::StrCat("toy_radio: '", key, "' must be an integer"));
    }
    return *i;
}

} // namespace

ToyRadioOptions ToyRadioOptions::FromArgs(const std::vector<Attribute>& args, const AttributeMap& kwargs) {
    static const char* const kKnown[] = {"max_steps", "time_step", "base_snr_db",
                                         "pathloss_exponent", "initial_power", "energy_weight"};
    for (const auto& [key, value] : kwargs) {
        if (std::find(std::begin(kKnown), std::end(kKnown), key) == std::end(kKnown)) {
            throw ConfigurationError(absl::StrCat("toy_radio: unknown argument '", key, "'"));
        }
    }
    if (args.size() > 1) {
        throw ConfigurationError("toy_radio: takes at most one positional argument (max_steps)");
    }

    ToyRadioOptions options;
    auto max_steps = kwargs.find("max_steps");
    if (max_steps != kwargs.end()) {
        options.max_steps = KwargInt(max_steps->second, "max_steps");
    } else if (!args.empty()) {
        options.max_steps = KwargInt(args.front(), "max_steps");
    }
    if (options.max_steps <= 0) {
        throw ConfigurationError("toy_radio: 'max_steps' is required and must be > 0");
    }

    options.time_step = KwargNumber(kwargs, "time_step", options.time_step);
    options.base_snr_db = KwargNumber(kwargs, "base_snr_db", options.base_snr_db);
    options.pathloss_exponent = KwargNumber(kwargs, "pathloss_exponent", options.pathloss_exponent);
    options.initial_power = KwargNumber(kwargs, "initial_power", options.initial_power);
    options.energy_weight = KwargNumber(kwargs, "energy_weight", options.energy_weight);
    if (options.time_step <= 0.0) {
        throw ConfigurationError("toy_radio: 'time_step' must be > 0");
    }
    if (options.initial_power < 0.0) {
        throw ConfigurationError("toy_radio: 'initial_power' must be >= 0");
    }
    return options;
}

ToyRadioSimulator::ToyRadioSimulator(std::vector<AgentId> agent_ids, ToyRadioOptions options)
    : agent_ids_(std::move(agent_ids)), options_(options) {
    if (agent_ids_.empty()) {
        throw ConfigurationError("toy_radio: needs at least one agent");
    }
}

std::unique_ptr<ISimulator> ToyRadioSimulator::Create(const SimulatorArgs& args) {
    return std::make_unique<ToyRadioSimulator>(args.agent_ids, ToyRadioOptions::FromArgs(args.args, args.kwargs));
}

void ToyRadioSimulator::RegisterFadingModel(const std::string& channel_id, FadingModel model) {
    fading_[channel_id] = std::move(model);
}

void ToyRadioSimulator::RegisterMobilityModel(const AgentId& agent_id, MobilityModel model) {
    mobility_[agent_id] = std::move(model);
}

Transition ToyRadioSimulator::Reset(std::optional<uint64_t> seed) {
    rng_.seed(seed.value_or(kDefaultSeed));
    std::uniform_real_distribution<double> jitter(-1.0, 1.0);

    episode_step_ = 0;
    agents_.clear();
    for (size_t i = 0; i < agent_ids_.size(); ++i) {
        AgentState state;
        state.position = {kAgentSpacingM * static_cast<double>(i + 1) + jitter(rng_), 0.0};
        state.power = options_.initial_power;
        state.snr_db = ComputeSnr(agent_ids_[i], state, false);
        agents_.emplace(agent_ids_[i], state);
    }
    VLOG(2) << "[ToyRadioSimulator] reset " << agents_.size() << " transmitter(s), horizon "
            << options_.max_steps << ", " << fading_.size() << " fading override(s)";
    return Snapshot(false);
}

Transition ToyRadioSimulator::Step(const ActionMap& actions) {
    if (agents_.empty()) {
        Reset(std::nullopt);
    }
    ++episode_step_;
    for (auto& [agent_id, state] : agents_) {
        auto action = actions.find(agent_id);
        if (action != actions.end()) {
            ApplyAction(state, action->second);
        }
        auto mobility = mobility_.find(agent_id);
        if (mobility != mobility_.end()) {
            state.position = mobility->second.Advance(state.position, options_.time_step);
        }
        state.snr_db = ComputeSnr(agent_id, state, true);
        state.energy_cost = state.power * options_.time_step;
    }
    return Snapshot(episode_step_ >= options_.max_steps);
}

void ToyRadioSimulator::ApplyAction(AgentState& state, const Action& action) const {
    if (GetBool(action, kHoldActionKey, false)) {
        return;
    }
    state.power = std::max(0.0, GetNumber(action, "power", state.power));
    state.position.x += GetNumber(action, "delta_x", 0.0);
    state.position.y += GetNumber(action, "delta_y", 0.0);
}

double ToyRadioSimulator::ComputeSnr(const AgentId& agent_id, const AgentState& state, bool with_fading) {
    double distance = std::max(1.0, std::hypot(state.position.x, state.position.y));
    double snr_db = options_.base_snr_db + 10.0 * std::log10(std::max(state.power, kMinPower)) -
                    10.0 * options_.pathloss_exponent * std::log10(distance / kReferenceDistanceM);
    if (!with_fading) {
        return snr_db;
    }
    auto fading = fading_.find(agent_id);
    if (fading == fading_.end()) {
        fading = fading_.find(kDefaultChannelId);
    }
    if (fading != fading_.end()) {
        snr_db += fading->second.Sample(LinkState{fading->first, distance, snr_db, episode_step_});
    }
    return snr_db;
}

Observation ToyRadioSimulator::Observe(const AgentState& state) const {
    return Observation{
        {"snr_db", state.snr_db},
        {"x", state.position.x},
        {"y", state.position.y},
        {"power", state.power},
        {"energy_cost", state.energy_cost},
        {"time_index", episode_step_},
    };
}

double ToyRadioSimulator::Reward(const AgentState& state) const {
    double snr_linear = std::pow(10.0, state.snr_db / 10.0);
    return std::log2(1.0 + snr_linear) - options_.energy_weight * state.energy_cost;
}

Transition ToyRadioSimulator::Snapshot(bool done) const {
    Transition transition;
    for (const auto& [agent_id, state] : agents_) {
        transition.observations.emplace(agent_id, Observe(state));
        transition.rewards.emplace(agent_id, Reward(state));
    }
    transition.done = done;
    transition.info["episode_step"] = episode_step_;
    transition.info["horizon"] = options_.max_steps;
    return transition;
}

} // namespace Lockstep
