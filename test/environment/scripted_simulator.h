#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../../src/environment/simulator.h"

namespace Lockstep {
namespace testing_support {

/**
 * Deterministic simulator for tests: ends after `horizon` steps, can be told
 * to throw or stall on a given step, and records what it was handed.
 */
class ScriptedSimulator : public ISimulator {
public:
    ScriptedSimulator(std::vector<AgentId> agent_ids, int64_t horizon)
        : agent_ids_(std::move(agent_ids)), horizon_(horizon) {}

    Transition Reset(std::optional<uint64_t> seed) override {
        last_seed = seed;
        last_actions.clear();
        step_ = 0;
        return Build(false);
    }

    Transition Step(const ActionMap& actions) override {
        ++step_calls;
        ++step_;
        last_actions = actions;
        if (throw_at.has_value() && step_ == *throw_at) {
            throw std::runtime_error("scripted failure at step " + std::to_string(step_));
        }
        if (stall_at.has_value() && step_ == *stall_at) {
            std::this_thread::sleep_for(stall_for);
        }
        return Build(step_ >= horizon_);
    }

    void RegisterFadingModel(const std::string& channel_id, FadingModel model) override {
        fading_channels.push_back(channel_id);
        fading_families.push_back(model.family());
    }

    void RegisterMobilityModel(const AgentId& agent_id, MobilityModel model) override {
        mobility_agents.push_back(agent_id);
    }

    std::optional<int64_t> throw_at;
    std::optional<int64_t> stall_at;
    std::chrono::milliseconds stall_for{0};

    std::atomic<int> step_calls{0};
    std::optional<uint64_t> last_seed;
    ActionMap last_actions;
    std::vector<std::string> fading_channels;
    std::vector<std::string> fading_families;
    std::vector<AgentId> mobility_agents;

private:
    Transition Build(bool done) const {
        Transition transition;
        for (const AgentId& agent_id : agent_ids_) {
            double power = 1.0;
            auto action = last_actions.find(agent_id);
            if (action != last_actions.end()) {
                power = GetNumber(action->second, "power", power);
            }
            transition.observations[agent_id] = Observation{
                {"snr_db", 10.0 + static_cast<double>(step_)},
                {"power", power},
            };
            transition.rewards[agent_id] = static_cast<double>(step_);
        }
        transition.done = done;
        transition.info["episode_step"] = step_;
        return transition;
    }

    std::vector<AgentId> agent_ids_;
    int64_t horizon_;
    int64_t step_ = 0;
};

} // namespace testing_support
} // namespace Lockstep
