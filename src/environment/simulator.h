#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/types.h"
#include "models/model_capability.h"

namespace Lockstep {

/**
 * Uniform contract every concrete simulator exposes to its delegate wrapper.
 */
class ISimulator {
public:
    virtual ~ISimulator() = default;

    virtual Transition Reset(std::optional<uint64_t> seed) = 0;

    // actions only holds entries for the simulator's own agents; a missing
    // entry (or an empty map) means the simulator's no-op policy applies.
    virtual Transition Step(const ActionMap& actions) = 0;

    // Slots for resolved per-channel / per-agent model overrides.
    virtual void RegisterFadingModel(const std::string& channel_id, FadingModel model) = 0;
    virtual void RegisterMobilityModel(const AgentId& agent_id, MobilityModel model) = 0;
};

struct SimulatorArgs {
    std::string delegate_name;
    std::vector<AgentId> agent_ids;
    std::vector<Attribute> args;
    AttributeMap kwargs;
};

// Registry handle for a simulator type; called once per delegate.
using SimulatorFactory = std::function<std::unique_ptr<ISimulator>(const SimulatorArgs& args)>;

} // namespace Lockstep
