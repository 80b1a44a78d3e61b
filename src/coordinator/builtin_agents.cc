#include "builtin_agents.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

#include <glog/logging.h>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "common/config.h"
#include "common/errors.h"

namespace Lockstep {

namespace {

constexpr char kUtilityPrefix[] = "utility.";
constexpr char kSharePrefix[] = "share.";

double ParamNumber(const AttributeMap& params, const std::string& key, double fallback,
                   const std::string& owner) {
    auto it = params.find(key);
    if (it == params.end()) {
        return fallback;
    }
    auto number = AsNumber(it->second);
    if (!number.has_value() || std::holds_alternative<bool>(it->second) || !std::isfinite(*number)) {
        throw ConfigurationError(absl::StrCat(owner, ": parameter '", key, "' must be a finite number"));
    }
    return *number;
}

double Throughput(double snr_db) {
    return std::log2(1.0 + std::pow(10.0, snr_db / 10.0));
}

} // namespace

PowerControlAgent::PowerControlAgent(AgentId id, const AttributeMap& params)
    : id_(std::move(id)),
      target_snr_db_(ParamNumber(params, "target_snr_db", 10.0, id_)),
      min_power_(ParamNumber(params, "min_power", 0.01, id_)),
      max_power_(ParamNumber(params, "max_power", 10.0, id_)) {
    if (min_power_ <= 0.0 || max_power_ < min_power_) {
        throw ConfigurationError(absl::StrCat(id_, ": need 0 < min_power <= max_power"));
    }
}

Proposal PowerControlAgent::Propose(const Observation& observation) {
    auto snr = observation.find("snr_db");
    if (snr == observation.end() || !AsNumber(snr->second).has_value()) {
        throw ProposalError(absl::StrCat(id_, ": observation carries no snr_db"));
    }
    double snr_db = *AsNumber(snr->second);
    double power = std::max(GetNumber(observation, "power", 1.0), min_power_);

    // Linear in dB: every dB of shortfall is a dB of extra transmit power.
    double wanted = power * std::pow(10.0, (target_snr_db_ - snr_db) / 10.0);
    double next_power = std::clamp(wanted, min_power_, max_power_);
    double predicted_snr_db = snr_db + 10.0 * std::log10(next_power / power);
    double throughput = Throughput(predicted_snr_db);

    Proposal proposal;
    proposal.agent_id = id_;
    proposal.action["power"] = next_power;
    proposal.utility = std::abs(snr_db - target_snr_db_) - std::abs(predicted_snr_db - target_snr_db_);
    proposal.metadata["predicted_snr_db"] = predicted_snr_db;
    proposal.metadata["estimate.throughput"] = throughput;
    proposal.metadata["estimate.energy"] = -next_power;
    proposal.metadata["estimate.latency"] = -1.0 / std::max(throughput, 1e-3);
    return proposal;
}

void PowerControlAgent::Feedback(const Transition& transition) {
    auto reward = transition.rewards.find(id_);
    if (reward != transition.rewards.end()) {
        cumulative_reward_ += reward->second;
    }
}

HoldAgent::HoldAgent(AgentId id, const AttributeMap& params)
    : id_(std::move(id)), utility_(ParamNumber(params, "utility", 0.0, id_)) {}

Proposal HoldAgent::Propose(const Observation& /*observation*/) {
    Proposal proposal;
    proposal.agent_id = id_;
    proposal.action[kHoldActionKey] = true;
    proposal.utility = utility_;
    return proposal;
}

SoftmaxAllocatorTool::SoftmaxAllocatorTool(std::string name, const AttributeMap& params)
    : name_(std::move(name)), temperature_(ParamNumber(params, "temperature", 1.0, name_)) {
    if (temperature_ <= 0.0) {
        throw ConfigurationError(absl::StrCat(name_, ": temperature must be > 0"));
    }
}

AttributeMap SoftmaxAllocatorTool::Call(const AttributeMap& args) {
    absl::btree_map<std::string, double> utilities;
    double peak = -std::numeric_limits<double>::infinity();
    for (const auto& [key, value] : args) {
        if (!absl::StartsWith(key, kUtilityPrefix)) {
            continue;
        }
        auto number = AsNumber(value);
        if (!number.has_value() || !std::isfinite(*number)) {
            throw std::invalid_argument(absl::StrCat(name_, ": '", key, "' is not a finite number"));
        }
        utilities.emplace(key.substr(sizeof(kUtilityPrefix) - 1), *number);
        peak = std::max(peak, *number);
    }

    AttributeMap shares;
    double total = 0.0;
    for (const auto& [agent_id, utility] : utilities) {
        total += std::exp((utility - peak) / temperature_);
    }
    for (const auto& [agent_id, utility] : utilities) {
        shares[absl::StrCat(kSharePrefix, agent_id)] = std::exp((utility - peak) / temperature_) / total;
    }
    return shares;
}

void RegisterBuiltinAgents(CapabilityRegistry& registry) {
    auto power_control = std::make_shared<AgentFactory>([](const AgentSpec& spec) -> std::shared_ptr<IAgent> {
        return std::make_shared<PowerControlAgent>(spec.id, spec.params);
    });
    auto hold = std::make_shared<AgentFactory>([](const AgentSpec& spec) -> std::shared_ptr<IAgent> {
        return std::make_shared<HoldAgent>(spec.id, spec.params);
    });
    auto softmax = std::make_shared<ToolFactory>([](const ToolSpec& spec) -> std::shared_ptr<ITool> {
        return std::make_shared<SoftmaxAllocatorTool>(spec.name, spec.params);
    });

    registry.RegisterInstance<AgentFactory>("lockstep.agents.PowerControlAgent", CapabilityKind::kFactory, power_control);
    registry.RegisterInstance<AgentFactory>("power_control", CapabilityKind::kFactory, power_control);
    registry.RegisterInstance<AgentFactory>("lockstep.agents.HoldAgent", CapabilityKind::kFactory, hold);
    registry.RegisterInstance<AgentFactory>("hold", CapabilityKind::kFactory, hold);
    registry.RegisterInstance<ToolFactory>("lockstep.tools.SoftmaxAllocator", CapabilityKind::kFactory, softmax);
    registry.RegisterInstance<ToolFactory>("softmax_allocator", CapabilityKind::kFactory, softmax);
    VLOG(1) << "[RegisterBuiltinAgents] power_control, hold, softmax_allocator";
}

} // namespace Lockstep
