#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "absl/container/btree_map.h"

namespace Lockstep {

using AgentId = std::string;
using DelegateId = std::string;

/**
 * Scalar-or-vector payload value carried in observations, actions, info
 * envelopes and model parameters.
 */
using Attribute = std::variant<bool, int64_t, double, std::string, std::vector<double>>;

// Ordered so that logging, telemetry and equality are deterministic.
using AttributeMap = absl::btree_map<std::string, Attribute>;

using Observation = AttributeMap;
using Action = AttributeMap;
using ActionMap = absl::btree_map<AgentId, Action>;

struct Position {
    double x = 0.0;
    double y = 0.0;
};

inline bool operator==(const Position& a, const Position& b) {
    return a.x == b.x && a.y == b.y;
}

/**
 * Link conditions handed to a fading model when drawing a channel gain.
 */
struct LinkState {
    std::string channel_id;
    double distance_m = 0.0;
    double snr_db = 0.0;
    int64_t time_index = 0;
};

/**
 * Per-step result bundle produced by a simulator, a delegate wrapper or the
 * composite environment.
 *
 * delegate_info is only populated by the composite environment: one entry per
 * delegate name holding that delegate's own info payload unmodified.
 */
struct Transition {
    absl::btree_map<AgentId, Observation> observations;
    absl::btree_map<AgentId, double> rewards;
    bool done = false;
    AttributeMap info;
    absl::btree_map<DelegateId, AttributeMap> delegate_info;
};

bool operator==(const Transition& a, const Transition& b);
inline bool operator!=(const Transition& a, const Transition& b) { return !(a == b); }

// Numeric view of an attribute; bool and int64 widen to double.
std::optional<double> AsNumber(const Attribute& value);

double GetNumber(const AttributeMap& map, const std::string& key, double fallback);
bool GetBool(const AttributeMap& map, const std::string& key, bool fallback);
std::string GetString(const AttributeMap& map, const std::string& key, const std::string& fallback);

std::string ToString(const Attribute& value);
std::string ToString(const AttributeMap& map);

// Mixes a base seed with a salt string (channel id, agent id, delegate name).
uint64_t DeriveSeed(uint64_t base_seed, const std::string& salt);

} // namespace Lockstep
