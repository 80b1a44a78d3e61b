#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "common/types.h"

namespace Lockstep {

// Closed alias resolved by the model resolver's own table (rician, rayleigh, ...).
struct BuiltinAlias {
    std::string name;
};

// Dotted or ::-separated locator resolved through the capability registry.
struct QualifiedReference {
    std::string locator;
};

using ModelRef = std::variant<BuiltinAlias, QualifiedReference>;

// Dotted or ::-separated names are qualified references, everything else is an alias.
inline bool IsQualifiedReference(const std::string& name) {
    return name.find('.') != std::string::npos || name.find("::") != std::string::npos;
}

/**
 * Description of one fading or mobility model override.
 *
 * target_id is the channel id for fading models and the agent id for
 * mobility models. Immutable once resolved.
 */
struct ModelSpec {
    std::string target_id;
    ModelRef ref;
    AttributeMap parameters;

    bool is_builtin() const { return std::holds_alternative<BuiltinAlias>(ref); }
    const std::string& name() const {
        return is_builtin() ? std::get<BuiltinAlias>(ref).name
                            : std::get<QualifiedReference>(ref).locator;
    }
};

/**
 * Recipe for one delegate simulator. Created at configuration load and
 * consumed once by the delegate wrapper; never mutated afterwards.
 */
struct DelegateSpec {
    std::string name;
    std::string reference;
    std::vector<AgentId> agent_ids;
    std::vector<Attribute> constructor_args;
    AttributeMap constructor_kwargs;
    std::optional<uint64_t> seed;
    std::vector<ModelSpec> fading_overrides;
    std::vector<ModelSpec> mobility_overrides;
};

struct AgentSpec {
    AgentId id;
    std::string reference;
    AttributeMap params;
};

struct ToolSpec {
    std::string name;
    std::string reference;
    AttributeMap params;
};

} // namespace Lockstep
