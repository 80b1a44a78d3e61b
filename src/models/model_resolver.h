#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"
#include "common/specs.h"
#include "models/model_capability.h"
#include "registry/build_context.h"

namespace Lockstep {

/**
 * Turns a ModelSpec into a ready-to-sample model.
 *
 * Built-in aliases (rician, rayleigh, nakagami for fading; random_walk for
 * mobility) map onto the generators in stochastic_models.h. Any other name is
 * looked up in the capability registry as a FadingFactory / MobilityFactory.
 * The resolver keeps no state of its own: resolving one spec twice yields two
 * models of the same family and parameters.
 *
 * Built-in parameters:
 *   rician       k_factor (>= 0, default 5.0), sigma (> 0, default 2.0)
 *   rayleigh     sigma (> 0, default 6.0)
 *   nakagami     m_factor (> 0, required), omega (> 0, required)
 *   random_walk  step_size (> 0, default 0.5)
 * Every built-in also accepts an integer seed; without one the caller's
 * default seed is used. Unknown parameter names are rejected.
 */
class ModelResolver {
public:
    explicit ModelResolver(BuildContext& context) : context_(context) {}

    /**
     * @throws InvalidModelParametersError on missing or out-of-domain parameters
     * @throws UnknownCapabilityError for an alias that is neither built in nor registered
     * @throws ResolutionError when a qualified reference cannot be located
     * @throws ModelResolutionError when a registered factory fails
     */
    FadingModel ResolveFading(const ModelSpec& spec, uint64_t default_seed) const;
    MobilityModel ResolveMobility(const ModelSpec& spec, uint64_t default_seed) const;

    /**
     * Resolve a list of per-target overrides. At most one model survives per
     * target_id; a later entry replaces an earlier one. Default seeds are
     * derived from base_seed and the target id.
     */
    absl::btree_map<std::string, FadingModel> ResolveFadingOverrides(
            const std::vector<ModelSpec>& specs, uint64_t base_seed) const;
    absl::btree_map<std::string, MobilityModel> ResolveMobilityOverrides(
            const std::vector<ModelSpec>& specs, uint64_t base_seed) const;

    static bool IsBuiltinFading(const std::string& alias);
    static bool IsBuiltinMobility(const std::string& alias);

private:
    BuildContext& context_;
};

} // namespace Lockstep
