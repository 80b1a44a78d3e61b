#pragma once

#include <cstdint>
#include <string>

#include "common/config.h"
#include "common/types.h"
#include "registry/capability_registry.h"

namespace Lockstep {

/**
 * Long-lived value handed to every construction call. Owns the capability
 * registry, and with it the resolution cache, for one orchestrator run.
 */
class BuildContext {
public:
    explicit BuildContext(uint64_t base_seed = kDefaultSeed) : base_seed_(base_seed) {}

    BuildContext(const BuildContext&) = delete;
    BuildContext& operator=(const BuildContext&) = delete;

    CapabilityRegistry& registry() { return registry_; }
    const CapabilityRegistry& registry() const { return registry_; }

    uint64_t base_seed() const { return base_seed_; }
    void set_base_seed(uint64_t seed) { base_seed_ = seed; }

    uint64_t SeedFor(const std::string& salt) const { return DeriveSeed(base_seed_, salt); }

private:
    CapabilityRegistry registry_;
    uint64_t base_seed_;
};

} // namespace Lockstep
