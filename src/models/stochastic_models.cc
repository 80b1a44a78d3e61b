#include "stochastic_models.h"

#include <algorithm>
#include <cmath>

namespace Lockstep {

RicianFading::RicianFading(double k_factor, double sigma, uint64_t seed)
    : los_(std::sqrt(k_factor / (k_factor + 1.0))),
      nlos_scale_(std::sqrt(1.0 / (k_factor + 1.0))),
      rng_(seed),
      normal_(0.0, sigma) {}

double RicianFading::Sample(const LinkState& /*link*/) {
    return los_ + nlos_scale_ * normal_(rng_);
}

RayleighFading::RayleighFading(double sigma, uint64_t seed)
    : rng_(seed), normal_(0.0, sigma) {}

double RayleighFading::Sample(const LinkState& /*link*/) {
    return normal_(rng_);
}

NakagamiFading::NakagamiFading(double m_factor, double omega, uint64_t seed)
    : rng_(seed), gamma_(m_factor, omega / m_factor) {}

double NakagamiFading::Sample(const LinkState& /*link*/) {
    double gain = gamma_(rng_);
    return 10.0 * std::log10(std::max(gain, 1e-9));
}

RandomWalkMobility::RandomWalkMobility(double step_size, uint64_t seed)
    : rng_(seed), step_(-step_size, step_size) {}

Position RandomWalkMobility::Advance(const Position& position, double dt) {
    Position next = position;
    next.x += step_(rng_) * dt;
    next.y += step_(rng_) * dt;
    return next;
}

} // namespace Lockstep
