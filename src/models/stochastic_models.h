#pragma once

#include <cstdint>
#include <random>

#include "common/types.h"

namespace Lockstep {

/**
 * Built-in stochastic generators behind the rician, rayleigh, nakagami and
 * random_walk aliases. Gains are returned in dB as an offset to the link SNR.
 * Each instance owns its generator; equal seeds replay equal sequences.
 */

// LoS-dominated: sqrt(K/(K+1)) + sqrt(1/(K+1)) * N(0, sigma).
class RicianFading {
public:
    RicianFading(double k_factor, double sigma, uint64_t seed);
    double Sample(const LinkState& link);

private:
    double los_;
    double nlos_scale_;
    std::mt19937_64 rng_;
    std::normal_distribution<double> normal_;
};

// Rich scattering: N(0, sigma).
class RayleighFading {
public:
    RayleighFading(double sigma, uint64_t seed);
    double Sample(const LinkState& link);

private:
    std::mt19937_64 rng_;
    std::normal_distribution<double> normal_;
};

// Power gain ~ Gamma(m, omega / m), reported as 10*log10(gain).
class NakagamiFading {
public:
    NakagamiFading(double m_factor, double omega, uint64_t seed);
    double Sample(const LinkState& link);

private:
    std::mt19937_64 rng_;
    std::gamma_distribution<double> gamma_;
};

// Uniform step in [-step_size, step_size] per axis, scaled by dt.
class RandomWalkMobility {
public:
    RandomWalkMobility(double step_size, uint64_t seed);
    Position Advance(const Position& position, double dt);

private:
    std::mt19937_64 rng_;
    std::uniform_real_distribution<double> step_;
};

} // namespace Lockstep
