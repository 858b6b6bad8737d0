#pragma once

#include <random>

namespace AgentEvo {

struct AgentGenome;

// Maximum absolute change applied to a mutated trait.
inline constexpr double kMutationDelta = 0.15;

struct MutationStats {
    int perturbations = 0;
};

/**
 * Mutate a genome: each trait independently, with probability mutationRate, moves by a
 * uniform delta in [-kMutationDelta, kMutationDelta] and is clamped to [0,1].
 * Returns a new genome; every non-gene field is copied from the input.
 */
AgentGenome mutate(
    const AgentGenome& parent,
    double mutationRate,
    std::mt19937& rng,
    MutationStats* stats = nullptr);

} // namespace AgentEvo
