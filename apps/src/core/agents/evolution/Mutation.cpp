#include "Mutation.h"

#include "core/agents/AgentGenome.h"

#include <algorithm>

namespace AgentEvo {

AgentGenome mutate(
    const AgentGenome& parent, double mutationRate, std::mt19937& rng, MutationStats* stats)
{
    if (stats) {
        stats->perturbations = 0;
    }

    AgentGenome child = parent;

    std::uniform_real_distribution<double> coin(0.0, 1.0);
    std::uniform_real_distribution<double> delta(-kMutationDelta, kMutationDelta);

    for (const Trait trait : ALL_TRAITS) {
        if (coin(rng) < mutationRate) {
            child.genes[trait] = std::clamp(child.genes[trait] + delta(rng), 0.0, 1.0);
            if (stats) {
                stats->perturbations++;
            }
        }
    }

    return child;
}

} // namespace AgentEvo
