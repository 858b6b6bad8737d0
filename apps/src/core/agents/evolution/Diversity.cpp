#include "Diversity.h"

#include "core/agents/AgentGenome.h"

#include <algorithm>

namespace AgentEvo {

double computeGeneticDiversity(const std::vector<AgentGenome>& population)
{
    if (population.size() < 2) {
        return 0.0;
    }

    const double count = static_cast<double>(population.size());
    double totalVariance = 0.0;

    for (const Trait trait : ALL_TRAITS) {
        double mean = 0.0;
        for (const auto& genome : population) {
            mean += genome.genes[trait];
        }
        mean /= count;

        double variance = 0.0;
        for (const auto& genome : population) {
            const double diff = genome.genes[trait] - mean;
            variance += diff * diff;
        }
        totalVariance += variance / count;
    }

    return std::min(1.0, totalVariance / static_cast<double>(TRAIT_COUNT));
}

} // namespace AgentEvo
