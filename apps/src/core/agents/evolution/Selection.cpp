#include "Selection.h"

#include "core/Assert.h"
#include "core/agents/AgentGenome.h"

namespace AgentEvo {

const AgentGenome& tournamentSelect(
    const std::vector<AgentGenome>& population, std::mt19937& rng, int tournamentSize)
{
    AGENTEVO_ASSERT(!population.empty(), "Tournament needs a non-empty population");
    AGENTEVO_ASSERT(tournamentSize > 0, "Tournament size must be positive");

    std::uniform_int_distribution<size_t> dist(0, population.size() - 1);

    size_t bestIdx = dist(rng);
    for (int i = 1; i < tournamentSize; i++) {
        const size_t idx = dist(rng);
        if (population[idx].fitness > population[bestIdx].fitness) {
            bestIdx = idx;
        }
    }

    return population[bestIdx];
}

} // namespace AgentEvo
