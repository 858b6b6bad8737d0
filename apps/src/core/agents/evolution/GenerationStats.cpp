#include "GenerationStats.h"
#include "Diversity.h"
#include "core/ReflectSerializer.h"
#include "core/agents/AgentGenome.h"

#include <algorithm>

namespace AgentEvo {

PopulationStatistics computePopulationStatistics(
    const std::vector<AgentGenome>& population, int generation)
{
    PopulationStatistics stats;
    if (population.empty()) {
        return stats;
    }

    double total = 0.0;
    double best = population.front().fitness;
    for (const auto& genome : population) {
        total += genome.fitness;
        best = std::max(best, genome.fitness);
    }

    stats.generation = generation;
    stats.populationSize = static_cast<int>(population.size());
    stats.averageFitness = total / static_cast<double>(population.size());
    stats.bestFitness = best;
    stats.geneticDiversity = computeGeneticDiversity(population);
    return stats;
}

void to_json(nlohmann::json& j, const GenerationStats& stats)
{
    j = ReflectSerializer::to_json(stats);
}

void to_json(nlohmann::json& j, const PopulationStatistics& stats)
{
    j = ReflectSerializer::to_json(stats);
}

} // namespace AgentEvo
