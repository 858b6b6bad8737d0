#pragma once

#include <nlohmann/json_fwd.hpp>
#include <vector>

namespace AgentEvo {

struct AgentGenome;

/**
 * Summary returned by one generational step.
 *
 * Fitness figures are read from the population as stored right after breeding: elites keep
 * their freshly evaluated score, clones keep their parent's score and crossover children
 * still hold 0 until the next step evaluates them.
 */
struct GenerationStats {
    int generation = 0;
    double averageFitness = 0.0;
    double bestFitness = 0.0;
    double geneticDiversity = 0.0;

    // Breeding telemetry for this step.
    int eliteCarryoverCount = 0;
    int offspringCrossoverCount = 0;
    int offspringCloneCount = 0;
    int mutatedGeneCount = 0;
};

/**
 * Snapshot of the population for reporting. All zero when the population is empty.
 */
struct PopulationStatistics {
    int generation = 0;
    int populationSize = 0;
    double averageFitness = 0.0;
    double bestFitness = 0.0;
    double geneticDiversity = 0.0;
};

PopulationStatistics computePopulationStatistics(
    const std::vector<AgentGenome>& population, int generation);

void to_json(nlohmann::json& j, const GenerationStats& stats);
void to_json(nlohmann::json& j, const PopulationStatistics& stats);

} // namespace AgentEvo
