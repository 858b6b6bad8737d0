#pragma once

#include "EvolutionConfig.h"
#include "GenerationStats.h"

#include <random>
#include <vector>

namespace AgentEvo {

struct AgentGenome;

/**
 * Population plus the index of the generation it belongs to.
 */
struct PopulationState {
    std::vector<AgentGenome> agents;
    int generation = 0;
};

std::vector<AgentGenome> createRandomPopulation(int size, int generation, std::mt19937& rng);

/**
 * Advance the population by one generation.
 *
 * An empty population is first seeded with config.populationSize random genomes at
 * generation 0. Then every genome is scored, the population is stably sorted by descending
 * fitness, the top config.elitismCount genomes carry over with age + 1, and the rest of the
 * next generation is bred from tournament-selected parents of the scored population through
 * crossover and mutation. The generation counter advances by one.
 *
 * Expects a config that passed validateEvolutionConfig.
 */
GenerationStats stepGeneration(
    PopulationState& state, const EvolutionConfig& config, std::mt19937& rng);

} // namespace AgentEvo
