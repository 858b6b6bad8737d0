#include "GenerationStepper.h"
#include "Crossover.h"
#include "FitnessEvaluator.h"
#include "Mutation.h"
#include "Selection.h"
#include "core/Assert.h"
#include "core/LoggingChannels.h"
#include "core/agents/AgentGenome.h"

#include <algorithm>

namespace AgentEvo {

std::vector<AgentGenome> createRandomPopulation(int size, int generation, std::mt19937& rng)
{
    std::vector<AgentGenome> population;
    population.reserve(static_cast<size_t>(std::max(0, size)));
    for (int i = 0; i < size; i++) {
        population.push_back(AgentGenome::random(generation, rng));
    }
    return population;
}

GenerationStats stepGeneration(
    PopulationState& state, const EvolutionConfig& config, std::mt19937& rng)
{
    AGENTEVO_ASSERT(
        validateEvolutionConfig(config).isValue(), "stepGeneration requires a valid config");

    if (state.agents.empty()) {
        LOG_INFO(
            Evolution,
            "Population empty, seeding {} random agents before stepping",
            config.populationSize);
        state.agents = createRandomPopulation(config.populationSize, 0, rng);
        state.generation = 0;
    }

    // Evaluate.
    for (auto& agent : state.agents) {
        agent.fitness = evaluateFitness(agent, config.fitnessFunction);
    }

    std::stable_sort(
        state.agents.begin(), state.agents.end(), [](const AgentGenome& a, const AgentGenome& b) {
            return a.fitness > b.fitness;
        });

    const auto populationSize = static_cast<size_t>(config.populationSize);
    const int targetGeneration = state.generation + 1;

    GenerationStats stats;
    std::vector<AgentGenome> next;
    next.reserve(populationSize);

    // Elitism.
    const size_t eliteCount =
        std::min(static_cast<size_t>(config.elitismCount), state.agents.size());
    for (size_t i = 0; i < eliteCount && next.size() < populationSize; i++) {
        AgentGenome elite = state.agents[i];
        elite.age++;
        next.push_back(std::move(elite));
        stats.eliteCarryoverCount++;
    }

    // Breed the remainder from the scored current population.
    while (next.size() < populationSize) {
        const AgentGenome& parent1 = tournamentSelect(state.agents, rng);
        const AgentGenome& parent2 = tournamentSelect(state.agents, rng);

        CrossoverOutcome outcome = CrossoverOutcome::Clone;
        const AgentGenome offspring =
            crossover(parent1, parent2, config.crossoverRate, targetGeneration, rng, &outcome);
        if (outcome == CrossoverOutcome::Uniform) {
            stats.offspringCrossoverCount++;
        }
        else {
            stats.offspringCloneCount++;
        }

        MutationStats mutationStats;
        next.push_back(mutate(offspring, config.mutationRate, rng, &mutationStats));
        stats.mutatedGeneCount += mutationStats.perturbations;
    }

    state.agents = std::move(next);
    state.generation = targetGeneration;

    const PopulationStatistics summary =
        computePopulationStatistics(state.agents, state.generation);
    stats.generation = state.generation;
    stats.averageFitness = summary.averageFitness;
    stats.bestFitness = summary.bestFitness;
    stats.geneticDiversity = summary.geneticDiversity;

    LOG_DEBUG(
        Evolution,
        "Generation {}: avg={:.4f} best={:.4f} diversity={:.4f} elites={} crossover={} clones={} "
        "mutatedGenes={}",
        stats.generation,
        stats.averageFitness,
        stats.bestFitness,
        stats.geneticDiversity,
        stats.eliteCarryoverCount,
        stats.offspringCrossoverCount,
        stats.offspringCloneCount,
        stats.mutatedGeneCount);

    return stats;
}

} // namespace AgentEvo
