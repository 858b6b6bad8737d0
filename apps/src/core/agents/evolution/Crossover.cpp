#include "Crossover.h"

#include "core/agents/AgentGenome.h"

namespace AgentEvo {

AgentGenome crossover(
    const AgentGenome& parent1,
    const AgentGenome& parent2,
    double crossoverRate,
    int targetGeneration,
    std::mt19937& rng,
    CrossoverOutcome* outcome)
{
    std::uniform_real_distribution<double> coin(0.0, 1.0);

    AgentGenome child;
    child.generation = targetGeneration;

    // coin is in [0,1): rate 0 always clones, rate 1 never does.
    if (coin(rng) >= crossoverRate) {
        // A clone is parent 1 under a new id: it keeps its genes, score, age and history.
        child.id = AgentId::generate(rng);
        child.genes = parent1.genes;
        child.fitness = parent1.fitness;
        child.age = parent1.age;
        child.performanceHistory = parent1.performanceHistory;
        if (outcome) {
            *outcome = CrossoverOutcome::Clone;
        }
        return child;
    }

    for (const Trait trait : ALL_TRAITS) {
        child.genes[trait] = coin(rng) < 0.5 ? parent1.genes[trait] : parent2.genes[trait];
    }
    child.id = AgentId::generate(rng);
    child.parentIds = { parent1.id, parent2.id };
    if (outcome) {
        *outcome = CrossoverOutcome::Uniform;
    }
    return child;
}

} // namespace AgentEvo
