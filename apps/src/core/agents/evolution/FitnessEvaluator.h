#pragma once

#include "EvolutionConfig.h"
#include "core/agents/Trait.h"

#include <array>

namespace AgentEvo {

struct AgentGenome;

using TraitWeights = std::array<double, TRAIT_COUNT>;

// Weight table for a variant, indexed by Trait. Unused traits weigh 0.
const TraitWeights& fitnessWeights(FitnessFunction function);

/**
 * Score a genome under the given objective.
 *
 * Pure weighted sum of gene values. The balanced objective is additionally scaled by
 * (1 + successRate * 0.2), so it is the only one influenced by performance feedback and may
 * exceed 1.0. Results are not clamped.
 */
double evaluateFitness(const AgentGenome& genome, FitnessFunction function);

} // namespace AgentEvo
