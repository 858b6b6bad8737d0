#pragma once

#include <vector>

namespace AgentEvo {

struct AgentGenome;

/**
 * Mean over all traits of the population variance of that trait, capped at 1.0.
 * Returns 0 for fewer than two genomes.
 */
double computeGeneticDiversity(const std::vector<AgentGenome>& population);

} // namespace AgentEvo
