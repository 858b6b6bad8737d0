#pragma once

#include <random>
#include <vector>

namespace AgentEvo {

struct AgentGenome;

// Fixed selection pressure for parent tournaments.
inline constexpr int kTournamentSize = 5;

/**
 * Tournament selection: draw tournamentSize genomes uniformly with replacement and return
 * the one with the strictly highest stored fitness (the first drawn wins ties).
 * The population is only read.
 */
const AgentGenome& tournamentSelect(
    const std::vector<AgentGenome>& population,
    std::mt19937& rng,
    int tournamentSize = kTournamentSize);

} // namespace AgentEvo
