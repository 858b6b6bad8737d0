#pragma once

#include "EvolutionConfig.h"
#include "GenerationStats.h"
#include "GenerationStepper.h"
#include "PerformanceRecorder.h"
#include "core/Result.h"
#include "core/agents/AgentGenome.h"

#include <cstddef>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <variant>
#include <vector>

namespace AgentEvo {

/**
 * Owns an evolving agent population and serializes every access to it.
 *
 * Hosts construct one engine per optimization run and share it by reference. All public
 * methods are thread-safe: feedback may arrive from other threads while a generation is
 * being stepped, and the two are applied one after the other. Queries return copies.
 */
class PopulationEngine {
public:
    static constexpr size_t kDefaultTopAgentCount = 10;

    /**
     * @throws std::invalid_argument if config fails validateEvolutionConfig.
     */
    explicit PopulationEngine(
        const EvolutionConfig& config = EvolutionConfig{},
        std::mt19937 rng = std::mt19937{ std::random_device{}() });

    /**
     * Replace the population with fresh random genomes and reset the generation to 0.
     * A given size also becomes config.populationSize; it is rejected, leaving the engine
     * unchanged, if it would make the config invalid.
     */
    Result<std::monostate, std::string> initializePopulation(std::optional<int> size = std::nullopt);

    /**
     * Replace the population with host-supplied genomes and reset the generation to 0.
     * Requires exactly config.populationSize genomes, unique non-nil ids and genes within [0,1].
     */
    Result<std::monostate, std::string> adoptPopulation(std::vector<AgentGenome> agents);

    GenerationStats stepGeneration();

    // Highest stored fitness (first wins ties), or nothing for an empty population.
    std::optional<AgentGenome> getBestAgent() const;

    // Up to n genomes by descending stored fitness; ties keep population order.
    std::vector<AgentGenome> getTopAgents(size_t n = kDefaultTopAgentCount) const;

    /**
     * Fold a host-observed outcome into the agent's history. Reports for agents that are no
     * longer in the population are ignored; the return value says whether it was applied.
     */
    bool recordPerformance(const PerformanceReport& report);

    PopulationStatistics getStatistics() const;

    EvolutionConfig getConfig() const;
    Result<std::monostate, std::string> setConfig(const EvolutionConfig& config);

    int getGeneration() const;
    std::vector<AgentGenome> getPopulation() const;

private:
    mutable std::mutex mutex_;
    EvolutionConfig config_;
    PopulationState state_;
    std::mt19937 rng_;
};

} // namespace AgentEvo
