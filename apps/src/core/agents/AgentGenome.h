#pragma once

#include "Trait.h"
#include "core/UUID.h"

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <random>
#include <vector>

namespace AgentEvo {

using AgentId = UUID;

/**
 * Outcomes reported by the host for one agent, accumulated across campaigns.
 */
struct PerformanceHistory {
    int campaignsAssisted = 0;
    double successRate = 0.0;       // Running mean of campaign successes, in [0,1].
    int64_t activistsSupported = 0; // Cumulative.
    double innovationScore = 0.0;   // Exponentially weighted, in [0,1].

    bool operator==(const PerformanceHistory& other) const = default;
};

/**
 * One evolvable agent: a fixed trait vector plus provenance and feedback.
 */
struct AgentGenome {
    AgentId id;
    int generation = 0; // Generation at which this genome was created.
    TraitGenes genes;
    double fitness = 0.0; // Valid only right after an evaluation pass.
    int age = 0;          // Generations survived through elitism.
    std::vector<AgentId> parentIds; // [parent1, parent2] for crossover offspring, else empty.
    PerformanceHistory performanceHistory;

    // Uniform genes in [0,1), fresh id, no parents.
    static AgentGenome random(int generation, std::mt19937& rng);

    bool genesWithinBounds() const;
};

void to_json(nlohmann::json& j, const PerformanceHistory& history);
void from_json(const nlohmann::json& j, PerformanceHistory& history);

void to_json(nlohmann::json& j, const AgentGenome& genome);
void from_json(const nlohmann::json& j, AgentGenome& genome);

} // namespace AgentEvo
