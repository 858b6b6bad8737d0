#include "AgentGenome.h"
#include "core/ReflectSerializer.h"

namespace AgentEvo {

AgentGenome AgentGenome::random(int generation, std::mt19937& rng)
{
    std::uniform_real_distribution<double> dist(0.0, 1.0);

    AgentGenome genome;
    genome.id = AgentId::generate(rng);
    genome.generation = generation;
    for (const Trait trait : ALL_TRAITS) {
        genome.genes[trait] = dist(rng);
    }
    return genome;
}

bool AgentGenome::genesWithinBounds() const
{
    for (const double value : genes.values) {
        if (!(value >= 0.0 && value <= 1.0)) {
            return false;
        }
    }
    return true;
}

void to_json(nlohmann::json& j, const PerformanceHistory& history)
{
    j = ReflectSerializer::to_json(history);
}

void from_json(const nlohmann::json& j, PerformanceHistory& history)
{
    history = ReflectSerializer::from_json<PerformanceHistory>(j);
}

void to_json(nlohmann::json& j, const AgentGenome& genome)
{
    j = ReflectSerializer::to_json(genome);
}

void from_json(const nlohmann::json& j, AgentGenome& genome)
{
    genome = ReflectSerializer::from_json<AgentGenome>(j);
}

} // namespace AgentEvo
