#include "EvolveRunner.h"
#include "core/LoggingChannels.h"
#include "core/agents/evolution/PopulationEngine.h"

#include <chrono>
#include <nlohmann/json.hpp>
#include <random>

namespace AgentEvo {
namespace Client {

void to_json(nlohmann::json& j, const EvolveResults& results)
{
    j = nlohmann::json{
        { "statistics", results.finalStatistics },
        { "bestAgent", nullptr },
        { "topAgents", results.topAgents },
        { "durationSec", results.durationSec },
    };
    if (results.bestAgent.has_value()) {
        j["bestAgent"] = results.bestAgent.value();
    }
}

EvolveRunner::EvolveRunner(std::ostream& out) : out_(out)
{}

EvolveResults EvolveRunner::run(const EvolveOptions& options)
{
    const uint32_t seed = options.seed.value_or(std::random_device{}());
    LOG_INFO(
        Cli,
        "Evolving {} agents for {} generations (fitness={}, seed={})",
        options.evolution.populationSize,
        options.generations,
        toString(options.evolution.fitnessFunction),
        seed);

    PopulationEngine engine(options.evolution, std::mt19937{ seed });

    EvolveResults results;
    const auto startTime = std::chrono::steady_clock::now();

    const auto initResult = engine.initializePopulation();
    if (initResult.isError()) {
        LOG_ERROR(Cli, "Failed to initialize population: {}", initResult.errorValue());
        return results;
    }

    for (int i = 0; i < options.generations; i++) {
        const GenerationStats stats = engine.stepGeneration();
        out_ << nlohmann::json(stats).dump() << '\n';
        results.history.push_back(stats);
    }

    const auto endTime = std::chrono::steady_clock::now();
    results.durationSec = std::chrono::duration<double>(endTime - startTime).count();
    results.finalStatistics = engine.getStatistics();
    results.bestAgent = engine.getBestAgent();
    results.topAgents = engine.getTopAgents(options.topCount);

    LOG_INFO(
        Cli,
        "Finished at generation {} in {:.3f}s, best fitness {:.4f}",
        results.finalStatistics.generation,
        results.durationSec,
        results.finalStatistics.bestFitness);
    return results;
}

} // namespace Client
} // namespace AgentEvo
