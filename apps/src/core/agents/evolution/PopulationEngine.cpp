#include "PopulationEngine.h"
#include "core/LoggingChannels.h"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace AgentEvo {

PopulationEngine::PopulationEngine(const EvolutionConfig& config, std::mt19937 rng)
    : config_(config), rng_(std::move(rng))
{
    const auto validation = validateEvolutionConfig(config_);
    if (validation.isError()) {
        throw std::invalid_argument("Invalid EvolutionConfig: " + validation.errorValue());
    }
}

Result<std::monostate, std::string> PopulationEngine::initializePopulation(std::optional<int> size)
{
    std::lock_guard<std::mutex> lock(mutex_);

    EvolutionConfig config = config_;
    if (size.has_value()) {
        config.populationSize = size.value();
    }

    const auto validation = validateEvolutionConfig(config);
    if (validation.isError()) {
        LOG_WARN(Evolution, "initializePopulation rejected: {}", validation.errorValue());
        return validation;
    }

    config_ = config;
    state_.agents = createRandomPopulation(config_.populationSize, 0, rng_);
    state_.generation = 0;

    LOG_INFO(Evolution, "Initialized population of {} agents", config_.populationSize);
    return Result<std::monostate, std::string>::okay(std::monostate{});
}

Result<std::monostate, std::string> PopulationEngine::adoptPopulation(std::vector<AgentGenome> agents)
{
    using R = Result<std::monostate, std::string>;
    std::lock_guard<std::mutex> lock(mutex_);

    if (agents.size() != static_cast<size_t>(config_.populationSize)) {
        return R::error(
            "Expected " + std::to_string(config_.populationSize) + " agents, got "
            + std::to_string(agents.size()));
    }

    std::unordered_set<AgentId> ids;
    for (const auto& agent : agents) {
        if (agent.id.isNil()) {
            return R::error("Agent without an id");
        }
        if (!agent.genesWithinBounds()) {
            return R::error("Agent " + agent.id.toString() + " has genes outside [0, 1]");
        }
        if (!ids.insert(agent.id).second) {
            return R::error("Duplicate agent id " + agent.id.toString());
        }
    }

    state_.agents = std::move(agents);
    state_.generation = 0;

    LOG_INFO(Evolution, "Adopted population of {} agents", state_.agents.size());
    return R::okay(std::monostate{});
}

GenerationStats PopulationEngine::stepGeneration()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return AgentEvo::stepGeneration(state_, config_, rng_);
}

std::optional<AgentGenome> PopulationEngine::getBestAgent() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.agents.empty()) {
        return std::nullopt;
    }

    const AgentGenome* best = &state_.agents.front();
    for (const auto& agent : state_.agents) {
        if (agent.fitness > best->fitness) {
            best = &agent;
        }
    }
    return *best;
}

std::vector<AgentGenome> PopulationEngine::getTopAgents(size_t n) const
{
    std::vector<AgentGenome> sorted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sorted = state_.agents;
    }

    std::stable_sort(sorted.begin(), sorted.end(), [](const AgentGenome& a, const AgentGenome& b) {
        return a.fitness > b.fitness;
    });
    if (sorted.size() > n) {
        sorted.resize(n);
    }
    return sorted;
}

bool PopulationEngine::recordPerformance(const PerformanceReport& report)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return AgentEvo::recordPerformance(state_.agents, report);
}

PopulationStatistics PopulationEngine::getStatistics() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return computePopulationStatistics(state_.agents, state_.generation);
}

EvolutionConfig PopulationEngine::getConfig() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

Result<std::monostate, std::string> PopulationEngine::setConfig(const EvolutionConfig& config)
{
    const auto validation = validateEvolutionConfig(config);
    if (validation.isError()) {
        LOG_WARN(Config, "setConfig rejected: {}", validation.errorValue());
        return validation;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    LOG_INFO(
        Config,
        "Evolution config: populationSize={} mutationRate={} crossoverRate={} elitism={} "
        "fitness={}",
        config_.populationSize,
        config_.mutationRate,
        config_.crossoverRate,
        config_.elitismCount,
        toString(config_.fitnessFunction));
    return validation;
}

int PopulationEngine::getGeneration() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.generation;
}

std::vector<AgentGenome> PopulationEngine::getPopulation() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.agents;
}

} // namespace AgentEvo
