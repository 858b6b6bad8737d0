#pragma once

#include "core/agents/AgentGenome.h"
#include "core/agents/evolution/EvolutionConfig.h"
#include "core/agents/evolution/GenerationStats.h"

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <ostream>
#include <vector>

namespace AgentEvo {
namespace Client {

struct EvolveOptions {
    EvolutionConfig evolution;
    int generations = 10;
    size_t topCount = 5;
    std::optional<uint32_t> seed;
};

/**
 * Results from a completed local evolution run.
 */
struct EvolveResults {
    std::vector<GenerationStats> history;
    PopulationStatistics finalStatistics;
    std::optional<AgentGenome> bestAgent;
    std::vector<AgentGenome> topAgents;
    double durationSec = 0.0;
};

void to_json(nlohmann::json& j, const EvolveResults& results);

/**
 * Runs an in-process PopulationEngine for a fixed number of generations, writing one JSON
 * line of GenerationStats per step to the output stream.
 */
class EvolveRunner {
public:
    explicit EvolveRunner(std::ostream& out);

    EvolveResults run(const EvolveOptions& options);

private:
    std::ostream& out_;
};

} // namespace Client
} // namespace AgentEvo
