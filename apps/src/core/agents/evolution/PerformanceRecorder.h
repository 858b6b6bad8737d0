#pragma once

#include "core/agents/AgentGenome.h"

#include <nlohmann/json_fwd.hpp>
#include <vector>

namespace AgentEvo {

/**
 * One externally observed campaign outcome for an agent.
 */
struct PerformanceReport {
    AgentId agentId;
    bool campaignSuccess = false;
    double innovationLevel = 0.0; // Expected in [0,1]; clamped when applied.
    int activistsHelped = 0;      // Negative values count as 0.
};

void from_json(const nlohmann::json& j, PerformanceReport& report);
void to_json(nlohmann::json& j, const PerformanceReport& report);

/**
 * Fold one outcome into a performance history: campaign count + 1, running-mean success rate,
 * cumulative activists and an exponentially smoothed innovation score (0.9 old, 0.1 new).
 */
void applyPerformanceReport(PerformanceHistory& history, const PerformanceReport& report);

/**
 * Apply a report to the matching agent. Returns false, leaving the population untouched, when
 * no agent has report.agentId.
 */
bool recordPerformance(std::vector<AgentGenome>& population, const PerformanceReport& report);

} // namespace AgentEvo
