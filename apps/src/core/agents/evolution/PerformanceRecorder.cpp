#include "PerformanceRecorder.h"
#include "core/LoggingChannels.h"
#include "core/ReflectSerializer.h"

#include <algorithm>
#include <cmath>

namespace AgentEvo {

namespace {
constexpr double kInnovationDecay = 0.9;
constexpr double kInnovationWeight = 0.1;
} // namespace

void from_json(const nlohmann::json& j, PerformanceReport& report)
{
    report = ReflectSerializer::from_json<PerformanceReport>(j);
}

void to_json(nlohmann::json& j, const PerformanceReport& report)
{
    j = ReflectSerializer::to_json(report);
}

void applyPerformanceReport(PerformanceHistory& history, const PerformanceReport& report)
{
    double innovationLevel = report.innovationLevel;
    if (!(innovationLevel >= 0.0 && innovationLevel <= 1.0)) {
        LOG_WARN(
            Feedback,
            "Agent {}: innovationLevel {} outside [0,1], clamping",
            report.agentId.toShortString(),
            innovationLevel);
        innovationLevel = std::isnan(innovationLevel) ? 0.0 : std::clamp(innovationLevel, 0.0, 1.0);
    }

    int activistsHelped = report.activistsHelped;
    if (activistsHelped < 0) {
        LOG_WARN(
            Feedback,
            "Agent {}: negative activistsHelped {}, counting as 0",
            report.agentId.toShortString(),
            activistsHelped);
        activistsHelped = 0;
    }

    history.campaignsAssisted++;
    history.activistsSupported += activistsHelped;

    const double n = static_cast<double>(history.campaignsAssisted);
    const double previousSuccesses = history.successRate * (n - 1.0);
    history.successRate = (previousSuccesses + (report.campaignSuccess ? 1.0 : 0.0)) / n;

    history.innovationScore =
        history.innovationScore * kInnovationDecay + innovationLevel * kInnovationWeight;
}

bool recordPerformance(std::vector<AgentGenome>& population, const PerformanceReport& report)
{
    const auto it = std::find_if(population.begin(), population.end(), [&](const AgentGenome& a) {
        return a.id == report.agentId;
    });
    if (it == population.end()) {
        LOG_DEBUG(Feedback, "Ignoring report for unknown agent {}", report.agentId.toString());
        return false;
    }

    applyPerformanceReport(it->performanceHistory, report);

    LOG_TRACE(
        Feedback,
        "Agent {}: campaigns={} successRate={:.3f} innovation={:.3f}",
        it->id.toShortString(),
        it->performanceHistory.campaignsAssisted,
        it->performanceHistory.successRate,
        it->performanceHistory.innovationScore);
    return true;
}

} // namespace AgentEvo
