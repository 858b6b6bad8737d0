#include "FitnessEvaluator.h"
#include "core/Assert.h"
#include "core/agents/AgentGenome.h"

namespace AgentEvo {

namespace {
constexpr double kSuccessRateBonus = 0.2;

// Order: strategicThinking, empathy, riskAssessment, creativity, persistence, collaboration,
// communication, adaptability.
constexpr TraitWeights kBalancedWeights = { 0.15, 0.15, 0.125, 0.125, 0.10, 0.15, 0.10, 0.10 };
constexpr TraitWeights kSuccessWeights = { 0.30, 0.0, 0.25, 0.0, 0.20, 0.15, 0.10, 0.0 };
constexpr TraitWeights kInnovationWeights = { 0.20, 0.10, 0.0, 0.35, 0.0, 0.0, 0.10, 0.25 };

double weightedSum(const TraitGenes& genes, const TraitWeights& weights)
{
    double sum = 0.0;
    for (const Trait trait : ALL_TRAITS) {
        const double weight = weights[static_cast<size_t>(trait)];
        if (weight != 0.0) {
            sum += genes[trait] * weight;
        }
    }
    return sum;
}
} // namespace

const TraitWeights& fitnessWeights(FitnessFunction function)
{
    switch (function) {
        case FitnessFunction::Balanced:
            return kBalancedWeights;
        case FitnessFunction::SuccessFocused:
            return kSuccessWeights;
        case FitnessFunction::InnovationFocused:
            return kInnovationWeights;
    }
    AGENTEVO_ASSERT(false, "FitnessEvaluator: Unknown FitnessFunction");
    return kBalancedWeights;
}

double evaluateFitness(const AgentGenome& genome, FitnessFunction function)
{
    const double base = weightedSum(genome.genes, fitnessWeights(function));

    if (function == FitnessFunction::Balanced) {
        return base * (1.0 + genome.performanceHistory.successRate * kSuccessRateBonus);
    }
    return base;
}

} // namespace AgentEvo
