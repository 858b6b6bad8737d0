#pragma once

#include "core/Result.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace AgentEvo {

/**
 * Objective used to score genomes. Serialized as "balanced", "success-focused" and
 * "innovation-focused".
 */
enum class FitnessFunction : uint8_t {
    Balanced = 0,
    SuccessFocused = 1,
    InnovationFocused = 2,
};

const char* toString(FitnessFunction function);
std::optional<FitnessFunction> fitnessFunctionFromString(std::string_view name);

void to_json(nlohmann::json& j, const FitnessFunction& function);
void from_json(const nlohmann::json& j, FitnessFunction& function);

/**
 * Configuration for the genetic algorithm.
 */
struct EvolutionConfig {
    int populationSize = 100;
    double mutationRate = 0.1;  // Per-trait perturbation probability.
    double crossoverRate = 0.7; // Probability an offspring mixes two parents instead of cloning.
    int elitismCount = 5;       // Top genomes carried over unchanged each generation.
    FitnessFunction fitnessFunction = FitnessFunction::Balanced;
};

/**
 * Rejects configurations the engine cannot honor: populationSize < 1, rates outside [0,1]
 * (or NaN), elitismCount outside [0, populationSize].
 */
Result<std::monostate, std::string> validateEvolutionConfig(const EvolutionConfig& config);

void to_json(nlohmann::json& j, const EvolutionConfig& config);
void from_json(const nlohmann::json& j, EvolutionConfig& config);

} // namespace AgentEvo
