#include "EvolutionConfig.h"
#include "core/Assert.h"
#include "core/ReflectSerializer.h"

#include <stdexcept>

namespace AgentEvo {

namespace {
bool isUnitInterval(double value)
{
    // NaN fails both comparisons.
    return value >= 0.0 && value <= 1.0;
}
} // namespace

const char* toString(FitnessFunction function)
{
    switch (function) {
        case FitnessFunction::Balanced:
            return "balanced";
        case FitnessFunction::SuccessFocused:
            return "success-focused";
        case FitnessFunction::InnovationFocused:
            return "innovation-focused";
    }
    AGENTEVO_ASSERT(false, "Unhandled FitnessFunction in switch");
    return "";
}

std::optional<FitnessFunction> fitnessFunctionFromString(std::string_view name)
{
    for (const FitnessFunction function : { FitnessFunction::Balanced,
                                            FitnessFunction::SuccessFocused,
                                            FitnessFunction::InnovationFocused }) {
        if (name == toString(function)) {
            return function;
        }
    }
    return std::nullopt;
}

void to_json(nlohmann::json& j, const FitnessFunction& function)
{
    j = toString(function);
}

void from_json(const nlohmann::json& j, FitnessFunction& function)
{
    const auto name = j.get<std::string>();
    const auto parsed = fitnessFunctionFromString(name);
    if (!parsed.has_value()) {
        throw std::invalid_argument("Unknown fitness function: " + name);
    }
    function = parsed.value();
}

Result<std::monostate, std::string> validateEvolutionConfig(const EvolutionConfig& config)
{
    using R = Result<std::monostate, std::string>;

    if (config.populationSize < 1) {
        return R::error(
            "populationSize must be at least 1 (got " + std::to_string(config.populationSize)
            + ")");
    }
    if (!isUnitInterval(config.mutationRate)) {
        return R::error("mutationRate must be within [0, 1]");
    }
    if (!isUnitInterval(config.crossoverRate)) {
        return R::error("crossoverRate must be within [0, 1]");
    }
    if (config.elitismCount < 0 || config.elitismCount > config.populationSize) {
        return R::error(
            "elitismCount must be within [0, populationSize] (got "
            + std::to_string(config.elitismCount) + " for populationSize "
            + std::to_string(config.populationSize) + ")");
    }
    return R::okay(std::monostate{});
}

void to_json(nlohmann::json& j, const EvolutionConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

void from_json(const nlohmann::json& j, EvolutionConfig& config)
{
    config = ReflectSerializer::from_json<EvolutionConfig>(j);
}

} // namespace AgentEvo
