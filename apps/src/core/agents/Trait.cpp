#include "Trait.h"
#include "core/Assert.h"

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace AgentEvo {

const char* toString(Trait trait)
{
    switch (trait) {
        case Trait::StrategicThinking:
            return "strategicThinking";
        case Trait::Empathy:
            return "empathy";
        case Trait::RiskAssessment:
            return "riskAssessment";
        case Trait::Creativity:
            return "creativity";
        case Trait::Persistence:
            return "persistence";
        case Trait::Collaboration:
            return "collaboration";
        case Trait::Communication:
            return "communication";
        case Trait::Adaptability:
            return "adaptability";
    }
    AGENTEVO_ASSERT(false, "Unhandled Trait in switch");
    return "";
}

std::optional<Trait> traitFromString(std::string_view name)
{
    for (const Trait trait : ALL_TRAITS) {
        if (name == toString(trait)) {
            return trait;
        }
    }
    return std::nullopt;
}

void to_json(nlohmann::json& j, const TraitGenes& genes)
{
    j = nlohmann::json::object();
    for (const Trait trait : ALL_TRAITS) {
        j[toString(trait)] = genes[trait];
    }
}

void from_json(const nlohmann::json& j, TraitGenes& genes)
{
    for (const Trait trait : ALL_TRAITS) {
        if (!j.contains(toString(trait))) {
            throw std::invalid_argument(std::string("Missing trait: ") + toString(trait));
        }
        genes[trait] = j.at(toString(trait)).get<double>();
    }
}

} // namespace AgentEvo
