#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string_view>

namespace AgentEvo {

/**
 * Behavioral traits carried by every agent genome. The set is fixed; operators that treat
 * all traits alike iterate ALL_TRAITS.
 */
enum class Trait : uint8_t {
    StrategicThinking = 0,
    Empathy,
    RiskAssessment,
    Creativity,
    Persistence,
    Collaboration,
    Communication,
    Adaptability,
};

inline constexpr size_t TRAIT_COUNT = 8;

inline constexpr std::array<Trait, TRAIT_COUNT> ALL_TRAITS = {
    Trait::StrategicThinking, Trait::Empathy,       Trait::RiskAssessment, Trait::Creativity,
    Trait::Persistence,       Trait::Collaboration, Trait::Communication,  Trait::Adaptability,
};

// JSON key, e.g. "strategicThinking".
const char* toString(Trait trait);
std::optional<Trait> traitFromString(std::string_view name);

/**
 * One value in [0,1] per trait, indexed by Trait.
 */
struct TraitGenes {
    std::array<double, TRAIT_COUNT> values{};

    double& operator[](Trait trait) { return values[static_cast<size_t>(trait)]; }
    double operator[](Trait trait) const { return values[static_cast<size_t>(trait)]; }

    bool operator==(const TraitGenes& other) const { return values == other.values; }
    bool operator!=(const TraitGenes& other) const { return values != other.values; }
};

void to_json(nlohmann::json& j, const TraitGenes& genes);
void from_json(const nlohmann::json& j, TraitGenes& genes);

} // namespace AgentEvo
