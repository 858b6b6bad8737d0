#pragma once

/**
 * \file
 * UUID used to identify agents across generations.
 * Version 4 (random) format per RFC 4122, drawn from a caller-supplied generator so a
 * seeded engine produces reproducible ids.
 */

#include <array>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <random>
#include <string>

namespace AgentEvo {

class UUID {
public:
    // All zeros. Marks an id that was never assigned.
    UUID();

    // Version 4 UUID from the given generator.
    static UUID generate(std::mt19937& rng);

    // Parse "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx", either case.
    // @throws std::invalid_argument on malformed input.
    static UUID fromString(const std::string& str);

    std::string toString() const;

    // First 8 hex chars for log lines.
    std::string toShortString() const;

    bool isNil() const;

    const std::array<uint8_t, 16>& bytes() const { return bytes_; }

    bool operator==(const UUID& other) const = default;

private:
    std::array<uint8_t, 16> bytes_;
};

// JSON serialization: UUID serializes as string "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx".
inline void to_json(nlohmann::json& j, const UUID& uuid)
{
    j = uuid.toString();
}

inline void from_json(const nlohmann::json& j, UUID& uuid)
{
    uuid = UUID::fromString(j.get<std::string>());
}

} // namespace AgentEvo

template <>
struct std::hash<AgentEvo::UUID> {
    std::size_t operator()(const AgentEvo::UUID& uuid) const noexcept;
};
