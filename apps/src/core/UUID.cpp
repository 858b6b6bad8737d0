#include "UUID.h"

#include <algorithm>
#include <stdexcept>

namespace AgentEvo {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

// Byte offsets that are followed by a dash in the canonical form.
constexpr bool dashAfterByte(size_t index)
{
    return index == 3 || index == 5 || index == 7 || index == 9;
}

int nibbleValue(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

UUID::UUID() : bytes_{}
{}

UUID UUID::generate(std::mt19937& rng)
{
    UUID uuid;

    // mt19937 yields 32 bits per draw.
    for (size_t word = 0; word < 4; ++word) {
        const uint32_t bits = rng();
        for (size_t i = 0; i < 4; ++i) {
            uuid.bytes_[word * 4 + i] = static_cast<uint8_t>(bits >> (24 - i * 8));
        }
    }

    uuid.bytes_[6] = static_cast<uint8_t>((uuid.bytes_[6] & 0x0F) | 0x40); // Version 4.
    uuid.bytes_[8] = static_cast<uint8_t>((uuid.bytes_[8] & 0x3F) | 0x80); // RFC 4122 variant.

    return uuid;
}

UUID UUID::fromString(const std::string& str)
{
    if (str.size() != 36) {
        throw std::invalid_argument("UUID must be 36 characters, got '" + str + "'");
    }

    UUID uuid;
    size_t pos = 0;
    for (size_t index = 0; index < uuid.bytes_.size(); ++index) {
        const int high = nibbleValue(str[pos]);
        const int low = nibbleValue(str[pos + 1]);
        if (high < 0 || low < 0) {
            throw std::invalid_argument("Invalid hex digit in UUID '" + str + "'");
        }
        uuid.bytes_[index] = static_cast<uint8_t>((high << 4) | low);
        pos += 2;

        if (dashAfterByte(index)) {
            if (str[pos] != '-') {
                throw std::invalid_argument("Misplaced dash in UUID '" + str + "'");
            }
            ++pos;
        }
    }

    return uuid;
}

std::string UUID::toString() const
{
    std::string out;
    out.reserve(36);
    for (size_t index = 0; index < bytes_.size(); ++index) {
        out.push_back(kHexDigits[bytes_[index] >> 4]);
        out.push_back(kHexDigits[bytes_[index] & 0x0F]);
        if (dashAfterByte(index)) {
            out.push_back('-');
        }
    }
    return out;
}

std::string UUID::toShortString() const
{
    return toString().substr(0, 8);
}

bool UUID::isNil() const
{
    return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t byte) { return byte == 0; });
}

} // namespace AgentEvo

std::size_t std::hash<AgentEvo::UUID>::operator()(const AgentEvo::UUID& uuid) const noexcept
{
    // FNV-1a.
    std::size_t hash = 14695981039346656037ULL;
    for (uint8_t byte : uuid.bytes()) {
        hash ^= byte;
        hash *= 1099511628211ULL;
    }
    return hash;
}
