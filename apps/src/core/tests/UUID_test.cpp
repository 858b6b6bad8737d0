#include "core/UUID.h"

#include <gtest/gtest.h>

#include <set>
#include <unordered_set>

using AgentEvo::UUID;

class UUIDTest : public ::testing::Test {
protected:
    std::mt19937 rng{ 42 };
};

TEST_F(UUIDTest, DefaultIsNil)
{
    UUID nil;
    EXPECT_TRUE(nil.isNil());
    EXPECT_EQ(nil.toString(), "00000000-0000-0000-0000-000000000000");
    EXPECT_FALSE(UUID::fromString("00000000-0000-0000-0000-000000000001").isNil());
}

TEST_F(UUIDTest, GenerateIsUniqueAndNotNil)
{
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        UUID uuid = UUID::generate(rng);
        EXPECT_FALSE(uuid.isNil());
        std::string str = uuid.toString();
        EXPECT_EQ(seen.count(str), 0) << "Duplicate UUID: " << str;
        seen.insert(str);
    }
}

TEST_F(UUIDTest, GenerateIsVersion4)
{
    for (int i = 0; i < 100; ++i) {
        std::string str = UUID::generate(rng).toString();
        // Version 4 has '4' at position 14.
        EXPECT_EQ(str[14], '4') << "UUID: " << str;
        char variant = str[19];
        EXPECT_TRUE(variant == '8' || variant == '9' || variant == 'a' || variant == 'b')
            << "UUID: " << str << " variant: " << variant;
    }
}

TEST_F(UUIDTest, SameSeedGivesSameSequence)
{
    std::mt19937 a{ 99 };
    std::mt19937 b{ 99 };
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(UUID::generate(a), UUID::generate(b));
    }
}

TEST_F(UUIDTest, FromStringRoundTrip)
{
    std::string original = "550e8400-e29b-41d4-a716-446655440000";
    UUID uuid = UUID::fromString(original);
    EXPECT_EQ(uuid.toString(), original);
    EXPECT_EQ(uuid.toShortString(), "550e8400");
}

TEST_F(UUIDTest, FromStringRejectsMalformedInput)
{
    EXPECT_THROW(UUID::fromString("too-short"), std::invalid_argument);
    EXPECT_THROW(UUID::fromString("550e8400-e29b-41d4-a716-4466554400001"), std::invalid_argument);
    EXPECT_THROW(UUID::fromString("550e8400xe29b-41d4-a716-446655440000"), std::invalid_argument);
    EXPECT_THROW(UUID::fromString("550e8400-e29b-41d4-a716-44665544000g"), std::invalid_argument);
}

TEST_F(UUIDTest, ParsingIsCaseInsensitive)
{
    UUID lower = UUID::fromString("550e8400-e29b-41d4-a716-446655440000");
    UUID upper = UUID::fromString("550E8400-E29B-41D4-A716-446655440000");

    EXPECT_EQ(lower, upper);
    EXPECT_NE(lower, UUID::fromString("550e8400-e29b-41d4-a716-446655440001"));
}

TEST_F(UUIDTest, WorksInUnorderedSet)
{
    UUID a = UUID::generate(rng);
    UUID b = UUID::generate(rng);

    std::unordered_set<UUID> hashed{ a, b, a };

    EXPECT_EQ(hashed.size(), 2u);
    EXPECT_EQ(hashed.count(b), 1u);
}

TEST_F(UUIDTest, SerializesAsJsonString)
{
    UUID uuid = UUID::generate(rng);

    nlohmann::json j = uuid;

    ASSERT_TRUE(j.is_string());
    EXPECT_EQ(j.get<std::string>(), uuid.toString());
    EXPECT_EQ(j.get<UUID>(), uuid);
}
