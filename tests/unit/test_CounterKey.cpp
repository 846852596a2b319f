#include <gtest/gtest.h>
#include "CounterKey.hpp"
#include <unordered_set>

class CounterKeyTest : public ::testing::Test
{
protected:
    CounterKey plain{"beans"};
    CounterKey composite{CounterKey::Part(int64_t(42)), CounterKey::Part(std::string("followers"))};
};

// Test that plain string names are single-part keys
TEST_F(CounterKeyTest, PlainNameIsSinglePart)
{
    EXPECT_EQ(plain.size(), 1u);
    EXPECT_EQ(plain, CounterKey(std::string("beans")));
    EXPECT_EQ(plain.toString(), "beans");
}

// Test textual form of composite keys
TEST_F(CounterKeyTest, CompositeToString)
{
    EXPECT_EQ(composite.size(), 2u);
    EXPECT_EQ(composite.toString(), "[42,\"followers\"]");
}

// Test that keys compare structurally
TEST_F(CounterKeyTest, StructuralEquality)
{
    CounterKey same{CounterKey::Part(int64_t(42)), CounterKey::Part(std::string("followers"))};
    CounterKey swapped{CounterKey::Part(std::string("followers")), CounterKey::Part(int64_t(42))};
    CounterKey stringNumber{CounterKey::Part(std::string("42")), CounterKey::Part(std::string("followers"))};

    EXPECT_EQ(composite, same);
    EXPECT_NE(composite, swapped);
    EXPECT_NE(composite, stringNumber);
    EXPECT_EQ(std::hash<CounterKey>{}(composite), std::hash<CounterKey>{}(same));
}

// Test keys usable in unordered containers
TEST_F(CounterKeyTest, UsableAsHashKey)
{
    std::unordered_set<CounterKey> keys;
    keys.insert(plain);
    keys.insert(composite);
    keys.insert(CounterKey("beans"));

    EXPECT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys.count(CounterKey("beans")), 1u);
}

// Test serialization of mixed parts
TEST_F(CounterKeyTest, SerializeDeserialize)
{
    CounterKey key{CounterKey::Part(int64_t(-7)), CounterKey::Part(std::string("")), CounterKey::Part(std::string("x y"))};
    std::vector<uint8_t> bytes = key.serialize();

    CounterKey decoded;
    size_t offset = 0;
    ASSERT_TRUE(decoded.deserialize(bytes, offset));
    EXPECT_EQ(decoded, key);
    EXPECT_EQ(offset, bytes.size());
}

// Test that truncated input is rejected
TEST_F(CounterKeyTest, DeserializeTruncated)
{
    std::vector<uint8_t> bytes = composite.serialize();
    bytes.pop_back();

    CounterKey decoded;
    size_t offset = 0;
    EXPECT_FALSE(decoded.deserialize(bytes, offset));
}
