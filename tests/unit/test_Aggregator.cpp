#include <gtest/gtest.h>
#include "Aggregator.hpp"
#include "MemoryShardStore.hpp"

class AggregatorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        store = std::make_unique<MemoryShardStore>();
        aggregator = std::make_unique<Aggregator>(*store);
    }

    std::unique_ptr<MemoryShardStore> store;
    std::unique_ptr<Aggregator> aggregator;
};

// Test that an unknown name counts as zero
TEST_F(AggregatorTest, UnknownNameIsZero)
{
    EXPECT_DOUBLE_EQ(aggregator->count("nothing"), 0.0);
}

// Test that every shard contributes, including ones above the current shard count
TEST_F(AggregatorTest, SumsAllShards)
{
    store->putShard("beans", 0, 4.0);
    store->putShard("beans", 3, -1.5);
    store->putShard("beans", 99, 2.5);
    store->putShard("friends", 0, 100.0);

    EXPECT_DOUBLE_EQ(aggregator->count("beans"), 5.0);
    EXPECT_DOUBLE_EQ(aggregator->count("friends"), 100.0);
}

// Test the static sum helper
TEST_F(AggregatorTest, SumOfEmptyList)
{
    EXPECT_DOUBLE_EQ(Aggregator::sum({}), 0.0);
    EXPECT_DOUBLE_EQ(Aggregator::sum({Shard("a", 0, 1.0), Shard("a", 1, 2.0)}), 3.0);
}
