#include <gtest/gtest.h>
#include "ShardSelector.hpp"
#include <deque>
#include <set>
#include <stdexcept>
#include <vector>

// Returns a fixed sequence of draws and records the bounds it was asked for
class ScriptedRandomSource : public RandomSource
{
public:
    explicit ScriptedRandomSource(std::deque<uint32_t> draws) : m_draws(std::move(draws)) {}

    uint32_t uniformIndex(uint32_t bound) override
    {
        bounds.push_back(bound);
        if (m_draws.empty())
        {
            return 0;
        }
        uint32_t value = m_draws.front();
        m_draws.pop_front();
        return value % bound;
    }

    std::vector<uint32_t> bounds;

private:
    std::deque<uint32_t> m_draws;
};

class ShardSelectorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        random = std::make_shared<ScriptedRandomSource>(std::deque<uint32_t>{3, 0, 9});
        selector = std::make_unique<ShardSelector>(random);
    }

    std::shared_ptr<ScriptedRandomSource> random;
    std::unique_ptr<ShardSelector> selector;
};

// Test that unpinned writes draw from [0, shardCount)
TEST_F(ShardSelectorTest, DrawsFromShardCount)
{
    EXPECT_EQ(selector->select(10), 3u);
    EXPECT_EQ(selector->select(10), 0u);
    EXPECT_EQ(selector->select(10), 9u);
    EXPECT_EQ(random->bounds, (std::vector<uint32_t>{10, 10, 10}));
}

// Test that a pinned shard bypasses the random source
TEST_F(ShardSelectorTest, PinnedShardIsReturnedUnchanged)
{
    EXPECT_EQ(selector->select(10, 7u), 7u);
    EXPECT_EQ(selector->select(10, 25u), 25u);
    EXPECT_TRUE(random->bounds.empty());
}

// Test that a single shard always selects index 0
TEST_F(ShardSelectorTest, SingleShard)
{
    EXPECT_EQ(selector->select(1), 0u);
    EXPECT_EQ(selector->select(1), 0u);
}

// Test that draws spread evenly over the shards
TEST(ShardSelectorFairnessTest, FrequenciesAreUniform)
{
    ShardSelector selector(std::make_shared<SeededRandomSource>(7));
    const uint32_t shardCount = 10;
    const int draws = 100000;
    const double expected = static_cast<double>(draws) / shardCount;

    std::vector<int> counts(shardCount, 0);
    for (int i = 0; i < draws; ++i)
    {
        counts[selector.select(shardCount)]++;
    }

    double chiSquare = 0.0;
    for (int count : counts)
    {
        EXPECT_NEAR(count, expected, expected * 0.05);
        chiSquare += (count - expected) * (count - expected) / expected;
    }
    // 9 degrees of freedom, p = 0.001
    EXPECT_LT(chiSquare, 27.88);
}

// Test the real sources stay in range and cover every index
TEST(RandomSourceTest, UniformIndexInRange)
{
    ThreadLocalRandomSource threadLocal;
    SeededRandomSource seeded(1234);

    std::set<uint32_t> seen;
    for (int i = 0; i < 2000; ++i)
    {
        uint32_t a = threadLocal.uniformIndex(8);
        uint32_t b = seeded.uniformIndex(8);
        EXPECT_LT(a, 8u);
        EXPECT_LT(b, 8u);
        seen.insert(b);
    }
    EXPECT_EQ(seen.size(), 8u);

    EXPECT_THROW(threadLocal.uniformIndex(0), std::invalid_argument);
    EXPECT_THROW(seeded.uniformIndex(0), std::invalid_argument);
}

// Test that equal seeds give equal sequences
TEST(RandomSourceTest, SeededIsReproducible)
{
    SeededRandomSource first(42);
    SeededRandomSource second(42);
    for (int i = 0; i < 100; ++i)
    {
        EXPECT_EQ(first.uniformIndex(1000), second.uniformIndex(1000));
    }
}
