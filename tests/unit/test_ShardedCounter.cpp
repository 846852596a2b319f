#include <gtest/gtest.h>
#include "ShardedCounter.hpp"
#include "MemoryShardStore.hpp"
#include <random>
#include <cmath>
#include <stdexcept>

class ShardedCounterTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        store = std::make_shared<MemoryShardStore>();
        random = std::make_shared<SeededRandomSource>(2024);

        settings.shardCounts[CounterKey("beans")] = 10;
        settings.shardCounts[CounterKey("users")] = 3;
        counter = std::make_unique<ShardedCounter>(store, random, settings);
    }

    std::shared_ptr<MemoryShardStore> store;
    std::shared_ptr<SeededRandomSource> random;
    CounterSettings settings;
    std::unique_ptr<ShardedCounter> counter;
};

// Test adding and subtracting from a configured counter
TEST_F(ShardedCounterTest, AddAndSubtract)
{
    counter->add("beans", 10);
    counter->add("beans", -5);
    EXPECT_DOUBLE_EQ(counter->count("beans"), 5.0);
}

// Test that unknown counters start at zero
TEST_F(ShardedCounterTest, UnknownCounterIsZero)
{
    EXPECT_DOUBLE_EQ(counter->count("never_written"), 0.0);
    EXPECT_DOUBLE_EQ(counter->estimateCount("never_written"), 0.0);
}

// Test that writes land within the configured shard count
TEST_F(ShardedCounterTest, WritesStayWithinShardCount)
{
    for (int i = 0; i < 500; ++i)
    {
        EXPECT_LT(counter->add("users"), 3u);
        EXPECT_LT(counter->add("other"), DEFAULT_SHARD_COUNT);
        EXPECT_LT(counter->add("other", 1.0, 5u), 5u);
    }

    EXPECT_EQ(store->scanShardsByName("users").size(), 3u);
    EXPECT_DOUBLE_EQ(counter->count("users"), 500.0);
    EXPECT_DOUBLE_EQ(counter->count("other"), 1000.0);
}

// Test per-name shard count lookup
TEST_F(ShardedCounterTest, ShardCountFor)
{
    EXPECT_EQ(counter->shardCountFor("beans"), 10u);
    EXPECT_EQ(counter->shardCountFor("users"), 3u);
    EXPECT_EQ(counter->shardCountFor("anything"), DEFAULT_SHARD_COUNT);
}

// Test that a pinned shard receives the write
TEST_F(ShardedCounterTest, PinnedShard)
{
    EXPECT_EQ(counter->add("beans", 3, std::nullopt, 7u), 7u);
    EXPECT_EQ(counter->add("beans", 2, std::nullopt, 7u), 7u);

    auto shards = store->scanShardsByName("beans");
    ASSERT_EQ(shards.size(), 1u);
    EXPECT_EQ(shards[0].shardIndex, 7u);
    EXPECT_DOUBLE_EQ(shards[0].value, 5.0);
}

// Test that a pinned shard above the shard count is still counted
TEST_F(ShardedCounterTest, PinnedShardOutOfRange)
{
    counter->add("users", 4, std::nullopt, 50u);
    EXPECT_DOUBLE_EQ(counter->count("users"), 4.0);

    counter->rebalance("users");
    EXPECT_NEAR(counter->count("users"), 4.0, 1e-9);
    EXPECT_FALSE(store->getShard("users", 50).has_value());
}

// Test that reset removes every shard
TEST_F(ShardedCounterTest, Reset)
{
    for (int i = 0; i < 50; ++i)
    {
        counter->add("beans");
    }
    counter->add("beans", 1, std::nullopt, 99u);

    counter->reset("beans");
    EXPECT_DOUBLE_EQ(counter->count("beans"), 0.0);
    EXPECT_TRUE(store->scanShardsByName("beans").empty());

    counter->add("beans", 2);
    EXPECT_DOUBLE_EQ(counter->count("beans"), 2.0);
}

// Test that independent counters do not interfere
TEST_F(ShardedCounterTest, CountersAreIndependent)
{
    CounterKey friendsOf42{CounterKey::Part(int64_t(42)), CounterKey::Part(std::string("friends"))};
    CounterKey friendsOf43{CounterKey::Part(int64_t(43)), CounterKey::Part(std::string("friends"))};

    counter->add(friendsOf42, 3);
    counter->add(friendsOf43, 1);
    counter->add("beans", 100);
    counter->reset(friendsOf43);

    EXPECT_DOUBLE_EQ(counter->count(friendsOf42), 3.0);
    EXPECT_DOUBLE_EQ(counter->count(friendsOf43), 0.0);
    EXPECT_DOUBLE_EQ(counter->count("beans"), 100.0);
}

// Test that the count equals the sum of all deltas regardless of order
TEST_F(ShardedCounterTest, CountIsSumOfDeltas)
{
    std::mt19937 gen(17);
    std::uniform_real_distribution<double> deltaDist(-10.0, 10.0);
    std::uniform_int_distribution<int> opDist(0, 9);

    double expected = 0.0;
    for (int i = 0; i < 2000; ++i)
    {
        int op = opDist(gen);
        if (op == 0)
        {
            counter->rebalance("prop", 1 + static_cast<uint32_t>(i % 7));
        }
        else
        {
            double delta = std::round(deltaDist(gen));
            counter->add("prop", delta, 1 + static_cast<uint32_t>(i % 13));
            expected += delta;
        }
    }

    EXPECT_NEAR(counter->count("prop"), expected, 1e-6);
}

// Test estimate after rebalance is exact
TEST_F(ShardedCounterTest, EstimateAfterRebalance)
{
    for (int i = 0; i < 100; ++i)
    {
        counter->add("beans", 1);
    }
    counter->rebalance("beans");

    EXPECT_EQ(store->scanShardsByName("beans").size(), 10u);
    EXPECT_DOUBLE_EQ(counter->estimateCount("beans"), 100.0);
    EXPECT_DOUBLE_EQ(counter->estimateCount("beans", std::nullopt, 3u), 100.0);
}

// Test that the estimate is within a reasonable band of the exact count
TEST_F(ShardedCounterTest, EstimateIsClose)
{
    for (int i = 0; i < 20000; ++i)
    {
        counter->add("users", 1);
    }
    double estimate = counter->estimateCount("users", std::nullopt, 2u);
    EXPECT_NEAR(estimate, 20000.0, 2000.0);
    EXPECT_DOUBLE_EQ(counter->estimateCount("users", std::nullopt, 3u), 20000.0);
}

// Test rejection of invalid arguments
TEST_F(ShardedCounterTest, InvalidArguments)
{
    EXPECT_THROW(counter->add("beans", 1, 0u), std::invalid_argument);
    EXPECT_THROW(counter->estimateCount("beans", 0u), std::invalid_argument);
    EXPECT_THROW(counter->estimateCount("beans", std::nullopt, 0u), std::invalid_argument);
    EXPECT_THROW(counter->rebalance("beans", 0u), std::invalid_argument);
    EXPECT_EQ(store->size(), 0u);

    EXPECT_THROW({ ShardedCounter noStore(nullptr); }, std::invalid_argument);

    CounterSettings bad;
    bad.defaultShardCount = 0;
    EXPECT_THROW({ ShardedCounter zeroShards(store, random, bad); }, std::invalid_argument);

    bad.defaultShardCount = 4;
    bad.defaultReadFromShards = 0;
    EXPECT_THROW({ ShardedCounter zeroSample(store, random, bad); }, std::invalid_argument);
}

// Test the handle bound to one name
TEST_F(ShardedCounterTest, CounterHandle)
{
    CounterHandle beans = counter->forKey("beans");
    beans.inc();
    beans.inc();
    beans.add(10);
    beans.dec();
    beans.subtract(3);

    EXPECT_EQ(beans.name(), CounterKey("beans"));
    EXPECT_DOUBLE_EQ(beans.count(), 9.0);
    EXPECT_DOUBLE_EQ(counter->count("beans"), 9.0);

    beans.rebalance();
    EXPECT_NEAR(beans.estimateCount(10u), 9.0, 1e-9);
    EXPECT_EQ(store->scanShardsByName("beans").size(), 10u);

    beans.reset();
    EXPECT_DOUBLE_EQ(beans.count(), 0.0);
}

// Test the default random source when none is supplied
TEST_F(ShardedCounterTest, DefaultRandomSource)
{
    ShardedCounter defaults(store);
    for (int i = 0; i < 100; ++i)
    {
        EXPECT_LT(defaults.add("defaults"), DEFAULT_SHARD_COUNT);
    }
    EXPECT_DOUBLE_EQ(defaults.count("defaults"), 100.0);
    EXPECT_EQ(defaults.settings().rebalancePolicy, RebalancePolicy::EVEN);
}

// Test the beans scenario: additions and subtractions leave other names alone
TEST_F(ShardedCounterTest, BeansScenario)
{
    counter->add("beans", 10);
    counter->add("beans", 5);
    EXPECT_DOUBLE_EQ(counter->count("beans"), 15.0);
    EXPECT_DOUBLE_EQ(counter->count("friends"), 0.0);

    counter->add("beans", -5);
    EXPECT_DOUBLE_EQ(counter->count("beans"), 10.0);
    EXPECT_DOUBLE_EQ(counter->count("friends"), 0.0);
}

// Test a single-shard counter later written with a larger shard count
TEST_F(ShardedCounterTest, SingleShardThenWider)
{
    EXPECT_EQ(counter->add("friends", 6, 1u), 0u);
    EXPECT_EQ(counter->add("friends", 2, 1u), 0u);

    auto shards = store->scanShardsByName("friends");
    ASSERT_EQ(shards.size(), 1u);
    EXPECT_DOUBLE_EQ(shards[0].value, 8.0);

    EXPECT_LT(counter->add("friends", 3, 3u), 3u);
    EXPECT_DOUBLE_EQ(counter->count("friends"), 11.0);
}

// Test that zero and fractional deltas are applied as given
TEST_F(ShardedCounterTest, ZeroAndFractionalDeltas)
{
    counter->add("beans", 0.0, std::nullopt, 2u);
    ASSERT_TRUE(store->getShard("beans", 2).has_value());
    EXPECT_DOUBLE_EQ(store->getShard("beans", 2)->value, 0.0);

    counter->add("beans", 0.25, std::nullopt, 2u);
    counter->add("beans", 0.5);
    EXPECT_DOUBLE_EQ(counter->count("beans"), 0.75);
}

// Test that estimates get no worse as more shards are read
TEST_F(ShardedCounterTest, EstimateErrorShrinksWithSampleSize)
{
    CounterSettings integral = settings;
    integral.rebalancePolicy = RebalancePolicy::INTEGRAL;
    ShardedCounter traffic(store, random, integral);

    traffic.add("beans", 1003.0);
    traffic.rebalance("beans");
    for (int i = 0; i < 3000; ++i)
    {
        traffic.add("beans");
    }
    const double exact = traffic.count("beans");
    ASSERT_DOUBLE_EQ(exact, 4003.0);

    const int draws = 4000;
    std::vector<double> meanError;
    for (uint32_t k = 1; k <= 10; ++k)
    {
        double totalError = 0.0;
        for (int i = 0; i < draws; ++i)
        {
            totalError += std::fabs(traffic.estimateCount("beans", std::nullopt, k) - exact);
        }
        meanError.push_back(totalError / draws);
    }

    EXPECT_GT(meanError.front(), 0.0);
    for (size_t i = 1; i < meanError.size(); ++i)
    {
        EXPECT_LE(meanError[i], meanError[i - 1] * 1.05 + 1e-9) << "readFromShards " << i + 1;
    }
    EXPECT_NEAR(meanError.back(), 0.0, 1e-6);
}
