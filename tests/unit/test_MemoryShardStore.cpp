#include <gtest/gtest.h>
#include "MemoryShardStore.hpp"
#include <thread>
#include <vector>
#include <stdexcept>

class MemoryShardStoreTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        store = std::make_unique<MemoryShardStore>();
    }

    void TearDown() override
    {
        store.reset();
    }

    std::unique_ptr<MemoryShardStore> store;
};

// Test that missing records read as absent
TEST_F(MemoryShardStoreTest, MissingShard)
{
    EXPECT_FALSE(store->getShard("beans", 0).has_value());
    EXPECT_TRUE(store->scanShardsByName("beans").empty());
    EXPECT_FALSE(store->deleteShard(ShardId{"beans", 0}));
}

// Test put then get
TEST_F(MemoryShardStoreTest, PutAndGet)
{
    store->putShard("beans", 3, 2.5);
    auto shard = store->getShard("beans", 3);
    ASSERT_TRUE(shard.has_value());
    EXPECT_EQ(shard->name, CounterKey("beans"));
    EXPECT_EQ(shard->shardIndex, 3u);
    EXPECT_DOUBLE_EQ(shard->value, 2.5);

    store->putShard("beans", 3, -1.0);
    EXPECT_DOUBLE_EQ(store->getShard("beans", 3)->value, -1.0);
    EXPECT_EQ(store->size(), 1u);
}

// Test that update sees the current value
TEST_F(MemoryShardStoreTest, UpdateSeesCurrentValue)
{
    std::optional<double> seen = 99.0;
    store->updateShard("beans", 0, [&](std::optional<double> current)
                       { seen = current; return 5.0; });
    EXPECT_FALSE(seen.has_value());

    double stored = store->updateShard("beans", 0, [&](std::optional<double> current)
                                       { seen = current; return *current + 1.0; });
    ASSERT_TRUE(seen.has_value());
    EXPECT_DOUBLE_EQ(*seen, 5.0);
    EXPECT_DOUBLE_EQ(stored, 6.0);
}

// Test that a throwing mutator leaves no trace
TEST_F(MemoryShardStoreTest, ThrowingMutatorLeavesStoreUnchanged)
{
    auto failing = [](std::optional<double>) -> double
    { throw ShardStoreError("rejected"); };

    EXPECT_THROW(store->updateShard("beans", 0, failing), ShardStoreError);
    EXPECT_TRUE(store->listNames().empty());

    store->putShard("beans", 0, 1.0);
    EXPECT_THROW(store->updateShard("beans", 0, failing), ShardStoreError);
    EXPECT_DOUBLE_EQ(store->getShard("beans", 0)->value, 1.0);
}

// Test that a non-standard exception also rolls back a new counter
TEST_F(MemoryShardStoreTest, ForeignExceptionLeavesStoreUnchanged)
{
    auto failing = [](std::optional<double>) -> double
    { throw 42; };

    EXPECT_THROW(store->updateShard("beans", 0, failing), int);
    EXPECT_TRUE(store->listNames().empty());
    EXPECT_FALSE(store->getShard("beans", 0).has_value());

    store->updateShard("beans", 0, [](std::optional<double> current)
                       { return current.value_or(0.0) + 2.0; });
    EXPECT_DOUBLE_EQ(store->getShard("beans", 0)->value, 2.0);
}

// Test scans are ordered by shard index and scoped to a name
TEST_F(MemoryShardStoreTest, ScanByName)
{
    store->putShard("beans", 7, 1.0);
    store->putShard("beans", 2, 2.0);
    store->putShard("beans", 4, 3.0);
    store->putShard("friends", 0, 10.0);

    auto shards = store->scanShardsByName("beans");
    ASSERT_EQ(shards.size(), 3u);
    EXPECT_EQ(shards[0].shardIndex, 2u);
    EXPECT_EQ(shards[1].shardIndex, 4u);
    EXPECT_EQ(shards[2].shardIndex, 7u);
}

// Test deletion and name bookkeeping
TEST_F(MemoryShardStoreTest, DeleteRemovesEmptyNames)
{
    store->putShard("beans", 0, 1.0);
    store->putShard("beans", 1, 1.0);
    store->putShard("friends", 0, 1.0);

    EXPECT_TRUE(store->deleteShard(ShardId{"beans", 0}));
    EXPECT_FALSE(store->deleteShard(ShardId{"beans", 0}));
    EXPECT_EQ(store->listNames().size(), 2u);

    EXPECT_TRUE(store->deleteShard(ShardId{"beans", 1}));
    auto names = store->listNames();
    ASSERT_EQ(names.size(), 1u);
    EXPECT_EQ(names[0], CounterKey("friends"));
}

// Test scanAll ordering and clear
TEST_F(MemoryShardStoreTest, ScanAllAndClear)
{
    store->putShard("b", 1, 1.0);
    store->putShard("a", 0, 2.0);
    store->putShard("b", 0, 3.0);

    auto all = store->scanAll();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id(), (ShardId{"a", 0}));
    EXPECT_EQ(all[1].id(), (ShardId{"b", 0}));
    EXPECT_EQ(all[2].id(), (ShardId{"b", 1}));

    store->clear();
    EXPECT_EQ(store->size(), 0u);
}

// Test that concurrent updates of one record are serialized
TEST_F(MemoryShardStoreTest, ConcurrentUpdatesAreAtomic)
{
    const int numThreads = 8;
    const int updatesPerThread = 5000;

    std::vector<std::thread> threads;
    for (int t = 0; t < numThreads; ++t)
    {
        threads.emplace_back([this]()
                             {
            for (int i = 0; i < updatesPerThread; ++i)
            {
                store->updateShard("hot", 0, [](std::optional<double> current)
                                   { return current ? *current + 1.0 : 1.0; });
            } });
    }
    for (auto &thread : threads)
    {
        thread.join();
    }

    EXPECT_DOUBLE_EQ(store->getShard("hot", 0)->value, numThreads * updatesPerThread);
}
