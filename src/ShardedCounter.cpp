#include "ShardedCounter.hpp"
#include <stdexcept>
#include <utility>

namespace
{
    std::shared_ptr<RandomSource> orDefault(std::shared_ptr<RandomSource> random)
    {
        if (!random)
        {
            return std::make_shared<ThreadLocalRandomSource>();
        }
        return random;
    }

    const ShardStore &requireStore(const std::shared_ptr<ShardStore> &store)
    {
        if (!store)
        {
            throw std::invalid_argument("ShardedCounter requires a shard store");
        }
        return *store;
    }
}

ShardedCounter::ShardedCounter(std::shared_ptr<ShardStore> store,
                               std::shared_ptr<RandomSource> random,
                               CounterSettings settings)
    : m_store(std::move(store)),
      m_random(orDefault(std::move(random))),
      m_settings(std::move(settings)),
      m_selector(m_random),
      m_aggregator(requireStore(m_store)),
      m_rebalancer(*m_store, m_settings.rebalancePolicy),
      m_estimator(*m_store, m_random)
{
    validateSettings(m_settings);
}

uint32_t ShardedCounter::resolveShardCount(const CounterKey &name, std::optional<uint32_t> shardCount) const
{
    uint32_t resolved = shardCount ? *shardCount : shardCountFor(name);
    if (resolved == 0)
    {
        throw std::invalid_argument("Shard count for " + name.toString() + " must be positive");
    }
    return resolved;
}

uint32_t ShardedCounter::shardCountFor(const CounterKey &name) const
{
    auto it = m_settings.shardCounts.find(name);
    if (it != m_settings.shardCounts.end())
    {
        return it->second;
    }
    return m_settings.defaultShardCount;
}

uint32_t ShardedCounter::add(const CounterKey &name,
                             double delta,
                             std::optional<uint32_t> shardCount,
                             std::optional<uint32_t> pinnedShard)
{
    uint32_t shardIndex = m_selector.select(resolveShardCount(name, shardCount), pinnedShard);

    m_store->updateShard(name, shardIndex, [delta](std::optional<double> current)
                         { return current ? *current + delta : delta; });

    return shardIndex;
}

double ShardedCounter::count(const CounterKey &name) const
{
    return m_aggregator.count(name);
}

double ShardedCounter::estimateCount(const CounterKey &name,
                                     std::optional<uint32_t> shardCount,
                                     std::optional<uint32_t> readFromShards) const
{
    uint32_t shards = resolveShardCount(name, shardCount);
    uint32_t sampled = readFromShards ? *readFromShards : m_settings.defaultReadFromShards;
    if (sampled == 0)
    {
        throw std::invalid_argument("readFromShards must be positive");
    }
    return m_estimator.estimate(name, shards, sampled);
}

void ShardedCounter::rebalance(const CounterKey &name, std::optional<uint32_t> shardCount)
{
    m_rebalancer.rebalance(name, resolveShardCount(name, shardCount));
}

void ShardedCounter::reset(const CounterKey &name)
{
    for (const auto &shard : m_store->scanShardsByName(name))
    {
        m_store->deleteShard(shard.id());
    }
}

CounterHandle ShardedCounter::forKey(const CounterKey &name)
{
    return CounterHandle(*this, name);
}
