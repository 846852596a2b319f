#ifndef SHARDED_COUNTER_HPP
#define SHARDED_COUNTER_HPP

#include "Config.hpp"
#include "ShardStore.hpp"
#include "RandomSource.hpp"
#include "ShardSelector.hpp"
#include "Aggregator.hpp"
#include "Rebalancer.hpp"
#include "Estimator.hpp"
#include <memory>
#include <optional>
#include <cstdint>
#include <utility>

class CounterHandle;

/**
 * @brief Map from counter names to counters sharded over a ShardStore
 *
 * Each counter is split over shardCount records so concurrent updates of
 * one counter mostly hit different records. More shards raise write
 * throughput and make count() and rebalance() proportionally more expensive.
 *
 * Invalid arguments (zero shard count or sample size) are rejected with
 * std::invalid_argument before the store is touched. Store errors propagate
 * unchanged; nothing is retried here.
 */
class ShardedCounter
{
public:
    // A null random source selects ThreadLocalRandomSource.
    explicit ShardedCounter(std::shared_ptr<ShardStore> store,
                            std::shared_ptr<RandomSource> random = nullptr,
                            CounterSettings settings = CounterSettings());

    ShardedCounter(const ShardedCounter &) = delete;
    ShardedCounter &operator=(const ShardedCounter &) = delete;

    /**
     * @brief Adds delta to the counter (negative deltas decrease it)
     *
     * @param shardCount Shards to pick from; defaults to the configured count for name
     * @param pinnedShard Shard to write to instead of a random one
     * @return The shard index written, so callers can pin it for later writes
     */
    uint32_t add(const CounterKey &name,
                 double delta = 1.0,
                 std::optional<uint32_t> shardCount = std::nullopt,
                 std::optional<uint32_t> pinnedShard = std::nullopt);

    // Exact value. Reads all shards, so it contends with every writer of name.
    double count(const CounterKey &name) const;

    // Reads readFromShards random shards and extrapolates.
    double estimateCount(const CounterKey &name,
                         std::optional<uint32_t> shardCount = std::nullopt,
                         std::optional<uint32_t> readFromShards = std::nullopt) const;

    void rebalance(const CounterKey &name, std::optional<uint32_t> shardCount = std::nullopt);

    // Deletes every shard of name.
    void reset(const CounterKey &name);

    uint32_t shardCountFor(const CounterKey &name) const;

    CounterHandle forKey(const CounterKey &name);

    const CounterSettings &settings() const { return m_settings; }

private:
    uint32_t resolveShardCount(const CounterKey &name, std::optional<uint32_t> shardCount) const;

    std::shared_ptr<ShardStore> m_store;
    std::shared_ptr<RandomSource> m_random;
    CounterSettings m_settings;

    ShardSelector m_selector;
    Aggregator m_aggregator;
    Rebalancer m_rebalancer;
    Estimator m_estimator;
};

// Operations of a ShardedCounter bound to one name.
class CounterHandle
{
public:
    CounterHandle(ShardedCounter &counter, CounterKey name)
        : m_counter(counter), m_name(std::move(name)) {}

    uint32_t add(double delta = 1.0) { return m_counter.add(m_name, delta); }
    uint32_t subtract(double delta = 1.0) { return m_counter.add(m_name, -delta); }
    uint32_t inc() { return add(1.0); }
    uint32_t dec() { return add(-1.0); }

    double count() const { return m_counter.count(m_name); }
    double estimateCount(std::optional<uint32_t> readFromShards = std::nullopt) const
    {
        return m_counter.estimateCount(m_name, std::nullopt, readFromShards);
    }

    void rebalance() { m_counter.rebalance(m_name); }
    void reset() { m_counter.reset(m_name); }

    const CounterKey &name() const { return m_name; }

private:
    ShardedCounter &m_counter;
    CounterKey m_name;
};

#endif
