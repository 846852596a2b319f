#ifndef MEMORY_SHARD_STORE_HPP
#define MEMORY_SHARD_STORE_HPP

#include "ShardStore.hpp"
#include <array>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

class MemoryShardStore : public ShardStore
{
public:
    // Number of lock stripes - should be a power of 2 for better hashing
    static constexpr size_t NUM_STRIPES = 64;

    MemoryShardStore() = default;
    ~MemoryShardStore() override = default;

    MemoryShardStore(const MemoryShardStore &) = delete;
    MemoryShardStore &operator=(const MemoryShardStore &) = delete;

    std::optional<Shard> getShard(const CounterKey &name, uint32_t shardIndex) const override;
    void putShard(const CounterKey &name, uint32_t shardIndex, double value) override;
    double updateShard(const CounterKey &name, uint32_t shardIndex, const Mutator &mutator) override;
    bool deleteShard(const ShardId &id) override;
    std::vector<Shard> scanShardsByName(const CounterKey &name) const override;

    std::vector<Shard> scanAll() const;
    std::vector<CounterKey> listNames() const;
    size_t size() const;
    void clear();

private:
    struct ShardRecord
    {
        mutable std::mutex mutex;
        double value{0.0};
    };

    // Readers and writers of individual records hold `mutex` shared; adding a
    // record or removing one holds it exclusively.
    struct CounterEntry
    {
        mutable std::shared_mutex mutex;
        std::map<uint32_t, std::unique_ptr<ShardRecord>> shards;
    };

    // Same layout as the entries: writers hold the stripe shared for the whole
    // update, so an entry is only erased once no write can be in flight on it.
    struct Stripe
    {
        mutable std::shared_mutex mutex;
        std::unordered_map<CounterKey, std::unique_ptr<CounterEntry>> counters;
    };

    std::array<Stripe, NUM_STRIPES> m_stripes;

    size_t getStripeIndex(const CounterKey &name) const
    {
        return std::hash<CounterKey>{}(name) & (NUM_STRIPES - 1);
    }

    static double applyToEntry(CounterEntry &entry, uint32_t shardIndex, const Mutator &mutator);
    static void collectEntry(const CounterKey &name, const CounterEntry &entry, std::vector<Shard> &out);
};

#endif
