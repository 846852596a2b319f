#include "MemoryShardStore.hpp"
#include <algorithm>

std::optional<Shard> MemoryShardStore::getShard(const CounterKey &name, uint32_t shardIndex) const
{
    const Stripe &stripe = m_stripes[getStripeIndex(name)];
    std::shared_lock<std::shared_mutex> stripeLock(stripe.mutex);

    auto it = stripe.counters.find(name);
    if (it == stripe.counters.end())
    {
        return std::nullopt;
    }

    const CounterEntry &entry = *it->second;
    std::shared_lock<std::shared_mutex> entryLock(entry.mutex);

    auto shardIt = entry.shards.find(shardIndex);
    if (shardIt == entry.shards.end())
    {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> recordLock(shardIt->second->mutex);
    return Shard(name, shardIndex, shardIt->second->value);
}

void MemoryShardStore::putShard(const CounterKey &name, uint32_t shardIndex, double value)
{
    updateShard(name, shardIndex, [value](std::optional<double>)
                { return value; });
}

double MemoryShardStore::updateShard(const CounterKey &name, uint32_t shardIndex, const Mutator &mutator)
{
    Stripe &stripe = m_stripes[getStripeIndex(name)];

    // Fast path: the counter already exists
    {
        std::shared_lock<std::shared_mutex> stripeLock(stripe.mutex);
        auto it = stripe.counters.find(name);
        if (it != stripe.counters.end())
        {
            return applyToEntry(*it->second, shardIndex, mutator);
        }
    }

    // First write to this counter name
    std::unique_lock<std::shared_mutex> stripeLock(stripe.mutex);
    auto [it, inserted] = stripe.counters.try_emplace(name, nullptr);
    try
    {
        if (inserted)
        {
            it->second = std::make_unique<CounterEntry>();
        }
        return applyToEntry(*it->second, shardIndex, mutator);
    }
    catch (...)
    {
        if (inserted)
        {
            stripe.counters.erase(it);
        }
        throw;
    }
}

double MemoryShardStore::applyToEntry(CounterEntry &entry, uint32_t shardIndex, const Mutator &mutator)
{
    {
        std::shared_lock<std::shared_mutex> entryLock(entry.mutex);
        auto it = entry.shards.find(shardIndex);
        if (it != entry.shards.end())
        {
            ShardRecord &record = *it->second;
            std::lock_guard<std::mutex> recordLock(record.mutex);
            double newValue = mutator(record.value);
            record.value = newValue;
            return newValue;
        }
    }

    std::unique_lock<std::shared_mutex> entryLock(entry.mutex);
    auto it = entry.shards.find(shardIndex);
    if (it != entry.shards.end())
    {
        // Another writer created the record while we were upgrading
        ShardRecord &record = *it->second;
        std::lock_guard<std::mutex> recordLock(record.mutex);
        double newValue = mutator(record.value);
        record.value = newValue;
        return newValue;
    }

    double newValue = mutator(std::nullopt);
    auto record = std::make_unique<ShardRecord>();
    record->value = newValue;
    entry.shards.emplace(shardIndex, std::move(record));
    return newValue;
}

bool MemoryShardStore::deleteShard(const ShardId &id)
{
    Stripe &stripe = m_stripes[getStripeIndex(id.name)];
    std::unique_lock<std::shared_mutex> stripeLock(stripe.mutex);

    auto it = stripe.counters.find(id.name);
    if (it == stripe.counters.end())
    {
        return false;
    }

    CounterEntry &entry = *it->second;
    bool erased = false;
    {
        std::unique_lock<std::shared_mutex> entryLock(entry.mutex);
        erased = entry.shards.erase(id.shardIndex) > 0;
    }

    if (entry.shards.empty())
    {
        stripe.counters.erase(it);
    }
    return erased;
}

void MemoryShardStore::collectEntry(const CounterKey &name, const CounterEntry &entry, std::vector<Shard> &out)
{
    std::shared_lock<std::shared_mutex> entryLock(entry.mutex);
    for (const auto &[shardIndex, record] : entry.shards)
    {
        std::lock_guard<std::mutex> recordLock(record->mutex);
        out.emplace_back(name, shardIndex, record->value);
    }
}

std::vector<Shard> MemoryShardStore::scanShardsByName(const CounterKey &name) const
{
    std::vector<Shard> result;
    const Stripe &stripe = m_stripes[getStripeIndex(name)];
    std::shared_lock<std::shared_mutex> stripeLock(stripe.mutex);

    auto it = stripe.counters.find(name);
    if (it != stripe.counters.end())
    {
        collectEntry(name, *it->second, result);
    }
    return result;
}

std::vector<Shard> MemoryShardStore::scanAll() const
{
    std::vector<Shard> result;
    for (const auto &stripe : m_stripes)
    {
        std::shared_lock<std::shared_mutex> stripeLock(stripe.mutex);
        for (const auto &[name, entry] : stripe.counters)
        {
            collectEntry(name, *entry, result);
        }
    }

    std::sort(result.begin(), result.end(), [](const Shard &a, const Shard &b)
              { return a.id() < b.id(); });
    return result;
}

std::vector<CounterKey> MemoryShardStore::listNames() const
{
    std::vector<CounterKey> names;
    for (const auto &stripe : m_stripes)
    {
        std::shared_lock<std::shared_mutex> stripeLock(stripe.mutex);
        for (const auto &pair : stripe.counters)
        {
            names.push_back(pair.first);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

size_t MemoryShardStore::size() const
{
    size_t total = 0;
    for (const auto &stripe : m_stripes)
    {
        std::shared_lock<std::shared_mutex> stripeLock(stripe.mutex);
        for (const auto &pair : stripe.counters)
        {
            std::shared_lock<std::shared_mutex> entryLock(pair.second->mutex);
            total += pair.second->shards.size();
        }
    }
    return total;
}

void MemoryShardStore::clear()
{
    // Lock all stripes to ensure consistency
    std::array<std::unique_lock<std::shared_mutex>, NUM_STRIPES> locks;
    for (size_t i = 0; i < NUM_STRIPES; ++i)
    {
        locks[i] = std::unique_lock<std::shared_mutex>(m_stripes[i].mutex);
    }

    for (auto &stripe : m_stripes)
    {
        stripe.counters.clear();
    }
}
