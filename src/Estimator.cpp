#include "Estimator.hpp"
#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include <utility>

Estimator::Estimator(const ShardStore &store, std::shared_ptr<RandomSource> random)
    : m_store(store), m_random(std::move(random))
{
    if (!m_random)
    {
        throw std::invalid_argument("Estimator requires a random source");
    }
}

std::vector<uint32_t> Estimator::sampleIndices(uint32_t shardCount, uint32_t k) const
{
    k = std::min(k, shardCount);

    // Positions not in the map still hold their own index
    std::unordered_map<uint32_t, uint32_t> displaced;
    displaced.reserve(k);
    auto valueAt = [&displaced](uint32_t position)
    {
        auto it = displaced.find(position);
        return it == displaced.end() ? position : it->second;
    };

    std::vector<uint32_t> indices;
    indices.reserve(k);
    for (uint32_t i = 0; i < k; ++i)
    {
        uint32_t j = i + m_random->uniformIndex(shardCount - i);
        uint32_t chosen = valueAt(j);
        displaced[j] = valueAt(i);
        indices.push_back(chosen);
    }
    return indices;
}

double Estimator::estimate(const CounterKey &name, uint32_t shardCount, uint32_t readFromShards) const
{
    if (shardCount == 0)
    {
        throw std::invalid_argument("Shard count must be positive");
    }

    uint32_t k = std::min(std::max(1u, readFromShards), shardCount);

    double readCount = 0.0;
    for (uint32_t shardIndex : sampleIndices(shardCount, k))
    {
        if (auto shard = m_store.getShard(name, shardIndex))
        {
            readCount += shard->value;
        }
    }

    return readCount * (static_cast<double>(shardCount) / k);
}
