#include "Rebalancer.hpp"
#include "Aggregator.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

std::vector<double> Rebalancer::distribute(double total, uint32_t shardCount, RebalancePolicy policy)
{
    if (shardCount == 0)
    {
        throw std::invalid_argument("Shard count must be positive");
    }

    if (policy == RebalancePolicy::EVEN)
    {
        return std::vector<double>(shardCount, total / shardCount);
    }

    double base = std::trunc(total / shardCount);
    std::vector<double> values(shardCount, base);

    double remainder = total - base * shardCount;
    double sign = remainder < 0 ? -1.0 : 1.0;
    double left = std::fabs(remainder);

    for (uint32_t i = 0; i < shardCount && left > 0; ++i)
    {
        double step = std::min(1.0, left);
        values[i] += sign * step;
        left -= step;
    }

    // Rounding residue when |remainder| came out a hair above shardCount
    if (left > 0)
    {
        values[0] += sign * left;
    }

    return values;
}

void Rebalancer::rebalance(const CounterKey &name, uint32_t shardCount) const
{
    std::vector<Shard> existing = m_store.scanShardsByName(name);
    double total = Aggregator::sum(existing);
    std::vector<double> values = distribute(total, shardCount, m_policy);

    for (uint32_t i = 0; i < shardCount; ++i)
    {
        m_store.putShard(name, i, values[i]);
    }

    for (const auto &shard : existing)
    {
        if (shard.shardIndex >= shardCount)
        {
            m_store.deleteShard(shard.id());
        }
    }
}
