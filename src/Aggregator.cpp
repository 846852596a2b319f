#include "Aggregator.hpp"

double Aggregator::count(const CounterKey &name) const
{
    return sum(m_store.scanShardsByName(name));
}

double Aggregator::sum(const std::vector<Shard> &shards)
{
    double total = 0.0;
    for (const auto &shard : shards)
    {
        total += shard.value;
    }
    return total;
}
